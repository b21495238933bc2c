#include "Pichuka/Game/CollisionEvaluator.hpp"

namespace Pichuka::Game {

bool ScoreBoard::AddPoint() {
    ++score;
    if (score > highScore) {
        highScore = score;
        return true;
    }
    return false;
}

Evaluation CollisionEvaluator::Evaluate(const AABB& flyer, const FieldGeometry& field,
                                        std::deque<Gate>& gates, float gateWidth,
                                        ScoreBoard& scoreBoard) const {
    Evaluation result;

    result.gatesPassed = MarkPassedGates(flyer, gates, gateWidth);
    for (uint32_t i = 0; i < result.gatesPassed; ++i) {
        if (scoreBoard.AddPoint()) {
            result.newHighScore = true;
        }
    }

    if (HitsBoundary(flyer, field) || HitsGate(flyer, gates, gateWidth)) {
        result.outcome = Outcome::Collision;
    } else if (result.gatesPassed > 0) {
        result.outcome = Outcome::Scored;
    }
    return result;
}

uint32_t CollisionEvaluator::MarkPassedGates(const AABB& flyer, std::deque<Gate>& gates, float gateWidth) {
    uint32_t passed = 0;
    for (auto& gate : gates) {
        if (!gate.scored && flyer.Right() > gate.TrailingEdge(gateWidth)) {
            gate.scored = true;
            passed++;
        }
    }
    return passed;
}

bool CollisionEvaluator::HitsBoundary(const AABB& flyer, const FieldGeometry& field) {
    return flyer.Top() <= 0.0f || flyer.Bottom() >= field.PlayableHeight();
}

bool CollisionEvaluator::HitsGate(const AABB& flyer, const std::deque<Gate>& gates, float gateWidth) {
    for (const auto& gate : gates) {
        if (Physics::Intersects(flyer, gate.GetTopBounds(gateWidth)) ||
            Physics::Intersects(flyer, gate.GetBottomBounds(gateWidth))) {
            return true;
        }
    }
    return false;
}

} // namespace Pichuka::Game
