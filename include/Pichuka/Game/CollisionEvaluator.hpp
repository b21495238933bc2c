#pragma once

#include "Pichuka/Game/GateManager.hpp"
#include "Pichuka/Game/Geometry.hpp"
#include "Pichuka/Game/Physics.hpp"
#include <cstdint>
#include <deque>

namespace Pichuka::Game {

struct ScoreBoard {
    uint32_t score = 0;
    uint32_t highScore = 0;

    // Adds one point. Returns true when the point set a new high score.
    bool AddPoint();
};

enum class Outcome {
    Continue,
    Scored,
    Collision
};

struct Evaluation {
    Outcome outcome = Outcome::Continue;
    uint32_t gatesPassed = 0;     // Points awarded this frame, also set on Collision
    bool newHighScore = false;
};

class CollisionEvaluator {
public:
    CollisionEvaluator() = default;

    // Scoring pass, then collision pass. A collision wins over a score in
    // the returned outcome, but the points are still awarded.
    Evaluation Evaluate(const AABB& flyer, const FieldGeometry& field,
                        std::deque<Gate>& gates, float gateWidth,
                        ScoreBoard& scoreBoard) const;

    // Flags every unscored gate whose trailing edge the flyer's leading edge
    // has strictly passed. Returns the number of gates flagged.
    static uint32_t MarkPassedGates(const AABB& flyer, std::deque<Gate>& gates, float gateWidth);

    // Touching the ceiling or the ground line is fatal; gates need a real overlap
    static bool HitsBoundary(const AABB& flyer, const FieldGeometry& field);
    static bool HitsGate(const AABB& flyer, const std::deque<Gate>& gates, float gateWidth);
};

} // namespace Pichuka::Game
