#include "Pichuka/Game/GateManager.hpp"
#include "Pichuka/Core/Logger.hpp"

namespace Pichuka::Game {

AABB Gate::GetTopBounds(float width) const {
    return AABB(
        glm::vec2(x, 0.0f),
        glm::vec2(x + width, topHeight)
    );
}

AABB Gate::GetBottomBounds(float width) const {
    return AABB(
        glm::vec2(x, GapEnd()),
        glm::vec2(x + width, GapEnd() + bottomHeight)
    );
}

bool FieldFitsGate(const FieldGeometry& geometry, const Config::GateSettings& settings) {
    return geometry.fieldWidth > 0.0f &&
           geometry.PlayableHeight() - settings.gapSize - 2.0f * settings.minSegmentHeight >= 0.0f;
}

bool ShouldSpawn(double now, const std::optional<double>& lastSpawnTime, double interval) {
    return !lastSpawnTime || now - *lastSpawnTime >= interval;
}

GateManager::GateManager(const Config::GateSettings& settings)
    : m_settings(settings) {
}

void GateManager::Reset() {
    m_gates.clear();
    m_lastSpawnTime.reset();
}

bool GateManager::MaybeSpawn(double now, const FieldGeometry& geometry, RandomSource& random) {
    if (!ShouldSpawn(now, m_lastSpawnTime, m_settings.spawnIntervalMs)) {
        return false;
    }

    const float available = geometry.PlayableHeight();
    const float minHeight = m_settings.minSegmentHeight;
    const float maxTopHeight = available - m_settings.gapSize - minHeight;

    float topHeight = random.NextUnit() * (maxTopHeight - minHeight) + minHeight;
    float bottomHeight = available - (topHeight + m_settings.gapSize);

    m_gates.emplace_back(geometry.fieldWidth, topHeight, m_settings.gapSize, bottomHeight);
    m_lastSpawnTime = now;

    PICHUKA_LOG_TRACE_F("Spawned gate at x=%.1f top=%.1f bottom=%.1f (%zu active)",
                        geometry.fieldWidth, topHeight, bottomHeight, m_gates.size());
    return true;
}

void GateManager::Advance(float deltaSeconds, float referenceRate) {
    const float moveBy = m_settings.speed * referenceRate * deltaSeconds;
    for (auto& gate : m_gates) {
        gate.x -= moveBy;
    }
}

size_t GateManager::Evict() {
    // Gates are spawned at the right edge and move in lockstep, so the
    // front gate is always the leftmost one.
    size_t removed = 0;
    while (!m_gates.empty() &&
           !(m_gates.front().TrailingEdge(m_settings.width) > -m_settings.evictionMargin)) {
        m_gates.pop_front();
        ++removed;
    }
    return removed;
}

} // namespace Pichuka::Game
