#pragma once

#include "Pichuka/Core/Config.hpp"
#include "Pichuka/Game/Geometry.hpp"
#include "Pichuka/Game/Physics.hpp"
#include "Pichuka/Game/RandomSource.hpp"
#include <deque>
#include <optional>

namespace Pichuka::Game {

struct Gate {
    float x;              // Left edge
    float topHeight;      // Top segment spans [0, topHeight]; the gap starts here
    float gapSize;
    float bottomHeight;   // Bottom segment spans [topHeight + gapSize, ground line]
    bool scored;          // Whether the flyer has passed this gate

    Gate(float x, float topHeight, float gapSize, float bottomHeight)
        : x(x), topHeight(topHeight), gapSize(gapSize), bottomHeight(bottomHeight), scored(false) {}

    float GapEnd() const { return topHeight + gapSize; }
    float TrailingEdge(float width) const { return x + width; }

    AABB GetTopBounds(float width) const;
    AABB GetBottomBounds(float width) const;
};

// True when the field is wide enough to scroll in and tall enough for a gap
// plus two minimum segments. The session assumes this holds on every frame;
// drivers check it before running one.
bool FieldFitsGate(const FieldGeometry& geometry, const Config::GateSettings& settings);

// True when no gate has been spawned yet or the interval has elapsed
bool ShouldSpawn(double now, const std::optional<double>& lastSpawnTime, double interval);

class GateManager {
public:
    explicit GateManager(const Config::GateSettings& settings);

    // Remove every gate and forget the last spawn time
    void Reset();

    // Spawn one gate at the right edge of the field when ShouldSpawn() holds.
    // Requires PlayableHeight() >= gapSize + 2 * minSegmentHeight.
    bool MaybeSpawn(double now, const FieldGeometry& geometry, RandomSource& random);

    // Scroll every gate left by speed * referenceRate * deltaSeconds
    void Advance(float deltaSeconds, float referenceRate);

    // Drop gates whose trailing edge is not right of -evictionMargin.
    // Returns the number of gates removed.
    size_t Evict();

    // Gates in spawn order; the oldest (leftmost) gate is at the front
    const std::deque<Gate>& GetGates() const { return m_gates; }
    std::deque<Gate>& GetGates() { return m_gates; }

    float GetGateWidth() const { return m_settings.width; }
    const std::optional<double>& GetLastSpawnTime() const { return m_lastSpawnTime; }

private:
    Config::GateSettings m_settings;
    std::deque<Gate> m_gates;
    std::optional<double> m_lastSpawnTime;
};

} // namespace Pichuka::Game
