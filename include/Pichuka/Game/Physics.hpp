#pragma once

#include <glm/glm.hpp>

namespace Pichuka::Game {

// Axis-aligned bounding box in field coordinates (y grows downward)
struct AABB {
    glm::vec2 min;
    glm::vec2 max;

    AABB() : min(0.0f), max(0.0f) {}
    AABB(const glm::vec2& min, const glm::vec2& max) : min(min), max(max) {}

    float Left() const { return min.x; }
    float Right() const { return max.x; }
    float Top() const { return min.y; }
    float Bottom() const { return max.y; }
};

class Physics {
public:
    Physics() = default;

    // Strict open-interval overlap: boxes that only share an edge do not intersect
    static bool Intersects(const AABB& a, const AABB& b);

    // Semi-implicit Euler step. Constants are per reference frame, so the
    // step is scaled by referenceRate * deltaSeconds.
    static void Integrate(float& position, float& velocity, float acceleration,
                          float deltaSeconds, float referenceRate);
};

} // namespace Pichuka::Game
