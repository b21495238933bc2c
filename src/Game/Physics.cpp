#include "Pichuka/Game/Physics.hpp"

namespace Pichuka::Game {

bool Physics::Intersects(const AABB& a, const AABB& b) {
    return (a.min.x < b.max.x && a.max.x > b.min.x &&
            a.min.y < b.max.y && a.max.y > b.min.y);
}

void Physics::Integrate(float& position, float& velocity, float acceleration,
                        float deltaSeconds, float referenceRate) {
    const float frames = referenceRate * deltaSeconds;
    velocity += acceleration * frames;
    position += velocity * frames;
}

} // namespace Pichuka::Game
