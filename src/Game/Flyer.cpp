#include "Pichuka/Game/Flyer.hpp"
#include <algorithm>

namespace Pichuka::Game {

Flyer::Flyer(const Config::PhysicsSettings& physics, float x)
    : m_position(x, 0.0f)
    , m_velocityY(0.0f)
    , m_gravity(physics.gravity)
    , m_impulse(physics.impulse)
    , m_referenceRate(physics.referenceRate) {
}

void Flyer::Reset(float y) {
    m_position.y = y;
    m_velocityY = 0.0f;
}

void Flyer::Integrate(float deltaSeconds) {
    // No bounds clamping; leaving the field is a collision
    Physics::Integrate(m_position.y, m_velocityY, m_gravity, deltaSeconds, m_referenceRate);
}

void Flyer::ApplyImpulse() {
    m_velocityY = m_impulse;
}

AABB Flyer::GetBoundingBox(float width, float height) const {
    return AABB(
        m_position,
        glm::vec2(m_position.x + width, m_position.y + height)
    );
}

float Flyer::GetRotationDegrees() const {
    return std::clamp(m_velocityY * ROTATION_PER_VELOCITY, MIN_ROTATION, MAX_ROTATION);
}

} // namespace Pichuka::Game
