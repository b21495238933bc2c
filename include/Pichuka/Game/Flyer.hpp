#pragma once

#include "Pichuka/Core/Config.hpp"
#include "Pichuka/Game/Physics.hpp"
#include <glm/glm.hpp>

namespace Pichuka::Game {

class Flyer {
public:
    explicit Flyer(const Config::PhysicsSettings& physics, float x = 90.0f);

    // Place the flyer at the given top edge with zero velocity
    void Reset(float y);

    // Advance one frame. deltaSeconds is expected to be clamped by the caller.
    void Integrate(float deltaSeconds);

    // Jump: overrides the current velocity with the impulse value
    void ApplyImpulse();

    // Top-left corner; x never changes
    const glm::vec2& GetPosition() const { return m_position; }
    float GetVelocity() const { return m_velocityY; }

    AABB GetBoundingBox(float width, float height) const;

    // Display tilt in degrees, velocity * 4 clamped to [-25, 70]
    float GetRotationDegrees() const;

private:
    glm::vec2 m_position;
    float m_velocityY;
    float m_gravity;
    float m_impulse;
    float m_referenceRate;

    static constexpr float ROTATION_PER_VELOCITY = 4.0f;
    static constexpr float MIN_ROTATION = -25.0f;
    static constexpr float MAX_ROTATION = 70.0f;
};

} // namespace Pichuka::Game
