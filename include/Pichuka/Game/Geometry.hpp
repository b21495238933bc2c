#pragma once

namespace Pichuka::Game {

// Sizes of the play field and the flyer, in field units (pixels)
struct FieldGeometry {
    float fieldWidth = 0.0f;
    float fieldHeight = 0.0f;
    float groundHeight = 0.0f;
    float flyerWidth = 0.0f;
    float flyerHeight = 0.0f;

    // Height above the ground strip; the ground line sits at this y
    float PlayableHeight() const { return fieldHeight - groundHeight; }
};

// Supplies the current geometry. Queried once per frame because the field
// may be resized between frames.
class GeometryProvider {
public:
    virtual ~GeometryProvider() = default;

    virtual FieldGeometry Query() const = 0;
};

} // namespace Pichuka::Game
