#pragma once

#include "fine2d/graphics/color.hpp"

#include <glm/glm.hpp>

namespace fine2d {

/**
 * @brief Per-draw transform and tint
 *
 * Applied on the CPU when a drawable is converted to a DrawCommand: origin
 * is subtracted, then scale, rotation (radians) and position are applied.
 * Negative scale flips the graphic around the origin.
 *
 * @code
 * auto params = DrawParams().at({32, 32}).withOrigin({8, 8}).rotated(0.5f);
 * @endcode
 */
struct DrawParams {
    glm::vec2 position{0.0f};
    glm::vec2 scale{1.0f};
    glm::vec2 origin{0.0f};
    float rotation = 0.0f;
    Color color = Color::WHITE;

    DrawParams& at(glm::vec2 p) { position = p; return *this; }
    DrawParams& scaled(glm::vec2 s) { scale = s; return *this; }
    DrawParams& withOrigin(glm::vec2 o) { origin = o; return *this; }
    DrawParams& rotated(float radians) { rotation = radians; return *this; }
    DrawParams& tinted(const Color& c) { color = c; return *this; }

    bool operator==(const DrawParams& o) const {
        return position == o.position && scale == o.scale && origin == o.origin &&
               rotation == o.rotation && color == o.color;
    }
};

} // namespace fine2d
