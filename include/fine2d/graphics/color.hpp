#pragma once

#include <glm/glm.hpp>

#include <cstdint>

namespace fine2d {

/**
 * @brief Linear RGBA color, components in [0, 1]
 */
struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float red, float green, float blue, float alpha = 1.0f)
        : r(red), g(green), b(blue), a(alpha) {}

    static constexpr Color rgb(float r, float g, float b) { return {r, g, b, 1.0f}; }
    static constexpr Color rgba(float r, float g, float b, float a) { return {r, g, b, a}; }

    /// From 8-bit components
    static constexpr Color rgb8(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
        return {r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f};
    }

    /// From 0xRRGGBBAA
    static constexpr Color hex(uint32_t rgba) {
        return rgb8(static_cast<uint8_t>(rgba >> 24), static_cast<uint8_t>(rgba >> 16),
                    static_cast<uint8_t>(rgba >> 8), static_cast<uint8_t>(rgba));
    }

    /// RGB multiplied by alpha, for PremultipliedAlpha blending
    constexpr Color premultiplied() const { return {r * a, g * a, b * a, a}; }

    constexpr Color withAlpha(float alpha) const { return {r, g, b, alpha}; }

    glm::vec4 toVec4() const { return glm::vec4(r, g, b, a); }

    constexpr bool operator==(const Color& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    constexpr bool operator!=(const Color& o) const { return !(*this == o); }

    static const Color WHITE;
    static const Color BLACK;
    static const Color RED;
    static const Color GREEN;
    static const Color BLUE;
    static const Color TRANSPARENT;
};

inline constexpr Color Color::WHITE{1.0f, 1.0f, 1.0f, 1.0f};
inline constexpr Color Color::BLACK{0.0f, 0.0f, 0.0f, 1.0f};
inline constexpr Color Color::RED{1.0f, 0.0f, 0.0f, 1.0f};
inline constexpr Color Color::GREEN{0.0f, 1.0f, 0.0f, 1.0f};
inline constexpr Color Color::BLUE{0.0f, 0.0f, 1.0f, 1.0f};
inline constexpr Color Color::TRANSPARENT{0.0f, 0.0f, 0.0f, 0.0f};

} // namespace fine2d
