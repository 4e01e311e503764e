#pragma once

#include <glm/glm.hpp>

#include <algorithm>
#include <cstdint>

namespace fine2d {

/**
 * @brief Axis-aligned rectangle, origin at the top left
 */
template<typename T>
struct Rectangle {
    T x{};
    T y{};
    T width{};
    T height{};

    constexpr Rectangle() = default;
    constexpr Rectangle(T x_, T y_, T w, T h) : x(x_), y(y_), width(w), height(h) {}

    constexpr T left() const { return x; }
    constexpr T top() const { return y; }
    constexpr T right() const { return x + width; }
    constexpr T bottom() const { return y + height; }

    constexpr bool isEmpty() const { return width <= T{} || height <= T{}; }

    constexpr bool containsPoint(T px, T py) const {
        return px >= x && px < right() && py >= y && py < bottom();
    }

    constexpr bool contains(const Rectangle& o) const {
        return o.x >= x && o.y >= y && o.right() <= right() && o.bottom() <= bottom();
    }

    constexpr bool intersects(const Rectangle& o) const {
        return x < o.right() && right() > o.x && y < o.bottom() && bottom() > o.y;
    }

    Rectangle intersection(const Rectangle& o) const {
        T l = std::max(x, o.x);
        T t = std::max(y, o.y);
        T r = std::min(right(), o.right());
        T b = std::min(bottom(), o.bottom());
        if (r <= l || b <= t) {
            return Rectangle{};
        }
        return Rectangle{l, t, r - l, b - t};
    }

    constexpr bool operator==(const Rectangle& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rectangle& o) const { return !(*this == o); }
};

using Rect = Rectangle<float>;

/// Pixel rectangle, used for scissor regions and texture sub-regions
using IRect = Rectangle<int32_t>;

} // namespace fine2d
