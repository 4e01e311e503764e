#pragma once

#include "fine2d/graphics/color.hpp"

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>

namespace fine2d {

/**
 * @brief Sprite vertex as uploaded to the GPU
 *
 * Layout is part of the shader contract:
 *   location 0 = position (vec2), location 1 = texCoord (vec2),
 *   location 2 = color (vec4). 32 bytes, tightly packed.
 */
struct Vertex {
    glm::vec2 position{0.0f};
    glm::vec2 texCoord{0.0f};
    glm::vec4 color{1.0f};

    Vertex() = default;
    Vertex(glm::vec2 pos, glm::vec2 uv, glm::vec4 col)
        : position(pos), texCoord(uv), color(col) {}
    Vertex(float x, float y, float u, float v, const Color& col)
        : position(x, y), texCoord(u, v), color(col.toVec4()) {}

    bool operator==(const Vertex& o) const {
        return position == o.position && texCoord == o.texCoord && color == o.color;
    }
};

static_assert(sizeof(Vertex) == 32, "Vertex must stay 32 bytes");
static_assert(offsetof(Vertex, position) == 0, "position must be at offset 0");
static_assert(offsetof(Vertex, texCoord) == 8, "texCoord must be at offset 8");
static_assert(offsetof(Vertex, color) == 16, "color must be at offset 16");

constexpr uint32_t VERTEX_LOCATION_POSITION = 0;
constexpr uint32_t VERTEX_LOCATION_TEXCOORD = 1;
constexpr uint32_t VERTEX_LOCATION_COLOR = 2;

} // namespace fine2d
