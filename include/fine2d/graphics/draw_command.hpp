#pragma once

#include "fine2d/graphics/rectangle.hpp"
#include "fine2d/graphics/vertex.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fine2d {

/**
 * @brief Opaque reference to a GPU texture owned by the render device
 *
 * Identity is the id alone; width and height ride along so drawables can
 * compute texture coordinates without asking the device. Id 0 is the
 * device's 1x1 white texture.
 */
struct TextureHandle {
    uint32_t id = 0;
    uint32_t width = 1;
    uint32_t height = 1;

    static TextureHandle white() { return TextureHandle{}; }

    bool operator==(const TextureHandle& o) const { return id == o.id; }
    bool operator!=(const TextureHandle& o) const { return id != o.id; }
};

/// Opaque reference to a shader program. Id 0 is the built-in sprite shader.
struct ShaderHandle {
    uint32_t id = 0;

    bool operator==(const ShaderHandle& o) const { return id == o.id; }
    bool operator!=(const ShaderHandle& o) const { return id != o.id; }
};

/// Render target. Id 0 is the virtual screen canvas.
struct CanvasHandle {
    uint32_t id = 0;

    static CanvasHandle screen() { return CanvasHandle{}; }

    bool operator==(const CanvasHandle& o) const { return id == o.id; }
    bool operator!=(const CanvasHandle& o) const { return id != o.id; }
};

enum class BlendMode {
    Alpha,              // src * a + dst * (1 - a)
    PremultipliedAlpha, // src + dst * (1 - a)
    Additive,           // src * a + dst
    Multiply            // src * dst
};

const char* blendModeToString(BlendMode mode);

/**
 * @brief Pipeline state shared by every vertex of a batch
 *
 * Two commands land in the same batch only if their states compare equal.
 */
struct DrawState {
    TextureHandle texture;
    ShaderHandle shader;
    BlendMode blend = BlendMode::Alpha;
    std::optional<IRect> scissor;

    bool operator==(const DrawState& o) const {
        return texture == o.texture && shader == o.shader && blend == o.blend &&
               scissor == o.scissor;
    }
    bool operator!=(const DrawState& o) const { return !(*this == o); }

    std::string describe() const;
};

/**
 * @brief One sprite or mesh, fully transformed, ready for batching
 *
 * Positions are already in canvas space. An empty index list means the
 * vertices form a plain triangle list.
 */
struct DrawCommand {
    DrawState state;
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;

    uint32_t vertexCount() const { return static_cast<uint32_t>(vertices.size()); }
    uint32_t indexCount() const {
        return indices.empty() ? vertexCount() : static_cast<uint32_t>(indices.size());
    }
};

} // namespace fine2d
