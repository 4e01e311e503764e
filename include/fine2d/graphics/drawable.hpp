#pragma once

#include "fine2d/graphics/draw_command.hpp"
#include "fine2d/graphics/draw_params.hpp"
#include "fine2d/graphics/rectangle.hpp"
#include "fine2d/graphics/vertex.hpp"

#include <optional>
#include <variant>
#include <vector>

namespace fine2d {

/// Pipeline options every drawable carries into its DrawState
struct RenderOptions {
    ShaderHandle shader;
    BlendMode blend = BlendMode::Alpha;
    std::optional<IRect> scissor;
};

/// A texture, or a sub-region of one, drawn as a single quad
struct Sprite {
    TextureHandle texture;
    std::optional<Rect> region;     // Pixels; whole texture if empty
    DrawParams params;
    RenderOptions options;
};

/// The current frame of an Animation, see Animation::frame()
struct AnimationFrame {
    TextureHandle texture;
    Rect region;
    DrawParams params;
    RenderOptions options;
};

/**
 * @brief Stretchable panel made of nine quads
 *
 * Corners keep their pixel size, edges stretch along one axis and the
 * center stretches along both.
 */
struct NineSlice {
    TextureHandle texture;
    Rect region;                    // Source region in pixels
    float left = 0.0f;
    float right = 0.0f;
    float top = 0.0f;
    float bottom = 0.0f;
    float width = 0.0f;             // Target size
    float height = 0.0f;
    DrawParams params;
    RenderOptions options;

    static NineSlice withBorder(TextureHandle texture, Rect region, float border,
                                float width, float height);
};

/// Caller-built geometry; params transform positions and tint colors
struct MeshDraw {
    TextureHandle texture;          // White texture by default
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;  // Empty = triangle list
    DrawParams params;
    RenderOptions options;
};

/// One pre-shaped glyph: where it goes and where it lives in the atlas
struct Glyph {
    Rect bounds;                    // Relative to the run origin
    Rect region;                    // Atlas pixels
};

/// Pre-shaped text over a glyph atlas
struct TextRun {
    TextureHandle atlas;
    std::vector<Glyph> glyphs;
    DrawParams params;
    RenderOptions options;
};

using Drawable = std::variant<Sprite, AnimationFrame, NineSlice, MeshDraw, TextRun>;

DrawCommand toDrawCommand(const Sprite& sprite);
DrawCommand toDrawCommand(const AnimationFrame& frame);
DrawCommand toDrawCommand(const NineSlice& slice);
DrawCommand toDrawCommand(const MeshDraw& mesh);
DrawCommand toDrawCommand(const TextRun& text);
DrawCommand toDrawCommand(const Drawable& drawable);

/**
 * @brief Append one transformed quad to a command
 *
 * (x1, y1)-(x2, y2) is the untransformed rectangle, (u1, v1)-(u2, v2) its
 * normalized texture coordinates. Emits 4 vertices in the order
 * top-left, bottom-left, bottom-right, top-right and 6 indices.
 */
void appendQuad(DrawCommand& command, float x1, float y1, float x2, float y2,
                float u1, float v1, float u2, float v2, const DrawParams& params);

} // namespace fine2d
