#include "fine2d/graphics/drawable.hpp"

#include <cmath>
#include <utility>

namespace fine2d {

namespace {

DrawState makeState(TextureHandle texture, const RenderOptions& options) {
    DrawState state;
    state.texture = texture;
    state.shader = options.shader;
    state.blend = options.blend;
    state.scissor = options.scissor;
    return state;
}

void appendRegionQuad(DrawCommand& command, TextureHandle texture, const Rect& region,
                      const DrawParams& params) {
    float tw = static_cast<float>(texture.width);
    float th = static_cast<float>(texture.height);

    appendQuad(command, 0.0f, 0.0f, region.width, region.height,
               region.x / tw, region.y / th, region.right() / tw, region.bottom() / th,
               params);
}

} // anonymous namespace

void appendQuad(DrawCommand& command, float x1, float y1, float x2, float y2,
                float u1, float v1, float u2, float v2, const DrawParams& params) {
    float fx = (x1 - params.origin.x) * params.scale.x;
    float fy = (y1 - params.origin.y) * params.scale.y;
    float fx2 = (x2 - params.origin.x) * params.scale.x;
    float fy2 = (y2 - params.origin.y) * params.scale.y;

    // Negative scale: keep corners ordered, flip the texture instead
    if (fx2 < fx) {
        std::swap(fx, fx2);
        std::swap(u1, u2);
    }
    if (fy2 < fy) {
        std::swap(fy, fy2);
        std::swap(v1, v2);
    }

    const glm::vec2& p = params.position;
    glm::vec2 c1, c2, c3, c4;

    if (params.rotation == 0.0f) {
        c1 = {p.x + fx, p.y + fy};
        c2 = {p.x + fx, p.y + fy2};
        c3 = {p.x + fx2, p.y + fy2};
        c4 = {p.x + fx2, p.y + fy};
    } else {
        float s = std::sin(params.rotation);
        float c = std::cos(params.rotation);
        c1 = {p.x + c * fx - s * fy, p.y + s * fx + c * fy};
        c2 = {p.x + c * fx - s * fy2, p.y + s * fx + c * fy2};
        c3 = {p.x + c * fx2 - s * fy2, p.y + s * fx2 + c * fy2};
        c4 = {p.x + c * fx2 - s * fy, p.y + s * fx2 + c * fy};
    }

    glm::vec4 color = params.color.toVec4();
    uint32_t base = command.vertexCount();

    command.vertices.emplace_back(c1, glm::vec2(u1, v1), color);
    command.vertices.emplace_back(c2, glm::vec2(u1, v2), color);
    command.vertices.emplace_back(c3, glm::vec2(u2, v2), color);
    command.vertices.emplace_back(c4, glm::vec2(u2, v1), color);

    for (uint32_t i : {0u, 1u, 2u, 2u, 3u, 0u}) {
        command.indices.push_back(base + i);
    }
}

// ============================================================================
// Conversions
// ============================================================================

DrawCommand toDrawCommand(const Sprite& sprite) {
    DrawCommand command;
    command.state = makeState(sprite.texture, sprite.options);

    Rect region = sprite.region.value_or(
        Rect(0.0f, 0.0f, static_cast<float>(sprite.texture.width),
             static_cast<float>(sprite.texture.height)));
    appendRegionQuad(command, sprite.texture, region, sprite.params);
    return command;
}

DrawCommand toDrawCommand(const AnimationFrame& frame) {
    DrawCommand command;
    command.state = makeState(frame.texture, frame.options);
    appendRegionQuad(command, frame.texture, frame.region, frame.params);
    return command;
}

DrawCommand toDrawCommand(const NineSlice& slice) {
    DrawCommand command;
    command.state = makeState(slice.texture, slice.options);
    command.vertices.reserve(36);
    command.indices.reserve(54);

    float tw = static_cast<float>(slice.texture.width);
    float th = static_cast<float>(slice.texture.height);
    const Rect& r = slice.region;

    float x1 = 0.0f;
    float y1 = 0.0f;
    float x2 = slice.left;
    float y2 = slice.top;
    float x3 = slice.width - slice.right;
    float y3 = slice.height - slice.bottom;
    float x4 = slice.width;
    float y4 = slice.height;

    float u1 = r.x / tw;
    float v1 = r.y / th;
    float u2 = (r.x + slice.left) / tw;
    float v2 = (r.y + slice.top) / th;
    float u3 = (r.x + r.width - slice.right) / tw;
    float v3 = (r.y + r.height - slice.bottom) / th;
    float u4 = (r.x + r.width) / tw;
    float v4 = (r.y + r.height) / th;

    const DrawParams& p = slice.params;

    // Top row
    appendQuad(command, x1, y1, x2, y2, u1, v1, u2, v2, p);
    appendQuad(command, x2, y1, x3, y2, u2, v1, u3, v2, p);
    appendQuad(command, x3, y1, x4, y2, u3, v1, u4, v2, p);

    // Middle row
    appendQuad(command, x1, y2, x2, y3, u1, v2, u2, v3, p);
    appendQuad(command, x2, y2, x3, y3, u2, v2, u3, v3, p);
    appendQuad(command, x3, y2, x4, y3, u3, v2, u4, v3, p);

    // Bottom row
    appendQuad(command, x1, y3, x2, y4, u1, v3, u2, v4, p);
    appendQuad(command, x2, y3, x3, y4, u2, v3, u3, v4, p);
    appendQuad(command, x3, y3, x4, y4, u3, v3, u4, v4, p);

    return command;
}

DrawCommand toDrawCommand(const MeshDraw& mesh) {
    DrawCommand command;
    command.state = makeState(mesh.texture, mesh.options);
    command.vertices.reserve(mesh.vertices.size());
    command.indices = mesh.indices;

    const DrawParams& p = mesh.params;
    float s = std::sin(p.rotation);
    float c = std::cos(p.rotation);
    glm::vec4 tint = p.color.toVec4();

    for (const Vertex& v : mesh.vertices) {
        glm::vec2 local = (v.position - p.origin) * p.scale;
        glm::vec2 world(p.position.x + c * local.x - s * local.y,
                        p.position.y + s * local.x + c * local.y);
        command.vertices.emplace_back(world, v.texCoord, v.color * tint);
    }
    return command;
}

DrawCommand toDrawCommand(const TextRun& text) {
    DrawCommand command;
    command.state = makeState(text.atlas, text.options);
    command.vertices.reserve(text.glyphs.size() * 4);
    command.indices.reserve(text.glyphs.size() * 6);

    float tw = static_cast<float>(text.atlas.width);
    float th = static_cast<float>(text.atlas.height);

    for (const Glyph& glyph : text.glyphs) {
        if (glyph.bounds.isEmpty()) {
            continue;  // Whitespace
        }
        appendQuad(command,
                   glyph.bounds.x, glyph.bounds.y, glyph.bounds.right(), glyph.bounds.bottom(),
                   glyph.region.x / tw, glyph.region.y / th,
                   glyph.region.right() / tw, glyph.region.bottom() / th,
                   text.params);
    }
    return command;
}

DrawCommand toDrawCommand(const Drawable& drawable) {
    return std::visit([](const auto& source) { return toDrawCommand(source); }, drawable);
}

NineSlice NineSlice::withBorder(TextureHandle texture, Rect region, float border,
                                float width, float height) {
    NineSlice slice;
    slice.texture = texture;
    slice.region = region;
    slice.left = border;
    slice.right = border;
    slice.top = border;
    slice.bottom = border;
    slice.width = width;
    slice.height = height;
    return slice;
}

} // namespace fine2d
