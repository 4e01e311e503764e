/**
 * @file test_drawables.cpp
 * @brief Drawable conversion tests - quads, nine-slices, meshes, text, animation
 *
 * This test verifies:
 * - Sprite quads honour origin, scale, flip, rotation and color
 * - Texture regions map to normalized coordinates
 * - Nine-slice produces nine quads with fixed-size corners
 * - Meshes and text runs carry their state into the command
 * - Animation advances with elapsed time, loops or holds the last frame
 */

#include <fine2d/core/logging.hpp>
#include <fine2d/graphics/animation.hpp>
#include <fine2d/graphics/drawable.hpp>

#include <iostream>
#include <cassert>
#include <cmath>

using namespace fine2d;
using namespace std::chrono_literals;

namespace {

bool near(float a, float b, float eps = 1e-4f) {
    return std::abs(a - b) < eps;
}

bool near(glm::vec2 a, glm::vec2 b) {
    return near(a.x, b.x) && near(a.y, b.y);
}

} // anonymous namespace

void test_sprite_quad() {
    std::cout << "Testing: Sprite quad corners and UVs... ";

    Sprite sprite;
    sprite.texture = TextureHandle{4, 32, 16};
    sprite.params.at({100.0f, 50.0f}).tinted(Color::RED);

    DrawCommand cmd = toDrawCommand(sprite);
    assert(cmd.state.texture.id == 4);
    assert(cmd.vertices.size() == 4);
    assert(cmd.indices == std::vector<uint32_t>({0, 1, 2, 2, 3, 0}));

    // Top-left, bottom-left, bottom-right, top-right
    assert(cmd.vertices[0].position == glm::vec2(100.0f, 50.0f));
    assert(cmd.vertices[1].position == glm::vec2(100.0f, 66.0f));
    assert(cmd.vertices[2].position == glm::vec2(132.0f, 66.0f));
    assert(cmd.vertices[3].position == glm::vec2(132.0f, 50.0f));

    assert(cmd.vertices[0].texCoord == glm::vec2(0.0f, 0.0f));
    assert(cmd.vertices[2].texCoord == glm::vec2(1.0f, 1.0f));
    for (const auto& v : cmd.vertices) {
        assert(v.color == glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
    }

    std::cout << "PASSED\n";
}

void test_sprite_region_origin_scale() {
    std::cout << "Testing: Region, origin and scale... ";

    Sprite sprite;
    sprite.texture = TextureHandle{1, 64, 64};
    sprite.region = Rect(16.0f, 32.0f, 16.0f, 16.0f);
    sprite.params.at({10.0f, 10.0f}).withOrigin({8.0f, 8.0f}).scaled({2.0f, 3.0f});

    DrawCommand cmd = toDrawCommand(sprite);
    assert(cmd.vertices[0].position == glm::vec2(10.0f - 16.0f, 10.0f - 24.0f));
    assert(cmd.vertices[2].position == glm::vec2(10.0f + 16.0f, 10.0f + 24.0f));
    assert(cmd.vertices[0].texCoord == glm::vec2(0.25f, 0.5f));
    assert(cmd.vertices[2].texCoord == glm::vec2(0.5f, 0.75f));

    std::cout << "PASSED\n";
}

void test_negative_scale_flips() {
    std::cout << "Testing: Negative scale flips texture, keeps winding... ";

    Sprite sprite;
    sprite.texture = TextureHandle{1, 16, 16};
    sprite.params.scaled({-1.0f, 1.0f});

    DrawCommand cmd = toDrawCommand(sprite);
    // Corners stay left-to-right, the texture runs right-to-left
    assert(cmd.vertices[0].position == glm::vec2(-16.0f, 0.0f));
    assert(cmd.vertices[2].position == glm::vec2(0.0f, 16.0f));
    assert(cmd.vertices[0].texCoord == glm::vec2(1.0f, 0.0f));
    assert(cmd.vertices[2].texCoord == glm::vec2(0.0f, 1.0f));

    std::cout << "PASSED\n";
}

void test_rotation() {
    std::cout << "Testing: Rotation about the origin... ";

    Sprite sprite;
    sprite.texture = TextureHandle{1, 10, 10};
    sprite.params.at({50.0f, 50.0f}).withOrigin({5.0f, 5.0f}).rotated(3.14159265f / 2.0f);

    DrawCommand cmd = toDrawCommand(sprite);
    // Quarter turn: top-left (-5, -5) goes to (5, -5)
    assert(near(cmd.vertices[0].position, glm::vec2(55.0f, 45.0f)));
    assert(near(cmd.vertices[2].position, glm::vec2(45.0f, 55.0f)));

    std::cout << "PASSED\n";
}

void test_nine_slice() {
    std::cout << "Testing: Nine-slice geometry... ";

    NineSlice panel = NineSlice::withBorder(TextureHandle{9, 32, 32},
                                            Rect(0.0f, 0.0f, 32.0f, 32.0f), 4.0f,
                                            200.0f, 100.0f);
    panel.params.at({10.0f, 20.0f});

    DrawCommand cmd = toDrawCommand(panel);
    assert(cmd.vertices.size() == 36);
    assert(cmd.indices.size() == 54);
    assert(cmd.state.texture.id == 9);

    // Top-left corner keeps its 4x4 size
    assert(cmd.vertices[0].position == glm::vec2(10.0f, 20.0f));
    assert(cmd.vertices[2].position == glm::vec2(14.0f, 24.0f));
    assert(cmd.vertices[2].texCoord == glm::vec2(4.0f / 32.0f, 4.0f / 32.0f));

    // Center quad stretches to fill the rest
    const Vertex* center = &cmd.vertices[16];
    assert(center[0].position == glm::vec2(14.0f, 24.0f));
    assert(center[2].position == glm::vec2(206.0f, 116.0f));
    assert(center[0].texCoord == glm::vec2(4.0f / 32.0f, 4.0f / 32.0f));
    assert(center[2].texCoord == glm::vec2(28.0f / 32.0f, 28.0f / 32.0f));

    // Bottom-right corner
    const Vertex* br = &cmd.vertices[32];
    assert(br[2].position == glm::vec2(210.0f, 120.0f));
    assert(br[2].texCoord == glm::vec2(1.0f, 1.0f));

    // Indices reference each quad's own vertices
    assert(cmd.indices[48] == 32 && cmd.indices[53] == 32);

    std::cout << "PASSED\n";
}

void test_mesh_and_text() {
    std::cout << "Testing: Mesh transform and text runs... ";

    MeshDraw mesh;
    mesh.vertices = {Vertex(0, 0, 0, 0, Color::WHITE),
                     Vertex(10, 0, 1, 0, Color(1.0f, 1.0f, 1.0f, 0.5f)),
                     Vertex(0, 10, 0, 1, Color::WHITE)};
    mesh.params.at({5.0f, 5.0f}).scaled({2.0f, 2.0f}).tinted(Color(0.5f, 1.0f, 1.0f, 1.0f));
    mesh.options.blend = BlendMode::Additive;

    DrawCommand cmd = toDrawCommand(mesh);
    assert(cmd.state.texture == TextureHandle::white());
    assert(cmd.state.blend == BlendMode::Additive);
    assert(cmd.indices.empty());
    assert(cmd.vertices[1].position == glm::vec2(25.0f, 5.0f));
    assert(cmd.vertices[1].color == glm::vec4(0.5f, 1.0f, 1.0f, 0.5f));

    TextRun text;
    text.atlas = TextureHandle{11, 128, 64};
    text.glyphs = {
        {Rect(0.0f, 0.0f, 8.0f, 12.0f), Rect(0.0f, 0.0f, 8.0f, 12.0f)},
        {Rect(8.0f, 0.0f, 0.0f, 0.0f), Rect()},                        // Space
        {Rect(12.0f, 2.0f, 8.0f, 10.0f), Rect(64.0f, 32.0f, 8.0f, 10.0f)},
    };
    text.params.at({100.0f, 100.0f});
    text.options.scissor = IRect(0, 0, 320, 180);

    cmd = toDrawCommand(text);
    assert(cmd.vertices.size() == 8);
    assert(cmd.indices.size() == 12);
    assert(cmd.state.scissor == IRect(0, 0, 320, 180));
    assert(cmd.vertices[4].position == glm::vec2(112.0f, 102.0f));
    assert(cmd.vertices[4].texCoord == glm::vec2(0.5f, 0.5f));

    std::cout << "PASSED\n";
}

void test_drawable_variant() {
    std::cout << "Testing: Drawable variant dispatch... ";

    std::vector<Drawable> drawables;
    Sprite s;
    s.texture = TextureHandle{1, 8, 8};
    drawables.emplace_back(s);
    drawables.emplace_back(NineSlice::withBorder(TextureHandle{2, 8, 8},
                                                 Rect(0, 0, 8, 8), 2.0f, 20.0f, 20.0f));
    drawables.emplace_back(MeshDraw{});

    size_t expectedVertices[] = {4, 36, 0};
    for (size_t i = 0; i < drawables.size(); i++) {
        assert(toDrawCommand(drawables[i]).vertices.size() == expectedVertices[i]);
    }

    std::cout << "PASSED\n";
}

void test_animation_advance() {
    std::cout << "Testing: Animation advances with elapsed time... ";

    std::vector<Rect> frames = {Rect(0, 0, 16, 16), Rect(16, 0, 16, 16), Rect(32, 0, 16, 16)};
    Animation anim(TextureHandle{3, 48, 16}, frames, 100ms);

    assert(anim.currentFrameIndex() == 0);
    anim.advance(99ms);
    assert(anim.currentFrameIndex() == 0);
    anim.advance(1ms);
    assert(anim.currentFrameIndex() == 1);

    // Large steps skip frames and wrap
    anim.advance(250ms);
    assert(anim.currentFrameIndex() == 0);
    assert(anim.currentFrameTime() == 50ms);

    AnimationFrame f = anim.frame(DrawParams().at({4.0f, 4.0f}));
    assert(f.region == frames[0]);
    DrawCommand cmd = toDrawCommand(f);
    assert(cmd.vertices[3].texCoord == glm::vec2(16.0f / 48.0f, 0.0f));

    anim.restart();
    assert(anim.currentFrameIndex() == 0);
    assert(anim.currentFrameTime() == 0ms);

    std::cout << "PASSED\n";
}

void test_animation_non_repeating() {
    std::cout << "Testing: Non-repeating animation holds last frame... ";

    std::vector<Rect> frames = {Rect(0, 0, 8, 8), Rect(8, 0, 8, 8)};
    Animation anim(TextureHandle{3, 16, 8}, frames, 50ms);
    anim.setRepeating(false);

    anim.advance(75ms);
    assert(anim.currentFrameIndex() == 1);
    assert(!anim.isFinished());

    anim.advance(1s);
    assert(anim.currentFrameIndex() == 1);
    assert(anim.isFinished());

    anim.setFrames({Rect(0, 0, 4, 4)});
    assert(anim.currentFrameIndex() == 0);
    assert(!anim.isFinished());

    bool threw = false;
    try {
        anim.setCurrentFrameIndex(5);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "fine2d - Drawable Tests\n";
    std::cout << "========================================\n\n";

    Logger::global().setMinLevel(LogLevel::Fatal);

    try {
        test_sprite_quad();
        test_sprite_region_origin_scale();
        test_negative_scale_flips();
        test_rotation();
        test_nine_slice();
        test_mesh_and_text();
        test_drawable_variant();
        test_animation_advance();
        test_animation_non_repeating();

        std::cout << "\n========================================\n";
        std::cout << "All Drawable tests PASSED!\n";
        std::cout << "========================================\n\n";
    }
    catch (const std::exception& e) {
        std::cerr << "\nTEST FAILED with exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
