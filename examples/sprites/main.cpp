/**
 * @file main.cpp
 * @brief Sprites example - bouncing sprites on a letterboxed virtual canvas
 *
 * Demonstrates:
 * - Context creation from an EngineConfig
 * - Textures built from memory, drawn as sprites and animations
 * - An offscreen canvas composed once and drawn every frame
 * - Fixed-rate update with interpolated drawing
 */

#include <fine2d/fine2d.hpp>

#include <cmath>
#include <iostream>
#include <random>
#include <vector>

using namespace fine2d;

namespace {

constexpr uint32_t VIRTUAL_WIDTH = 320;
constexpr uint32_t VIRTUAL_HEIGHT = 180;
constexpr uint32_t TILE = 16;

struct Bunny {
    glm::vec2 position;
    glm::vec2 previous;
    glm::vec2 velocity;
};

// Four 16x16 frames side by side, each a different shade
std::vector<uint8_t> makeStrip() {
    std::vector<uint8_t> pixels(TILE * 4 * TILE * 4);
    for (uint32_t y = 0; y < TILE; y++) {
        for (uint32_t x = 0; x < TILE * 4; x++) {
            uint32_t frame = x / TILE;
            int dx = static_cast<int>(x % TILE) - 8;
            int dy = static_cast<int>(y) - 8;
            bool inside = dx * dx + dy * dy < 49;
            uint8_t* p = &pixels[(y * TILE * 4 + x) * 4];
            p[0] = static_cast<uint8_t>(120 + frame * 40);
            p[1] = 200;
            p[2] = static_cast<uint8_t>(255 - frame * 40);
            p[3] = inside ? 255 : 0;
        }
    }
    return pixels;
}

} // anonymous namespace

int main() {
    std::cout << "fine2d - Sprites\n\n";

    auto config = EngineConfig::create()
        .title("fine2d sprites")
        .windowSize(1280, 720)
        .virtualSize(VIRTUAL_WIDTH, VIRTUAL_HEIGHT)
        .scalingPolicy(ScalingPolicy::ShowAllPixelPerfect)
        .ticksPerSecond(60.0)
        .quitOnEscape()
        .build();
    if (!config) {
        std::cerr << config.error().describe() << "\n";
        return 1;
    }

    auto context = createVulkanContext(config.value());
    if (!context) {
        std::cerr << context.error().describe() << "\n";
        return 1;
    }
    Context& game = *context.value();
    auto& renderer = static_cast<VulkanRenderer&>(game.device());

    std::vector<uint8_t> strip = makeStrip();
    auto texture = renderer.createTexture(strip.data(), TILE * 4, TILE, FilterMode::Nearest);
    if (!texture) {
        std::cerr << texture.error().describe() << "\n";
        return 1;
    }

    std::vector<Rect> frames;
    for (uint32_t i = 0; i < 4; i++) {
        frames.emplace_back(static_cast<float>(i * TILE), 0.0f,
                            static_cast<float>(TILE), static_cast<float>(TILE));
    }
    Animation spin(texture.value(), frames, std::chrono::milliseconds(120));

    // Static backdrop drawn once into a canvas
    auto backdrop = renderer.createCanvas(VIRTUAL_WIDTH, VIRTUAL_HEIGHT);
    if (!backdrop) {
        std::cerr << backdrop.error().describe() << "\n";
        return 1;
    }
    bool backdropReady = false;

    std::mt19937 rng(42);
    std::uniform_real_distribution<float> speed(-90.0f, 90.0f);
    std::vector<Bunny> bunnies(64);
    for (auto& bunny : bunnies) {
        bunny.position = {VIRTUAL_WIDTH / 2.0f, VIRTUAL_HEIGHT / 2.0f};
        bunny.previous = bunny.position;
        bunny.velocity = {speed(rng), speed(rng)};
    }

    auto update = [&](FrameClock::Duration dt) -> Status {
        float seconds = std::chrono::duration<float>(dt).count();
        for (auto& bunny : bunnies) {
            bunny.previous = bunny.position;
            bunny.position += bunny.velocity * seconds;
            if (bunny.position.x < 0.0f || bunny.position.x > VIRTUAL_WIDTH - TILE) {
                bunny.velocity.x = -bunny.velocity.x;
            }
            if (bunny.position.y < 0.0f || bunny.position.y > VIRTUAL_HEIGHT - TILE) {
                bunny.velocity.y = -bunny.velocity.y;
            }
        }
        spin.advance(dt);
        return ok();
    };

    auto draw = [&](double blend) -> Status {
        if (!backdropReady) {
            Status status = game.setCanvas(backdrop.value().canvas);
            if (!status) return status;
            status = game.clear(Color::rgb(0.1f, 0.1f, 0.15f));
            if (!status) return status;

            for (uint32_t y = 0; y < VIRTUAL_HEIGHT; y += TILE) {
                for (uint32_t x = (y / TILE) % 2 * TILE; x < VIRTUAL_WIDTH; x += TILE * 2) {
                    MeshDraw tile;
                    tile.vertices = {
                        Vertex(0.0f, 0.0f, 0.0f, 0.0f, Color::rgb(0.15f, 0.15f, 0.2f)),
                        Vertex(0.0f, TILE, 0.0f, 0.0f, Color::rgb(0.15f, 0.15f, 0.2f)),
                        Vertex(TILE, TILE, 0.0f, 0.0f, Color::rgb(0.15f, 0.15f, 0.2f)),
                        Vertex(TILE, 0.0f, 0.0f, 0.0f, Color::rgb(0.15f, 0.15f, 0.2f)),
                    };
                    tile.indices = {0, 1, 2, 0, 2, 3};
                    tile.params.at({static_cast<float>(x), static_cast<float>(y)});
                    status = game.draw(tile);
                    if (!status) return status;
                }
            }

            status = game.setCanvas(CanvasHandle::screen());
            if (!status) return status;
            backdropReady = true;
        }

        Sprite background;
        background.texture = backdrop.value().texture;
        Status status = game.draw(background);
        if (!status) return status;

        float t = static_cast<float>(blend);
        for (const auto& bunny : bunnies) {
            glm::vec2 at = bunny.previous + (bunny.position - bunny.previous) * t;
            status = game.draw(spin.frame(DrawParams().at(at)));
            if (!status) return status;
        }
        return ok();
    };

    Status result = game.run(update, draw);
    if (!result) {
        std::cerr << "Exited with " << result.error().describe() << "\n";
        return 1;
    }

    const BatchStats& stats = game.batcher().stats();
    std::cout << "Last frame: " << stats.commands << " commands in "
              << stats.flushes << " flushes\n";
    return 0;
}
