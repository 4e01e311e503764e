/**
 * @file test_gpu_smoke.cpp
 * @brief GPU smoke tests - the Vulkan renderer behind a hidden window
 *
 * This test verifies:
 * - Platform and renderer come up with the white texture and screen canvas
 * - Textures and canvases can be created, drawn and released
 * - A canvas cannot sample itself while it is the draw target
 * - Frames record, composite and present through Batcher and GlfwPlatform
 * - The virtual canvas can be resized between frames
 * - Context::run drives a few real frames to a clean quit
 *
 * Needs a display and a Vulkan device; without them the test reports
 * itself as skipped (exit code 77).
 */

#include <fine2d/fine2d.hpp>
#include <fine2d/device/logical_device.hpp>
#include <fine2d/device/memory.hpp>
#include <fine2d/window/window.hpp>

#include <iostream>
#include <string>
#include <cassert>
#include <vector>

using namespace fine2d;

constexpr int SKIPPED = 77;

// Global test state
struct TestContext {
    EngineConfig config;
    std::unique_ptr<Context> context;
    GlfwPlatform* platform = nullptr;
    VulkanRenderer* renderer = nullptr;
};

static TestContext ctx;

bool setup_test_context() {
    std::cout << "Setting up test context...\n";

    auto config = EngineConfig::create()
        .title("fine2d GPU smoke test")
        .windowSize(640, 360)
        .virtualSize(320, 180)
        .framesInFlight(2)
        .validation(true)
        .shaderDirectory(FINE2D_SHADER_DIR)
        .logLevel(LogLevel::Warning)
        .build();
    assert(config);
    ctx.config = config.value();

    WindowPtr window;
    try {
        window = Window::create()
            .title(ctx.config.title)
            .size(ctx.config.windowWidth, ctx.config.windowHeight)
            .visible(false)
            .build();
    } catch (const DeviceError& e) {
        std::cout << "  No window system: " << e.what() << "\n";
        return false;
    }

    std::unique_ptr<GlfwPlatform> platform;
    try {
        platform = std::make_unique<GlfwPlatform>(std::move(window), ctx.config);
    } catch (const DeviceError& e) {
        std::cout << "  No usable Vulkan device: " << e.what() << "\n";
        return false;
    }

    ctx.platform = platform.get();
    std::unique_ptr<RenderDevice> renderer = platform->createRenderer(ctx.config);
    ctx.renderer = platform->renderer();
    ctx.context = std::make_unique<Context>(ctx.config, std::move(platform), std::move(renderer));

    std::cout << "  Renderer ready, " << ctx.renderer->maxVertices() << " max vertices per draw\n\n";
    return true;
}

void cleanup_test_context() {
    std::cout << "\nCleaning up test context...\n";
    ctx.context.reset();
    ctx.platform = nullptr;
    ctx.renderer = nullptr;
}

// Record one frame through the batcher and show it
void present_frame(const std::vector<Drawable>& drawables) {
    Batcher& batcher = ctx.context->batcher();
    assert(batcher.beginFrame());
    for (const auto& drawable : drawables) {
        Status status = batcher.draw(toDrawCommand(drawable));
        assert(status);
    }
    assert(batcher.presentFrame());

    CanvasScaler& scaler = ctx.context->scaler();
    assert(ctx.platform->bindViewport(scaler.viewport(), scaler.letterboxColor()));
    assert(ctx.platform->present());
}

std::vector<uint8_t> checkerboard(uint32_t size) {
    std::vector<uint8_t> pixels(size * size * 4);
    for (uint32_t y = 0; y < size; y++) {
        for (uint32_t x = 0; x < size; x++) {
            uint8_t value = ((x + y) % 2 == 0) ? 255 : 40;
            uint8_t* p = &pixels[(y * size + x) * 4];
            p[0] = value;
            p[1] = value;
            p[2] = value;
            p[3] = 255;
        }
    }
    return pixels;
}

void test_initial_resources() {
    std::cout << "Testing: Renderer starts with white texture and screen canvas... ";

    assert(ctx.renderer->textureCount() == 1);
    assert(ctx.renderer->canvasCount() == 1);
    assert(ctx.renderer->maxVertices() >= ctx.config.vertexCapacity);
    assert(ctx.renderer->currentFrame() == 0);

    // Rings, images and staging all go through the allocator
    MemoryAllocator& allocator = ctx.platform->device().allocator();
    assert(allocator.allocationCount() > 0);
    assert(allocator.totalAllocated() > 0);

    std::cout << "PASSED\n";
}

void test_texture_lifecycle() {
    std::cout << "Testing: Texture creation, drawing and release... ";

    auto pixels = checkerboard(8);
    auto texture = ctx.renderer->createTexture(pixels.data(), 8, 8, FilterMode::Nearest);
    assert(texture);
    assert(texture.value().id != 0);
    assert(texture.value().width == 8);
    assert(texture.value().height == 8);
    assert(ctx.renderer->textureCount() == 2);

    Sprite sprite;
    sprite.texture = texture.value();
    sprite.params.at({16.0f, 16.0f}).scaled({4.0f, 4.0f});
    present_frame({sprite});

    assert(ctx.renderer->releaseTexture(texture.value()));
    assert(ctx.renderer->textureCount() == 1);

    // The white texture is permanent
    Status status = ctx.renderer->releaseTexture(TextureHandle{});
    assert(!status);
    assert(status.error().kind == ErrorKind::InvalidConfiguration);

    std::cout << "PASSED\n";
}

void test_missing_texture_file() {
    std::cout << "Testing: Missing image file is a DeviceResourceError... ";

    auto texture = ctx.renderer->loadTexture("does/not/exist.png");
    assert(!texture);
    assert(texture.error().kind == ErrorKind::DeviceResourceError);
    assert(ctx.renderer->textureCount() == 1);

    std::cout << "PASSED\n";
}

void test_canvas_draw_and_sample() {
    std::cout << "Testing: Draw into a canvas, then draw the canvas... ";

    auto target = ctx.renderer->createCanvas(64, 64);
    assert(target);
    assert(ctx.renderer->canvasCount() == 2);

    Batcher& batcher = ctx.context->batcher();
    assert(batcher.beginFrame());
    assert(batcher.setCanvas(target.value().canvas));
    assert(batcher.clear(Color::rgba(0.0f, 0.0f, 0.0f, 0.0f)));

    MeshDraw triangle;
    triangle.vertices = {
        Vertex(32.0f, 4.0f, 0.0f, 0.0f, Color::rgb(1.0f, 0.2f, 0.2f)),
        Vertex(4.0f, 60.0f, 0.0f, 0.0f, Color::rgb(0.2f, 1.0f, 0.2f)),
        Vertex(60.0f, 60.0f, 0.0f, 0.0f, Color::rgb(0.2f, 0.2f, 1.0f)),
    };
    assert(batcher.draw(toDrawCommand(triangle)));

    // Sampling the canvas while it is the target is refused at flush
    Sprite self;
    self.texture = target.value().texture;
    Status status = batcher.draw(toDrawCommand(self));
    if (status) {
        status = batcher.flush();
    }
    assert(!status);
    assert(status.error().kind == ErrorKind::DeviceResourceError);

    assert(batcher.setCanvas(CanvasHandle::screen()));
    Sprite onScreen;
    onScreen.texture = target.value().texture;
    onScreen.params.at({100.0f, 50.0f});
    onScreen.options.blend = BlendMode::PremultipliedAlpha;
    assert(batcher.draw(toDrawCommand(onScreen)));
    assert(batcher.presentFrame());

    CanvasScaler& scaler = ctx.context->scaler();
    assert(ctx.platform->bindViewport(scaler.viewport(), scaler.letterboxColor()));
    assert(ctx.platform->present());

    // Releasing the texture also drops the canvas
    assert(ctx.renderer->releaseTexture(target.value().texture));
    assert(ctx.renderer->canvasCount() == 1);

    std::cout << "PASSED\n";
}

void test_blend_modes_and_scissor() {
    std::cout << "Testing: Every blend mode and a scissor rectangle... ";

    std::vector<Drawable> drawables;
    const BlendMode modes[] = {
        BlendMode::Alpha, BlendMode::PremultipliedAlpha, BlendMode::Additive, BlendMode::Multiply
    };
    float x = 0.0f;
    for (BlendMode mode : modes) {
        Sprite sprite;
        sprite.region = Rect(0.0f, 0.0f, 1.0f, 1.0f);
        sprite.params.at({x, 0.0f}).scaled({32.0f, 32.0f}).tinted(Color::rgba(1.0f, 0.5f, 0.0f, 0.5f));
        sprite.options.blend = mode;
        sprite.options.scissor = IRect(0, 0, 100, 20);
        drawables.push_back(sprite);
        x += 40.0f;
    }
    present_frame(drawables);

    // Four blend modes, four pipelines, four flushes
    assert(ctx.context->batcher().stats().flushes == 4);

    std::cout << "PASSED\n";
}

void test_custom_shader() {
    std::cout << "Testing: A loaded shader gets its own pipeline... ";

    std::string dir = FINE2D_SHADER_DIR;
    auto shader = ctx.renderer->loadShader(dir + "/sprite.vert.spv", dir + "/sprite.frag.spv");
    assert(shader);
    assert(shader.value().id != 0);

    Sprite plain;
    plain.params.scaled({8.0f, 8.0f});
    Sprite shaded = plain;
    shaded.options.shader = shader.value();
    present_frame({plain, shaded});
    assert(ctx.context->batcher().stats().flushes == 2);

    auto missing = ctx.renderer->loadShader("missing.vert.spv", "missing.frag.spv");
    assert(!missing);
    assert(missing.error().kind == ErrorKind::DeviceResourceError);

    std::cout << "PASSED\n";
}

void test_many_frames() {
    std::cout << "Testing: More frames than frames in flight... ";

    for (int frame = 0; frame < 6; frame++) {
        std::vector<Drawable> drawables;
        for (int i = 0; i < 200; i++) {
            Sprite sprite;
            sprite.params.at({static_cast<float>(i % 20) * 16.0f, static_cast<float>(i / 20) * 16.0f})
                .scaled({8.0f, 8.0f});
            drawables.push_back(sprite);
        }
        present_frame(drawables);
    }

    assert(ctx.renderer->currentFrame() < ctx.config.framesInFlight);
    assert(ctx.context->batcher().stats().commands == 200);

    std::cout << "PASSED\n";
}

void test_resize_virtual_canvas() {
    std::cout << "Testing: Virtual canvas resize between frames... ";

    assert(ctx.context->setVirtualResolution(160, 90));
    assert(ctx.context->scaler().virtualWidth() == 160);
    present_frame({Sprite{}});

    // Not while a frame is being recorded
    assert(ctx.context->batcher().beginFrame());
    Status status = ctx.renderer->resizeScreen(200, 100);
    assert(!status);
    assert(ctx.context->batcher().presentFrame());
    assert(ctx.platform->present());

    assert(ctx.context->setVirtualResolution(320, 180));

    std::cout << "PASSED\n";
}

void test_swapchain_rebuild() {
    std::cout << "Testing: Frames survive a forced swap chain rebuild... ";

    ctx.renderer->markSwapChainDirty();
    present_frame({Sprite{}});
    present_frame({Sprite{}});

    std::cout << "PASSED\n";
}

void test_context_run() {
    std::cout << "Testing: Context::run drives real frames... ";

    int ticks = 0;
    int draws = 0;
    Status result = ctx.context->run(
        [&](FrameClock::Duration) -> Status {
            ticks++;
            return ok();
        },
        [&](double) -> Status {
            draws++;
            if (draws == 5) {
                ctx.context->quit();
            }
            Sprite sprite;
            sprite.params.at({static_cast<float>(draws) * 10.0f, 20.0f}).scaled({16.0f, 16.0f});
            return ctx.context->draw(sprite);
        });

    assert(result);
    assert(draws == 5);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "fine2d - GPU Smoke Tests\n";
    std::cout << "========================================\n\n";

    try {
        if (!setup_test_context()) {
            std::cout << "SKIPPED\n";
            return SKIPPED;
        }

        test_initial_resources();
        test_texture_lifecycle();
        test_missing_texture_file();
        test_canvas_draw_and_sample();
        test_blend_modes_and_scissor();
        test_custom_shader();
        test_many_frames();
        test_resize_virtual_canvas();
        test_swapchain_rebuild();
        test_context_run();

        cleanup_test_context();

        std::cout << "\n========================================\n";
        std::cout << "All GPU Smoke tests PASSED!\n";
        std::cout << "========================================\n\n";
    }
    catch (const std::exception& e) {
        std::cerr << "\nTEST FAILED with exception: " << e.what() << "\n";
        cleanup_test_context();
        return 1;
    }

    return 0;
}
