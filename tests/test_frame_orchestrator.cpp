/**
 * @file test_frame_orchestrator.cpp
 * @brief FrameOrchestrator and Context tests against scripted doubles
 *
 * This test verifies:
 * - Per-iteration order: events, ticks, draw, present
 * - Resize and mouse events are routed through the scaler
 * - Quit events, quit() and quit-on-escape end the loop
 * - Callback errors halt the loop and come out of run() unchanged
 * - An interrupted frame is flushed on the way out
 * - Context wires everything from an EngineConfig
 */

#include <fine2d/core/logging.hpp>
#include <fine2d/engine/context.hpp>
#include <fine2d/engine/frame_orchestrator.hpp>

#include "test_doubles.hpp"

#include <iostream>
#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fine2d;
using namespace fine2d::testing;
using namespace std::chrono_literals;

namespace {

/// Every now() call moves time forward by a fixed step
class SteppingTimeSource : public TimeSource {
public:
    explicit SteppingTimeSource(std::chrono::nanoseconds step) : step_(step) {}
    std::chrono::nanoseconds now() override {
        now_ += step_;
        return now_;
    }

private:
    std::chrono::nanoseconds step_;
    std::chrono::nanoseconds now_{0};
};

/// Platform that logs calls into a shared trace
class TracingPlatform : public ScriptedPlatform {
public:
    explicit TracingPlatform(std::vector<std::string>& trace) : trace_(trace) {}

    std::vector<PlatformEvent> pollEvents() override {
        trace_.push_back("poll");
        return ScriptedPlatform::pollEvents();
    }
    Status bindViewport(const Rect& viewport, const Color& color) override {
        trace_.push_back("viewport");
        return ScriptedPlatform::bindViewport(viewport, color);
    }
    Status present() override {
        trace_.push_back("present");
        return ScriptedPlatform::present();
    }

private:
    std::vector<std::string>& trace_;
};

struct Harness {
    explicit Harness(std::chrono::nanoseconds frameTime = 10ms,
                     Timestep timestep = Timestep::fixed(10ms))
        : time(frameTime)
        , clock(timestep, 150ms, &time)
        , scaler(640, 360, 1280, 720)
        , batcher(device, 1024)
        , loop(platform, batcher, clock, scaler) {}

    RecordingDevice device;
    ScriptedPlatform platform;
    SteppingTimeSource time;
    FrameClock clock;
    CanvasScaler scaler;
    Batcher batcher;
    FrameOrchestrator loop;
};

} // anonymous namespace

void test_runs_until_quit_event() {
    std::cout << "Testing: Loop runs until the platform reports quit... ";

    Harness h;
    h.platform.addIdleFrames(5);

    int updates = 0;
    int draws = 0;
    Status result = h.loop.run(
        [&](FrameClock::Duration dt) {
            assert(dt == 10ms);
            updates++;
            return ok();
        },
        [&](double blend) {
            assert(blend >= 0.0 && blend < 1.0);
            draws++;
            return ok();
        });

    assert(result);
    assert(draws == 5);
    assert(h.platform.presents == 5);
    assert(h.device.frames == 5 && h.device.endedFrames == 5);
    // First frame sees zero elapsed time, then one 10ms tick per frame
    assert(updates == 4);
    assert(h.loop.frameNumber() == 5);
    assert(h.loop.tickNumber() == 4);
    assert(!h.loop.isRunning());

    std::cout << "PASSED\n";
}

void test_iteration_order() {
    std::cout << "Testing: Events, ticks, draw, viewport, present order... ";

    std::vector<std::string> trace;
    RecordingDevice device;
    TracingPlatform platform(trace);
    platform.addIdleFrames(2);
    SteppingTimeSource time(25ms);
    FrameClock clock(Timestep::fixed(10ms), 150ms, &time);
    CanvasScaler scaler(640, 360, 1280, 720);
    Batcher batcher(device, 1024);
    FrameOrchestrator loop(platform, batcher, clock, scaler);

    Status result = loop.run(
        [&](FrameClock::Duration) { trace.push_back("update"); return ok(); },
        [&](double) {
            trace.push_back("draw");
            return batcher.draw(quadCommand(1, 0.0f));
        });
    assert(result);

    std::vector<std::string> expected = {
        "poll", "draw", "viewport", "present",                       // 0 elapsed
        "poll", "update", "update", "draw", "viewport", "present",   // 25ms -> 2 ticks
        "poll"                                                        // Quit
    };
    assert(trace == expected);
    assert(device.batches.size() == 2);
    assert(platform.lastViewport == scaler.viewport());

    std::cout << "PASSED\n";
}

void test_resize_and_mouse_routing() {
    std::cout << "Testing: Resize and mouse events go through the scaler... ";

    Harness h;
    event::MouseMoved move;
    move.window = {800.0, 512.0};
    h.platform.addFrame({event::Resized{1600, 1024}, move});
    h.platform.addIdleFrames(1);

    glm::dvec2 canvasPos{-1.0};
    h.loop.setEventCallback([&](const PlatformEvent& ev) {
        if (auto* m = std::get_if<event::MouseMoved>(&ev)) {
            canvasPos = m->canvas;
        }
        return ok();
    });

    uint32_t widthSeenByUpdate = 0;
    Status result = h.loop.run(
        [&](FrameClock::Duration) {
            widthSeenByUpdate = h.scaler.windowWidth();
            return ok();
        },
        [&](double) { return ok(); });
    assert(result);

    // 640x360 in 1600x1024: scale 2.5, viewport (0, 62, 1600, 900)
    assert(h.scaler.viewport() == Rect(0.0f, 62.0f, 1600.0f, 900.0f));
    assert(widthSeenByUpdate == 1600);
    assert(canvasPos.x == 320.0 && canvasPos.y == 180.0);
    assert(*h.platform.lastViewport == h.scaler.viewport());

    std::cout << "PASSED\n";
}

void test_quit_from_callback() {
    std::cout << "Testing: quit() from a callback ends the loop... ";

    Harness h;
    h.platform.addIdleFrames(100);

    int draws = 0;
    Status result = h.loop.run(
        [&](FrameClock::Duration) { return ok(); },
        [&](double) {
            if (++draws == 3) {
                h.loop.quit();
            }
            return ok();
        });

    assert(result);
    assert(draws == 3);
    assert(h.platform.presents == 3);

    std::cout << "PASSED\n";
}

void test_quit_on_escape() {
    std::cout << "Testing: Escape quits only when enabled... ";

    {
        Harness h;
        h.platform.addFrame({event::KeyPressed{KEY_ESCAPE, 9, Modifier::None, false}});
        h.platform.addIdleFrames(3);
        Status result = h.loop.run(nullptr, nullptr);
        assert(result);
        assert(h.platform.presents == 4);
    }
    {
        Harness h;
        h.loop.setQuitOnEscape(true);
        h.platform.addFrame({event::KeyPressed{KEY_ESCAPE, 9, Modifier::None, false}});
        h.platform.addIdleFrames(3);
        Status result = h.loop.run(nullptr, nullptr);
        assert(result);
        assert(h.platform.presents == 0);
    }

    std::cout << "PASSED\n";
}

void test_callback_error_halts() {
    std::cout << "Testing: Callback errors halt and propagate unchanged... ";

    Harness h;
    h.platform.addIdleFrames(10);

    int updates = 0;
    Status result = h.loop.run(
        [&](FrameClock::Duration) {
            if (++updates == 3) {
                return Status(makeError(ErrorKind::CallbackError, "player fell out of world"));
            }
            return ok();
        },
        [&](double) { return ok(); });

    assert(!result);
    assert(result.error().kind == ErrorKind::CallbackError);
    assert(result.error().message == "player fell out of world");
    assert(updates == 3);
    assert(h.platform.presents == 3);

    std::cout << "PASSED\n";
}

void test_interrupted_frame_is_flushed() {
    std::cout << "Testing: Draw failure mid-frame still flushes... ";

    Harness h;
    h.platform.addIdleFrames(10);

    Status result = h.loop.run(
        [&](FrameClock::Duration) { return ok(); },
        [&](double) -> Status {
            Status s = h.batcher.draw(quadCommand(1, 0.0f));
            if (!s) {
                return s;
            }
            if (h.loop.frameNumber() == 1) {
                throw std::runtime_error("sprite sheet missing");
            }
            return ok();
        });

    assert(!result);
    assert(result.error().kind == ErrorKind::CallbackError);
    assert(result.error().message.find("sprite sheet missing") != std::string::npos);

    // Frame 0 presented normally, frame 1 flushed by teardown but never presented
    assert(h.device.batches.size() == 2);
    assert(h.device.endedFrames == 2);
    assert(h.platform.presents == 1);
    assert(!h.batcher.inFrame());

    std::cout << "PASSED\n";
}

void test_device_and_platform_errors() {
    std::cout << "Testing: Device and platform failures stop the loop... ";

    {
        Harness h;
        h.platform.addIdleFrames(5);
        Status result = h.loop.run(
            [&](FrameClock::Duration) { return ok(); },
            [&](double) {
                h.device.throwNextSubmit = true;
                return h.batcher.draw(quadCommand(1, 0.0f));
            });
        assert(!result);
        assert(result.error().kind == ErrorKind::DeviceResourceError);
        assert(h.platform.presents == 0);
    }
    {
        Harness h;
        h.platform.addIdleFrames(5);
        h.platform.failPresent = true;
        Status result = h.loop.run(nullptr, nullptr);
        assert(!result);
        assert(result.error().kind == ErrorKind::PlatformError);
    }

    std::cout << "PASSED\n";
}

void test_variable_timestep() {
    std::cout << "Testing: Variable timestep passes raw deltas... ";

    Harness h(7ms, Timestep::variable());
    h.platform.addIdleFrames(4);

    std::vector<FrameClock::Duration> deltas;
    std::vector<double> blends;
    Status result = h.loop.run(
        [&](FrameClock::Duration dt) { deltas.push_back(dt); return ok(); },
        [&](double blend) { blends.push_back(blend); return ok(); });

    assert(result);
    std::vector<FrameClock::Duration> expected = {0ms, 7ms, 7ms, 7ms};
    assert(deltas == expected);
    for (double b : blends) {
        assert(b == 1.0);
    }

    std::cout << "PASSED\n";
}

void test_context_from_config() {
    std::cout << "Testing: Context wires engine objects from config... ";

    auto config = EngineConfig::create()
        .virtualSize(320, 180)
        .vertexCapacity(64)
        .scalingPolicy(ScalingPolicy::ShowAllPixelPerfect)
        .letterboxColor(Color::BLUE)
        .logLevel(LogLevel::Fatal)
        .build();
    assert(config);

    auto platform = std::make_unique<ScriptedPlatform>(glm::uvec2(1280, 720));
    auto device = std::make_unique<RecordingDevice>();
    ScriptedPlatform* platformPtr = platform.get();
    RecordingDevice* devicePtr = device.get();
    platformPtr->addIdleFrames(2);

    SteppingTimeSource time(20ms);
    Context context(config.value(), std::move(platform), std::move(device), &time);
    assert(context.batcher().capacity() == 64);
    assert(context.scaler().scale().x == 4.0f);

    TextureHandle texture{5, 64, 64};
    Status result = context.run(
        [&](FrameClock::Duration) { return ok(); },
        [&](double) -> Status {
            for (int i = 0; i < 20; i++) {
                Sprite sprite;
                sprite.texture = texture;
                sprite.params.at({i * 8.0f, 0.0f});
                Status s = context.draw(sprite);
                if (!s) {
                    return s;
                }
            }
            return ok();
        });

    assert(result);
    // 20 quads = 80 vertices under a 64-vertex ceiling: 2 flushes per frame
    assert(devicePtr->batches.size() == 4);
    assert(platformPtr->lastLetterbox == Color::BLUE);

    // Virtual resolution changes reach both the device and the scaler
    assert(context.setVirtualResolution(640, 360));
    assert(devicePtr->screenSize == glm::uvec2(640, 360));
    assert(context.scaler().scale().x == 2.0f);
    Status rejected = context.setVirtualResolution(0, 360);
    assert(!rejected);
    assert(rejected.error().kind == ErrorKind::InvalidConfiguration);

    // Invalid configs are rejected before anything is built
    auto bad = EngineConfig::create().vertexCapacity(0).build();
    assert(!bad);
    assert(bad.error().kind == ErrorKind::InvalidConfiguration);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "fine2d - Frame Orchestrator Tests\n";
    std::cout << "========================================\n\n";

    Logger::global().setMinLevel(LogLevel::Fatal);

    try {
        test_runs_until_quit_event();
        test_iteration_order();
        test_resize_and_mouse_routing();
        test_quit_from_callback();
        test_quit_on_escape();
        test_callback_error_halts();
        test_interrupted_frame_is_flushed();
        test_device_and_platform_errors();
        test_variable_timestep();
        test_context_from_config();

        std::cout << "\n========================================\n";
        std::cout << "All Frame Orchestrator tests PASSED!\n";
        std::cout << "========================================\n\n";
    }
    catch (const std::exception& e) {
        std::cerr << "\nTEST FAILED with exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
