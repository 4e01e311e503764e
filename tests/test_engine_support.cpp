/**
 * @file test_engine_support.cpp
 * @brief Engine support tests - Result/Status, EngineConfig, audio parameters
 *
 * This test verifies:
 * - Result and Status carry values and errors
 * - EngineConfig defaults, builder and validation
 * - AudioParams state transitions and lock-free storage
 */

#include <fine2d/core/error.hpp>
#include <fine2d/core/logging.hpp>
#include <fine2d/engine/audio_params.hpp>
#include <fine2d/engine/config.hpp>

#include <iostream>
#include <cassert>
#include <cstring>
#include <thread>

using namespace fine2d;
using namespace std::chrono_literals;

void test_result_and_status() {
    std::cout << "Testing: Result and Status... ";

    Result<int> good = 42;
    assert(good.isOk() && good);
    assert(good.value() == 42);
    assert(good.map([](int v) { return v * 2; }).value() == 84);

    Result<int> bad = makeError(ErrorKind::PlatformError, "no surface");
    assert(bad.isError() && !bad);
    assert(bad.valueOr(7) == 7);
    assert(bad.error().kind == ErrorKind::PlatformError);
    assert(bad.error().describe() == "PlatformError: no surface");
    assert(bad.map([](int v) { return v + 1; }).isError());

    Status fine = ok();
    assert(fine);
    Status failed = makeError(ErrorKind::CallbackError, "boom");
    assert(!failed);
    assert(std::strcmp(errorKindToString(failed.error().kind), "CallbackError") == 0);

    DeviceError deviceError("Failed to create buffer", -2);
    assert(deviceError.code() == -2);
    assert(std::string(deviceError.what()) == "Failed to create buffer");

    std::cout << "PASSED\n";
}

void test_config_defaults() {
    std::cout << "Testing: EngineConfig defaults are valid... ";

    EngineConfig config;
    assert(config.validate());
    assert(config.timestep == Timestep::fixedRate(60.0));
    assert(config.accumulatorCap == 150ms);
    assert(config.vertexCapacity == DEFAULT_VERTEX_CAPACITY);
    assert(config.scalingPolicy == ScalingPolicy::Letterbox);
    assert(config.framesInFlight == 2);
    assert(config.defaultFilter == FilterMode::Nearest);

    std::cout << "PASSED\n";
}

void test_config_builder() {
    std::cout << "Testing: EngineConfig builder and validation... ";

    Result<EngineConfig> built = EngineConfig::create()
        .title("Bunnies")
        .windowSize(800, 600)
        .virtualSize(320, 240)
        .ticksPerSecond(30.0)
        .scalingPolicy(ScalingPolicy::CropPixelPerfect)
        .letterboxColor(Color::BLUE)
        .vertexCapacity(4096)
        .quitOnEscape()
        .vsync(false)
        .build();
    assert(built);
    const EngineConfig& config = built.value();
    assert(config.title == "Bunnies");
    assert(config.windowWidth == 800 && config.virtualHeight == 240);
    assert(config.timestep.tickDuration == 33333333ns);
    assert(config.scalingPolicy == ScalingPolicy::CropPixelPerfect);
    assert(config.letterboxColor == Color::BLUE);
    assert(config.quitOnEscape && !config.vsync);

    Result<EngineConfig> zeroVirtual = EngineConfig::create().virtualSize(0, 240).build();
    assert(!zeroVirtual);
    assert(zeroVirtual.error().kind == ErrorKind::InvalidConfiguration);

    assert(!EngineConfig::create().ticksPerSecond(0.0).build());
    assert(!EngineConfig::create().vertexCapacity(0).build());
    assert(!EngineConfig::create().accumulatorCap(0ms).build());

    Result<EngineConfig> shortCap = EngineConfig::create()
        .timestep(Timestep::fixed(50ms))
        .accumulatorCap(20ms)
        .build();
    assert(!shortCap);
    assert(shortCap.error().kind == ErrorKind::InvalidConfiguration);
    assert(EngineConfig::create().timestep(Timestep::fixed(50ms)).accumulatorCap(50ms).build());
    assert(EngineConfig::create().timestep(Timestep::variable()).accumulatorCap(1ms).build());
    assert(!EngineConfig::create().framesInFlight(0).build());

    // Variable timestep has no tick duration to check
    assert(EngineConfig::create().timestep(Timestep::variable()).build());

    std::cout << "PASSED\n";
}

void test_audio_state_transitions() {
    std::cout << "Testing: AudioParams state transitions... ";

    auto params = std::make_shared<AudioParams>();
    SoundInstance sound(params);
    assert(sound.state() == SoundState::Playing);

    sound.pause();
    assert(sound.state() == SoundState::Paused);
    assert(!params->rewindPending());

    sound.stop();
    assert(sound.state() == SoundState::Stopped);
    assert(params->rewindPending());

    // Mixer consumes the rewind once
    assert(params->consumeRewind());
    assert(!params->consumeRewind());
    assert(sound.state() == SoundState::Stopped);

    sound.setState(SoundState::Playing);
    assert(sound.state() == SoundState::Playing);

    sound.setVolume(0.25f);
    sound.setSpeed(2.0f);
    assert(params->volume() == 0.25f);
    assert(params->speed() == 2.0f);

    assert(!params->repeating());
    sound.toggleRepeating();
    assert(params->repeating());

    std::cout << "PASSED\n";
}

void test_audio_cross_thread() {
    std::cout << "Testing: AudioParams toggles from two threads... ";

    assert(AudioParams::isLockFree());

    auto params = std::make_shared<AudioParams>(false, false);
    const int toggles = 10000;

    std::thread mixer([params]() {
        for (int i = 0; i < toggles; i++) {
            params->toggleRepeating();
        }
    });
    for (int i = 0; i < toggles; i++) {
        params->toggleRepeating();
    }
    mixer.join();

    // An even number of toggles in total lands back where it started
    assert(!params->repeating());

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "fine2d - Engine Support Tests\n";
    std::cout << "========================================\n\n";

    Logger::global().setMinLevel(LogLevel::Fatal);

    try {
        test_result_and_status();
        test_config_defaults();
        test_config_builder();
        test_audio_state_transitions();
        test_audio_cross_thread();

        std::cout << "\n========================================\n";
        std::cout << "All Engine Support tests PASSED!\n";
        std::cout << "========================================\n\n";
    }
    catch (const std::exception& e) {
        std::cerr << "\nTEST FAILED with exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
