/**
 * @file test_frame_clock.cpp
 * @brief FrameClock tests - fixed and variable timesteps, cap, blend factor
 *
 * This test verifies:
 * - Fixed ticks equal floor(min(accumulated, cap) / T)
 * - The blend factor stays in [0, 1)
 * - The first step sees zero elapsed time
 * - Variable mode runs exactly one tick with the raw delta
 * - FPS averaging and reset()
 * - An accumulator cap below one fixed tick is rejected
 */

#include <fine2d/core/logging.hpp>
#include <fine2d/engine/frame_clock.hpp>

#include <iostream>
#include <cassert>
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace fine2d;
using namespace std::chrono_literals;

void test_first_step_is_zero() {
    std::cout << "Testing: First step sees zero elapsed time... ";

    ManualTimeSource time;
    time.set(5s);
    FrameClock clock(Timestep::fixedRate(60.0), FrameClock::DEFAULT_ACCUMULATOR_CAP, &time);

    ClockStep step = clock.step();
    assert(step.elapsed == 0ns);
    assert(step.ticks == 0);
    assert(clock.blendFactor() == 0.0);

    time.advance(20ms);
    step = clock.step();
    assert(step.elapsed == 20ms);
    assert(step.ticks == 1);

    std::cout << "PASSED\n";
}

void test_tick_duration_from_rate() {
    std::cout << "Testing: Tick duration from ticks per second... ";

    Timestep t = Timestep::fixedRate(60.0);
    assert(t.isFixed());
    assert(t.tickDuration == 16666666ns);
    assert(Timestep::fixed(10ms).tickDuration == 10ms);
    assert(!Timestep::variable().isFixed());

    bool threw = false;
    try {
        Timestep::fixedRate(0.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_cap_limits_ticks() {
    std::cout << "Testing: 500ms step with 150ms cap gives 9 ticks... ";

    FrameClock clock(Timestep::fixedRate(60.0), 150ms);
    ClockStep step = clock.advance(500ms);

    assert(step.ticks == 9);
    assert(step.dropped == 350ms);
    assert(step.tickDelta == 16666666ns);
    assert(step.blend >= 0.0 && step.blend < 1.0);

    // 150ms - 9 * 16666666ns = 6ns left over
    assert(clock.accumulated() == 6ns);

    std::cout << "PASSED\n";
}

void test_fixed_tick_count_matches_formula() {
    std::cout << "Testing: Tick counts over irregular deltas... ";

    const auto tick = 10ms;
    const auto cap = 45ms;
    FrameClock clock(Timestep::fixed(tick), cap);

    const std::chrono::nanoseconds deltas[] = {3ms, 7ms, 12ms, 1ms, 40ms, 100ms, 0ms, 9ms, 25ms};
    std::chrono::nanoseconds expectedAccumulator{0};

    for (auto dt : deltas) {
        std::chrono::nanoseconds total = std::min(expectedAccumulator + dt,
                                                  std::chrono::nanoseconds(cap));
        uint32_t expectedTicks = static_cast<uint32_t>(total / tick);
        expectedAccumulator = total - expectedTicks * tick;

        ClockStep step = clock.advance(dt);
        assert(step.ticks == expectedTicks);
        assert(step.ticks <= cap / tick);
        assert(clock.accumulated() == expectedAccumulator);
        assert(step.blend >= 0.0 && step.blend < 1.0);
        assert(std::abs(step.blend - static_cast<double>(expectedAccumulator.count()) /
                                     static_cast<double>(std::chrono::nanoseconds(tick).count()))
               < 1e-12);
    }

    std::cout << "PASSED\n";
}

void test_variable_mode() {
    std::cout << "Testing: Variable mode runs one tick with raw delta... ";

    ManualTimeSource time;
    FrameClock clock(Timestep::variable(), FrameClock::DEFAULT_ACCUMULATOR_CAP, &time);

    ClockStep first = clock.step();
    assert(first.ticks == 1);
    assert(first.tickDelta == 0ns);

    time.advance(33ms);
    ClockStep step = clock.step();
    assert(step.ticks == 1);
    assert(step.tickDelta == 33ms);
    assert(step.blend == 1.0);
    assert(clock.deltaTime() == 33ms);

    // No cap in variable mode
    time.advance(2s);
    step = clock.step();
    assert(step.ticks == 1);
    assert(step.tickDelta == 2s);
    assert(step.dropped == 0ns);

    std::cout << "PASSED\n";
}

void test_set_timestep_resets() {
    std::cout << "Testing: Changing timestep resets the accumulator... ";

    ManualTimeSource time;
    FrameClock clock(Timestep::fixed(10ms), 150ms, &time);
    clock.step();
    time.advance(25ms);
    clock.step();
    assert(clock.accumulated() == 5ms);

    clock.setTimestep(Timestep::fixed(20ms));
    assert(clock.accumulated() == 0ns);
    assert(clock.deltaTime() == 20ms);

    // After reset the next step is a first step again
    time.advance(500ms);
    ClockStep step = clock.step();
    assert(step.elapsed == 0ns);
    assert(step.ticks == 0);

    std::cout << "PASSED\n";
}

void test_cap_below_tick_rejected() {
    std::cout << "Testing: Accumulator cap below one tick is rejected... ";

    bool threw = false;
    try {
        FrameClock clock(Timestep::fixed(50ms), 20ms);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Cap equal to the tick still ticks; every fourth 16ms frame overflows it
    FrameClock exact(Timestep::fixed(50ms), 50ms);
    uint32_t ticks = 0;
    for (int i = 0; i < 100; i++) {
        ticks += exact.advance(16ms).ticks;
    }
    assert(ticks == 25);

    // Rejected setters leave the clock untouched
    ManualTimeSource time;
    FrameClock clock(Timestep::fixed(10ms), 30ms, &time);
    clock.advance(25ms);

    threw = false;
    try {
        clock.setAccumulatorCap(5ms);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(clock.accumulatorCap() == 30ms);
    assert(clock.accumulated() == 5ms);

    threw = false;
    try {
        clock.setTimestep(Timestep::fixed(40ms));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(clock.timestep().tickDuration == 10ms);
    assert(clock.accumulated() == 5ms);

    // Variable mode has no tick to hold the cap against
    clock.setTimestep(Timestep::variable());
    clock.setAccumulatorCap(1ms);
    assert(clock.accumulatorCap() == 1ms);
    assert(clock.advance(16ms).ticks == 1);

    std::cout << "PASSED\n";
}

void test_fps_average() {
    std::cout << "Testing: FPS average over recent frames... ";

    FrameClock clock(Timestep::fixedRate(60.0));
    assert(clock.fps() == 0.0);

    for (int i = 0; i < 300; i++) {
        clock.advance(i < 100 ? 50ms : 10ms);
    }
    // Only the last 200 frames count, all at 10ms
    assert(std::abs(clock.fps() - 100.0) < 1e-6);
    assert(clock.frameCount() == 300);
    assert(clock.totalTime() == 100 * 50ms + 200 * 10ms);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "fine2d - Frame Clock Tests\n";
    std::cout << "========================================\n\n";

    Logger::global().setMinLevel(LogLevel::Fatal);

    try {
        test_first_step_is_zero();
        test_tick_duration_from_rate();
        test_cap_limits_ticks();
        test_fixed_tick_count_matches_formula();
        test_variable_mode();
        test_set_timestep_resets();
        test_cap_below_tick_rejected();
        test_fps_average();

        std::cout << "\n========================================\n";
        std::cout << "All Frame Clock tests PASSED!\n";
        std::cout << "========================================\n\n";
    }
    catch (const std::exception& e) {
        std::cerr << "\nTEST FAILED with exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
