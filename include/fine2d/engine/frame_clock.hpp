#pragma once

#include <array>
#include <chrono>
#include <cstdint>

namespace fine2d {

/// Monotonic time source, injectable so tests can drive the clock
class TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual std::chrono::nanoseconds now() = 0;
};

/// std::chrono::steady_clock
class SteadyTimeSource : public TimeSource {
public:
    static SteadyTimeSource& global();
    std::chrono::nanoseconds now() override;
};

/// Time only moves when told to
class ManualTimeSource : public TimeSource {
public:
    std::chrono::nanoseconds now() override { return now_; }
    void advance(std::chrono::nanoseconds dt) { now_ += dt; }
    void set(std::chrono::nanoseconds t) { now_ = t; }

private:
    std::chrono::nanoseconds now_{0};
};

/**
 * @brief Fixed(tick duration) or Variable
 */
struct Timestep {
    enum class Mode { Fixed, Variable };

    Mode mode = Mode::Fixed;
    std::chrono::nanoseconds tickDuration{16666666};

    static Timestep fixed(std::chrono::nanoseconds tick) { return {Mode::Fixed, tick}; }
    static Timestep fixedRate(double ticksPerSecond);
    static Timestep variable() { return {Mode::Variable, std::chrono::nanoseconds::zero()}; }

    bool isFixed() const { return mode == Mode::Fixed; }

    bool operator==(const Timestep& o) const {
        return mode == o.mode && (mode == Mode::Variable || tickDuration == o.tickDuration);
    }
    bool operator!=(const Timestep& o) const { return !(*this == o); }
};

/// Outcome of one clock iteration
struct ClockStep {
    uint32_t ticks = 0;
    std::chrono::nanoseconds tickDelta{0};  // Passed to each update
    std::chrono::nanoseconds elapsed{0};    // Raw wall time since last step
    std::chrono::nanoseconds dropped{0};    // Discarded by the accumulator cap
    double blend = 0.0;
};

/**
 * @brief Turns wall-clock deltas into simulation ticks
 *
 * Fixed mode: elapsed time is added to an accumulator clamped to the cap;
 * one tick runs per whole tick duration and the remainder divided by the
 * tick duration is the blend factor, always in [0, 1). Time dropped by
 * the cap is lost, so the simulation slows down instead of spiralling.
 *
 * Variable mode: exactly one tick per step with the raw elapsed time and a
 * blend factor of 1.
 *
 * The first step after construction or reset() sees zero elapsed time.
 * All bookkeeping is in integral nanoseconds so tick counts are exact.
 */
class FrameClock {
public:
    using Duration = std::chrono::nanoseconds;

    static constexpr Duration DEFAULT_ACCUMULATOR_CAP = std::chrono::milliseconds(150);
    static constexpr int FPS_SAMPLE_COUNT = 200;

    explicit FrameClock(Timestep timestep = Timestep::fixedRate(60.0),
                        Duration accumulatorCap = DEFAULT_ACCUMULATOR_CAP,
                        TimeSource* source = &SteadyTimeSource::global());

    /// Read the time source and advance by the elapsed time
    ClockStep step();

    /// Advance by an explicit elapsed time
    ClockStep advance(Duration elapsed);

    /// Clear accumulator, delta and the last time point
    void reset();

    /// Change mode or tick duration; resets the accumulator.
    /// Throws std::invalid_argument if a fixed tick exceeds the accumulator cap.
    void setTimestep(Timestep timestep);
    const Timestep& timestep() const { return timestep_; }

    /// Must be positive and, in fixed mode, at least one tick
    void setAccumulatorCap(Duration cap);
    Duration accumulatorCap() const { return accumulatorCap_; }

    /// Interpolation factor from the last step
    double blendFactor() const { return blend_; }

    /// Tick duration in fixed mode, raw delta in variable mode
    Duration deltaTime() const;

    /// deltaTime() in seconds
    double deltaSeconds() const;

    Duration accumulated() const { return accumulator_; }

    /// Wall time since the clock started
    Duration totalTime() const { return total_; }

    /// Average over the last FPS_SAMPLE_COUNT frames
    double fps() const;

    uint64_t frameCount() const { return frameCount_; }

    static double toSeconds(Duration d) { return std::chrono::duration<double>(d).count(); }

private:
    Timestep timestep_;
    Duration accumulatorCap_;
    TimeSource* source_;

    bool started_ = false;
    Duration lastTime_{0};
    Duration accumulator_{0};
    Duration rawDelta_{0};
    Duration total_{0};
    double blend_ = 0.0;
    uint64_t frameCount_ = 0;

    // FPS smoothing
    std::array<Duration, FPS_SAMPLE_COUNT> samples_{};
    int sampleIndex_ = 0;
    int sampleCount_ = 0;
    Duration sampleSum_{0};
};

} // namespace fine2d
