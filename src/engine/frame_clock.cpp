#include "fine2d/engine/frame_clock.hpp"
#include "fine2d/core/logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace fine2d {

SteadyTimeSource& SteadyTimeSource::global() {
    static SteadyTimeSource instance;
    return instance;
}

std::chrono::nanoseconds SteadyTimeSource::now() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch());
}

Timestep Timestep::fixedRate(double ticksPerSecond) {
    if (ticksPerSecond <= 0.0) {
        throw std::invalid_argument("Timestep: tick rate must be positive");
    }
    return fixed(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double>(1.0 / ticksPerSecond)));
}

namespace {

// A cap below one tick would hold the accumulator short of a tick forever
void checkTiming(const Timestep& timestep, FrameClock::Duration cap) {
    if (timestep.isFixed() && timestep.tickDuration <= FrameClock::Duration::zero()) {
        throw std::invalid_argument("FrameClock: tick duration must be positive");
    }
    if (cap <= FrameClock::Duration::zero()) {
        throw std::invalid_argument("FrameClock: accumulator cap must be positive");
    }
    if (timestep.isFixed() && cap < timestep.tickDuration) {
        throw std::invalid_argument("FrameClock: accumulator cap must be at least one tick");
    }
}

} // anonymous namespace

FrameClock::FrameClock(Timestep timestep, Duration accumulatorCap, TimeSource* source)
    : timestep_(timestep), accumulatorCap_(accumulatorCap), source_(source) {
    if (!source_) {
        throw std::runtime_error("FrameClock: time source cannot be null");
    }
    checkTiming(timestep_, accumulatorCap_);
}

ClockStep FrameClock::step() {
    Duration now = source_->now();
    Duration elapsed{0};

    if (started_) {
        elapsed = std::max(now - lastTime_, Duration::zero());
    }
    started_ = true;
    lastTime_ = now;

    return advance(elapsed);
}

ClockStep FrameClock::advance(Duration elapsed) {
    ClockStep result;
    result.elapsed = elapsed;

    rawDelta_ = elapsed;
    total_ += elapsed;
    frameCount_++;

    if (elapsed > Duration::zero()) {
        sampleSum_ -= samples_[sampleIndex_];
        samples_[sampleIndex_] = elapsed;
        sampleSum_ += elapsed;
        sampleIndex_ = (sampleIndex_ + 1) % FPS_SAMPLE_COUNT;
        sampleCount_ = std::min(sampleCount_ + 1, FPS_SAMPLE_COUNT);
    }

    if (!timestep_.isFixed()) {
        result.ticks = 1;
        result.tickDelta = elapsed;
        result.blend = 1.0;
        blend_ = 1.0;
        return result;
    }

    accumulator_ += elapsed;
    if (accumulator_ > accumulatorCap_) {
        result.dropped = accumulator_ - accumulatorCap_;
        accumulator_ = accumulatorCap_;
        FINE2D_WARN(LogCategory::Timing,
            "Accumulator capped, dropped " +
            std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(
                result.dropped).count()) + "us of simulation time");
    }

    const Duration tick = timestep_.tickDuration;
    while (accumulator_ >= tick) {
        accumulator_ -= tick;
        result.ticks++;
    }

    result.tickDelta = tick;
    blend_ = static_cast<double>(accumulator_.count()) / static_cast<double>(tick.count());
    result.blend = blend_;
    return result;
}

void FrameClock::reset() {
    started_ = false;
    lastTime_ = Duration::zero();
    accumulator_ = Duration::zero();
    rawDelta_ = Duration::zero();
    blend_ = 0.0;
}

void FrameClock::setTimestep(Timestep timestep) {
    checkTiming(timestep, accumulatorCap_);
    timestep_ = timestep;
    reset();
    FINE2D_DEBUG(LogCategory::Timing,
        timestep_.isFixed()
            ? "Timestep set to fixed " + std::to_string(timestep_.tickDuration.count()) + "ns"
            : std::string("Timestep set to variable"));
}

void FrameClock::setAccumulatorCap(Duration cap) {
    checkTiming(timestep_, cap);
    accumulatorCap_ = cap;
    accumulator_ = std::min(accumulator_, accumulatorCap_);
}

FrameClock::Duration FrameClock::deltaTime() const {
    return timestep_.isFixed() ? timestep_.tickDuration : rawDelta_;
}

double FrameClock::deltaSeconds() const {
    return toSeconds(deltaTime());
}

double FrameClock::fps() const {
    if (sampleCount_ == 0 || sampleSum_ <= Duration::zero()) {
        return 0.0;
    }
    return static_cast<double>(sampleCount_) / toSeconds(sampleSum_);
}

} // namespace fine2d
