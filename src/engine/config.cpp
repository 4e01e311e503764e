#include "fine2d/engine/config.hpp"

namespace fine2d {

Status EngineConfig::validate() const {
    if (windowWidth == 0 || windowHeight == 0) {
        return makeError(ErrorKind::InvalidConfiguration, "window size must be non-zero");
    }
    if (virtualWidth == 0 || virtualHeight == 0) {
        return makeError(ErrorKind::InvalidConfiguration, "virtual size must be non-zero");
    }
    if (timestep.isFixed() && timestep.tickDuration <= FrameClock::Duration::zero()) {
        return makeError(ErrorKind::InvalidConfiguration, "tick duration must be positive");
    }
    if (accumulatorCap <= FrameClock::Duration::zero()) {
        return makeError(ErrorKind::InvalidConfiguration, "accumulator cap must be positive");
    }
    if (timestep.isFixed() && accumulatorCap < timestep.tickDuration) {
        return makeError(ErrorKind::InvalidConfiguration, "accumulator cap must be at least one tick");
    }
    if (vertexCapacity == 0) {
        return makeError(ErrorKind::InvalidConfiguration, "vertex capacity must be non-zero");
    }
    if (framesInFlight == 0) {
        return makeError(ErrorKind::InvalidConfiguration, "frames in flight must be non-zero");
    }
    return ok();
}

EngineConfig::Builder EngineConfig::create() {
    return Builder();
}

// ============================================================================
// EngineConfig::Builder implementation
// ============================================================================

EngineConfig::Builder& EngineConfig::Builder::title(std::string_view title) {
    config_.title = std::string(title);
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::windowSize(uint32_t width, uint32_t height) {
    config_.windowWidth = width;
    config_.windowHeight = height;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::virtualSize(uint32_t width, uint32_t height) {
    config_.virtualWidth = width;
    config_.virtualHeight = height;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::timestep(Timestep timestep) {
    config_.timestep = timestep;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::ticksPerSecond(double rate) {
    // A non-positive rate is reported by validate(), not thrown
    config_.timestep = rate > 0.0 ? Timestep::fixedRate(rate)
                                  : Timestep::fixed(FrameClock::Duration::zero());
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::accumulatorCap(FrameClock::Duration cap) {
    config_.accumulatorCap = cap;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::vertexCapacity(uint32_t vertices) {
    config_.vertexCapacity = vertices;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::scalingPolicy(ScalingPolicy policy) {
    config_.scalingPolicy = policy;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::letterboxColor(const Color& color) {
    config_.letterboxColor = color;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::clearColor(const Color& color) {
    config_.clearColor = color;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::vsync(bool enabled) {
    config_.vsync = enabled;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::resizable(bool enabled) {
    config_.resizable = enabled;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::quitOnEscape(bool enabled) {
    config_.quitOnEscape = enabled;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::validation(bool enabled) {
    config_.enableValidation = enabled;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::framesInFlight(uint32_t count) {
    config_.framesInFlight = count;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::defaultFilter(FilterMode filter) {
    config_.defaultFilter = filter;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::logLevel(LogLevel level) {
    config_.logLevel = level;
    return *this;
}

EngineConfig::Builder& EngineConfig::Builder::shaderDirectory(std::string_view path) {
    config_.shaderDirectory = std::string(path);
    return *this;
}

Result<EngineConfig> EngineConfig::Builder::build() const {
    Status status = config_.validate();
    if (!status) {
        return std::move(status).error();
    }
    return config_;
}

} // namespace fine2d
