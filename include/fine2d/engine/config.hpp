#pragma once

#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/engine/canvas_scaler.hpp"
#include "fine2d/engine/frame_clock.hpp"
#include "fine2d/graphics/batcher.hpp"
#include "fine2d/graphics/color.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace fine2d {

/// Texture sampling filter
enum class FilterMode {
    Nearest,
    Linear
};

/**
 * @brief Everything needed to start a game, with working defaults
 *
 * @code
 * EngineConfig config = EngineConfig::create()
 *     .title("Bunnies")
 *     .virtualSize(320, 180)
 *     .scalingPolicy(ScalingPolicy::ShowAllPixelPerfect)
 *     .build();
 * @endcode
 */
struct EngineConfig {
    std::string title = "fine2d";
    uint32_t windowWidth = 1280;
    uint32_t windowHeight = 720;
    uint32_t virtualWidth = 640;
    uint32_t virtualHeight = 360;

    Timestep timestep = Timestep::fixedRate(60.0);
    FrameClock::Duration accumulatorCap = FrameClock::DEFAULT_ACCUMULATOR_CAP;
    uint32_t vertexCapacity = DEFAULT_VERTEX_CAPACITY;

    ScalingPolicy scalingPolicy = ScalingPolicy::Letterbox;
    Color letterboxColor = Color::BLACK;
    Color clearColor = Color::rgb(0.392f, 0.584f, 0.929f);

    bool vsync = true;
    bool resizable = true;
    bool quitOnEscape = false;
#ifdef NDEBUG
    bool enableValidation = false;
#else
    bool enableValidation = true;
#endif
    uint32_t framesInFlight = 2;
    FilterMode defaultFilter = FilterMode::Nearest;
    LogLevel logLevel = LogLevel::Info;
    std::string shaderDirectory = "shaders";    // Compiled .spv files

    /// Reject zero sizes, zero tick duration, zero capacity
    Status validate() const;

    class Builder;
    static Builder create();
};

/**
 * @brief Fluent builder for EngineConfig
 */
class EngineConfig::Builder {
public:
    Builder& title(std::string_view title);
    Builder& windowSize(uint32_t width, uint32_t height);
    Builder& virtualSize(uint32_t width, uint32_t height);
    Builder& timestep(Timestep timestep);
    Builder& ticksPerSecond(double rate);
    Builder& accumulatorCap(FrameClock::Duration cap);
    Builder& vertexCapacity(uint32_t vertices);
    Builder& scalingPolicy(ScalingPolicy policy);
    Builder& letterboxColor(const Color& color);
    Builder& clearColor(const Color& color);
    Builder& vsync(bool enabled = true);
    Builder& resizable(bool enabled = true);
    Builder& quitOnEscape(bool enabled = true);
    Builder& validation(bool enabled = true);
    Builder& framesInFlight(uint32_t count);
    Builder& defaultFilter(FilterMode filter);
    Builder& logLevel(LogLevel level);
    Builder& shaderDirectory(std::string_view path);

    /// Validates; returns the config or InvalidConfiguration
    Result<EngineConfig> build() const;

private:
    EngineConfig config_;
};

} // namespace fine2d
