#pragma once

#include "fine2d/core/error.hpp"
#include "fine2d/engine/canvas_scaler.hpp"
#include "fine2d/engine/config.hpp"
#include "fine2d/engine/frame_clock.hpp"
#include "fine2d/engine/frame_orchestrator.hpp"
#include "fine2d/engine/platform.hpp"
#include "fine2d/graphics/batcher.hpp"
#include "fine2d/graphics/drawable.hpp"
#include "fine2d/graphics/render_device.hpp"

#include <memory>

namespace fine2d {

/**
 * @brief Owns every per-game engine object
 *
 * Constructed once at startup and passed by reference; there is no global
 * engine state. The platform and device are injected so the same Context
 * runs on the Vulkan backend or on test doubles. Destruction order is
 * loop, batcher, scaler, clock, device, platform.
 *
 * @code
 * auto context = createVulkanContext(config);   // fine2d_vulkan
 * Status result = context.value()->run(update, draw);
 * @endcode
 */
class Context {
public:
    Context(const EngineConfig& config,
            std::unique_ptr<Platform> platform,
            std::unique_ptr<RenderDevice> device,
            TimeSource* timeSource = &SteadyTimeSource::global());
    ~Context();

    // Non-copyable, non-movable (the loop refers to members)
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    /// Run the frame loop until quit
    Status run(FrameOrchestrator::UpdateFn update, FrameOrchestrator::DrawFn draw);

    /// Ask the loop to stop after this iteration
    void quit() { loop_->quit(); }

    /// Convert and submit one drawable
    Status draw(const Drawable& drawable) { return batcher_->draw(toDrawCommand(drawable)); }

    /// Redirect drawing to a canvas, or back to the screen
    Status setCanvas(CanvasHandle canvas) { return batcher_->setCanvas(canvas); }

    /// Fill the current canvas with a color
    Status clear(const Color& color) { return batcher_->clear(color); }

    void setTimestep(Timestep timestep) { loop_->setTimestep(timestep); }
    void setScalingPolicy(ScalingPolicy policy) { scaler_->setScalingPolicy(policy); }

    /// Resize the virtual canvas on the device and in the scaler. Call between frames.
    Status setVirtualResolution(uint32_t width, uint32_t height);

    const EngineConfig& config() const { return config_; }
    Platform& platform() { return *platform_; }
    RenderDevice& device() { return *device_; }
    FrameClock& clock() { return *clock_; }
    CanvasScaler& scaler() { return *scaler_; }
    Batcher& batcher() { return *batcher_; }
    FrameOrchestrator& loop() { return *loop_; }

private:
    EngineConfig config_;
    std::unique_ptr<Platform> platform_;
    std::unique_ptr<RenderDevice> device_;
    std::unique_ptr<FrameClock> clock_;
    std::unique_ptr<CanvasScaler> scaler_;
    std::unique_ptr<Batcher> batcher_;
    std::unique_ptr<FrameOrchestrator> loop_;
};

} // namespace fine2d
