#pragma once

#include "fine2d/core/error.hpp"
#include "fine2d/engine/canvas_scaler.hpp"
#include "fine2d/engine/frame_clock.hpp"
#include "fine2d/engine/platform.hpp"
#include "fine2d/graphics/batcher.hpp"

#include <chrono>
#include <cstdint>
#include <functional>

namespace fine2d {

/**
 * @brief Main loop: events, fixed ticks, one render, present
 *
 * Each iteration:
 * 1. Drain platform events. Resizes go to the scaler, mouse positions are
 *    converted to canvas coordinates, Quit ends the loop.
 * 2. Step the frame clock and call update once per tick.
 * 3. Open a batcher frame, call draw with the blend factor, present the
 *    batcher (trailing flush).
 * 4. Bind the scaler viewport and present through the platform.
 *
 * Errors returned by callbacks stop the loop and come out of run()
 * unchanged. Exceptions thrown by callbacks become ErrorKind::CallbackError;
 * nothing is thrown out of run().
 *
 * @code
 * FrameOrchestrator loop(platform, batcher, clock, scaler);
 * Status result = loop.run(
 *     [&](FrameClock::Duration dt) { world.step(dt); return ok(); },
 *     [&](double blend) { return world.draw(batcher, blend); });
 * @endcode
 */
class FrameOrchestrator {
public:
    using UpdateFn = std::function<Status(FrameClock::Duration delta)>;
    using DrawFn = std::function<Status(double blend)>;
    using EventFn = std::function<Status(const PlatformEvent& event)>;

    FrameOrchestrator(Platform* platform, Batcher* batcher, FrameClock* clock,
                      CanvasScaler* scaler);
    FrameOrchestrator(Platform& platform, Batcher& batcher, FrameClock& clock,
                      CanvasScaler& scaler)
        : FrameOrchestrator(&platform, &batcher, &clock, &scaler) {}

    // Non-copyable, non-movable (callbacks capture this)
    FrameOrchestrator(const FrameOrchestrator&) = delete;
    FrameOrchestrator& operator=(const FrameOrchestrator&) = delete;

    /// Run until quit; blocks
    Status run(UpdateFn update, DrawFn draw);

    /// Request the loop to stop after the current iteration
    void quit() { quitRequested_ = true; }
    bool quitRequested() const { return quitRequested_; }

    /// Optional, receives every event after built-in handling
    void setEventCallback(EventFn callback) { eventCallback_ = std::move(callback); }

    /// Escape key ends the loop
    void setQuitOnEscape(bool enabled) { quitOnEscape_ = enabled; }
    bool quitOnEscape() const { return quitOnEscape_; }

    /// Change timestep; takes effect on the next iteration
    void setTimestep(Timestep timestep) { clock_->setTimestep(timestep); }
    const Timestep& timestep() const { return clock_->timestep(); }

    double blendFactor() const { return clock_->blendFactor(); }

    bool isRunning() const { return running_; }
    uint64_t frameNumber() const { return frameNumber_; }
    uint64_t tickNumber() const { return tickNumber_; }

private:
    Status processEvents();
    Status runFrame(const UpdateFn& update, const DrawFn& draw);
    Status renderFrame(const DrawFn& draw);
    Status teardown();

    // Non-owning references
    Platform* platform_ = nullptr;
    Batcher* batcher_ = nullptr;
    FrameClock* clock_ = nullptr;
    CanvasScaler* scaler_ = nullptr;

    EventFn eventCallback_;
    bool quitOnEscape_ = false;
    bool quitRequested_ = false;
    bool running_ = false;
    uint64_t frameNumber_ = 0;
    uint64_t tickNumber_ = 0;
};

} // namespace fine2d
