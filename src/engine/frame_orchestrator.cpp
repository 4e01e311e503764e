#include "fine2d/engine/frame_orchestrator.hpp"
#include "fine2d/core/logging.hpp"

#include <stdexcept>
#include <string>

namespace fine2d {

namespace {

template<typename F, typename... Args>
Status invokeCallback(const char* name, const F& callback, Args&&... args) {
    if (!callback) {
        return ok();
    }
    try {
        Status status = callback(std::forward<Args>(args)...);
        if (!status) {
            FINE2D_ERROR(LogCategory::Core,
                std::string(name) + " callback failed: " + status.error().describe());
        }
        return status;
    } catch (const std::exception& e) {
        FINE2D_ERROR(LogCategory::Core, std::string(name) + " callback threw: " + e.what());
        return makeError(ErrorKind::CallbackError, std::string(name) + ": " + e.what());
    }
}

} // anonymous namespace

FrameOrchestrator::FrameOrchestrator(Platform* platform, Batcher* batcher, FrameClock* clock,
                                     CanvasScaler* scaler)
    : platform_(platform), batcher_(batcher), clock_(clock), scaler_(scaler) {
    if (!platform_) {
        throw std::runtime_error("FrameOrchestrator: platform cannot be null");
    }
    if (!batcher_) {
        throw std::runtime_error("FrameOrchestrator: batcher cannot be null");
    }
    if (!clock_) {
        throw std::runtime_error("FrameOrchestrator: clock cannot be null");
    }
    if (!scaler_) {
        throw std::runtime_error("FrameOrchestrator: scaler cannot be null");
    }
}

// =============================================================================
// Loop
// =============================================================================

Status FrameOrchestrator::run(UpdateFn update, DrawFn draw) {
    if (running_) {
        FINE2D_WARN(LogCategory::Core, "FrameOrchestrator::run() called while already running");
        return ok();
    }

    running_ = true;
    quitRequested_ = false;
    frameNumber_ = 0;
    tickNumber_ = 0;
    clock_->reset();

    // Pick up the real window size before the first frame
    glm::uvec2 size = platform_->windowSize();
    scaler_->setWindowSize(size.x, size.y);

    FINE2D_INFO(LogCategory::Core, "Frame loop started");

    Status result = ok();
    while (!quitRequested_) {
        try {
            result = runFrame(update, draw);
        } catch (const DeviceError& e) {
            FINE2D_ERROR(LogCategory::Core, std::string("Device failure: ") + e.what());
            result = makeError(ErrorKind::DeviceResourceError, e.what());
        } catch (const std::exception& e) {
            FINE2D_ERROR(LogCategory::Core, std::string("Platform failure: ") + e.what());
            result = makeError(ErrorKind::PlatformError, e.what());
        }

        if (!result) {
            break;
        }
    }

    Status teardownStatus = teardown();
    running_ = false;

    if (!result) {
        FINE2D_INFO(LogCategory::Core,
            "Frame loop halted after " + std::to_string(frameNumber_) + " frames: " +
            result.error().describe());
        return result;
    }

    FINE2D_INFO(LogCategory::Core,
        "Frame loop exited after " + std::to_string(frameNumber_) + " frames");
    return teardownStatus;
}

Status FrameOrchestrator::runFrame(const UpdateFn& update, const DrawFn& draw) {
    Status status = processEvents();
    if (!status || quitRequested_) {
        return status;
    }

    ClockStep step = clock_->step();
    for (uint32_t i = 0; i < step.ticks; i++) {
        status = invokeCallback("update", update, step.tickDelta);
        if (!status) {
            return status;
        }
        tickNumber_++;
    }

    status = renderFrame(draw);
    if (!status) {
        return status;
    }

    frameNumber_++;
    return ok();
}

Status FrameOrchestrator::processEvents() {
    std::vector<PlatformEvent> events = platform_->pollEvents();

    for (PlatformEvent& ev : events) {
        if (std::holds_alternative<event::Quit>(ev)) {
            FINE2D_DEBUG(LogCategory::Core, "Quit event received");
            quit();
        } else if (auto* resized = std::get_if<event::Resized>(&ev)) {
            scaler_->setWindowSize(resized->width, resized->height);
        } else if (auto* moved = std::get_if<event::MouseMoved>(&ev)) {
            moved->canvas = scaler_->toVirtualCoords(moved->window.x, moved->window.y);
        } else if (auto* key = std::get_if<event::KeyPressed>(&ev)) {
            if (quitOnEscape_ && key->key == KEY_ESCAPE) {
                FINE2D_DEBUG(LogCategory::Core, "Escape pressed, quitting");
                quit();
            }
        }

        Status status = invokeCallback("event", eventCallback_, ev);
        if (!status) {
            return status;
        }
    }

    return ok();
}

Status FrameOrchestrator::renderFrame(const DrawFn& draw) {
    Status status = batcher_->beginFrame();
    if (!status) {
        return status;
    }

    status = invokeCallback("draw", draw, clock_->blendFactor());
    if (!status) {
        return status;
    }

    status = batcher_->presentFrame();
    if (!status) {
        return status;
    }

    status = platform_->bindViewport(scaler_->viewport(), scaler_->letterboxColor());
    if (!status) {
        return status;
    }

    return platform_->present();
}

Status FrameOrchestrator::teardown() {
    // A frame interrupted by an error still has an open batch
    if (!batcher_->inFrame()) {
        return ok();
    }

    FINE2D_DEBUG(LogCategory::Core, "Flushing interrupted frame");
    try {
        return batcher_->presentFrame();
    } catch (const std::exception& e) {
        FINE2D_ERROR(LogCategory::Core, std::string("Teardown failed: ") + e.what());
        return makeError(ErrorKind::DeviceResourceError, e.what());
    }
}

} // namespace fine2d
