#include "fine2d/engine/context.hpp"
#include "fine2d/core/logging.hpp"

#include <stdexcept>

namespace fine2d {

Context::Context(const EngineConfig& config,
                 std::unique_ptr<Platform> platform,
                 std::unique_ptr<RenderDevice> device,
                 TimeSource* timeSource)
    : config_(config)
    , platform_(std::move(platform))
    , device_(std::move(device)) {
    Status status = config_.validate();
    if (!status) {
        throw std::invalid_argument("Context: " + status.error().describe());
    }
    if (!platform_) {
        throw std::runtime_error("Context: platform cannot be null");
    }
    if (!device_) {
        throw std::runtime_error("Context: render device cannot be null");
    }

    Logger::global().setMinLevel(config_.logLevel);

    glm::uvec2 size = platform_->windowSize();
    clock_ = std::make_unique<FrameClock>(config_.timestep, config_.accumulatorCap, timeSource);
    scaler_ = std::make_unique<CanvasScaler>(
        config_.virtualWidth, config_.virtualHeight,
        size.x != 0 ? size.x : config_.windowWidth,
        size.y != 0 ? size.y : config_.windowHeight,
        config_.scalingPolicy);
    scaler_->setLetterboxColor(config_.letterboxColor);
    batcher_ = std::make_unique<Batcher>(*device_, config_.vertexCapacity);
    loop_ = std::make_unique<FrameOrchestrator>(*platform_, *batcher_, *clock_, *scaler_);
    loop_->setQuitOnEscape(config_.quitOnEscape);

    FINE2D_INFO(LogCategory::Core, "Context created for \"" + config_.title + "\"");
}

Context::~Context() {
    loop_.reset();
    batcher_.reset();
    scaler_.reset();
    clock_.reset();
    device_.reset();
    platform_.reset();
    FINE2D_DEBUG(LogCategory::Core, "Context destroyed");
}

Status Context::setVirtualResolution(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        return makeError(ErrorKind::InvalidConfiguration, "virtual resolution must be non-zero");
    }

    try {
        Status status = device_->resizeScreen(width, height);
        if (!status) {
            return status;
        }
    } catch (const std::exception& e) {
        return makeError(ErrorKind::DeviceResourceError,
                         std::string("Screen canvas resize: ") + e.what());
    }

    scaler_->setVirtualResolution(width, height);
    return ok();
}

Status Context::run(FrameOrchestrator::UpdateFn update, FrameOrchestrator::DrawFn draw) {
    return loop_->run(std::move(update), std::move(draw));
}

} // namespace fine2d
