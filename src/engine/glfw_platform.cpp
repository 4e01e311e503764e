#include "fine2d/engine/glfw_platform.hpp"
#include "fine2d/core/instance.hpp"
#include "fine2d/core/surface.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/physical_device.hpp"
#include "fine2d/rendering/swapchain.hpp"
#include "fine2d/window/window.hpp"

#include <stdexcept>

namespace fine2d {

GlfwPlatform::GlfwPlatform(WindowPtr window, const EngineConfig& config)
    : window_(std::move(window)) {
    if (!window_) {
        throw std::invalid_argument("GlfwPlatform: window is required");
    }

    instance_ = Instance::create()
        .applicationName(config.title)
        .enableValidation(config.enableValidation)
        .build();

    surface_ = Surface::fromGLFW(instance_.get(), window_->handle());

    auto physical = PhysicalDevice::selectBest(instance_.get(), surface_.get());
    FINE2D_INFO(LogCategory::Vulkan, std::string("Using GPU: ") + physical.name());

    auto builder = LogicalDevice::create(physical);
    builder.surface(surface_.get())
        .addExtension(VK_KHR_SWAPCHAIN_EXTENSION_NAME);
    if (physical.capabilities().supportsAnisotropy()) {
        builder.enableAnisotropy();
    }
    device_ = builder.build();

    glm::uvec2 size = window_->framebufferSize();
    swapChain_ = SwapChain::create(device_.get(), surface_.get())
        .vsync(config.vsync)
        .extent(size.x, size.y)
        .imageCount(config.framesInFlight + 1)
        .build();
}

GlfwPlatform::~GlfwPlatform() {
    if (device_) {
        try {
            device_->waitIdle();
        } catch (const std::exception& e) {
            FINE2D_ERROR(LogCategory::Vulkan, std::string("waitIdle during teardown: ") + e.what());
        }
    }

    // Reverse creation order; the window terminates GLFW, so it goes last
    swapChain_.reset();
    device_.reset();
    surface_.reset();
    instance_.reset();
    window_.reset();
}

std::unique_ptr<VulkanRenderer> GlfwPlatform::createRenderer(const EngineConfig& config) {
    if (renderer_) {
        throw std::logic_error("GlfwPlatform: renderer already created");
    }
    auto renderer = std::make_unique<VulkanRenderer>(device_.get(), swapChain_.get(), config);
    renderer_ = renderer.get();
    return renderer;
}

std::vector<PlatformEvent> GlfwPlatform::pollEvents() {
    std::vector<PlatformEvent> events = window_->pollEvents();
    if (renderer_) {
        for (const auto& event : events) {
            if (std::holds_alternative<event::Resized>(event)) {
                renderer_->markSwapChainDirty();
                break;
            }
        }
    }
    return events;
}

glm::uvec2 GlfwPlatform::windowSize() const {
    return window_->framebufferSize();
}

Status GlfwPlatform::bindViewport(const Rect& viewport, const Color& letterboxColor) {
    viewport_ = viewport;
    letterboxColor_ = letterboxColor;
    return ok();
}

Status GlfwPlatform::present() {
    if (!renderer_) {
        return makeError(ErrorKind::PlatformError, "present() before a renderer was created");
    }
    return renderer_->present(viewport_, letterboxColor_, window_->framebufferSize());
}

// ============================================================================
// Context factory
// ============================================================================

Result<std::unique_ptr<Context>> createVulkanContext(const EngineConfig& config) {
    Status valid = config.validate();
    if (!valid) {
        return std::move(valid).error();
    }
    Logger::global().setMinLevel(config.logLevel);

    WindowPtr window;
    try {
        window = Window::create()
            .title(config.title)
            .size(config.windowWidth, config.windowHeight)
            .resizable(config.resizable)
            .build();
    } catch (const std::exception& e) {
        FINE2D_ERROR(LogCategory::Core, std::string("Window creation failed: ") + e.what());
        return makeError(ErrorKind::PlatformError, e.what());
    }

    try {
        auto platform = std::make_unique<GlfwPlatform>(std::move(window), config);
        std::unique_ptr<RenderDevice> renderer = platform->createRenderer(config);
        return std::make_unique<Context>(config, std::move(platform), std::move(renderer));
    } catch (const std::exception& e) {
        FINE2D_ERROR(LogCategory::Vulkan, std::string("Vulkan setup failed: ") + e.what());
        return makeError(ErrorKind::DeviceResourceError, e.what());
    }
}

} // namespace fine2d
