#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/engine/config.hpp"
#include "fine2d/engine/context.hpp"
#include "fine2d/engine/platform.hpp"
#include "fine2d/graphics/vulkan_renderer.hpp"

#include <memory>

namespace fine2d {

/**
 * @brief Platform backed by a GLFW window and a Vulkan swap chain
 *
 * Owns the window and every Vulkan object below the renderer. The
 * renderer itself is handed to the Context as its RenderDevice, so the
 * platform keeps a non-owning pointer to it. Context destroys the device
 * before the platform.
 */
class GlfwPlatform : public Platform {
public:
    /// Brings up Vulkan on the window. Throws DeviceError if no usable GPU.
    GlfwPlatform(WindowPtr window, const EngineConfig& config);
    ~GlfwPlatform() override;

    // Non-copyable
    GlfwPlatform(const GlfwPlatform&) = delete;
    GlfwPlatform& operator=(const GlfwPlatform&) = delete;

    /// Create the renderer for this platform's device. Call once.
    std::unique_ptr<VulkanRenderer> createRenderer(const EngineConfig& config);

    std::vector<PlatformEvent> pollEvents() override;
    glm::uvec2 windowSize() const override;
    Status bindViewport(const Rect& viewport, const Color& letterboxColor) override;
    Status present() override;

    Window& window() { return *window_; }
    LogicalDevice& device() { return *device_; }
    VulkanRenderer* renderer() { return renderer_; }

private:
    WindowPtr window_;
    InstancePtr instance_;
    SurfacePtr surface_;
    LogicalDevicePtr device_;
    SwapChainPtr swapChain_;

    VulkanRenderer* renderer_ = nullptr;
    Rect viewport_;
    Color letterboxColor_ = Color::BLACK;
};

/**
 * @brief Window, GPU and Context in one call
 *
 * @code
 * auto context = createVulkanContext(config);
 * if (!context) { ... context.error().describe() ... }
 * Status result = context.value()->run(update, draw);
 * @endcode
 *
 * Window failures come back as PlatformError, GPU failures as
 * DeviceResourceError.
 */
Result<std::unique_ptr<Context>> createVulkanContext(const EngineConfig& config);

} // namespace fine2d
