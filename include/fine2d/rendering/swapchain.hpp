#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <vector>

namespace fine2d {

struct AcquireResult {
    uint32_t imageIndex = 0;
    bool outOfDate = false;
    bool suboptimal = false;
};

/**
 * @brief Vulkan swap chain wrapper
 *
 * Usage:
 * @code
 * auto swapChain = SwapChain::create(device, surface)
 *     .vsync(config.vsync)
 *     .extent(size.x, size.y)
 *     .build();
 * @endcode
 */
class SwapChain {
public:
    class Builder {
    public:
        Builder(LogicalDevice* device, Surface* surface);

        /// FIFO when enabled, otherwise MAILBOX then IMMEDIATE if available
        Builder& vsync(bool enabled);

        /// Used only when the surface leaves the extent to the application
        Builder& extent(uint32_t width, uint32_t height);

        Builder& imageCount(uint32_t count);

        SwapChainPtr build();

    private:
        LogicalDevice* device_;
        Surface* surface_;
        bool vsync_ = true;
        uint32_t width_ = 1280;
        uint32_t height_ = 720;
        uint32_t imageCount_ = 3;
    };

    static Builder create(LogicalDevice* device, Surface* surface);

    VkSwapchainKHR handle() const { return swapChain_; }
    VkFormat format() const { return format_.format; }
    VkExtent2D extent() const { return extent_; }
    uint32_t imageCount() const { return static_cast<uint32_t>(images_.size()); }
    Image& image(uint32_t index) { return *images_[index]; }

    /// Out-of-date is reported, other failures throw DeviceError
    AcquireResult acquireNextImage(VkSemaphore signalSemaphore, uint64_t timeout = UINT64_MAX);

    /// Returns false when the swap chain must be recreated
    bool present(Queue* queue, uint32_t imageIndex, VkSemaphore waitSemaphore);

    /// Rebuild for a new framebuffer size; waits for the device to go idle
    void recreate(uint32_t width, uint32_t height);

    bool needsRecreation() const { return needsRecreation_; }

    ~SwapChain();

    // Non-copyable
    SwapChain(const SwapChain&) = delete;
    SwapChain& operator=(const SwapChain&) = delete;

private:
    SwapChain() = default;

    void createSwapChain(uint32_t width, uint32_t height, VkSwapchainKHR oldSwapChain);
    void cleanup();

    LogicalDevice* device_ = nullptr;
    Surface* surface_ = nullptr;
    VkSwapchainKHR swapChain_ = VK_NULL_HANDLE;
    VkSurfaceFormatKHR format_{};
    VkExtent2D extent_{};
    VkPresentModeKHR presentMode_ = VK_PRESENT_MODE_FIFO_KHR;
    uint32_t requestedImageCount_ = 3;
    std::vector<ImagePtr> images_;
    bool needsRecreation_ = false;
};

} // namespace fine2d
