#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/device/physical_device.hpp"

#include <vulkan/vulkan.h>
#include <memory>
#include <vector>

namespace fine2d {

/**
 * @brief Vulkan queue wrapper
 */
class Queue {
public:
    Queue(VkQueue queue, uint32_t familyIndex);

    VkQueue handle() const { return queue_; }
    uint32_t familyIndex() const { return familyIndex_; }

    void submit(const VkSubmitInfo& submitInfo, VkFence fence = VK_NULL_HANDLE);

    /// Submit one command buffer with optional wait/signal semaphores
    void submit(
        VkCommandBuffer commandBuffer,
        const std::vector<VkSemaphore>& waitSemaphores,
        const std::vector<VkPipelineStageFlags>& waitStages,
        const std::vector<VkSemaphore>& signalSemaphores,
        VkFence fence);

    void waitIdle();

    /// Returns the raw result so callers can react to VK_ERROR_OUT_OF_DATE_KHR
    VkResult present(VkSwapchainKHR swapChain, uint32_t imageIndex, VkSemaphore waitSemaphore);

private:
    VkQueue queue_ = VK_NULL_HANDLE;
    uint32_t familyIndex_ = 0;
};

/**
 * @brief Vulkan logical device with its graphics and present queues
 *
 * Usage:
 * @code
 * auto device = LogicalDevice::create(physical)
 *     .surface(surface.get())
 *     .enableAnisotropy()
 *     .build();
 * @endcode
 */
class LogicalDevice {
public:
    class Builder {
    public:
        explicit Builder(const PhysicalDevice& physical);

        Builder& surface(Surface* surface);
        Builder& addExtension(const char* extension);

        /// Enable anisotropic filtering if available
        Builder& enableAnisotropy();

        LogicalDevicePtr build();

    private:
        PhysicalDevice physical_;
        Surface* surface_ = nullptr;
        std::vector<const char*> extensions_;
        VkPhysicalDeviceFeatures enabledFeatures_{};
    };

    static Builder create(const PhysicalDevice& physical);

    VkDevice handle() const { return device_; }
    const PhysicalDevice& physicalDevice() const { return physical_; }

    Queue* graphicsQueue() const { return graphicsQueue_; }
    Queue* presentQueue() const { return presentQueue_; }

    MemoryAllocator& allocator() { return *allocator_; }

    /// Resettable pool on the graphics queue, created on first use
    CommandPool* defaultCommandPool();

    bool anisotropyEnabled() const { return anisotropyEnabled_; }

    void waitIdle();

    ~LogicalDevice();

    // Non-copyable
    LogicalDevice(const LogicalDevice&) = delete;
    LogicalDevice& operator=(const LogicalDevice&) = delete;

private:
    LogicalDevice() = default;

    void cleanup();

    VkDevice device_ = VK_NULL_HANDLE;
    PhysicalDevice physical_;

    std::vector<std::unique_ptr<Queue>> ownedQueues_;
    Queue* graphicsQueue_ = nullptr;
    Queue* presentQueue_ = nullptr;

    std::unique_ptr<MemoryAllocator> allocator_;
    CommandPoolPtr defaultCommandPool_;
    bool anisotropyEnabled_ = false;
};

} // namespace fine2d
