#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/command.hpp"
#include "fine2d/device/memory.hpp"
#include "fine2d/core/surface.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

#include <set>

namespace fine2d {

// ============================================================================
// Queue implementation
// ============================================================================

Queue::Queue(VkQueue queue, uint32_t familyIndex)
    : queue_(queue), familyIndex_(familyIndex) {
}

void Queue::submit(const VkSubmitInfo& submitInfo, VkFence fence) {
    VkResult result = vkQueueSubmit(queue_, 1, &submitInfo, fence);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to submit command buffer to queue", result);
    }
}

void Queue::submit(
    VkCommandBuffer commandBuffer,
    const std::vector<VkSemaphore>& waitSemaphores,
    const std::vector<VkPipelineStageFlags>& waitStages,
    const std::vector<VkSemaphore>& signalSemaphores,
    VkFence fence) {

    VkSubmitInfo submitInfo{};
    submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submitInfo.commandBufferCount = 1;
    submitInfo.pCommandBuffers = &commandBuffer;

    submitInfo.waitSemaphoreCount = static_cast<uint32_t>(waitSemaphores.size());
    submitInfo.pWaitSemaphores = waitSemaphores.empty() ? nullptr : waitSemaphores.data();
    submitInfo.pWaitDstStageMask = waitStages.empty() ? nullptr : waitStages.data();

    submitInfo.signalSemaphoreCount = static_cast<uint32_t>(signalSemaphores.size());
    submitInfo.pSignalSemaphores = signalSemaphores.empty() ? nullptr : signalSemaphores.data();

    submit(submitInfo, fence);
}

void Queue::waitIdle() {
    VkResult result = vkQueueWaitIdle(queue_);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to wait for queue", result);
    }
}

VkResult Queue::present(VkSwapchainKHR swapChain, uint32_t imageIndex, VkSemaphore waitSemaphore) {
    VkPresentInfoKHR presentInfo{};
    presentInfo.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    presentInfo.waitSemaphoreCount = waitSemaphore != VK_NULL_HANDLE ? 1 : 0;
    presentInfo.pWaitSemaphores = &waitSemaphore;
    presentInfo.swapchainCount = 1;
    presentInfo.pSwapchains = &swapChain;
    presentInfo.pImageIndices = &imageIndex;

    return vkQueuePresentKHR(queue_, &presentInfo);
}

// ============================================================================
// Builder implementation
// ============================================================================

LogicalDevice::Builder::Builder(const PhysicalDevice& physical)
    : physical_(physical) {
    extensions_.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);

#ifdef __APPLE__
    if (physical_.capabilities().supportsExtension("VK_KHR_portability_subset")) {
        extensions_.push_back("VK_KHR_portability_subset");
    }
#endif
}

LogicalDevice::Builder& LogicalDevice::Builder::surface(Surface* surface) {
    surface_ = surface;
    return *this;
}

LogicalDevice::Builder& LogicalDevice::Builder::addExtension(const char* extension) {
    extensions_.push_back(extension);
    return *this;
}

LogicalDevice::Builder& LogicalDevice::Builder::enableAnisotropy() {
    if (physical_.capabilities().supportsAnisotropy()) {
        enabledFeatures_.samplerAnisotropy = VK_TRUE;
    }
    return *this;
}

LogicalDevicePtr LogicalDevice::Builder::build() {
    const auto& caps = physical_.capabilities();

    auto graphicsFamily = caps.graphicsQueueFamily();
    if (!graphicsFamily) {
        throw DeviceError("No graphics queue family found");
    }

    auto presentFamily = surface_
        ? caps.presentQueueFamily(physical_.handle(), surface_->handle())
        : graphicsFamily;
    if (!presentFamily) {
        throw DeviceError("No present queue family found");
    }

    std::set<uint32_t> uniqueFamilies = {*graphicsFamily, *presentFamily};

    std::vector<VkDeviceQueueCreateInfo> queueCreateInfos;
    float queuePriority = 1.0f;

    for (uint32_t family : uniqueFamilies) {
        VkDeviceQueueCreateInfo queueCreateInfo{};
        queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queueCreateInfo.queueFamilyIndex = family;
        queueCreateInfo.queueCount = 1;
        queueCreateInfo.pQueuePriorities = &queuePriority;
        queueCreateInfos.push_back(queueCreateInfo);
    }

    VkDeviceCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    createInfo.queueCreateInfoCount = static_cast<uint32_t>(queueCreateInfos.size());
    createInfo.pQueueCreateInfos = queueCreateInfos.data();
    createInfo.pEnabledFeatures = &enabledFeatures_;
    createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions_.size());
    createInfo.ppEnabledExtensionNames = extensions_.data();

    VkDevice vkDevice;
    VkResult result = vkCreateDevice(physical_.handle(), &createInfo, nullptr, &vkDevice);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create logical device", result);
    }

    auto device = LogicalDevicePtr(new LogicalDevice());
    device->device_ = vkDevice;
    device->physical_ = physical_;
    device->anisotropyEnabled_ = enabledFeatures_.samplerAnisotropy == VK_TRUE;

    VkQueue vkGraphicsQueue;
    vkGetDeviceQueue(vkDevice, *graphicsFamily, 0, &vkGraphicsQueue);
    device->ownedQueues_.push_back(
        std::unique_ptr<Queue>(new Queue(vkGraphicsQueue, *graphicsFamily)));
    device->graphicsQueue_ = device->ownedQueues_.back().get();

    if (*presentFamily == *graphicsFamily) {
        device->presentQueue_ = device->graphicsQueue_;
    } else {
        VkQueue vkPresentQueue;
        vkGetDeviceQueue(vkDevice, *presentFamily, 0, &vkPresentQueue);
        device->ownedQueues_.push_back(
            std::unique_ptr<Queue>(new Queue(vkPresentQueue, *presentFamily)));
        device->presentQueue_ = device->ownedQueues_.back().get();
    }

    device->allocator_ = std::make_unique<MemoryAllocator>(device.get());

    FINE2D_INFO(LogCategory::Vulkan, "Logical device created");
    return device;
}

// ============================================================================
// LogicalDevice implementation
// ============================================================================

LogicalDevice::Builder LogicalDevice::create(const PhysicalDevice& physical) {
    return Builder(physical);
}

CommandPool* LogicalDevice::defaultCommandPool() {
    if (!defaultCommandPool_) {
        defaultCommandPool_ = std::make_unique<CommandPool>(
            this, graphicsQueue_, VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT);
    }
    return defaultCommandPool_.get();
}

LogicalDevice::~LogicalDevice() {
    cleanup();
}

void LogicalDevice::cleanup() {
    if (device_ != VK_NULL_HANDLE) {
        vkDeviceWaitIdle(device_);

        defaultCommandPool_.reset();
        allocator_.reset();
        ownedQueues_.clear();

        vkDestroyDevice(device_, nullptr);
        device_ = VK_NULL_HANDLE;

        FINE2D_DEBUG(LogCategory::Vulkan, "Logical device destroyed");
    }
}

void LogicalDevice::waitIdle() {
    if (device_ != VK_NULL_HANDLE) {
        VkResult result = vkDeviceWaitIdle(device_);
        if (result != VK_SUCCESS) {
            throw DeviceError("Failed to wait for device idle", result);
        }
    }
}

} // namespace fine2d
