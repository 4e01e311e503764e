#include "fine2d/rendering/sync.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

namespace fine2d {

FrameSync::FrameSync(LogicalDevice* device, uint32_t framesInFlight)
    : device_(device), slots_(framesInFlight) {
    VkSemaphoreCreateInfo semaphoreInfo{};
    semaphoreInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    VkFenceCreateInfo fenceInfo{};
    fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    VkDevice vkDevice = device_->handle();
    for (Slot& slot : slots_) {
        VkResult result = vkCreateSemaphore(vkDevice, &semaphoreInfo, nullptr, &slot.imageAvailable);
        if (result == VK_SUCCESS) {
            result = vkCreateSemaphore(vkDevice, &semaphoreInfo, nullptr, &slot.renderFinished);
        }
        if (result == VK_SUCCESS) {
            result = vkCreateFence(vkDevice, &fenceInfo, nullptr, &slot.inFlight);
        }
        if (result != VK_SUCCESS) {
            destroy();
            throw DeviceError("Failed to create frame sync objects", result);
        }
    }

    FINE2D_DEBUG(LogCategory::Render, "Created sync objects for " +
        std::to_string(framesInFlight) + " frames in flight");
}

FrameSync::~FrameSync() {
    destroy();
}

void FrameSync::destroy() {
    VkDevice vkDevice = device_->handle();
    for (Slot& slot : slots_) {
        if (slot.imageAvailable != VK_NULL_HANDLE) {
            vkDestroySemaphore(vkDevice, slot.imageAvailable, nullptr);
        }
        if (slot.renderFinished != VK_NULL_HANDLE) {
            vkDestroySemaphore(vkDevice, slot.renderFinished, nullptr);
        }
        if (slot.inFlight != VK_NULL_HANDLE) {
            vkDestroyFence(vkDevice, slot.inFlight, nullptr);
        }
    }
    slots_.clear();
}

void FrameSync::advanceFrame() {
    currentFrame_ = (currentFrame_ + 1) % static_cast<uint32_t>(slots_.size());
}

void FrameSync::waitForSlot() {
    VkFence fence = slots_[currentFrame_].inFlight;
    VkResult result = vkWaitForFences(device_->handle(), 1, &fence, VK_TRUE, UINT64_MAX);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed waiting for frame " + std::to_string(currentFrame_), result);
    }
}

void FrameSync::armFence() {
    VkFence fence = slots_[currentFrame_].inFlight;
    VkResult result = vkResetFences(device_->handle(), 1, &fence);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to reset frame fence", result);
    }
}

} // namespace fine2d
