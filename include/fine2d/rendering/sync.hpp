#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <vector>

namespace fine2d {

/**
 * @brief Semaphores and fence for each frame in flight
 *
 * Frame slot N may only reuse its vertex ring and command buffer once the
 * fence from its previous submit has signaled. Fences start signaled so the
 * first wait on every slot returns at once.
 */
class FrameSync {
public:
    /// Throws DeviceError if any sync object cannot be created
    FrameSync(LogicalDevice* device, uint32_t framesInFlight);
    ~FrameSync();

    // Non-copyable
    FrameSync(const FrameSync&) = delete;
    FrameSync& operator=(const FrameSync&) = delete;

    uint32_t currentFrame() const { return currentFrame_; }
    void advanceFrame();

    /// Block until the GPU is done with the current slot. Throws DeviceError.
    void waitForSlot();

    /// Unsignal the current fence. Call right before the submit that signals
    /// it again, so a failed acquire never leaves waitForSlot() blocked.
    void armFence();

    VkSemaphore imageAvailable() const { return slots_[currentFrame_].imageAvailable; }
    VkSemaphore renderFinished() const { return slots_[currentFrame_].renderFinished; }
    VkFence inFlight() const { return slots_[currentFrame_].inFlight; }

private:
    struct Slot {
        VkSemaphore imageAvailable = VK_NULL_HANDLE;
        VkSemaphore renderFinished = VK_NULL_HANDLE;
        VkFence inFlight = VK_NULL_HANDLE;
    };

    void destroy();

    LogicalDevice* device_;
    std::vector<Slot> slots_;
    uint32_t currentFrame_ = 0;
};

} // namespace fine2d
