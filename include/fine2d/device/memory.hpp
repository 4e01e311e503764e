#pragma once

#include <vulkan/vulkan.h>
#include <cstddef>

namespace fine2d {

class LogicalDevice;

enum class MemoryUsage {
    GpuOnly,    // Device local
    CpuToGpu    // Host visible and coherent, persistently mapped
};

struct AllocationInfo {
    VkDeviceMemory memory = VK_NULL_HANDLE;
    VkDeviceSize size = 0;
    void* mappedPtr = nullptr;  // Set for CpuToGpu
};

/**
 * @brief Dedicated-allocation memory allocator
 *
 * A 2D renderer allocates a handful of long-lived buffers and one image
 * per texture, so every resource gets its own VkDeviceMemory.
 */
class MemoryAllocator {
public:
    explicit MemoryAllocator(LogicalDevice* device);
    ~MemoryAllocator();

    AllocationInfo allocate(const VkMemoryRequirements& requirements, MemoryUsage usage);
    void free(const AllocationInfo& allocation);

    size_t totalAllocated() const { return totalAllocated_; }
    size_t allocationCount() const { return allocationCount_; }

    // Non-copyable
    MemoryAllocator(const MemoryAllocator&) = delete;
    MemoryAllocator& operator=(const MemoryAllocator&) = delete;

private:
    LogicalDevice* device_;
    size_t totalAllocated_ = 0;
    size_t allocationCount_ = 0;
};

} // namespace fine2d
