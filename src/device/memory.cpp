#include "fine2d/device/memory.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/physical_device.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

namespace fine2d {

namespace {

VkMemoryPropertyFlags requiredFlags(MemoryUsage usage) {
    switch (usage) {
        case MemoryUsage::GpuOnly:
            return VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;
        case MemoryUsage::CpuToGpu:
            return VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
    }
    return 0;
}

// First type allowed by the resource that has every required flag
uint32_t pickMemoryType(const VkPhysicalDeviceMemoryProperties& types,
                        uint32_t allowed, VkMemoryPropertyFlags required) {
    for (uint32_t i = 0; i < types.memoryTypeCount; i++) {
        bool permitted = (allowed >> i) & 1u;
        if (permitted && (types.memoryTypes[i].propertyFlags & required) == required) {
            return i;
        }
    }
    throw DeviceError("No memory type for " + std::to_string(required) +
                      " in mask " + std::to_string(allowed));
}

} // anonymous namespace

MemoryAllocator::MemoryAllocator(LogicalDevice* device)
    : device_(device) {
}

MemoryAllocator::~MemoryAllocator() {
    // Buffers and images free themselves; anything left is a leaked texture or ring
    if (allocationCount_ > 0) {
        FINE2D_WARN(LogCategory::Vulkan,
            std::to_string(allocationCount_) + " device allocations leaked (" +
            std::to_string(totalAllocated_) + " bytes)");
    }
}

AllocationInfo MemoryAllocator::allocate(
    const VkMemoryRequirements& requirements, MemoryUsage usage) {

    VkMemoryAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    allocInfo.allocationSize = requirements.size;
    allocInfo.memoryTypeIndex = pickMemoryType(
        device_->physicalDevice().capabilities().memory,
        requirements.memoryTypeBits, requiredFlags(usage));

    AllocationInfo info;
    info.size = requirements.size;

    VkResult result = vkAllocateMemory(device_->handle(), &allocInfo, nullptr, &info.memory);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to allocate " + std::to_string(requirements.size) +
                          " bytes of device memory", result);
    }

    // Vertex rings and staging buffers stay mapped for their whole life
    if (usage == MemoryUsage::CpuToGpu) {
        result = vkMapMemory(device_->handle(), info.memory, 0, VK_WHOLE_SIZE, 0, &info.mappedPtr);
        if (result != VK_SUCCESS) {
            vkFreeMemory(device_->handle(), info.memory, nullptr);
            throw DeviceError("Failed to map device memory", result);
        }
    }

    totalAllocated_ += static_cast<size_t>(info.size);
    allocationCount_++;
    return info;
}

void MemoryAllocator::free(const AllocationInfo& allocation) {
    if (allocation.memory == VK_NULL_HANDLE) {
        return;
    }

    // Unmapping is implicit in vkFreeMemory
    vkFreeMemory(device_->handle(), allocation.memory, nullptr);

    totalAllocated_ -= static_cast<size_t>(allocation.size);
    allocationCount_--;
}

} // namespace fine2d
