#include "fine2d/device/buffer.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/core/error.hpp"

#include <cstring>

namespace fine2d {

// ============================================================================
// Buffer::Builder implementation
// ============================================================================

Buffer::Builder::Builder(LogicalDevice* device)
    : device_(device) {
}

Buffer::Builder& Buffer::Builder::size(VkDeviceSize bytes) {
    size_ = bytes;
    return *this;
}

Buffer::Builder& Buffer::Builder::usage(VkBufferUsageFlags usage) {
    usage_ = usage;
    return *this;
}

Buffer::Builder& Buffer::Builder::memoryUsage(MemoryUsage memUsage) {
    memUsage_ = memUsage;
    return *this;
}

BufferPtr Buffer::Builder::build() {
    if (size_ == 0) {
        throw std::invalid_argument("Buffer size must be greater than 0");
    }
    if (usage_ == 0) {
        throw std::invalid_argument("Buffer usage must be specified");
    }

    VkBufferCreateInfo bufferInfo{};
    bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufferInfo.size = size_;
    bufferInfo.usage = usage_;
    bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VkBuffer vkBuffer;
    VkResult result = vkCreateBuffer(device_->handle(), &bufferInfo, nullptr, &vkBuffer);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create buffer", result);
    }

    VkMemoryRequirements memRequirements;
    vkGetBufferMemoryRequirements(device_->handle(), vkBuffer, &memRequirements);

    AllocationInfo allocation;
    try {
        allocation = device_->allocator().allocate(memRequirements, memUsage_);
    } catch (...) {
        vkDestroyBuffer(device_->handle(), vkBuffer, nullptr);
        throw;
    }

    result = vkBindBufferMemory(device_->handle(), vkBuffer, allocation.memory, 0);
    if (result != VK_SUCCESS) {
        device_->allocator().free(allocation);
        vkDestroyBuffer(device_->handle(), vkBuffer, nullptr);
        throw DeviceError("Failed to bind buffer memory", result);
    }

    auto buffer = BufferPtr(new Buffer());
    buffer->device_ = device_;
    buffer->buffer_ = vkBuffer;
    buffer->size_ = size_;
    buffer->allocation_ = allocation;
    return buffer;
}

// ============================================================================
// Buffer implementation
// ============================================================================

Buffer::Builder Buffer::create(LogicalDevice* device) {
    return Builder(device);
}

BufferPtr Buffer::createStreamingVertexBuffer(LogicalDevice* device, VkDeviceSize size) {
    return create(device)
        .size(size)
        .usage(VK_BUFFER_USAGE_VERTEX_BUFFER_BIT)
        .memoryUsage(MemoryUsage::CpuToGpu)
        .build();
}

BufferPtr Buffer::createStreamingIndexBuffer(LogicalDevice* device, VkDeviceSize size) {
    return create(device)
        .size(size)
        .usage(VK_BUFFER_USAGE_INDEX_BUFFER_BIT)
        .memoryUsage(MemoryUsage::CpuToGpu)
        .build();
}

BufferPtr Buffer::createStagingBuffer(LogicalDevice* device, VkDeviceSize size) {
    return create(device)
        .size(size)
        .usage(VK_BUFFER_USAGE_TRANSFER_SRC_BIT)
        .memoryUsage(MemoryUsage::CpuToGpu)
        .build();
}

Buffer::~Buffer() {
    if (buffer_ != VK_NULL_HANDLE && device_ != nullptr) {
        vkDestroyBuffer(device_->handle(), buffer_, nullptr);
        device_->allocator().free(allocation_);
        buffer_ = VK_NULL_HANDLE;
    }
}

void Buffer::write(const void* data, VkDeviceSize dataSize, VkDeviceSize offset) {
    if (!allocation_.mappedPtr) {
        throw DeviceError("Cannot write to a GPU-only buffer");
    }
    if (offset + dataSize > size_) {
        throw DeviceError("Buffer write out of range");
    }
    std::memcpy(static_cast<char*>(allocation_.mappedPtr) + offset, data, dataSize);
}

} // namespace fine2d
