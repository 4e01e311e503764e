#pragma once

#include "fine2d/device/memory.hpp"
#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>

namespace fine2d {

/**
 * @brief Vulkan buffer with its own memory allocation
 */
class Buffer {
public:
    class Builder {
    public:
        explicit Builder(LogicalDevice* device);

        Builder& size(VkDeviceSize bytes);
        Builder& usage(VkBufferUsageFlags usage);
        Builder& memoryUsage(MemoryUsage memUsage);

        BufferPtr build();

    private:
        LogicalDevice* device_;
        VkDeviceSize size_ = 0;
        VkBufferUsageFlags usage_ = 0;
        MemoryUsage memUsage_ = MemoryUsage::GpuOnly;
    };

    static Builder create(LogicalDevice* device);

    /// Host-visible, persistently mapped; rewritten every frame
    static BufferPtr createStreamingVertexBuffer(LogicalDevice* device, VkDeviceSize size);
    static BufferPtr createStreamingIndexBuffer(LogicalDevice* device, VkDeviceSize size);

    /// Host-visible transfer source
    static BufferPtr createStagingBuffer(LogicalDevice* device, VkDeviceSize size);

    VkBuffer handle() const { return buffer_; }
    VkDeviceSize size() const { return size_; }
    void* mappedPtr() const { return allocation_.mappedPtr; }

    /// Copy into a mapped buffer; throws for GPU-only buffers
    void write(const void* data, VkDeviceSize size, VkDeviceSize offset = 0);

    ~Buffer();

    // Non-copyable
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

private:
    Buffer() = default;

    LogicalDevice* device_ = nullptr;
    VkBuffer buffer_ = VK_NULL_HANDLE;
    VkDeviceSize size_ = 0;
    AllocationInfo allocation_;
};

} // namespace fine2d
