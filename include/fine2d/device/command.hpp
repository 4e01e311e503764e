#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <vector>

namespace fine2d {

/**
 * @brief Vulkan command pool wrapper
 */
class CommandPool {
public:
    CommandPool(LogicalDevice* device, Queue* queue,
                VkCommandPoolCreateFlags flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT);

    VkCommandPool handle() const { return pool_; }
    LogicalDevice* device() const { return device_; }
    Queue* queue() const { return queue_; }

    CommandBufferPtr allocate();
    std::vector<CommandBufferPtr> allocate(uint32_t count);

    /// Begin a one-shot command buffer; call submit() on the result
    class ImmediateCommands beginImmediate();

    ~CommandPool();

    // Non-copyable
    CommandPool(const CommandPool&) = delete;
    CommandPool& operator=(const CommandPool&) = delete;

private:
    void cleanup();

    LogicalDevice* device_ = nullptr;
    Queue* queue_ = nullptr;
    VkCommandPool pool_ = VK_NULL_HANDLE;
};

/**
 * @brief Vulkan command buffer wrapper
 *
 * Thin recording helpers; only what a sprite renderer issues.
 */
class CommandBuffer {
public:
    VkCommandBuffer handle() const { return buffer_; }

    // Recording
    void begin(VkCommandBufferUsageFlags flags = 0);
    void end();
    void reset();

    void bindPipeline(GraphicsPipeline& pipeline);
    void bindDescriptorSet(PipelineLayout& layout, VkDescriptorSet set, uint32_t setIndex = 0);

    void bindVertexBuffer(Buffer& buffer, VkDeviceSize offset = 0);
    void bindIndexBuffer(Buffer& buffer, VkDeviceSize offset = 0);

    // Dynamic state
    void setViewport(float x, float y, float width, float height);
    void setScissor(int32_t x, int32_t y, uint32_t width, uint32_t height);

    void draw(uint32_t vertexCount, uint32_t firstVertex = 0);
    void drawIndexed(uint32_t indexCount, uint32_t firstIndex = 0, int32_t vertexOffset = 0);

    void pushConstants(PipelineLayout& layout, VkShaderStageFlags stageFlags,
                       uint32_t size, const void* data);

    // Render pass
    void beginRenderPass(VkRenderPass renderPass, VkFramebuffer framebuffer,
                         VkExtent2D extent, const VkClearValue& clearValue);
    void endRenderPass();

    // Transfers
    void copyBufferToImage(Buffer& src, Image& dst);
    void transitionImageLayout(Image& image, VkImageLayout oldLayout, VkImageLayout newLayout);

    ~CommandBuffer();

    // Non-copyable
    CommandBuffer(const CommandBuffer&) = delete;
    CommandBuffer& operator=(const CommandBuffer&) = delete;

private:
    friend class CommandPool;
    CommandBuffer(CommandPool* pool, VkCommandBuffer buffer);

    CommandPool* pool_ = nullptr;
    VkCommandBuffer buffer_ = VK_NULL_HANDLE;
};

/**
 * @brief One-shot command buffer for uploads
 *
 * Recording starts on construction; submit() ends, submits and waits.
 */
class ImmediateCommands {
public:
    CommandBuffer& cmd() { return *cmd_; }

    void submit();

    ~ImmediateCommands();

    // Move-only
    ImmediateCommands(ImmediateCommands&& other) noexcept;
    ImmediateCommands& operator=(ImmediateCommands&&) = delete;
    ImmediateCommands(const ImmediateCommands&) = delete;
    ImmediateCommands& operator=(const ImmediateCommands&) = delete;

private:
    friend class CommandPool;
    ImmediateCommands(CommandPool* pool, CommandBufferPtr cmd);

    CommandPool* pool_ = nullptr;
    CommandBufferPtr cmd_;
    bool submitted_ = false;
};

} // namespace fine2d
