#include "fine2d/device/command.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/buffer.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/rendering/pipeline.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

namespace fine2d {

// ============================================================================
// CommandPool implementation
// ============================================================================

CommandPool::CommandPool(LogicalDevice* device, Queue* queue, VkCommandPoolCreateFlags flags)
    : device_(device), queue_(queue) {

    VkCommandPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolInfo.queueFamilyIndex = queue->familyIndex();
    poolInfo.flags = flags;

    VkResult result = vkCreateCommandPool(device_->handle(), &poolInfo, nullptr, &pool_);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create command pool", result);
    }
}

CommandPool::~CommandPool() {
    cleanup();
}

void CommandPool::cleanup() {
    if (pool_ != VK_NULL_HANDLE && device_ != nullptr) {
        vkDestroyCommandPool(device_->handle(), pool_, nullptr);
        pool_ = VK_NULL_HANDLE;
    }
}

CommandBufferPtr CommandPool::allocate() {
    auto buffers = allocate(1);
    return std::move(buffers.front());
}

std::vector<CommandBufferPtr> CommandPool::allocate(uint32_t count) {
    VkCommandBufferAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    allocInfo.commandPool = pool_;
    allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocInfo.commandBufferCount = count;

    std::vector<VkCommandBuffer> buffers(count);
    VkResult result = vkAllocateCommandBuffers(device_->handle(), &allocInfo, buffers.data());
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to allocate command buffers", result);
    }

    std::vector<CommandBufferPtr> cmdBuffers;
    cmdBuffers.reserve(count);
    for (auto buffer : buffers) {
        cmdBuffers.push_back(CommandBufferPtr(new CommandBuffer(this, buffer)));
    }
    return cmdBuffers;
}

ImmediateCommands CommandPool::beginImmediate() {
    auto cmd = allocate();
    cmd->begin(VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT);
    return ImmediateCommands(this, std::move(cmd));
}

// ============================================================================
// CommandBuffer implementation
// ============================================================================

CommandBuffer::CommandBuffer(CommandPool* pool, VkCommandBuffer buffer)
    : pool_(pool), buffer_(buffer) {
}

CommandBuffer::~CommandBuffer() {
    if (buffer_ != VK_NULL_HANDLE && pool_ != nullptr) {
        vkFreeCommandBuffers(pool_->device()->handle(), pool_->handle(), 1, &buffer_);
        buffer_ = VK_NULL_HANDLE;
    }
}

void CommandBuffer::begin(VkCommandBufferUsageFlags flags) {
    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = flags;

    VkResult result = vkBeginCommandBuffer(buffer_, &beginInfo);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to begin recording command buffer", result);
    }
}

void CommandBuffer::end() {
    VkResult result = vkEndCommandBuffer(buffer_);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to end command buffer recording", result);
    }
}

void CommandBuffer::reset() {
    VkResult result = vkResetCommandBuffer(buffer_, 0);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to reset command buffer", result);
    }
}

void CommandBuffer::bindPipeline(GraphicsPipeline& pipeline) {
    vkCmdBindPipeline(buffer_, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline.handle());
}

void CommandBuffer::bindDescriptorSet(PipelineLayout& layout, VkDescriptorSet set, uint32_t setIndex) {
    vkCmdBindDescriptorSets(
        buffer_, VK_PIPELINE_BIND_POINT_GRAPHICS, layout.handle(),
        setIndex, 1, &set, 0, nullptr);
}

void CommandBuffer::bindVertexBuffer(Buffer& buffer, VkDeviceSize offset) {
    VkBuffer buffers[] = {buffer.handle()};
    VkDeviceSize offsets[] = {offset};
    vkCmdBindVertexBuffers(buffer_, 0, 1, buffers, offsets);
}

void CommandBuffer::bindIndexBuffer(Buffer& buffer, VkDeviceSize offset) {
    vkCmdBindIndexBuffer(buffer_, buffer.handle(), offset, VK_INDEX_TYPE_UINT32);
}

void CommandBuffer::setViewport(float x, float y, float width, float height) {
    VkViewport viewport{};
    viewport.x = x;
    viewport.y = y;
    viewport.width = width;
    viewport.height = height;
    viewport.minDepth = 0.0f;
    viewport.maxDepth = 1.0f;
    vkCmdSetViewport(buffer_, 0, 1, &viewport);
}

void CommandBuffer::setScissor(int32_t x, int32_t y, uint32_t width, uint32_t height) {
    VkRect2D scissor{};
    scissor.offset = {x, y};
    scissor.extent = {width, height};
    vkCmdSetScissor(buffer_, 0, 1, &scissor);
}

void CommandBuffer::draw(uint32_t vertexCount, uint32_t firstVertex) {
    vkCmdDraw(buffer_, vertexCount, 1, firstVertex, 0);
}

void CommandBuffer::drawIndexed(uint32_t indexCount, uint32_t firstIndex, int32_t vertexOffset) {
    vkCmdDrawIndexed(buffer_, indexCount, 1, firstIndex, vertexOffset, 0);
}

void CommandBuffer::pushConstants(PipelineLayout& layout, VkShaderStageFlags stageFlags,
                                  uint32_t size, const void* data) {
    vkCmdPushConstants(buffer_, layout.handle(), stageFlags, 0, size, data);
}

void CommandBuffer::beginRenderPass(VkRenderPass renderPass, VkFramebuffer framebuffer,
                                    VkExtent2D extent, const VkClearValue& clearValue) {
    VkRenderPassBeginInfo renderPassInfo{};
    renderPassInfo.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    renderPassInfo.renderPass = renderPass;
    renderPassInfo.framebuffer = framebuffer;
    renderPassInfo.renderArea.offset = {0, 0};
    renderPassInfo.renderArea.extent = extent;
    renderPassInfo.clearValueCount = 1;
    renderPassInfo.pClearValues = &clearValue;

    vkCmdBeginRenderPass(buffer_, &renderPassInfo, VK_SUBPASS_CONTENTS_INLINE);
}

void CommandBuffer::endRenderPass() {
    vkCmdEndRenderPass(buffer_);
}

void CommandBuffer::copyBufferToImage(Buffer& src, Image& dst) {
    VkBufferImageCopy region{};
    region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    region.imageSubresource.mipLevel = 0;
    region.imageSubresource.baseArrayLayer = 0;
    region.imageSubresource.layerCount = 1;
    region.imageOffset = {0, 0, 0};
    region.imageExtent = {dst.width(), dst.height(), 1};

    vkCmdCopyBufferToImage(buffer_, src.handle(), dst.handle(),
                           VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);
}

void CommandBuffer::transitionImageLayout(Image& image, VkImageLayout oldLayout,
                                          VkImageLayout newLayout) {
    VkImageMemoryBarrier barrier{};
    barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
    barrier.oldLayout = oldLayout;
    barrier.newLayout = newLayout;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = image.handle();
    barrier.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    barrier.subresourceRange.baseMipLevel = 0;
    barrier.subresourceRange.levelCount = 1;
    barrier.subresourceRange.baseArrayLayer = 0;
    barrier.subresourceRange.layerCount = 1;

    VkPipelineStageFlags sourceStage;
    VkPipelineStageFlags destinationStage;

    if (oldLayout == VK_IMAGE_LAYOUT_UNDEFINED &&
        newLayout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL) {
        barrier.srcAccessMask = 0;
        barrier.dstAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
        sourceStage = VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT;
        destinationStage = VK_PIPELINE_STAGE_TRANSFER_BIT;
    }
    else if (oldLayout == VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL &&
             newLayout == VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL) {
        barrier.srcAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
        barrier.dstAccessMask = VK_ACCESS_SHADER_READ_BIT;
        sourceStage = VK_PIPELINE_STAGE_TRANSFER_BIT;
        destinationStage = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
    }
    else if (oldLayout == VK_IMAGE_LAYOUT_UNDEFINED &&
             newLayout == VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL) {
        // Fresh canvas that is sampled before it is ever drawn to
        barrier.srcAccessMask = 0;
        barrier.dstAccessMask = VK_ACCESS_SHADER_READ_BIT;
        sourceStage = VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT;
        destinationStage = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
    }
    else {
        barrier.srcAccessMask = VK_ACCESS_MEMORY_READ_BIT | VK_ACCESS_MEMORY_WRITE_BIT;
        barrier.dstAccessMask = VK_ACCESS_MEMORY_READ_BIT | VK_ACCESS_MEMORY_WRITE_BIT;
        sourceStage = VK_PIPELINE_STAGE_ALL_COMMANDS_BIT;
        destinationStage = VK_PIPELINE_STAGE_ALL_COMMANDS_BIT;
    }

    vkCmdPipelineBarrier(buffer_, sourceStage, destinationStage, 0,
                         0, nullptr, 0, nullptr, 1, &barrier);
}

// ============================================================================
// ImmediateCommands implementation
// ============================================================================

ImmediateCommands::ImmediateCommands(CommandPool* pool, CommandBufferPtr cmd)
    : pool_(pool), cmd_(std::move(cmd)) {
}

ImmediateCommands::ImmediateCommands(ImmediateCommands&& other) noexcept
    : pool_(other.pool_)
    , cmd_(std::move(other.cmd_))
    , submitted_(other.submitted_) {
    other.submitted_ = true;
}

ImmediateCommands::~ImmediateCommands() {
    if (!submitted_ && cmd_) {
        FINE2D_WARN(LogCategory::Vulkan, "Immediate command buffer discarded without submit");
    }
}

void ImmediateCommands::submit() {
    if (submitted_) {
        return;
    }
    submitted_ = true;

    cmd_->end();

    VkSubmitInfo submitInfo{};
    submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submitInfo.commandBufferCount = 1;
    VkCommandBuffer buffer = cmd_->handle();
    submitInfo.pCommandBuffers = &buffer;

    pool_->queue()->submit(submitInfo);
    pool_->queue()->waitIdle();
}

} // namespace fine2d
