#include "fine2d/rendering/renderpass.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

namespace fine2d {

// ============================================================================
// RenderPass::Builder implementation
// ============================================================================

RenderPass::Builder::Builder(LogicalDevice* device)
    : device_(device) {
}

RenderPass::Builder& RenderPass::Builder::colorAttachment(
    VkFormat format,
    VkAttachmentLoadOp loadOp,
    VkImageLayout initialLayout,
    VkImageLayout finalLayout) {

    attachment_ = VkAttachmentDescription{};
    attachment_.format = format;
    attachment_.samples = VK_SAMPLE_COUNT_1_BIT;
    attachment_.loadOp = loadOp;
    attachment_.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    attachment_.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    attachment_.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    attachment_.initialLayout = initialLayout;
    attachment_.finalLayout = finalLayout;
    hasAttachment_ = true;
    return *this;
}

RenderPass::Builder& RenderPass::Builder::addDependency(const VkSubpassDependency& dependency) {
    dependencies_.push_back(dependency);
    return *this;
}

RenderPassPtr RenderPass::Builder::build() {
    if (!hasAttachment_) {
        throw std::invalid_argument("Render pass needs a color attachment");
    }

    VkAttachmentReference colorRef{};
    colorRef.attachment = 0;
    colorRef.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

    VkSubpassDescription subpass{};
    subpass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    subpass.colorAttachmentCount = 1;
    subpass.pColorAttachments = &colorRef;

    VkRenderPassCreateInfo renderPassInfo{};
    renderPassInfo.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
    renderPassInfo.attachmentCount = 1;
    renderPassInfo.pAttachments = &attachment_;
    renderPassInfo.subpassCount = 1;
    renderPassInfo.pSubpasses = &subpass;
    renderPassInfo.dependencyCount = static_cast<uint32_t>(dependencies_.size());
    renderPassInfo.pDependencies = dependencies_.empty() ? nullptr : dependencies_.data();

    VkRenderPass vkRenderPass;
    VkResult result = vkCreateRenderPass(device_->handle(), &renderPassInfo, nullptr, &vkRenderPass);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create render pass", result);
    }

    auto renderPass = RenderPassPtr(new RenderPass());
    renderPass->device_ = device_;
    renderPass->renderPass_ = vkRenderPass;

    FINE2D_DEBUG(LogCategory::Render, "Render pass created");

    return renderPass;
}

// ============================================================================
// RenderPass implementation
// ============================================================================

RenderPass::Builder RenderPass::create(LogicalDevice* device) {
    return Builder(device);
}

RenderPassPtr RenderPass::createForCanvas(LogicalDevice* device, VkFormat format) {
    // Earlier sampling of this canvas must finish before we write to it
    VkSubpassDependency before{};
    before.srcSubpass = VK_SUBPASS_EXTERNAL;
    before.dstSubpass = 0;
    before.srcStageMask = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
    before.srcAccessMask = VK_ACCESS_SHADER_READ_BIT;
    before.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    before.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_READ_BIT |
                           VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

    // And our writes must land before anything samples it
    VkSubpassDependency after{};
    after.srcSubpass = 0;
    after.dstSubpass = VK_SUBPASS_EXTERNAL;
    after.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    after.srcAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
    after.dstStageMask = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
    after.dstAccessMask = VK_ACCESS_SHADER_READ_BIT;

    return create(device)
        .colorAttachment(format, VK_ATTACHMENT_LOAD_OP_LOAD,
                         VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL,
                         VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL)
        .addDependency(before)
        .addDependency(after)
        .build();
}

RenderPassPtr RenderPass::createForPresentation(LogicalDevice* device, VkFormat format) {
    VkSubpassDependency dependency{};
    dependency.srcSubpass = VK_SUBPASS_EXTERNAL;
    dependency.dstSubpass = 0;
    dependency.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dependency.srcAccessMask = 0;
    dependency.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dependency.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

    return create(device)
        .colorAttachment(format, VK_ATTACHMENT_LOAD_OP_CLEAR,
                         VK_IMAGE_LAYOUT_UNDEFINED,
                         VK_IMAGE_LAYOUT_PRESENT_SRC_KHR)
        .addDependency(dependency)
        .build();
}

RenderPass::~RenderPass() {
    if (renderPass_ != VK_NULL_HANDLE && device_ != nullptr) {
        vkDestroyRenderPass(device_->handle(), renderPass_, nullptr);
        renderPass_ = VK_NULL_HANDLE;
        FINE2D_DEBUG(LogCategory::Render, "Render pass destroyed");
    }
}

} // namespace fine2d
