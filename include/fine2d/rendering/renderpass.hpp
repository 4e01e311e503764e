#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <vector>

namespace fine2d {

/**
 * @brief Vulkan render pass wrapper
 *
 * fine2d only needs single-subpass color passes: one into canvases, one
 * into swap chain images for the final composite.
 */
class RenderPass {
public:
    class Builder {
    public:
        explicit Builder(LogicalDevice* device);

        /// The single color attachment, referenced by subpass 0
        Builder& colorAttachment(
            VkFormat format,
            VkAttachmentLoadOp loadOp,
            VkImageLayout initialLayout,
            VkImageLayout finalLayout);

        Builder& addDependency(const VkSubpassDependency& dependency);

        RenderPassPtr build();

    private:
        LogicalDevice* device_;
        VkAttachmentDescription attachment_{};
        bool hasAttachment_ = false;
        std::vector<VkSubpassDependency> dependencies_;
    };

    static Builder create(LogicalDevice* device);

    /**
     * @brief Pass that draws into a canvas image
     *
     * Contents are loaded, not cleared, so a canvas keeps what was drawn
     * into it until cleared explicitly. The image is shader-readable before
     * and after the pass.
     */
    static RenderPassPtr createForCanvas(LogicalDevice* device, VkFormat format);

    /// Pass that clears a swap chain image and leaves it ready to present
    static RenderPassPtr createForPresentation(LogicalDevice* device, VkFormat format);

    VkRenderPass handle() const { return renderPass_; }

    ~RenderPass();

    // Non-copyable
    RenderPass(const RenderPass&) = delete;
    RenderPass& operator=(const RenderPass&) = delete;

private:
    RenderPass() = default;

    LogicalDevice* device_ = nullptr;
    VkRenderPass renderPass_ = VK_NULL_HANDLE;
};

} // namespace fine2d
