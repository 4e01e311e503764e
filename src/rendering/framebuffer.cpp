#include "fine2d/rendering/framebuffer.hpp"
#include "fine2d/rendering/renderpass.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/core/error.hpp"

namespace fine2d {

Framebuffer::Framebuffer(LogicalDevice* device, RenderPass& renderPass, ImageView& view,
                         uint32_t width, uint32_t height)
    : device_(device), extent_{width, height} {
    if (width == 0 || height == 0) {
        throw std::invalid_argument("Framebuffer extent must be non-zero");
    }

    VkImageView attachment = view.handle();

    VkFramebufferCreateInfo framebufferInfo{};
    framebufferInfo.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
    framebufferInfo.renderPass = renderPass.handle();
    framebufferInfo.attachmentCount = 1;
    framebufferInfo.pAttachments = &attachment;
    framebufferInfo.width = width;
    framebufferInfo.height = height;
    framebufferInfo.layers = 1;

    VkResult result = vkCreateFramebuffer(device_->handle(), &framebufferInfo, nullptr, &framebuffer_);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create framebuffer", result);
    }
}

Framebuffer::~Framebuffer() {
    if (framebuffer_ != VK_NULL_HANDLE && device_ != nullptr) {
        vkDestroyFramebuffer(device_->handle(), framebuffer_, nullptr);
        framebuffer_ = VK_NULL_HANDLE;
    }
}

} // namespace fine2d
