#include "fine2d/graphics/canvas.hpp"
#include "fine2d/device/command.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/rendering/framebuffer.hpp"
#include "fine2d/core/logging.hpp"

#include <glm/gtc/matrix_transform.hpp>

namespace fine2d {

Canvas::Canvas(LogicalDevice* device, CommandPool* commandPool, RenderPass& canvasPass,
               uint32_t width, uint32_t height, const Color& initialColor)
    : width_(width), height_(height) {
    image_ = Image::create(device)
        .extent(width, height)
        .format(FORMAT)
        .usage(VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT |
               VK_IMAGE_USAGE_SAMPLED_BIT |
               VK_IMAGE_USAGE_TRANSFER_DST_BIT)
        .build();

    VkClearColorValue clearValue{};
    clearValue.float32[0] = initialColor.r;
    clearValue.float32[1] = initialColor.g;
    clearValue.float32[2] = initialColor.b;
    clearValue.float32[3] = initialColor.a;

    VkImageSubresourceRange range{};
    range.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    range.levelCount = 1;
    range.layerCount = 1;

    auto imm = commandPool->beginImmediate();
    imm.cmd().transitionImageLayout(*image_,
        VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
    vkCmdClearColorImage(imm.cmd().handle(), image_->handle(),
        VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, &clearValue, 1, &range);
    imm.cmd().transitionImageLayout(*image_,
        VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
    imm.submit();

    framebuffer_ = std::make_unique<Framebuffer>(device, canvasPass, *image_->view(), width, height);

    FINE2D_DEBUG(LogCategory::Resource, "Canvas created: " +
        std::to_string(width) + "x" + std::to_string(height));
}

Canvas::~Canvas() {
    // Framebuffer refers to the image view
    framebuffer_.reset();
    image_.reset();
}

ImageView& Canvas::view() {
    return *image_->view();
}

glm::mat4 Canvas::projection() const {
    // Vulkan clip space has +y pointing down, so this keeps y = 0 at the top
    return glm::ortho(0.0f, static_cast<float>(width_), 0.0f, static_cast<float>(height_));
}

} // namespace fine2d
