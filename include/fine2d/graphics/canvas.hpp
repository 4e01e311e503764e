#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/graphics/color.hpp"

#include <glm/glm.hpp>
#include <vulkan/vulkan.h>

namespace fine2d {

/**
 * @brief Offscreen render target that can also be drawn as a texture
 *
 * The virtual screen is a Canvas too; the composite pass samples it into
 * the swap chain. Between render passes the image stays in
 * SHADER_READ_ONLY_OPTIMAL, which is what the canvas render pass expects
 * on entry and leaves on exit.
 */
class Canvas {
public:
    static constexpr VkFormat FORMAT = VK_FORMAT_R8G8B8A8_UNORM;

    /// New canvases start filled with initialColor
    Canvas(LogicalDevice* device, CommandPool* commandPool, RenderPass& canvasPass,
           uint32_t width, uint32_t height, const Color& initialColor = Color::TRANSPARENT);

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }

    Image& image() { return *image_; }
    ImageView& view();
    Framebuffer& framebuffer() { return *framebuffer_; }

    /// Top-left origin, y down, in canvas pixels
    glm::mat4 projection() const;

    ~Canvas();

    // Non-copyable
    Canvas(const Canvas&) = delete;
    Canvas& operator=(const Canvas&) = delete;

private:
    uint32_t width_;
    uint32_t height_;
    ImagePtr image_;
    FramebufferPtr framebuffer_;
};

} // namespace fine2d
