#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>

namespace fine2d {

/**
 * @brief Vulkan framebuffer over a single color view
 */
class Framebuffer {
public:
    Framebuffer(LogicalDevice* device, RenderPass& renderPass, ImageView& view,
                uint32_t width, uint32_t height);

    VkFramebuffer handle() const { return framebuffer_; }
    VkExtent2D extent() const { return extent_; }

    ~Framebuffer();

    // Non-copyable
    Framebuffer(const Framebuffer&) = delete;
    Framebuffer& operator=(const Framebuffer&) = delete;

private:
    LogicalDevice* device_ = nullptr;
    VkFramebuffer framebuffer_ = VK_NULL_HANDLE;
    VkExtent2D extent_{};
};

} // namespace fine2d
