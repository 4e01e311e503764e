#pragma once

#include "fine2d/device/memory.hpp"
#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>

namespace fine2d {

/**
 * @brief 2D color image, either owned or borrowed from a swap chain
 */
class Image {
public:
    class Builder {
    public:
        explicit Builder(LogicalDevice* device);

        Builder& extent(uint32_t width, uint32_t height);
        Builder& format(VkFormat format);
        Builder& usage(VkImageUsageFlags usage);

        ImagePtr build();

    private:
        LogicalDevice* device_;
        uint32_t width_ = 0;
        uint32_t height_ = 0;
        VkFormat format_ = VK_FORMAT_R8G8B8A8_SRGB;
        VkImageUsageFlags usage_ = VK_IMAGE_USAGE_SAMPLED_BIT;
    };

    static Builder create(LogicalDevice* device);

    /// Sampled image filled by a staging copy
    static ImagePtr createTexture2D(LogicalDevice* device, uint32_t width, uint32_t height,
                                    VkFormat format);

    /// Render target that is later sampled (offscreen canvas)
    static ImagePtr createRenderTarget(LogicalDevice* device, uint32_t width, uint32_t height,
                                       VkFormat format);

    /// Wrap a swap chain image; memory and handle stay with the swap chain
    static ImagePtr wrapExternal(LogicalDevice* device, VkImage image, VkFormat format,
                                 uint32_t width, uint32_t height);

    VkImage handle() const { return image_; }
    VkFormat format() const { return format_; }
    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }

    /// Whole-image color view, created on first access
    ImageView* view();

    ~Image();

    // Non-copyable
    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

private:
    Image() = default;

    LogicalDevice* device_ = nullptr;
    VkImage image_ = VK_NULL_HANDLE;
    VkFormat format_ = VK_FORMAT_UNDEFINED;
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    AllocationInfo allocation_;
    bool ownsImage_ = true;
    ImageViewPtr defaultView_;
};

/**
 * @brief Vulkan image view wrapper
 */
class ImageView {
public:
    VkImageView handle() const { return view_; }
    Image* image() const { return image_; }

    ~ImageView();

    // Non-copyable
    ImageView(const ImageView&) = delete;
    ImageView& operator=(const ImageView&) = delete;

private:
    friend class Image;
    ImageView(LogicalDevice* device, Image* image, VkImageView view);

    LogicalDevice* device_ = nullptr;
    Image* image_ = nullptr;
    VkImageView view_ = VK_NULL_HANDLE;
};

} // namespace fine2d
