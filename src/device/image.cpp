#include "fine2d/device/image.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/core/error.hpp"

namespace fine2d {

// ============================================================================
// Image::Builder implementation
// ============================================================================

Image::Builder::Builder(LogicalDevice* device)
    : device_(device) {
}

Image::Builder& Image::Builder::extent(uint32_t width, uint32_t height) {
    width_ = width;
    height_ = height;
    return *this;
}

Image::Builder& Image::Builder::format(VkFormat format) {
    format_ = format;
    return *this;
}

Image::Builder& Image::Builder::usage(VkImageUsageFlags usage) {
    usage_ = usage;
    return *this;
}

ImagePtr Image::Builder::build() {
    if (width_ == 0 || height_ == 0) {
        throw std::invalid_argument("Image extent must be non-zero");
    }

    VkImageCreateInfo imageInfo{};
    imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    imageInfo.imageType = VK_IMAGE_TYPE_2D;
    imageInfo.extent = {width_, height_, 1};
    imageInfo.mipLevels = 1;
    imageInfo.arrayLayers = 1;
    imageInfo.format = format_;
    imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
    imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    imageInfo.usage = usage_;
    imageInfo.samples = VK_SAMPLE_COUNT_1_BIT;
    imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VkImage vkImage;
    VkResult result = vkCreateImage(device_->handle(), &imageInfo, nullptr, &vkImage);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create image", result);
    }

    VkMemoryRequirements memRequirements;
    vkGetImageMemoryRequirements(device_->handle(), vkImage, &memRequirements);

    AllocationInfo allocation;
    try {
        allocation = device_->allocator().allocate(memRequirements, MemoryUsage::GpuOnly);
    } catch (...) {
        vkDestroyImage(device_->handle(), vkImage, nullptr);
        throw;
    }

    result = vkBindImageMemory(device_->handle(), vkImage, allocation.memory, 0);
    if (result != VK_SUCCESS) {
        device_->allocator().free(allocation);
        vkDestroyImage(device_->handle(), vkImage, nullptr);
        throw DeviceError("Failed to bind image memory", result);
    }

    auto image = ImagePtr(new Image());
    image->device_ = device_;
    image->image_ = vkImage;
    image->format_ = format_;
    image->width_ = width_;
    image->height_ = height_;
    image->allocation_ = allocation;
    return image;
}

// ============================================================================
// Image implementation
// ============================================================================

Image::Builder Image::create(LogicalDevice* device) {
    return Builder(device);
}

ImagePtr Image::createTexture2D(LogicalDevice* device, uint32_t width, uint32_t height,
                                VkFormat format) {
    return create(device)
        .extent(width, height)
        .format(format)
        .usage(VK_IMAGE_USAGE_TRANSFER_DST_BIT | VK_IMAGE_USAGE_SAMPLED_BIT)
        .build();
}

ImagePtr Image::createRenderTarget(LogicalDevice* device, uint32_t width, uint32_t height,
                                   VkFormat format) {
    return create(device)
        .extent(width, height)
        .format(format)
        .usage(VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_SAMPLED_BIT)
        .build();
}

ImagePtr Image::wrapExternal(LogicalDevice* device, VkImage vkImage, VkFormat format,
                             uint32_t width, uint32_t height) {
    auto image = ImagePtr(new Image());
    image->device_ = device;
    image->image_ = vkImage;
    image->format_ = format;
    image->width_ = width;
    image->height_ = height;
    image->ownsImage_ = false;
    return image;
}

Image::~Image() {
    // Views before the image
    defaultView_.reset();

    if (image_ != VK_NULL_HANDLE && ownsImage_ && device_ != nullptr) {
        vkDestroyImage(device_->handle(), image_, nullptr);
        device_->allocator().free(allocation_);
    }
    image_ = VK_NULL_HANDLE;
}

ImageView* Image::view() {
    if (!defaultView_) {
        VkImageViewCreateInfo viewInfo{};
        viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        viewInfo.image = image_;
        viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
        viewInfo.format = format_;
        viewInfo.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        viewInfo.subresourceRange.baseMipLevel = 0;
        viewInfo.subresourceRange.levelCount = 1;
        viewInfo.subresourceRange.baseArrayLayer = 0;
        viewInfo.subresourceRange.layerCount = 1;

        VkImageView view;
        VkResult result = vkCreateImageView(device_->handle(), &viewInfo, nullptr, &view);
        if (result != VK_SUCCESS) {
            throw DeviceError("Failed to create image view", result);
        }
        defaultView_ = ImageViewPtr(new ImageView(device_, this, view));
    }
    return defaultView_.get();
}

// ============================================================================
// ImageView implementation
// ============================================================================

ImageView::ImageView(LogicalDevice* device, Image* image, VkImageView view)
    : device_(device), image_(image), view_(view) {
}

ImageView::~ImageView() {
    if (view_ != VK_NULL_HANDLE && device_ != nullptr) {
        vkDestroyImageView(device_->handle(), view_, nullptr);
        view_ = VK_NULL_HANDLE;
    }
}

} // namespace fine2d
