#include "fine2d/rendering/swapchain.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/physical_device.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/core/surface.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

#include <algorithm>

namespace fine2d {

// ============================================================================
// SwapChain::Builder implementation
// ============================================================================

SwapChain::Builder::Builder(LogicalDevice* device, Surface* surface)
    : device_(device), surface_(surface) {
}

SwapChain::Builder& SwapChain::Builder::vsync(bool enabled) {
    vsync_ = enabled;
    return *this;
}

SwapChain::Builder& SwapChain::Builder::extent(uint32_t width, uint32_t height) {
    width_ = width;
    height_ = height;
    return *this;
}

SwapChain::Builder& SwapChain::Builder::imageCount(uint32_t count) {
    imageCount_ = count;
    return *this;
}

SwapChainPtr SwapChain::Builder::build() {
    SwapChainSupport support = device_->physicalDevice().querySwapChainSupport(surface_->handle());
    if (!support.isAdequate()) {
        throw DeviceError("Swap chain support is not adequate");
    }

    // Prefer a UNORM format: colors are authored in sRGB and blended as-is
    VkSurfaceFormatKHR surfaceFormat = support.formats[0];
    for (const auto& format : support.formats) {
        if (format.format == VK_FORMAT_B8G8R8A8_UNORM &&
            format.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) {
            surfaceFormat = format;
            break;
        }
    }

    VkPresentModeKHR presentMode = VK_PRESENT_MODE_FIFO_KHR;
    if (!vsync_) {
        for (VkPresentModeKHR preferred : {VK_PRESENT_MODE_MAILBOX_KHR, VK_PRESENT_MODE_IMMEDIATE_KHR}) {
            if (std::find(support.presentModes.begin(), support.presentModes.end(), preferred)
                != support.presentModes.end()) {
                presentMode = preferred;
                break;
            }
        }
    }

    auto swapChain = SwapChainPtr(new SwapChain());
    swapChain->device_ = device_;
    swapChain->surface_ = surface_;
    swapChain->format_ = surfaceFormat;
    swapChain->presentMode_ = presentMode;
    swapChain->requestedImageCount_ = imageCount_;
    swapChain->createSwapChain(width_, height_, VK_NULL_HANDLE);

    FINE2D_INFO(LogCategory::Render, "Swap chain created: " +
        std::to_string(swapChain->extent_.width) + "x" + std::to_string(swapChain->extent_.height) +
        ", " + std::to_string(swapChain->images_.size()) + " images" +
        (presentMode == VK_PRESENT_MODE_FIFO_KHR ? ", vsync" : ""));

    return swapChain;
}

// ============================================================================
// SwapChain implementation
// ============================================================================

SwapChain::Builder SwapChain::create(LogicalDevice* device, Surface* surface) {
    return Builder(device, surface);
}

SwapChain::~SwapChain() {
    cleanup();
}

void SwapChain::cleanup() {
    images_.clear();
    if (swapChain_ != VK_NULL_HANDLE && device_ != nullptr) {
        vkDestroySwapchainKHR(device_->handle(), swapChain_, nullptr);
        swapChain_ = VK_NULL_HANDLE;
        FINE2D_DEBUG(LogCategory::Render, "Swap chain destroyed");
    }
}

void SwapChain::createSwapChain(uint32_t width, uint32_t height, VkSwapchainKHR oldSwapChain) {
    SwapChainSupport support = device_->physicalDevice().querySwapChainSupport(surface_->handle());
    const auto& caps = support.capabilities;

    if (caps.currentExtent.width != UINT32_MAX) {
        extent_ = caps.currentExtent;
    } else {
        extent_.width = std::clamp(width, caps.minImageExtent.width, caps.maxImageExtent.width);
        extent_.height = std::clamp(height, caps.minImageExtent.height, caps.maxImageExtent.height);
    }

    uint32_t imageCount = std::max(requestedImageCount_, caps.minImageCount);
    if (caps.maxImageCount > 0) {
        imageCount = std::min(imageCount, caps.maxImageCount);
    }

    VkSwapchainCreateInfoKHR createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    createInfo.surface = surface_->handle();
    createInfo.minImageCount = imageCount;
    createInfo.imageFormat = format_.format;
    createInfo.imageColorSpace = format_.colorSpace;
    createInfo.imageExtent = extent_;
    createInfo.imageArrayLayers = 1;
    createInfo.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;

    uint32_t queueFamilyIndices[] = {
        device_->graphicsQueue()->familyIndex(),
        device_->presentQueue()->familyIndex()
    };

    if (queueFamilyIndices[0] != queueFamilyIndices[1]) {
        createInfo.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
        createInfo.queueFamilyIndexCount = 2;
        createInfo.pQueueFamilyIndices = queueFamilyIndices;
    } else {
        createInfo.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }

    createInfo.preTransform = caps.currentTransform;
    createInfo.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    createInfo.presentMode = presentMode_;
    createInfo.clipped = VK_TRUE;
    createInfo.oldSwapchain = oldSwapChain;

    VkSwapchainKHR vkSwapChain;
    VkResult result = vkCreateSwapchainKHR(device_->handle(), &createInfo, nullptr, &vkSwapChain);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create swap chain", result);
    }
    swapChain_ = vkSwapChain;

    uint32_t actualImageCount = 0;
    vkGetSwapchainImagesKHR(device_->handle(), swapChain_, &actualImageCount, nullptr);
    std::vector<VkImage> vkImages(actualImageCount);
    vkGetSwapchainImagesKHR(device_->handle(), swapChain_, &actualImageCount, vkImages.data());

    images_.clear();
    images_.reserve(actualImageCount);
    for (VkImage vkImage : vkImages) {
        images_.push_back(Image::wrapExternal(device_, vkImage, format_.format,
                                              extent_.width, extent_.height));
    }
}

AcquireResult SwapChain::acquireNextImage(VkSemaphore signalSemaphore, uint64_t timeout) {
    AcquireResult result;

    VkResult vkResult = vkAcquireNextImageKHR(
        device_->handle(), swapChain_, timeout,
        signalSemaphore, VK_NULL_HANDLE, &result.imageIndex);

    if (vkResult == VK_ERROR_OUT_OF_DATE_KHR) {
        result.outOfDate = true;
        needsRecreation_ = true;
    } else if (vkResult == VK_SUBOPTIMAL_KHR) {
        result.suboptimal = true;
    } else if (vkResult != VK_SUCCESS) {
        throw DeviceError("Failed to acquire swap chain image", vkResult);
    }

    return result;
}

bool SwapChain::present(Queue* queue, uint32_t imageIndex, VkSemaphore waitSemaphore) {
    VkResult result = queue->present(swapChain_, imageIndex, waitSemaphore);

    if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR) {
        needsRecreation_ = true;
        return false;
    }
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to present swap chain image", result);
    }
    return true;
}

void SwapChain::recreate(uint32_t width, uint32_t height) {
    device_->waitIdle();

    VkSwapchainKHR oldSwapChain = swapChain_;
    images_.clear();
    createSwapChain(width, height, oldSwapChain);
    vkDestroySwapchainKHR(device_->handle(), oldSwapChain, nullptr);

    needsRecreation_ = false;

    FINE2D_INFO(LogCategory::Render, "Swap chain recreated: " +
        std::to_string(extent_.width) + "x" + std::to_string(extent_.height));
}

} // namespace fine2d
