#include "fine2d/device/sampler.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/core/error.hpp"

#include <algorithm>

namespace fine2d {

Sampler::Sampler(LogicalDevice* device, VkFilter filter, float maxAnisotropy)
    : device_(device) {
    VkSamplerCreateInfo info{};
    info.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
    info.magFilter = filter;
    info.minFilter = filter;
    info.addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    info.addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    info.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    info.borderColor = VK_BORDER_COLOR_INT_TRANSPARENT_BLACK;
    info.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
    info.maxAnisotropy = 1.0f;

    // Only when the logical device was created with the feature
    if (device_->anisotropyEnabled() && maxAnisotropy > 1.0f) {
        float limit = device_->physicalDevice().capabilities().properties.limits.maxSamplerAnisotropy;
        info.anisotropyEnable = VK_TRUE;
        info.maxAnisotropy = std::min(maxAnisotropy, limit);
    }

    VkResult result = vkCreateSampler(device_->handle(), &info, nullptr, &sampler_);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create sampler", result);
    }
}

SamplerPtr Sampler::createLinear(LogicalDevice* device) {
    return SamplerPtr(new Sampler(device, VK_FILTER_LINEAR, 4.0f));
}

SamplerPtr Sampler::createNearest(LogicalDevice* device) {
    return SamplerPtr(new Sampler(device, VK_FILTER_NEAREST, 1.0f));
}

Sampler::~Sampler() {
    if (sampler_ != VK_NULL_HANDLE && device_ != nullptr) {
        vkDestroySampler(device_->handle(), sampler_, nullptr);
    }
}

} // namespace fine2d
