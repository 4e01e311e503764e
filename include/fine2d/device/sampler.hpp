#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>

namespace fine2d {

/**
 * @brief Texture sampler for one FilterMode
 *
 * Both flavors clamp to the edge so atlas neighbors never bleed into a
 * sprite, and neither uses mipmaps.
 */
class Sampler {
public:
    /// Smooth sampling for scaled art, anisotropic where the device allows
    static SamplerPtr createLinear(LogicalDevice* device);

    /// Crisp texels for pixel art
    static SamplerPtr createNearest(LogicalDevice* device);

    VkSampler handle() const { return sampler_; }

    ~Sampler();

    // Non-copyable
    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

private:
    Sampler(LogicalDevice* device, VkFilter filter, float maxAnisotropy);

    LogicalDevice* device_ = nullptr;
    VkSampler sampler_ = VK_NULL_HANDLE;
};

} // namespace fine2d
