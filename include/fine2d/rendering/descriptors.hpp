#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <vector>

namespace fine2d {

/**
 * @brief Vulkan descriptor set layout wrapper
 */
class DescriptorSetLayout {
public:
    class Builder {
    public:
        explicit Builder(LogicalDevice* device);

        Builder& combinedImageSampler(uint32_t binding, VkShaderStageFlags stageFlags);

        DescriptorSetLayoutPtr build();

    private:
        LogicalDevice* device_;
        std::vector<VkDescriptorSetLayoutBinding> bindings_;
    };

    static Builder create(LogicalDevice* device);

    /// Binding 0: the sprite texture, read by the fragment stage
    static DescriptorSetLayoutPtr createForSprites(LogicalDevice* device);

    VkDescriptorSetLayout handle() const { return layout_; }

    ~DescriptorSetLayout();

    // Non-copyable
    DescriptorSetLayout(const DescriptorSetLayout&) = delete;
    DescriptorSetLayout& operator=(const DescriptorSetLayout&) = delete;

private:
    DescriptorSetLayout() = default;

    LogicalDevice* device_ = nullptr;
    VkDescriptorSetLayout layout_ = VK_NULL_HANDLE;
};

/**
 * @brief Descriptor pool for per-texture sets
 *
 * Sets can be freed individually so textures may come and go.
 */
class DescriptorPool {
public:
    DescriptorPool(LogicalDevice* device, uint32_t maxSets);

    VkDescriptorPool handle() const { return pool_; }

    /// Throws DeviceError when the pool is exhausted
    VkDescriptorSet allocate(DescriptorSetLayout& layout);
    void free(VkDescriptorSet set);

    /// Point binding 0 of a set at an image and sampler
    void writeImage(VkDescriptorSet set, ImageView& view, Sampler& sampler);

    ~DescriptorPool();

    // Non-copyable
    DescriptorPool(const DescriptorPool&) = delete;
    DescriptorPool& operator=(const DescriptorPool&) = delete;

private:
    LogicalDevice* device_ = nullptr;
    VkDescriptorPool pool_ = VK_NULL_HANDLE;
};

} // namespace fine2d
