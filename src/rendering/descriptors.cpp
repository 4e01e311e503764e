#include "fine2d/rendering/descriptors.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/device/sampler.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

namespace fine2d {

// ============================================================================
// DescriptorSetLayout::Builder implementation
// ============================================================================

DescriptorSetLayout::Builder::Builder(LogicalDevice* device)
    : device_(device) {
}

DescriptorSetLayout::Builder& DescriptorSetLayout::Builder::combinedImageSampler(
    uint32_t binding, VkShaderStageFlags stageFlags) {

    VkDescriptorSetLayoutBinding layoutBinding{};
    layoutBinding.binding = binding;
    layoutBinding.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    layoutBinding.descriptorCount = 1;
    layoutBinding.stageFlags = stageFlags;
    layoutBinding.pImmutableSamplers = nullptr;

    bindings_.push_back(layoutBinding);
    return *this;
}

DescriptorSetLayoutPtr DescriptorSetLayout::Builder::build() {
    VkDescriptorSetLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layoutInfo.bindingCount = static_cast<uint32_t>(bindings_.size());
    layoutInfo.pBindings = bindings_.empty() ? nullptr : bindings_.data();

    VkDescriptorSetLayout vkLayout;
    VkResult result = vkCreateDescriptorSetLayout(device_->handle(), &layoutInfo, nullptr, &vkLayout);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create descriptor set layout", result);
    }

    auto layout = DescriptorSetLayoutPtr(new DescriptorSetLayout());
    layout->device_ = device_;
    layout->layout_ = vkLayout;
    return layout;
}

// ============================================================================
// DescriptorSetLayout implementation
// ============================================================================

DescriptorSetLayout::Builder DescriptorSetLayout::create(LogicalDevice* device) {
    return Builder(device);
}

DescriptorSetLayoutPtr DescriptorSetLayout::createForSprites(LogicalDevice* device) {
    return create(device)
        .combinedImageSampler(0, VK_SHADER_STAGE_FRAGMENT_BIT)
        .build();
}

DescriptorSetLayout::~DescriptorSetLayout() {
    if (layout_ != VK_NULL_HANDLE && device_ != nullptr) {
        vkDestroyDescriptorSetLayout(device_->handle(), layout_, nullptr);
        layout_ = VK_NULL_HANDLE;
    }
}

// ============================================================================
// DescriptorPool implementation
// ============================================================================

DescriptorPool::DescriptorPool(LogicalDevice* device, uint32_t maxSets)
    : device_(device) {
    VkDescriptorPoolSize poolSize{};
    poolSize.type = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    poolSize.descriptorCount = maxSets;

    VkDescriptorPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    poolInfo.maxSets = maxSets;
    poolInfo.poolSizeCount = 1;
    poolInfo.pPoolSizes = &poolSize;

    VkResult result = vkCreateDescriptorPool(device_->handle(), &poolInfo, nullptr, &pool_);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create descriptor pool", result);
    }

    FINE2D_DEBUG(LogCategory::Render, "Descriptor pool created for " +
        std::to_string(maxSets) + " textures");
}

DescriptorPool::~DescriptorPool() {
    if (pool_ != VK_NULL_HANDLE && device_ != nullptr) {
        vkDestroyDescriptorPool(device_->handle(), pool_, nullptr);
        pool_ = VK_NULL_HANDLE;
    }
}

VkDescriptorSet DescriptorPool::allocate(DescriptorSetLayout& layout) {
    VkDescriptorSetLayout vkLayout = layout.handle();

    VkDescriptorSetAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocInfo.descriptorPool = pool_;
    allocInfo.descriptorSetCount = 1;
    allocInfo.pSetLayouts = &vkLayout;

    VkDescriptorSet set;
    VkResult result = vkAllocateDescriptorSets(device_->handle(), &allocInfo, &set);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to allocate descriptor set", result);
    }
    return set;
}

void DescriptorPool::free(VkDescriptorSet set) {
    if (set != VK_NULL_HANDLE) {
        vkFreeDescriptorSets(device_->handle(), pool_, 1, &set);
    }
}

void DescriptorPool::writeImage(VkDescriptorSet set, ImageView& view, Sampler& sampler) {
    VkDescriptorImageInfo imageInfo{};
    imageInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    imageInfo.imageView = view.handle();
    imageInfo.sampler = sampler.handle();

    VkWriteDescriptorSet write{};
    write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    write.dstSet = set;
    write.dstBinding = 0;
    write.dstArrayElement = 0;
    write.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    write.descriptorCount = 1;
    write.pImageInfo = &imageInfo;

    vkUpdateDescriptorSets(device_->handle(), 1, &write, 0, nullptr);
}

} // namespace fine2d
