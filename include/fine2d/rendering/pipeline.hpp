#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/graphics/draw_command.hpp"

#include <vulkan/vulkan.h>
#include <string>
#include <vector>

namespace fine2d {

/**
 * @brief Vulkan shader module wrapper
 */
class ShaderModule {
public:
    static ShaderModulePtr fromSPIRV(LogicalDevice* device, const std::vector<uint32_t>& spirv);

    /// Load a compiled .spv file; throws DeviceError if it cannot be read
    static ShaderModulePtr fromFile(LogicalDevice* device, const std::string& path);

    VkShaderModule handle() const { return module_; }

    ~ShaderModule();

    // Non-copyable
    ShaderModule(const ShaderModule&) = delete;
    ShaderModule& operator=(const ShaderModule&) = delete;

private:
    ShaderModule() = default;

    LogicalDevice* device_ = nullptr;
    VkShaderModule module_ = VK_NULL_HANDLE;
};

/**
 * @brief Vulkan pipeline layout wrapper
 */
class PipelineLayout {
public:
    class Builder {
    public:
        explicit Builder(LogicalDevice* device);

        Builder& addDescriptorSetLayout(DescriptorSetLayout& layout);
        Builder& addPushConstantRange(VkShaderStageFlags stages, uint32_t offset, uint32_t size);

        PipelineLayoutPtr build();

    private:
        LogicalDevice* device_;
        std::vector<VkDescriptorSetLayout> setLayouts_;
        std::vector<VkPushConstantRange> pushConstantRanges_;
    };

    static Builder create(LogicalDevice* device);

    /// Set 0 = texture, push constant = mat4 projection for the vertex stage
    static PipelineLayoutPtr createForSprites(LogicalDevice* device, DescriptorSetLayout& textureLayout);

    VkPipelineLayout handle() const { return layout_; }

    ~PipelineLayout();

    // Non-copyable
    PipelineLayout(const PipelineLayout&) = delete;
    PipelineLayout& operator=(const PipelineLayout&) = delete;

private:
    PipelineLayout() = default;

    LogicalDevice* device_ = nullptr;
    VkPipelineLayout layout_ = VK_NULL_HANDLE;
};

/**
 * @brief Vulkan graphics pipeline wrapper
 *
 * Sprite pipelines share one vertex layout (fine2d::Vertex), no depth, no
 * culling, dynamic viewport and scissor. Only the shaders, the blend state
 * and the render pass vary.
 *
 * @code
 * auto pipeline = GraphicsPipeline::create(device, canvasPass, layout)
 *     .vertexShader(*vert)
 *     .fragmentShader(*frag)
 *     .blend(BlendMode::Additive)
 *     .build();
 * @endcode
 */
class GraphicsPipeline {
public:
    class Builder {
    public:
        Builder(LogicalDevice* device, RenderPass* renderPass, PipelineLayout* layout);

        Builder& vertexShader(ShaderModule& module, const char* entryPoint = "main");
        Builder& fragmentShader(ShaderModule& module, const char* entryPoint = "main");
        Builder& blend(BlendMode mode);

        GraphicsPipelinePtr build();

    private:
        LogicalDevice* device_;
        RenderPass* renderPass_;
        PipelineLayout* layout_;
        std::vector<VkPipelineShaderStageCreateInfo> shaderStages_;
        BlendMode blend_ = BlendMode::Alpha;
    };

    static Builder create(LogicalDevice* device, RenderPass* renderPass, PipelineLayout* layout);

    VkPipeline handle() const { return pipeline_; }

    ~GraphicsPipeline();

    // Non-copyable
    GraphicsPipeline(const GraphicsPipeline&) = delete;
    GraphicsPipeline& operator=(const GraphicsPipeline&) = delete;

private:
    GraphicsPipeline() = default;

    LogicalDevice* device_ = nullptr;
    VkPipeline pipeline_ = VK_NULL_HANDLE;
};

} // namespace fine2d
