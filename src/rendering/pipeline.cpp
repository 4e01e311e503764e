#include "fine2d/rendering/pipeline.hpp"
#include "fine2d/rendering/renderpass.hpp"
#include "fine2d/rendering/descriptors.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/graphics/vertex.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

#include <glm/glm.hpp>

#include <fstream>

namespace fine2d {

namespace {

VkPipelineColorBlendAttachmentState blendAttachment(BlendMode mode) {
    VkPipelineColorBlendAttachmentState state{};
    state.colorWriteMask =
        VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
        VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
    state.blendEnable = VK_TRUE;
    state.colorBlendOp = VK_BLEND_OP_ADD;
    state.alphaBlendOp = VK_BLEND_OP_ADD;

    switch (mode) {
    case BlendMode::Alpha:
        state.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
        state.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        state.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
        state.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        break;
    case BlendMode::PremultipliedAlpha:
        state.srcColorBlendFactor = VK_BLEND_FACTOR_ONE;
        state.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        state.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
        state.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
        break;
    case BlendMode::Additive:
        state.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
        state.dstColorBlendFactor = VK_BLEND_FACTOR_ONE;
        state.srcAlphaBlendFactor = VK_BLEND_FACTOR_ZERO;
        state.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
        break;
    case BlendMode::Multiply:
        state.srcColorBlendFactor = VK_BLEND_FACTOR_DST_COLOR;
        state.dstColorBlendFactor = VK_BLEND_FACTOR_ZERO;
        state.srcAlphaBlendFactor = VK_BLEND_FACTOR_DST_ALPHA;
        state.dstAlphaBlendFactor = VK_BLEND_FACTOR_ZERO;
        break;
    }
    return state;
}

} // namespace

// ============================================================================
// ShaderModule implementation
// ============================================================================

ShaderModulePtr ShaderModule::fromSPIRV(LogicalDevice* device, const std::vector<uint32_t>& spirv) {
    if (spirv.empty()) {
        throw std::invalid_argument("SPIR-V code is empty");
    }

    VkShaderModuleCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    createInfo.codeSize = spirv.size() * sizeof(uint32_t);
    createInfo.pCode = spirv.data();

    VkShaderModule vkModule;
    VkResult result = vkCreateShaderModule(device->handle(), &createInfo, nullptr, &vkModule);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create shader module", result);
    }

    auto module = ShaderModulePtr(new ShaderModule());
    module->device_ = device;
    module->module_ = vkModule;
    return module;
}

ShaderModulePtr ShaderModule::fromFile(LogicalDevice* device, const std::string& path) {
    std::ifstream file(path, std::ios::ate | std::ios::binary);
    if (!file.is_open()) {
        throw DeviceError("Failed to open shader file: " + path);
    }

    size_t fileSize = static_cast<size_t>(file.tellg());
    if (fileSize == 0 || fileSize % sizeof(uint32_t) != 0) {
        throw DeviceError("Not a SPIR-V file: " + path);
    }

    std::vector<uint32_t> buffer(fileSize / sizeof(uint32_t));
    file.seekg(0);
    file.read(reinterpret_cast<char*>(buffer.data()), fileSize);

    FINE2D_DEBUG(LogCategory::Resource, "Loaded shader: " + path);

    return fromSPIRV(device, buffer);
}

ShaderModule::~ShaderModule() {
    if (module_ != VK_NULL_HANDLE && device_ != nullptr) {
        vkDestroyShaderModule(device_->handle(), module_, nullptr);
        module_ = VK_NULL_HANDLE;
    }
}

// ============================================================================
// PipelineLayout implementation
// ============================================================================

PipelineLayout::Builder::Builder(LogicalDevice* device)
    : device_(device) {
}

PipelineLayout::Builder& PipelineLayout::Builder::addDescriptorSetLayout(DescriptorSetLayout& layout) {
    setLayouts_.push_back(layout.handle());
    return *this;
}

PipelineLayout::Builder& PipelineLayout::Builder::addPushConstantRange(
    VkShaderStageFlags stages, uint32_t offset, uint32_t size) {
    VkPushConstantRange range{};
    range.stageFlags = stages;
    range.offset = offset;
    range.size = size;
    pushConstantRanges_.push_back(range);
    return *this;
}

PipelineLayoutPtr PipelineLayout::Builder::build() {
    VkPipelineLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layoutInfo.setLayoutCount = static_cast<uint32_t>(setLayouts_.size());
    layoutInfo.pSetLayouts = setLayouts_.empty() ? nullptr : setLayouts_.data();
    layoutInfo.pushConstantRangeCount = static_cast<uint32_t>(pushConstantRanges_.size());
    layoutInfo.pPushConstantRanges = pushConstantRanges_.empty() ? nullptr : pushConstantRanges_.data();

    VkPipelineLayout vkLayout;
    VkResult result = vkCreatePipelineLayout(device_->handle(), &layoutInfo, nullptr, &vkLayout);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create pipeline layout", result);
    }

    auto layout = PipelineLayoutPtr(new PipelineLayout());
    layout->device_ = device_;
    layout->layout_ = vkLayout;
    return layout;
}

PipelineLayout::Builder PipelineLayout::create(LogicalDevice* device) {
    return Builder(device);
}

PipelineLayoutPtr PipelineLayout::createForSprites(LogicalDevice* device,
                                                   DescriptorSetLayout& textureLayout) {
    return create(device)
        .addDescriptorSetLayout(textureLayout)
        .addPushConstantRange(VK_SHADER_STAGE_VERTEX_BIT, 0, sizeof(glm::mat4))
        .build();
}

PipelineLayout::~PipelineLayout() {
    if (layout_ != VK_NULL_HANDLE && device_ != nullptr) {
        vkDestroyPipelineLayout(device_->handle(), layout_, nullptr);
        layout_ = VK_NULL_HANDLE;
    }
}

// ============================================================================
// GraphicsPipeline::Builder implementation
// ============================================================================

GraphicsPipeline::Builder::Builder(LogicalDevice* device, RenderPass* renderPass,
                                   PipelineLayout* layout)
    : device_(device), renderPass_(renderPass), layout_(layout) {
}

GraphicsPipeline::Builder& GraphicsPipeline::Builder::vertexShader(
    ShaderModule& module, const char* entryPoint) {
    VkPipelineShaderStageCreateInfo stageInfo{};
    stageInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stageInfo.stage = VK_SHADER_STAGE_VERTEX_BIT;
    stageInfo.module = module.handle();
    stageInfo.pName = entryPoint;
    shaderStages_.push_back(stageInfo);
    return *this;
}

GraphicsPipeline::Builder& GraphicsPipeline::Builder::fragmentShader(
    ShaderModule& module, const char* entryPoint) {
    VkPipelineShaderStageCreateInfo stageInfo{};
    stageInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stageInfo.stage = VK_SHADER_STAGE_FRAGMENT_BIT;
    stageInfo.module = module.handle();
    stageInfo.pName = entryPoint;
    shaderStages_.push_back(stageInfo);
    return *this;
}

GraphicsPipeline::Builder& GraphicsPipeline::Builder::blend(BlendMode mode) {
    blend_ = mode;
    return *this;
}

GraphicsPipelinePtr GraphicsPipeline::Builder::build() {
    if (shaderStages_.size() != 2) {
        throw std::invalid_argument("Sprite pipeline needs a vertex and a fragment shader");
    }

    // fine2d::Vertex, one interleaved binding
    VkVertexInputBindingDescription binding{};
    binding.binding = 0;
    binding.stride = sizeof(Vertex);
    binding.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;

    VkVertexInputAttributeDescription attributes[3]{};
    attributes[0] = {VERTEX_LOCATION_POSITION, 0, VK_FORMAT_R32G32_SFLOAT,
                     static_cast<uint32_t>(offsetof(Vertex, position))};
    attributes[1] = {VERTEX_LOCATION_TEXCOORD, 0, VK_FORMAT_R32G32_SFLOAT,
                     static_cast<uint32_t>(offsetof(Vertex, texCoord))};
    attributes[2] = {VERTEX_LOCATION_COLOR, 0, VK_FORMAT_R32G32B32A32_SFLOAT,
                     static_cast<uint32_t>(offsetof(Vertex, color))};

    VkPipelineVertexInputStateCreateInfo vertexInputInfo{};
    vertexInputInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    vertexInputInfo.vertexBindingDescriptionCount = 1;
    vertexInputInfo.pVertexBindingDescriptions = &binding;
    vertexInputInfo.vertexAttributeDescriptionCount = 3;
    vertexInputInfo.pVertexAttributeDescriptions = attributes;

    VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
    inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    inputAssembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
    inputAssembly.primitiveRestartEnable = VK_FALSE;

    // Viewport and scissor are dynamic
    VkPipelineViewportStateCreateInfo viewportState{};
    viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewportState.viewportCount = 1;
    viewportState.scissorCount = 1;

    // Flipped sprites change winding, so nothing is culled
    VkPipelineRasterizationStateCreateInfo rasterizer{};
    rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    rasterizer.depthClampEnable = VK_FALSE;
    rasterizer.rasterizerDiscardEnable = VK_FALSE;
    rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
    rasterizer.lineWidth = 1.0f;
    rasterizer.cullMode = VK_CULL_MODE_NONE;
    rasterizer.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;

    VkPipelineMultisampleStateCreateInfo multisampling{};
    multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;
    multisampling.minSampleShading = 1.0f;

    VkPipelineColorBlendAttachmentState colorBlendAttachment = blendAttachment(blend_);

    VkPipelineColorBlendStateCreateInfo colorBlending{};
    colorBlending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    colorBlending.logicOpEnable = VK_FALSE;
    colorBlending.attachmentCount = 1;
    colorBlending.pAttachments = &colorBlendAttachment;

    VkDynamicState dynamicStates[] = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
    VkPipelineDynamicStateCreateInfo dynamicState{};
    dynamicState.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamicState.dynamicStateCount = 2;
    dynamicState.pDynamicStates = dynamicStates;

    VkGraphicsPipelineCreateInfo pipelineInfo{};
    pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pipelineInfo.stageCount = static_cast<uint32_t>(shaderStages_.size());
    pipelineInfo.pStages = shaderStages_.data();
    pipelineInfo.pVertexInputState = &vertexInputInfo;
    pipelineInfo.pInputAssemblyState = &inputAssembly;
    pipelineInfo.pViewportState = &viewportState;
    pipelineInfo.pRasterizationState = &rasterizer;
    pipelineInfo.pMultisampleState = &multisampling;
    pipelineInfo.pDepthStencilState = nullptr;
    pipelineInfo.pColorBlendState = &colorBlending;
    pipelineInfo.pDynamicState = &dynamicState;
    pipelineInfo.layout = layout_->handle();
    pipelineInfo.renderPass = renderPass_->handle();
    pipelineInfo.subpass = 0;

    VkPipeline vkPipeline;
    VkResult result = vkCreateGraphicsPipelines(
        device_->handle(), VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &vkPipeline);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create graphics pipeline", result);
    }

    auto pipeline = GraphicsPipelinePtr(new GraphicsPipeline());
    pipeline->device_ = device_;
    pipeline->pipeline_ = vkPipeline;

    FINE2D_DEBUG(LogCategory::Render,
        std::string("Graphics pipeline created, blend ") + blendModeToString(blend_));

    return pipeline;
}

// ============================================================================
// GraphicsPipeline implementation
// ============================================================================

GraphicsPipeline::Builder GraphicsPipeline::create(
    LogicalDevice* device, RenderPass* renderPass, PipelineLayout* layout) {
    return Builder(device, renderPass, layout);
}

GraphicsPipeline::~GraphicsPipeline() {
    if (pipeline_ != VK_NULL_HANDLE && device_ != nullptr) {
        vkDestroyPipeline(device_->handle(), pipeline_, nullptr);
        pipeline_ = VK_NULL_HANDLE;
    }
}

} // namespace fine2d
