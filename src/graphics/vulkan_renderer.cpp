#include "fine2d/graphics/vulkan_renderer.hpp"
#include "fine2d/graphics/canvas.hpp"
#include "fine2d/graphics/texture.hpp"
#include "fine2d/device/buffer.hpp"
#include "fine2d/device/command.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/physical_device.hpp"
#include "fine2d/device/sampler.hpp"
#include "fine2d/rendering/descriptors.hpp"
#include "fine2d/rendering/framebuffer.hpp"
#include "fine2d/rendering/pipeline.hpp"
#include "fine2d/rendering/renderpass.hpp"
#include "fine2d/rendering/swapchain.hpp"
#include "fine2d/rendering/sync.hpp"
#include "fine2d/core/logging.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <limits>

namespace fine2d {

namespace {

constexpr uint32_t MAX_TEXTURES = 1024;
constexpr uint32_t COMPOSITE_VERTICES = 6;

/// Run a throwing device call and turn failure into DeviceResourceError
template<typename F>
auto deviceCall(const std::string& what, F&& call) -> decltype(call()) {
    try {
        return call();
    } catch (const std::exception& e) {
        FINE2D_ERROR(LogCategory::Render, what + " failed: " + e.what());
        return makeError(ErrorKind::DeviceResourceError, what + ": " + e.what());
    }
}

VkClearValue toClearValue(const Color& color) {
    VkClearValue value{};
    value.color = {{color.r, color.g, color.b, color.a}};
    return value;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

VulkanRenderer::VulkanRenderer(LogicalDevice* device, SwapChain* swapChain,
                               const EngineConfig& config)
    : device_(device)
    , swapChain_(swapChain)
    , commandPool_(device->defaultCommandPool())
    , clearColor_(config.clearColor)
    , defaultFilter_(config.defaultFilter) {

    textureSetLayout_ = DescriptorSetLayout::createForSprites(device_);
    descriptorPool_ = std::make_unique<DescriptorPool>(device_, MAX_TEXTURES);
    pipelineLayout_ = PipelineLayout::createForSprites(device_, *textureSetLayout_);
    canvasPass_ = RenderPass::createForCanvas(device_, Canvas::FORMAT);
    presentPass_ = RenderPass::createForPresentation(device_, swapChain_->format());
    nearestSampler_ = Sampler::createNearest(device_);
    linearSampler_ = Sampler::createLinear(device_);

    // Shader 0: the built-in sprite shader
    ShaderProgram sprite;
    sprite.vertex = ShaderModule::fromFile(device_, config.shaderDirectory + "/sprite.vert.spv");
    sprite.fragment = ShaderModule::fromFile(device_, config.shaderDirectory + "/sprite.frag.spv");
    shaders_.emplace(0, std::move(sprite));

    compositePipeline_ = GraphicsPipeline::create(device_, presentPass_.get(), pipelineLayout_.get())
        .vertexShader(*shaders_.at(0).vertex)
        .fragmentShader(*shaders_.at(0).fragment)
        .blend(BlendMode::Alpha)
        .build();

    // Texture 0: 1x1 white for untextured geometry
    const uint8_t white[4] = {255, 255, 255, 255};
    TextureEntry whiteEntry;
    whiteEntry.texture = Texture::fromMemory(device_, commandPool_, white, 1, 1);
    whiteEntry.descriptorSet = allocateTextureSet(whiteEntry.texture->view(), FilterMode::Nearest);
    whiteEntry.width = 1;
    whiteEntry.height = 1;
    textures_.emplace(0, std::move(whiteEntry));

    // Canvas 0: the virtual screen
    canvases_.emplace(0, std::make_unique<Canvas>(device_, commandPool_, *canvasPass_,
        config.virtualWidth, config.virtualHeight, clearColor_));
    screenSet_ = allocateTextureSet(canvases_.at(0)->view(), defaultFilter_);

    createSwapChainFramebuffers();
    sync_ = std::make_unique<FrameSync>(device_, config.framesInFlight);
    createFrameResources(config.framesInFlight, config.vertexCapacity);

    FINE2D_INFO(LogCategory::Render, "Vulkan renderer ready: virtual canvas " +
        std::to_string(config.virtualWidth) + "x" + std::to_string(config.virtualHeight) +
        ", " + std::to_string(config.framesInFlight) + " frames in flight");
}

VulkanRenderer::~VulkanRenderer() {
    try {
        device_->waitIdle();
    } catch (const std::exception& e) {
        FINE2D_ERROR(LogCategory::Render, std::string("waitIdle during teardown: ") + e.what());
    }
    FINE2D_DEBUG(LogCategory::Render, "Vulkan renderer destroyed");
}

void VulkanRenderer::createFrameResources(uint32_t framesInFlight, uint32_t vertexCapacity) {
    // Room for a couple of full batches plus the composite quad before growing
    VkDeviceSize vertices = static_cast<VkDeviceSize>(vertexCapacity) * 2 + COMPOSITE_VERTICES;
    VkDeviceSize indices = static_cast<VkDeviceSize>(vertexCapacity) * 3;

    frames_.resize(framesInFlight);
    for (auto& frame : frames_) {
        frame.cmd = commandPool_->allocate();
        frame.vertices = Buffer::createStreamingVertexBuffer(device_, vertices * sizeof(Vertex));
        frame.indices = Buffer::createStreamingIndexBuffer(device_, indices * sizeof(uint32_t));
        frame.vertexCapacity = vertices;
        frame.indexCapacity = indices;
    }
}

void VulkanRenderer::createSwapChainFramebuffers() {
    VkExtent2D extent = swapChain_->extent();
    swapChainFramebuffers_.clear();
    for (uint32_t i = 0; i < swapChain_->imageCount(); i++) {
        swapChainFramebuffers_.push_back(std::make_unique<Framebuffer>(
            device_, *presentPass_, *swapChain_->image(i).view(), extent.width, extent.height));
    }
}

void VulkanRenderer::recreateSwapChain(glm::uvec2 framebufferSize) {
    if (framebufferSize.x == 0 || framebufferSize.y == 0) {
        return;
    }

    device_->waitIdle();
    swapChainFramebuffers_.clear();

    VkFormat oldFormat = swapChain_->format();
    swapChain_->recreate(framebufferSize.x, framebufferSize.y);

    if (swapChain_->format() != oldFormat) {
        compositePipeline_.reset();
        presentPass_ = RenderPass::createForPresentation(device_, swapChain_->format());
        compositePipeline_ = GraphicsPipeline::create(device_, presentPass_.get(), pipelineLayout_.get())
            .vertexShader(*shaders_.at(0).vertex)
            .fragmentShader(*shaders_.at(0).fragment)
            .blend(BlendMode::Alpha)
            .build();
    }

    createSwapChainFramebuffers();
    swapChainDirty_ = false;
}

uint32_t VulkanRenderer::currentFrame() const {
    return sync_->currentFrame();
}

// ============================================================================
// Lookups
// ============================================================================

Sampler& VulkanRenderer::sampler(FilterMode filter) {
    return filter == FilterMode::Linear ? *linearSampler_ : *nearestSampler_;
}

VkDescriptorSet VulkanRenderer::allocateTextureSet(ImageView& view, FilterMode filter) {
    VkDescriptorSet set = descriptorPool_->allocate(*textureSetLayout_);
    descriptorPool_->writeImage(set, view, sampler(filter));
    return set;
}

Canvas& VulkanRenderer::canvasFor(CanvasHandle handle) {
    auto it = canvases_.find(handle.id);
    if (it == canvases_.end()) {
        throw DeviceError("Unknown canvas " + std::to_string(handle.id));
    }
    return *it->second;
}

GraphicsPipeline& VulkanRenderer::pipelineFor(ShaderHandle shader, BlendMode blend) {
    auto key = std::make_pair(shader.id, blend);
    auto it = pipelines_.find(key);
    if (it != pipelines_.end()) {
        return *it->second;
    }

    auto program = shaders_.find(shader.id);
    if (program == shaders_.end()) {
        throw DeviceError("Unknown shader " + std::to_string(shader.id));
    }

    auto pipeline = GraphicsPipeline::create(device_, canvasPass_.get(), pipelineLayout_.get())
        .vertexShader(*program->second.vertex)
        .fragmentShader(*program->second.fragment)
        .blend(blend)
        .build();

    GraphicsPipeline& ref = *pipeline;
    pipelines_.emplace(key, std::move(pipeline));
    return ref;
}

void VulkanRenderer::ensureRingSpace(FrameResources& frame, uint32_t vertexCount, uint32_t indexCount) {
    if (frame.vertexCursor + vertexCount > frame.vertexCapacity) {
        VkDeviceSize capacity = std::max<VkDeviceSize>(frame.vertexCapacity * 2, vertexCount);
        frame.retired.push_back(std::move(frame.vertices));
        frame.vertices = Buffer::createStreamingVertexBuffer(device_, capacity * sizeof(Vertex));
        frame.vertexCapacity = capacity;
        frame.vertexCursor = 0;
        FINE2D_DEBUG(LogCategory::Render, "Vertex ring grown to " + std::to_string(capacity));
    }
    if (frame.indexCursor + indexCount > frame.indexCapacity) {
        VkDeviceSize capacity = std::max<VkDeviceSize>(frame.indexCapacity * 2, indexCount);
        frame.retired.push_back(std::move(frame.indices));
        frame.indices = Buffer::createStreamingIndexBuffer(device_, capacity * sizeof(uint32_t));
        frame.indexCapacity = capacity;
        frame.indexCursor = 0;
        FINE2D_DEBUG(LogCategory::Render, "Index ring grown to " + std::to_string(capacity));
    }
}

// ============================================================================
// Canvas passes
// ============================================================================

void VulkanRenderer::beginCanvasPass(CanvasHandle handle) {
    Canvas& canvas = canvasFor(handle);
    CommandBuffer& cmd = *frames_[sync_->currentFrame()].cmd;

    cmd.beginRenderPass(canvasPass_->handle(), canvas.framebuffer().handle(),
                        {canvas.width(), canvas.height()}, toClearValue(Color::TRANSPARENT));
    cmd.setViewport(0.0f, 0.0f, static_cast<float>(canvas.width()),
                    static_cast<float>(canvas.height()));
    cmd.setScissor(0, 0, canvas.width(), canvas.height());

    glm::mat4 projection = canvas.projection();
    cmd.pushConstants(*pipelineLayout_, VK_SHADER_STAGE_VERTEX_BIT, sizeof(projection), &projection);

    target_ = handle;
    passOpen_ = true;
    boundPipeline_ = nullptr;
    boundSet_ = VK_NULL_HANDLE;
}

void VulkanRenderer::endCanvasPass() {
    if (passOpen_) {
        frames_[sync_->currentFrame()].cmd->endRenderPass();
        passOpen_ = false;
    }
}

void VulkanRenderer::applyScissor(const std::optional<IRect>& scissor) {
    Canvas& canvas = canvasFor(target_);
    CommandBuffer& cmd = *frames_[sync_->currentFrame()].cmd;

    if (!scissor) {
        cmd.setScissor(0, 0, canvas.width(), canvas.height());
        return;
    }

    // Clip to the canvas; Vulkan rejects negative offsets
    int32_t left = std::clamp(scissor->x, 0, static_cast<int32_t>(canvas.width()));
    int32_t top = std::clamp(scissor->y, 0, static_cast<int32_t>(canvas.height()));
    int32_t right = std::clamp(scissor->x + scissor->width, left, static_cast<int32_t>(canvas.width()));
    int32_t bottom = std::clamp(scissor->y + scissor->height, top, static_cast<int32_t>(canvas.height()));
    cmd.setScissor(left, top, static_cast<uint32_t>(right - left), static_cast<uint32_t>(bottom - top));
}

// ============================================================================
// RenderDevice
// ============================================================================

Status VulkanRenderer::beginFrame() {
    if (frameOpen_) {
        FINE2D_WARN(LogCategory::Render, "beginFrame() while a frame is open");
        endCanvasPass();
        frameOpen_ = false;
    }

    FrameResources& frame = frames_[sync_->currentFrame()];
    if (recorded_) {
        // Previous frame was never presented
        frame.cmd->end();
        recorded_ = false;
    }

    sync_->waitForSlot();
    frame.retired.clear();
    frame.vertexCursor = 0;
    frame.indexCursor = 0;

    frame.cmd->reset();
    frame.cmd->begin(VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT);
    recorded_ = true;
    frameOpen_ = true;

    beginCanvasPass(CanvasHandle::screen());
    return clear(clearColor_);
}

Status VulkanRenderer::submit(const BatchData& batch) {
    if (!passOpen_) {
        return makeError(ErrorKind::DeviceResourceError, "submit outside of a frame");
    }

    auto texture = textures_.find(batch.state.texture.id);
    if (texture == textures_.end()) {
        return makeError(ErrorKind::DeviceResourceError,
            "unknown texture " + std::to_string(batch.state.texture.id));
    }
    if (texture->second.canvas.id != 0 && texture->second.canvas == target_) {
        return makeError(ErrorKind::DeviceResourceError,
            "canvas " + std::to_string(target_.id) + " cannot be drawn into itself");
    }

    FrameResources& frame = frames_[sync_->currentFrame()];
    CommandBuffer& cmd = *frame.cmd;

    ensureRingSpace(frame, batch.vertexCount, batch.indexCount);
    frame.vertices->write(batch.vertices, batch.vertexCount * sizeof(Vertex),
                          frame.vertexCursor * sizeof(Vertex));
    frame.indices->write(batch.indices, batch.indexCount * sizeof(uint32_t),
                         frame.indexCursor * sizeof(uint32_t));

    GraphicsPipeline& pipeline = pipelineFor(batch.state.shader, batch.state.blend);
    if (&pipeline != boundPipeline_) {
        cmd.bindPipeline(pipeline);
        boundPipeline_ = &pipeline;
    }
    if (texture->second.descriptorSet != boundSet_) {
        cmd.bindDescriptorSet(*pipelineLayout_, texture->second.descriptorSet);
        boundSet_ = texture->second.descriptorSet;
    }

    cmd.bindVertexBuffer(*frame.vertices);
    cmd.bindIndexBuffer(*frame.indices);
    applyScissor(batch.state.scissor);

    cmd.drawIndexed(batch.indexCount, frame.indexCursor, static_cast<int32_t>(frame.vertexCursor));

    frame.vertexCursor += batch.vertexCount;
    frame.indexCursor += batch.indexCount;
    return ok();
}

Status VulkanRenderer::setCanvas(CanvasHandle canvas) {
    if (!frameOpen_) {
        return makeError(ErrorKind::DeviceResourceError, "setCanvas outside of a frame");
    }
    if (canvases_.find(canvas.id) == canvases_.end()) {
        return makeError(ErrorKind::DeviceResourceError, "unknown canvas " + std::to_string(canvas.id));
    }

    endCanvasPass();
    beginCanvasPass(canvas);
    return ok();
}

Status VulkanRenderer::clear(const Color& color) {
    if (!passOpen_) {
        return makeError(ErrorKind::DeviceResourceError, "clear outside of a frame");
    }

    Canvas& canvas = canvasFor(target_);

    VkClearAttachment attachment{};
    attachment.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    attachment.colorAttachment = 0;
    attachment.clearValue = toClearValue(color);

    VkClearRect rect{};
    rect.rect.offset = {0, 0};
    rect.rect.extent = {canvas.width(), canvas.height()};
    rect.baseArrayLayer = 0;
    rect.layerCount = 1;

    vkCmdClearAttachments(frames_[sync_->currentFrame()].cmd->handle(), 1, &attachment, 1, &rect);
    return ok();
}

Status VulkanRenderer::resizeScreen(uint32_t width, uint32_t height) {
    if (recorded_) {
        return makeError(ErrorKind::InvalidConfiguration,
            "the screen canvas cannot be resized during a frame");
    }

    Canvas& current = canvasFor(CanvasHandle::screen());
    if (current.width() == width && current.height() == height) {
        return ok();
    }

    device_->waitIdle();
    descriptorPool_->free(screenSet_);
    screenSet_ = VK_NULL_HANDLE;
    canvases_[0] = std::make_unique<Canvas>(device_, commandPool_, *canvasPass_,
                                            width, height, clearColor_);
    screenSet_ = allocateTextureSet(canvases_.at(0)->view(), defaultFilter_);

    FINE2D_INFO(LogCategory::Render, "Virtual canvas resized to " +
        std::to_string(width) + "x" + std::to_string(height));
    return ok();
}

Status VulkanRenderer::endFrame() {
    if (!frameOpen_) {
        return ok();
    }
    endCanvasPass();
    frameOpen_ = false;
    return ok();
}

uint32_t VulkanRenderer::maxVertices() const {
    uint64_t limit = device_->physicalDevice().capabilities().properties.limits.maxDrawIndexedIndexValue;
    return static_cast<uint32_t>(std::min<uint64_t>(limit, std::numeric_limits<uint32_t>::max()));
}

// ============================================================================
// Resources
// ============================================================================

TextureHandle VulkanRenderer::registerTexture(TexturePtr texture, FilterMode filter) {
    TextureEntry entry;
    entry.width = texture->width();
    entry.height = texture->height();
    entry.descriptorSet = allocateTextureSet(texture->view(), filter);
    entry.texture = std::move(texture);

    TextureHandle handle{nextTextureId_++, entry.width, entry.height};
    textures_.emplace(handle.id, std::move(entry));
    return handle;
}

Result<TextureHandle> VulkanRenderer::loadTexture(const std::string& path) {
    return loadTexture(path, defaultFilter_);
}

Result<TextureHandle> VulkanRenderer::loadTexture(const std::string& path, FilterMode filter) {
    return deviceCall("Load texture " + path, [&]() -> Result<TextureHandle> {
        return registerTexture(Texture::fromFile(device_, commandPool_, path), filter);
    });
}

Result<TextureHandle> VulkanRenderer::createTexture(const void* rgba, uint32_t width, uint32_t height,
                                                    FilterMode filter) {
    return deviceCall("Create texture", [&]() -> Result<TextureHandle> {
        return registerTexture(Texture::fromMemory(device_, commandPool_, rgba, width, height), filter);
    });
}

Status VulkanRenderer::releaseTexture(TextureHandle texture) {
    if (texture.id == 0) {
        return makeError(ErrorKind::InvalidConfiguration, "the white texture cannot be released");
    }
    if (recorded_) {
        return makeError(ErrorKind::InvalidConfiguration, "textures cannot be released during a frame");
    }

    auto it = textures_.find(texture.id);
    if (it == textures_.end()) {
        return makeError(ErrorKind::DeviceResourceError, "unknown texture " + std::to_string(texture.id));
    }

    return deviceCall("Release texture", [&]() -> Status {
        device_->waitIdle();
        descriptorPool_->free(it->second.descriptorSet);
        if (it->second.canvas.id != 0) {
            canvases_.erase(it->second.canvas.id);
        }
        textures_.erase(it);
        return ok();
    });
}

Result<CanvasTarget> VulkanRenderer::createCanvas(uint32_t width, uint32_t height) {
    return createCanvas(width, height, defaultFilter_);
}

Result<CanvasTarget> VulkanRenderer::createCanvas(uint32_t width, uint32_t height, FilterMode filter) {
    if (width == 0 || height == 0) {
        return makeError(ErrorKind::InvalidConfiguration, "canvas size must be non-zero");
    }

    return deviceCall("Create canvas", [&]() -> Result<CanvasTarget> {
        auto canvas = std::make_unique<Canvas>(device_, commandPool_, *canvasPass_, width, height);

        TextureEntry entry;
        entry.canvas = CanvasHandle{nextCanvasId_++};
        entry.width = width;
        entry.height = height;
        entry.descriptorSet = allocateTextureSet(canvas->view(), filter);

        CanvasTarget target{entry.canvas, TextureHandle{nextTextureId_++, width, height}};
        canvases_.emplace(target.canvas.id, std::move(canvas));
        textures_.emplace(target.texture.id, std::move(entry));
        return target;
    });
}

Result<ShaderHandle> VulkanRenderer::loadShader(const std::string& vertexPath,
                                                const std::string& fragmentPath) {
    return deviceCall("Load shader " + vertexPath, [&]() -> Result<ShaderHandle> {
        ShaderProgram program;
        program.vertex = ShaderModule::fromFile(device_, vertexPath);
        program.fragment = ShaderModule::fromFile(device_, fragmentPath);

        ShaderHandle handle{nextShaderId_++};
        shaders_.emplace(handle.id, std::move(program));
        return handle;
    });
}

// ============================================================================
// Presentation
// ============================================================================

Status VulkanRenderer::present(const Rect& viewport, const Color& letterboxColor,
                               glm::uvec2 framebufferSize) {
    if (frameOpen_) {
        FINE2D_WARN(LogCategory::Render, "present() before endFrame()");
        endCanvasPass();
        frameOpen_ = false;
    }
    if (!recorded_) {
        return ok();
    }

    return deviceCall("Present", [&]() -> Status {
        FrameResources& frame = frames_[sync_->currentFrame()];
        CommandBuffer& cmd = *frame.cmd;
        recorded_ = false;

        if (framebufferSize.x == 0 || framebufferSize.y == 0) {
            cmd.end();
            return ok();
        }
        if (swapChainDirty_ || swapChain_->needsRecreation()) {
            recreateSwapChain(framebufferSize);
        }

        AcquireResult acquired = swapChain_->acquireNextImage(sync_->imageAvailable());
        if (acquired.outOfDate) {
            cmd.end();
            recreateSwapChain(framebufferSize);
            return ok();
        }

        VkExtent2D extent = swapChain_->extent();
        cmd.beginRenderPass(presentPass_->handle(),
                            swapChainFramebuffers_[acquired.imageIndex]->handle(),
                            extent, toClearValue(letterboxColor));
        cmd.setViewport(0.0f, 0.0f, static_cast<float>(extent.width), static_cast<float>(extent.height));
        cmd.setScissor(0, 0, extent.width, extent.height);
        cmd.bindPipeline(*compositePipeline_);
        cmd.bindDescriptorSet(*pipelineLayout_, screenSet_);

        glm::mat4 projection = glm::ortho(0.0f, static_cast<float>(extent.width),
                                          0.0f, static_cast<float>(extent.height));
        cmd.pushConstants(*pipelineLayout_, VK_SHADER_STAGE_VERTEX_BIT, sizeof(projection), &projection);

        float left = viewport.x;
        float top = viewport.y;
        float right = viewport.x + viewport.width;
        float bottom = viewport.y + viewport.height;
        glm::vec4 white(1.0f);
        const Vertex quad[COMPOSITE_VERTICES] = {
            Vertex({left, top}, {0.0f, 0.0f}, white),
            Vertex({left, bottom}, {0.0f, 1.0f}, white),
            Vertex({right, bottom}, {1.0f, 1.0f}, white),
            Vertex({left, top}, {0.0f, 0.0f}, white),
            Vertex({right, bottom}, {1.0f, 1.0f}, white),
            Vertex({right, top}, {1.0f, 0.0f}, white),
        };

        ensureRingSpace(frame, COMPOSITE_VERTICES, 0);
        frame.vertices->write(quad, sizeof(quad), frame.vertexCursor * sizeof(Vertex));
        cmd.bindVertexBuffer(*frame.vertices);
        cmd.draw(COMPOSITE_VERTICES, frame.vertexCursor);
        frame.vertexCursor += COMPOSITE_VERTICES;

        cmd.endRenderPass();
        cmd.end();

        sync_->armFence();
        device_->graphicsQueue()->submit(
            cmd.handle(),
            {sync_->imageAvailable()},
            {VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT},
            {sync_->renderFinished()},
            sync_->inFlight());

        bool presented = swapChain_->present(device_->presentQueue(), acquired.imageIndex,
                                             sync_->renderFinished());
        sync_->advanceFrame();

        if (!presented || acquired.suboptimal) {
            swapChainDirty_ = true;
        }
        return ok();
    });
}

} // namespace fine2d
