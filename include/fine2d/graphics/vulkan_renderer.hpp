#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/engine/config.hpp"
#include "fine2d/graphics/render_device.hpp"

#include <glm/glm.hpp>
#include <vulkan/vulkan.h>

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fine2d {

/// A canvas handle plus the texture handle that samples it
struct CanvasTarget {
    CanvasHandle canvas;
    TextureHandle texture;
};

/**
 * @brief RenderDevice backed by Vulkan
 *
 * All drawing goes into canvases: the virtual screen canvas (CanvasHandle 0)
 * and any canvas created by the game. present() then composites the screen
 * canvas into a swap chain image at the scaler's viewport, with the bars
 * cleared to the letterbox color.
 *
 * Each frame in flight owns a command buffer and a host-visible vertex and
 * index ring. A ring that runs out of room is replaced by one twice the
 * size; the old buffer is kept until that frame's fence has signaled.
 */
class VulkanRenderer : public RenderDevice {
public:
    VulkanRenderer(LogicalDevice* device, SwapChain* swapChain, const EngineConfig& config);
    ~VulkanRenderer() override;

    // Non-copyable
    VulkanRenderer(const VulkanRenderer&) = delete;
    VulkanRenderer& operator=(const VulkanRenderer&) = delete;

    // ========================================================================
    // RenderDevice
    // ========================================================================

    Status beginFrame() override;
    Status submit(const BatchData& batch) override;
    Status setCanvas(CanvasHandle canvas) override;
    Status clear(const Color& color) override;
    Status resizeScreen(uint32_t width, uint32_t height) override;
    Status endFrame() override;

    /// Largest vertex count one indexed draw may reference
    uint32_t maxVertices() const override;

    // ========================================================================
    // Resources
    // ========================================================================

    Result<TextureHandle> loadTexture(const std::string& path);
    Result<TextureHandle> loadTexture(const std::string& path, FilterMode filter);
    Result<TextureHandle> createTexture(const void* rgba, uint32_t width, uint32_t height,
                                        FilterMode filter);

    /// Wait for the GPU, then free the texture. The white texture stays.
    Status releaseTexture(TextureHandle texture);

    Result<CanvasTarget> createCanvas(uint32_t width, uint32_t height);
    Result<CanvasTarget> createCanvas(uint32_t width, uint32_t height, FilterMode filter);

    /// Compiled SPIR-V pair using the sprite vertex layout and push constant
    Result<ShaderHandle> loadShader(const std::string& vertexPath, const std::string& fragmentPath);

    // ========================================================================
    // Presentation (driven by GlfwPlatform)
    // ========================================================================

    /**
     * @brief Composite the screen canvas and present
     *
     * A zero framebuffer size (minimized window) or an out-of-date swap
     * chain drops the frame without error.
     */
    Status present(const Rect& viewport, const Color& letterboxColor, glm::uvec2 framebufferSize);

    /// The next present() rebuilds the swap chain first
    void markSwapChainDirty() { swapChainDirty_ = true; }

    uint32_t textureCount() const { return static_cast<uint32_t>(textures_.size()); }
    uint32_t canvasCount() const { return static_cast<uint32_t>(canvases_.size()); }
    uint32_t currentFrame() const;

private:
    struct FrameResources {
        CommandBufferPtr cmd;
        BufferPtr vertices;
        BufferPtr indices;
        VkDeviceSize vertexCapacity = 0;    // In vertices
        VkDeviceSize indexCapacity = 0;     // In indices
        uint32_t vertexCursor = 0;
        uint32_t indexCursor = 0;
        std::vector<BufferPtr> retired;
    };

    struct TextureEntry {
        TexturePtr texture;                 // Null for canvas textures
        CanvasHandle canvas;                // Set for canvas textures
        VkDescriptorSet descriptorSet = VK_NULL_HANDLE;
        uint32_t width = 0;
        uint32_t height = 0;
    };

    struct ShaderProgram {
        ShaderModulePtr vertex;
        ShaderModulePtr fragment;
    };

    void createFrameResources(uint32_t framesInFlight, uint32_t vertexCapacity);
    void createSwapChainFramebuffers();
    void recreateSwapChain(glm::uvec2 framebufferSize);

    TextureHandle registerTexture(TexturePtr texture, FilterMode filter);
    VkDescriptorSet allocateTextureSet(ImageView& view, FilterMode filter);
    Sampler& sampler(FilterMode filter);

    Canvas& canvasFor(CanvasHandle handle);
    GraphicsPipeline& pipelineFor(ShaderHandle shader, BlendMode blend);
    void ensureRingSpace(FrameResources& frame, uint32_t vertexCount, uint32_t indexCount);

    void beginCanvasPass(CanvasHandle handle);
    void endCanvasPass();
    void applyScissor(const std::optional<IRect>& scissor);

    LogicalDevice* device_;
    SwapChain* swapChain_;
    CommandPool* commandPool_;
    Color clearColor_;
    FilterMode defaultFilter_;

    DescriptorSetLayoutPtr textureSetLayout_;
    DescriptorPoolPtr descriptorPool_;
    PipelineLayoutPtr pipelineLayout_;
    RenderPassPtr canvasPass_;
    RenderPassPtr presentPass_;
    SamplerPtr nearestSampler_;
    SamplerPtr linearSampler_;

    std::unordered_map<uint32_t, ShaderProgram> shaders_;
    std::map<std::pair<uint32_t, BlendMode>, GraphicsPipelinePtr> pipelines_;
    GraphicsPipelinePtr compositePipeline_;

    std::unordered_map<uint32_t, TextureEntry> textures_;
    std::unordered_map<uint32_t, CanvasPtr> canvases_;
    VkDescriptorSet screenSet_ = VK_NULL_HANDLE;

    std::vector<FramebufferPtr> swapChainFramebuffers_;
    FrameSyncPtr sync_;
    std::vector<FrameResources> frames_;

    uint32_t nextTextureId_ = 1;
    uint32_t nextCanvasId_ = 1;
    uint32_t nextShaderId_ = 1;

    // Recording state for the current frame
    bool frameOpen_ = false;
    bool passOpen_ = false;
    bool recorded_ = false;
    CanvasHandle target_;
    GraphicsPipeline* boundPipeline_ = nullptr;
    VkDescriptorSet boundSet_ = VK_NULL_HANDLE;
    bool swapChainDirty_ = false;
};

} // namespace fine2d
