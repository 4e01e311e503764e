#pragma once

#include <memory>

namespace fine2d {

// Vulkan wrapper forward declarations
class Instance;
class Surface;
class PhysicalDevice;
class LogicalDevice;
class Queue;
class MemoryAllocator;
class Buffer;
class Image;
class ImageView;
class Sampler;
class CommandPool;
class CommandBuffer;
class SwapChain;
class RenderPass;
class Framebuffer;
class FrameSync;
class DescriptorSetLayout;
class DescriptorPool;
class ShaderModule;
class PipelineLayout;
class GraphicsPipeline;
class Window;
class Texture;
class Canvas;

// Owning pointers
using InstancePtr = std::unique_ptr<Instance>;
using SurfacePtr = std::unique_ptr<Surface>;
using LogicalDevicePtr = std::unique_ptr<LogicalDevice>;
using BufferPtr = std::unique_ptr<Buffer>;
using ImagePtr = std::unique_ptr<Image>;
using ImageViewPtr = std::unique_ptr<ImageView>;
using SamplerPtr = std::unique_ptr<Sampler>;
using CommandPoolPtr = std::unique_ptr<CommandPool>;
using CommandBufferPtr = std::unique_ptr<CommandBuffer>;
using SwapChainPtr = std::unique_ptr<SwapChain>;
using RenderPassPtr = std::unique_ptr<RenderPass>;
using FramebufferPtr = std::unique_ptr<Framebuffer>;
using FrameSyncPtr = std::unique_ptr<FrameSync>;
using DescriptorSetLayoutPtr = std::unique_ptr<DescriptorSetLayout>;
using DescriptorPoolPtr = std::unique_ptr<DescriptorPool>;
using ShaderModulePtr = std::unique_ptr<ShaderModule>;
using PipelineLayoutPtr = std::unique_ptr<PipelineLayout>;
using GraphicsPipelinePtr = std::unique_ptr<GraphicsPipeline>;
using WindowPtr = std::unique_ptr<Window>;
using TexturePtr = std::unique_ptr<Texture>;
using CanvasPtr = std::unique_ptr<Canvas>;

} // namespace fine2d
