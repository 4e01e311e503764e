#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <string>

namespace fine2d {

/**
 * @brief Sampled RGBA8 image in shader-read layout
 *
 * Decoding is stb_image's job; a texture only uploads pixels. Textures
 * are owned by the VulkanRenderer and referred to by TextureHandle.
 */
class Texture {
public:
    /// Decode any format stb_image understands; throws DeviceError on failure
    static TexturePtr fromFile(LogicalDevice* device, CommandPool* commandPool,
                               const std::string& path);

    /// Upload tightly packed 8-bit RGBA pixels (width * height * 4 bytes)
    static TexturePtr fromMemory(LogicalDevice* device, CommandPool* commandPool,
                                 const void* rgba, uint32_t width, uint32_t height);

    Image& image() { return *image_; }
    ImageView& view();
    uint32_t width() const;
    uint32_t height() const;

    ~Texture();

    // Non-copyable
    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

private:
    Texture() = default;

    ImagePtr image_;
};

} // namespace fine2d
