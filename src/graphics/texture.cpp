#include "fine2d/graphics/texture.hpp"
#include "fine2d/device/buffer.hpp"
#include "fine2d/device/command.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

namespace fine2d {

TexturePtr Texture::fromFile(LogicalDevice* device, CommandPool* commandPool,
                             const std::string& path) {
    int width, height, channels;
    stbi_uc* pixels = stbi_load(path.c_str(), &width, &height, &channels, STBI_rgb_alpha);

    if (!pixels) {
        throw DeviceError("Failed to load texture: " + path + " (" + stbi_failure_reason() + ")");
    }

    FINE2D_DEBUG(LogCategory::Resource, "Loaded texture: " + path +
        " (" + std::to_string(width) + "x" + std::to_string(height) + ")");

    TexturePtr texture;
    try {
        texture = fromMemory(device, commandPool, pixels,
                             static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    } catch (...) {
        stbi_image_free(pixels);
        throw;
    }

    stbi_image_free(pixels);
    return texture;
}

TexturePtr Texture::fromMemory(LogicalDevice* device, CommandPool* commandPool,
                               const void* rgba, uint32_t width, uint32_t height) {
    if (rgba == nullptr || width == 0 || height == 0) {
        throw std::invalid_argument("Texture needs pixels and a non-zero size");
    }

    VkDeviceSize imageSize = static_cast<VkDeviceSize>(width) * height * 4;

    auto stagingBuffer = Buffer::createStagingBuffer(device, imageSize);
    stagingBuffer->write(rgba, imageSize);

    // Colors are blended as authored, so no sRGB decode on sampling
    auto image = Image::createTexture2D(device, width, height, VK_FORMAT_R8G8B8A8_UNORM);

    auto imm = commandPool->beginImmediate();
    imm.cmd().transitionImageLayout(*image,
        VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
    imm.cmd().copyBufferToImage(*stagingBuffer, *image);
    imm.cmd().transitionImageLayout(*image,
        VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
    imm.submit();

    auto texture = TexturePtr(new Texture());
    texture->image_ = std::move(image);
    return texture;
}

Texture::~Texture() = default;

ImageView& Texture::view() {
    return *image_->view();
}

uint32_t Texture::width() const {
    return image_->width();
}

uint32_t Texture::height() const {
    return image_->height();
}

} // namespace fine2d
