#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <optional>
#include <vector>

namespace fine2d {

/**
 * @brief Cached device capabilities for quick queries
 */
struct DeviceCapabilities {
    VkPhysicalDeviceProperties properties{};
    VkPhysicalDeviceFeatures features{};
    VkPhysicalDeviceMemoryProperties memory{};
    std::vector<VkQueueFamilyProperties> queueFamilies;
    std::vector<VkExtensionProperties> extensions;

    bool supportsAnisotropy() const { return features.samplerAnisotropy == VK_TRUE; }
    bool supportsExtension(const char* extensionName) const;

    std::optional<uint32_t> graphicsQueueFamily() const;
    std::optional<uint32_t> presentQueueFamily(VkPhysicalDevice device, VkSurfaceKHR surface) const;

    /// Higher is better; discrete GPUs first, then device-local memory
    int score() const;
};

struct SwapChainSupport {
    VkSurfaceCapabilitiesKHR capabilities{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR> presentModes;

    bool isAdequate() const {
        return !formats.empty() && !presentModes.empty();
    }
};

/**
 * @brief A Vulkan-capable GPU
 */
class PhysicalDevice {
public:
    /// Pick the best GPU that can present to the surface
    static PhysicalDevice selectBest(Instance* instance, Surface* surface);

    VkPhysicalDevice handle() const { return device_; }
    const DeviceCapabilities& capabilities() const { return capabilities_; }

    SwapChainSupport querySwapChainSupport(VkSurfaceKHR surface) const;

    const char* name() const { return capabilities_.properties.deviceName; }

    PhysicalDevice() = default;

private:
    PhysicalDevice(Instance* instance, VkPhysicalDevice device);

    VkPhysicalDevice device_ = VK_NULL_HANDLE;
    Instance* instance_ = nullptr;
    DeviceCapabilities capabilities_;
};

} // namespace fine2d
