#include "fine2d/device/physical_device.hpp"
#include "fine2d/core/instance.hpp"
#include "fine2d/core/surface.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

#include <cstring>

namespace fine2d {

// ============================================================================
// DeviceCapabilities implementation
// ============================================================================

bool DeviceCapabilities::supportsExtension(const char* extensionName) const {
    for (const auto& ext : extensions) {
        if (std::strcmp(ext.extensionName, extensionName) == 0) {
            return true;
        }
    }
    return false;
}

std::optional<uint32_t> DeviceCapabilities::graphicsQueueFamily() const {
    for (uint32_t i = 0; i < queueFamilies.size(); i++) {
        if (queueFamilies[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<uint32_t> DeviceCapabilities::presentQueueFamily(
    VkPhysicalDevice device, VkSurfaceKHR surface) const {
    // Prefer the graphics family so a single queue does both
    auto graphics = graphicsQueueFamily();
    if (graphics) {
        VkBool32 presentSupport = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, *graphics, surface, &presentSupport);
        if (presentSupport) {
            return graphics;
        }
    }

    for (uint32_t i = 0; i < queueFamilies.size(); i++) {
        VkBool32 presentSupport = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface, &presentSupport);
        if (presentSupport) {
            return i;
        }
    }
    return std::nullopt;
}

int DeviceCapabilities::score() const {
    int score = 0;

    if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) {
        score += 10000;
    } else if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU) {
        score += 1000;
    }

    for (uint32_t i = 0; i < memory.memoryHeapCount; i++) {
        if (memory.memoryHeaps[i].flags & VK_MEMORY_HEAP_DEVICE_LOCAL_BIT) {
            score += static_cast<int>(memory.memoryHeaps[i].size / (1024 * 1024 * 64));
        }
    }

    if (supportsAnisotropy()) score += 100;

    return score;
}

// ============================================================================
// PhysicalDevice implementation
// ============================================================================

PhysicalDevice::PhysicalDevice(Instance* instance, VkPhysicalDevice device)
    : device_(device), instance_(instance) {
    vkGetPhysicalDeviceProperties(device_, &capabilities_.properties);
    vkGetPhysicalDeviceFeatures(device_, &capabilities_.features);
    vkGetPhysicalDeviceMemoryProperties(device_, &capabilities_.memory);

    uint32_t queueFamilyCount = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device_, &queueFamilyCount, nullptr);
    capabilities_.queueFamilies.resize(queueFamilyCount);
    vkGetPhysicalDeviceQueueFamilyProperties(device_, &queueFamilyCount,
                                             capabilities_.queueFamilies.data());

    uint32_t extensionCount = 0;
    vkEnumerateDeviceExtensionProperties(device_, nullptr, &extensionCount, nullptr);
    capabilities_.extensions.resize(extensionCount);
    vkEnumerateDeviceExtensionProperties(device_, nullptr, &extensionCount,
                                         capabilities_.extensions.data());
}

PhysicalDevice PhysicalDevice::selectBest(Instance* instance, Surface* surface) {
    if (!instance || !surface) {
        throw std::invalid_argument("PhysicalDevice::selectBest: instance and surface are required");
    }

    uint32_t deviceCount = 0;
    vkEnumeratePhysicalDevices(instance->handle(), &deviceCount, nullptr);
    if (deviceCount == 0) {
        throw DeviceError("No Vulkan-capable GPUs found");
    }

    std::vector<VkPhysicalDevice> vkDevices(deviceCount);
    vkEnumeratePhysicalDevices(instance->handle(), &deviceCount, vkDevices.data());

    FINE2D_DEBUG(LogCategory::Vulkan, "Found " + std::to_string(deviceCount) + " physical device(s)");

    std::optional<PhysicalDevice> best;
    int bestScore = -1;

    for (VkPhysicalDevice vkDevice : vkDevices) {
        PhysicalDevice device(instance, vkDevice);
        const auto& caps = device.capabilities();

        if (!caps.graphicsQueueFamily() ||
            !caps.presentQueueFamily(vkDevice, surface->handle()) ||
            !caps.supportsExtension(VK_KHR_SWAPCHAIN_EXTENSION_NAME) ||
            !device.querySwapChainSupport(surface->handle()).isAdequate()) {
            continue;
        }

        int score = caps.score();
        if (score > bestScore) {
            bestScore = score;
            best = device;
        }
    }

    if (!best) {
        throw DeviceError("No suitable GPU found");
    }

    FINE2D_INFO(LogCategory::Vulkan, std::string("Selected GPU: ") + best->name());
    return *best;
}

SwapChainSupport PhysicalDevice::querySwapChainSupport(VkSurfaceKHR surface) const {
    SwapChainSupport support;

    vkGetPhysicalDeviceSurfaceCapabilitiesKHR(device_, surface, &support.capabilities);

    uint32_t formatCount = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(device_, surface, &formatCount, nullptr);
    if (formatCount > 0) {
        support.formats.resize(formatCount);
        vkGetPhysicalDeviceSurfaceFormatsKHR(device_, surface, &formatCount,
                                             support.formats.data());
    }

    uint32_t presentModeCount = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(device_, surface, &presentModeCount, nullptr);
    if (presentModeCount > 0) {
        support.presentModes.resize(presentModeCount);
        vkGetPhysicalDeviceSurfacePresentModesKHR(device_, surface, &presentModeCount,
                                                  support.presentModes.data());
    }

    return support;
}

} // namespace fine2d
