#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <string>
#include <string_view>
#include <vector>

namespace fine2d {

/**
 * @brief Vulkan instance, optionally with validation routed to the Logger
 *
 * Usage:
 * @code
 * auto instance = Instance::create()
 *     .applicationName("Bunnies")
 *     .enableValidation(true)
 *     .build();
 * @endcode
 *
 * GLFW must be initialized first; its required surface extensions are
 * added automatically.
 */
class Instance {
public:
    class Builder {
    public:
        Builder();

        Builder& applicationName(std::string_view name);
        Builder& applicationVersion(uint32_t major, uint32_t minor, uint32_t patch);

        /// Target API version (default: VK_API_VERSION_1_2)
        Builder& apiVersion(uint32_t version);

        /// Validation layers (default: enabled in debug builds)
        Builder& enableValidation(bool enable = true);

        Builder& addExtension(const char* extension);

        InstancePtr build();

    private:
        std::string appName_ = "fine2d application";
        uint32_t appVersion_ = VK_MAKE_VERSION(1, 0, 0);
        uint32_t apiVersion_ = VK_API_VERSION_1_2;
        bool validationEnabled_ = true;
        std::vector<const char*> extensions_;

        std::vector<const char*> requiredExtensions() const;
        bool validationLayerAvailable() const;
    };

    static Builder create();

    VkInstance handle() const { return instance_; }
    bool validationEnabled() const { return validationEnabled_; }

    ~Instance();

    // Non-copyable
    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    // Movable
    Instance(Instance&& other) noexcept;
    Instance& operator=(Instance&& other) noexcept;

private:
    Instance() = default;

    void createDebugMessenger();
    void cleanup();

    VkInstance instance_ = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT debugMessenger_ = VK_NULL_HANDLE;
    bool validationEnabled_ = false;
};

} // namespace fine2d
