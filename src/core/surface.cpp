#include "fine2d/core/surface.hpp"
#include "fine2d/core/instance.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

#include <GLFW/glfw3.h>

namespace fine2d {

SurfacePtr Surface::fromGLFW(Instance* instance, GLFWwindow* window) {
    if (!instance || !window) {
        throw std::invalid_argument("Surface::fromGLFW: instance and window are required");
    }

    VkSurfaceKHR surface;
    VkResult result = glfwCreateWindowSurface(instance->handle(), window, nullptr, &surface);
    if (result != VK_SUCCESS) {
        throw DeviceError("Failed to create window surface", result);
    }

    return SurfacePtr(new Surface(instance, surface));
}

Surface::Surface(Instance* instance, VkSurfaceKHR surface)
    : surface_(surface), instance_(instance) {
}

Surface::~Surface() {
    cleanup();
}

void Surface::cleanup() {
    if (surface_ != VK_NULL_HANDLE && instance_ != nullptr) {
        vkDestroySurfaceKHR(instance_->handle(), surface_, nullptr);
        surface_ = VK_NULL_HANDLE;
        FINE2D_DEBUG(LogCategory::Vulkan, "Surface destroyed");
    }
}

} // namespace fine2d
