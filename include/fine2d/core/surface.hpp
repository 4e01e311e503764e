#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>

struct GLFWwindow;

namespace fine2d {

/**
 * @brief Presentable surface of a GLFW window
 */
class Surface {
public:
    static SurfacePtr fromGLFW(Instance* instance, GLFWwindow* window);

    VkSurfaceKHR handle() const { return surface_; }
    Instance* instance() const { return instance_; }

    ~Surface();

    // Non-copyable
    Surface(const Surface&) = delete;
    Surface& operator=(const Surface&) = delete;

private:
    Surface(Instance* instance, VkSurfaceKHR surface);

    void cleanup();

    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    Instance* instance_ = nullptr;
};

} // namespace fine2d
