#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/engine/platform.hpp"

#include <glm/glm.hpp>

#include <string>
#include <string_view>
#include <vector>

struct GLFWwindow;

namespace fine2d {

/**
 * @brief Window configuration options
 */
struct WindowConfig {
    std::string title = "fine2d";
    uint32_t width = 1280;
    uint32_t height = 720;
    bool resizable = true;
    bool visible = true;
};

/**
 * @brief GLFW window that queues its input as PlatformEvents
 *
 * Creating the first window initializes GLFW, so it must exist before the
 * Vulkan Instance asks GLFW for its required extensions.
 *
 * @code
 * auto window = Window::create()
 *     .title("Bunnies")
 *     .size(1280, 720)
 *     .build();
 *
 * for (const auto& event : window->pollEvents()) { ... }
 * @endcode
 */
class Window {
public:
    class Builder {
    public:
        Builder() = default;

        Builder& title(std::string_view title);
        Builder& size(uint32_t width, uint32_t height);
        Builder& resizable(bool enabled = true);

        /// Hidden windows still get a surface; used by the GPU smoke test
        Builder& visible(bool enabled = true);

        /// Throws DeviceError if GLFW cannot be initialized or the window cannot be created
        WindowPtr build();

    private:
        WindowConfig config_;
    };

    static Builder create();

    GLFWwindow* handle() const { return window_; }
    const WindowConfig& config() const { return config_; }

    bool shouldClose() const;
    void close();

    /// Framebuffer size in pixels (differs from window size on HiDPI)
    glm::uvec2 framebufferSize() const;

    bool isMinimized() const;

    /// Block until the framebuffer has a non-zero size again
    void waitWhileMinimized();

    /// Process GLFW events and return what they produced, oldest first
    std::vector<PlatformEvent> pollEvents();

    void setTitle(std::string_view title);

    ~Window();

    // Non-copyable
    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

private:
    Window() = default;

    void setupCallbacks();

    static void glfwKeyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void glfwMouseButtonCallback(GLFWwindow* window, int button, int action, int mods);
    static void glfwCursorPosCallback(GLFWwindow* window, double x, double y);
    static void glfwScrollCallback(GLFWwindow* window, double xoffset, double yoffset);
    static void glfwCharCallback(GLFWwindow* window, unsigned int codepoint);
    static void glfwFramebufferSizeCallback(GLFWwindow* window, int width, int height);

    static Modifier glfwModsToModifier(int glfwMods);

    GLFWwindow* window_ = nullptr;
    WindowConfig config_;
    std::vector<PlatformEvent> pending_;
    bool quitReported_ = false;
};

} // namespace fine2d
