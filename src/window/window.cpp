#include "fine2d/window/window.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

#include <GLFW/glfw3.h>

namespace fine2d {

// Key and button codes are passed through untranslated
static_assert(KEY_ESCAPE == GLFW_KEY_ESCAPE, "Key codes must match GLFW");
static_assert(MOUSE_BUTTON_LEFT == GLFW_MOUSE_BUTTON_LEFT, "Button codes must match GLFW");
static_assert(MOUSE_BUTTON_RIGHT == GLFW_MOUSE_BUTTON_RIGHT, "Button codes must match GLFW");
static_assert(MOUSE_BUTTON_MIDDLE == GLFW_MOUSE_BUTTON_MIDDLE, "Button codes must match GLFW");

// ============================================================================
// Builder implementation
// ============================================================================

Window::Builder& Window::Builder::title(std::string_view title) {
    config_.title = std::string(title);
    return *this;
}

Window::Builder& Window::Builder::size(uint32_t width, uint32_t height) {
    config_.width = width;
    config_.height = height;
    return *this;
}

Window::Builder& Window::Builder::resizable(bool enabled) {
    config_.resizable = enabled;
    return *this;
}

Window::Builder& Window::Builder::visible(bool enabled) {
    config_.visible = enabled;
    return *this;
}

WindowPtr Window::Builder::build() {
    if (config_.width == 0 || config_.height == 0) {
        throw std::invalid_argument("Window size must be non-zero");
    }

    if (!glfwInit()) {
        throw DeviceError("Failed to initialize GLFW");
    }
    if (!glfwVulkanSupported()) {
        glfwTerminate();
        throw DeviceError("GLFW found no Vulkan loader");
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);  // No OpenGL context
    glfwWindowHint(GLFW_RESIZABLE, config_.resizable ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_VISIBLE, config_.visible ? GLFW_TRUE : GLFW_FALSE);

    auto window = WindowPtr(new Window());
    window->config_ = config_;
    window->window_ = glfwCreateWindow(
        static_cast<int>(config_.width),
        static_cast<int>(config_.height),
        config_.title.c_str(),
        nullptr,
        nullptr);

    if (!window->window_) {
        glfwTerminate();
        throw DeviceError("Failed to create GLFW window");
    }

    glfwSetWindowUserPointer(window->window_, window.get());
    window->setupCallbacks();

    FINE2D_INFO(LogCategory::Core, "Window created: " + std::to_string(config_.width) + "x" +
                std::to_string(config_.height) + " \"" + config_.title + "\"");

    return window;
}

// ============================================================================
// Window implementation
// ============================================================================

Window::Builder Window::create() {
    return Builder();
}

Window::~Window() {
    if (window_) {
        glfwDestroyWindow(window_);
        window_ = nullptr;
        glfwTerminate();
        FINE2D_DEBUG(LogCategory::Core, "Window destroyed");
    }
}

void Window::setupCallbacks() {
    glfwSetKeyCallback(window_, glfwKeyCallback);
    glfwSetMouseButtonCallback(window_, glfwMouseButtonCallback);
    glfwSetCursorPosCallback(window_, glfwCursorPosCallback);
    glfwSetScrollCallback(window_, glfwScrollCallback);
    glfwSetCharCallback(window_, glfwCharCallback);
    glfwSetFramebufferSizeCallback(window_, glfwFramebufferSizeCallback);
}

bool Window::shouldClose() const {
    return glfwWindowShouldClose(window_) == GLFW_TRUE;
}

void Window::close() {
    glfwSetWindowShouldClose(window_, GLFW_TRUE);
}

glm::uvec2 Window::framebufferSize() const {
    int w = 0, h = 0;
    glfwGetFramebufferSize(window_, &w, &h);
    return {static_cast<uint32_t>(w), static_cast<uint32_t>(h)};
}

bool Window::isMinimized() const {
    glm::uvec2 size = framebufferSize();
    return size.x == 0 || size.y == 0;
}

void Window::waitWhileMinimized() {
    while (isMinimized() && !shouldClose()) {
        glfwWaitEvents();
    }
}

std::vector<PlatformEvent> Window::pollEvents() {
    glfwPollEvents();

    if (shouldClose() && !quitReported_) {
        pending_.push_back(event::Quit{});
        quitReported_ = true;
    }

    std::vector<PlatformEvent> events;
    events.swap(pending_);
    return events;
}

void Window::setTitle(std::string_view title) {
    config_.title = std::string(title);
    glfwSetWindowTitle(window_, config_.title.c_str());
}

// ============================================================================
// GLFW callbacks
// ============================================================================

void Window::glfwKeyCallback(GLFWwindow* glfwWindow, int key, int scancode, int action, int mods) {
    auto* window = static_cast<Window*>(glfwGetWindowUserPointer(glfwWindow));
    if (!window) {
        return;
    }

    if (action == GLFW_RELEASE) {
        window->pending_.push_back(event::KeyReleased{key, scancode, glfwModsToModifier(mods)});
    } else {
        window->pending_.push_back(event::KeyPressed{
            key, scancode, glfwModsToModifier(mods), action == GLFW_REPEAT});
    }
}

void Window::glfwMouseButtonCallback(GLFWwindow* glfwWindow, int button, int action, int mods) {
    auto* window = static_cast<Window*>(glfwGetWindowUserPointer(glfwWindow));
    if (!window) {
        return;
    }

    if (action == GLFW_RELEASE) {
        window->pending_.push_back(event::MouseButtonReleased{button, glfwModsToModifier(mods)});
    } else {
        window->pending_.push_back(event::MouseButtonPressed{button, glfwModsToModifier(mods)});
    }
}

void Window::glfwCursorPosCallback(GLFWwindow* glfwWindow, double x, double y) {
    auto* window = static_cast<Window*>(glfwGetWindowUserPointer(glfwWindow));
    if (window) {
        event::MouseMoved moved;
        moved.window = glm::dvec2(x, y);
        window->pending_.push_back(moved);
    }
}

void Window::glfwScrollCallback(GLFWwindow* glfwWindow, double xoffset, double yoffset) {
    auto* window = static_cast<Window*>(glfwGetWindowUserPointer(glfwWindow));
    if (window) {
        window->pending_.push_back(event::Scrolled{xoffset, yoffset});
    }
}

void Window::glfwCharCallback(GLFWwindow* glfwWindow, unsigned int codepoint) {
    auto* window = static_cast<Window*>(glfwGetWindowUserPointer(glfwWindow));
    if (window) {
        window->pending_.push_back(event::TextInput{static_cast<char32_t>(codepoint)});
    }
}

void Window::glfwFramebufferSizeCallback(GLFWwindow* glfwWindow, int width, int height) {
    auto* window = static_cast<Window*>(glfwGetWindowUserPointer(glfwWindow));
    if (window) {
        window->pending_.push_back(event::Resized{
            static_cast<uint32_t>(width), static_cast<uint32_t>(height)});
    }
}

// ============================================================================
// Modifier conversion
// ============================================================================

Modifier Window::glfwModsToModifier(int glfwMods) {
    Modifier mods = Modifier::None;
    if (glfwMods & GLFW_MOD_SHIFT) mods = mods | Modifier::Shift;
    if (glfwMods & GLFW_MOD_CONTROL) mods = mods | Modifier::Control;
    if (glfwMods & GLFW_MOD_ALT) mods = mods | Modifier::Alt;
    if (glfwMods & GLFW_MOD_SUPER) mods = mods | Modifier::Super;
    if (glfwMods & GLFW_MOD_CAPS_LOCK) mods = mods | Modifier::CapsLock;
    if (glfwMods & GLFW_MOD_NUM_LOCK) mods = mods | Modifier::NumLock;
    return mods;
}

} // namespace fine2d
