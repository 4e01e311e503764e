#pragma once

#include "fine2d/core/error.hpp"
#include "fine2d/graphics/color.hpp"
#include "fine2d/graphics/rectangle.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace fine2d {

/**
 * @brief Keyboard key code, same numbering as GLFW_KEY_*
 */
using Key = int;

/// Mouse button, same numbering as GLFW_MOUSE_BUTTON_*
using MouseButton = int;

constexpr Key KEY_ESCAPE = 256;
constexpr MouseButton MOUSE_BUTTON_LEFT = 0;
constexpr MouseButton MOUSE_BUTTON_RIGHT = 1;
constexpr MouseButton MOUSE_BUTTON_MIDDLE = 2;

/**
 * @brief Modifier key flags
 */
enum class Modifier : uint32_t {
    None = 0,
    Shift = 1 << 0,
    Control = 1 << 1,
    Alt = 1 << 2,
    Super = 1 << 3,
    CapsLock = 1 << 4,
    NumLock = 1 << 5
};

inline Modifier operator|(Modifier a, Modifier b) {
    return static_cast<Modifier>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool operator&(Modifier a, Modifier b) {
    return (static_cast<uint32_t>(a) & static_cast<uint32_t>(b)) != 0;
}

// Platform events
namespace event {

struct Quit {};

struct Resized {
    uint32_t width = 0;
    uint32_t height = 0;
};

struct KeyPressed {
    Key key = 0;
    int scancode = 0;
    Modifier mods = Modifier::None;
    bool repeat = false;
};

struct KeyReleased {
    Key key = 0;
    int scancode = 0;
    Modifier mods = Modifier::None;
};

struct MouseMoved {
    glm::dvec2 window{0.0};         // Window pixels
    glm::dvec2 canvas{0.0};         // Virtual canvas pixels, filled in by the orchestrator
};

struct MouseButtonPressed {
    MouseButton button = MOUSE_BUTTON_LEFT;
    Modifier mods = Modifier::None;
};

struct MouseButtonReleased {
    MouseButton button = MOUSE_BUTTON_LEFT;
    Modifier mods = Modifier::None;
};

struct Scrolled {
    double dx = 0.0;
    double dy = 0.0;
};

/// One UTF-32 codepoint of text input
struct TextInput {
    char32_t codepoint = 0;
};

} // namespace event

using PlatformEvent = std::variant<
    event::Quit,
    event::Resized,
    event::KeyPressed,
    event::KeyReleased,
    event::MouseMoved,
    event::MouseButtonPressed,
    event::MouseButtonReleased,
    event::Scrolled,
    event::TextInput>;

/**
 * @brief Window, input and presentation collaborator of the frame loop
 *
 * Only the FrameOrchestrator talks to the platform.
 */
class Platform {
public:
    virtual ~Platform() = default;

    /// Drain pending window and input events, oldest first
    virtual std::vector<PlatformEvent> pollEvents() = 0;

    /// Current framebuffer size in pixels
    virtual glm::uvec2 windowSize() const = 0;

    /// Where the virtual canvas lands in the window, and the color of the bars
    virtual Status bindViewport(const Rect& viewport, const Color& letterboxColor) = 0;

    /// Show the finished frame
    virtual Status present() = 0;
};

} // namespace fine2d
