#pragma once

#include "fine2d/graphics/color.hpp"
#include "fine2d/graphics/rectangle.hpp"

#include <glm/glm.hpp>

#include <cstdint>

namespace fine2d {

/// How the virtual canvas is fitted into the window
enum class ScalingPolicy {
    Fixed,                  // Scale 1, centered
    Stretch,                // Fill the window, aspect ratio ignored
    Letterbox,              // Largest uniform scale that shows everything
    CropLetterbox,          // Smallest uniform scale that fills the window
    ShowAllPixelPerfect,    // Letterbox scale floored to an integer >= 1
    CropPixelPerfect        // Crop scale floored to an integer >= 1
};

const char* scalingPolicyToString(ScalingPolicy policy);

/**
 * @brief Maps a fixed-resolution virtual canvas onto the window
 *
 * The viewport is the window-space rectangle the canvas is drawn into;
 * anything outside it is cleared with the letterbox color. The viewport
 * is only recomputed when the window size, the virtual resolution or the
 * policy actually changes; revision() counts those recomputations.
 */
class CanvasScaler {
public:
    CanvasScaler(uint32_t virtualWidth, uint32_t virtualHeight,
                 uint32_t windowWidth, uint32_t windowHeight,
                 ScalingPolicy policy = ScalingPolicy::Letterbox);

    /// Window resized. Zero sizes (minimized) keep the previous viewport.
    void setWindowSize(uint32_t width, uint32_t height);

    void setVirtualResolution(uint32_t width, uint32_t height);

    void setScalingPolicy(ScalingPolicy policy);
    ScalingPolicy scalingPolicy() const { return policy_; }

    void setLetterboxColor(const Color& color) { letterboxColor_ = color; }
    const Color& letterboxColor() const { return letterboxColor_; }

    /// Window-space rectangle covered by the canvas
    const Rect& viewport() const { return viewport_; }

    /// Viewport size over virtual size, per axis
    glm::vec2 scale() const;

    uint32_t virtualWidth() const { return virtualWidth_; }
    uint32_t virtualHeight() const { return virtualHeight_; }
    uint32_t windowWidth() const { return windowWidth_; }
    uint32_t windowHeight() const { return windowHeight_; }

    /// Window pixel -> virtual canvas pixel
    glm::dvec2 toVirtualCoords(double windowX, double windowY) const;

    /// Virtual canvas pixel -> window pixel
    glm::dvec2 toWindowCoords(double virtualX, double virtualY) const;

    /// True if the window point lands on the canvas rather than a bar
    bool containsWindowPoint(double windowX, double windowY) const;

    uint64_t revision() const { return revision_; }

    /// Pure viewport computation for one policy
    static Rect computeViewport(ScalingPolicy policy,
                                uint32_t virtualWidth, uint32_t virtualHeight,
                                uint32_t windowWidth, uint32_t windowHeight);

private:
    void recompute();

    uint32_t virtualWidth_;
    uint32_t virtualHeight_;
    uint32_t windowWidth_;
    uint32_t windowHeight_;
    ScalingPolicy policy_;
    Color letterboxColor_ = Color::BLACK;
    Rect viewport_;
    uint64_t revision_ = 0;
};

} // namespace fine2d
