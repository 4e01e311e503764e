#include "fine2d/engine/canvas_scaler.hpp"
#include "fine2d/core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace fine2d {

const char* scalingPolicyToString(ScalingPolicy policy) {
    switch (policy) {
        case ScalingPolicy::Fixed:               return "Fixed";
        case ScalingPolicy::Stretch:             return "Stretch";
        case ScalingPolicy::Letterbox:           return "Letterbox";
        case ScalingPolicy::CropLetterbox:       return "CropLetterbox";
        case ScalingPolicy::ShowAllPixelPerfect: return "ShowAllPixelPerfect";
        case ScalingPolicy::CropPixelPerfect:    return "CropPixelPerfect";
    }
    return "Unknown";
}

namespace {

// Uniform scale with ceil'd size and offset
Rect uniformViewport(float scale, float vw, float vh, float ww, float wh) {
    float width = std::ceil(vw * scale);
    float height = std::ceil(vh * scale);
    float x = std::ceil((ww - width) / 2.0f);
    float y = std::ceil((wh - height) / 2.0f);
    return Rect(x, y, width, height);
}

// Integer scale, integer centering
Rect pixelPerfectViewport(int32_t scale, int32_t vw, int32_t vh, int32_t ww, int32_t wh) {
    scale = std::max(scale, 1);
    int32_t width = vw * scale;
    int32_t height = vh * scale;
    int32_t x = (ww - width) / 2;
    int32_t y = (wh - height) / 2;
    return Rect(static_cast<float>(x), static_cast<float>(y),
                static_cast<float>(width), static_cast<float>(height));
}

} // anonymous namespace

CanvasScaler::CanvasScaler(uint32_t virtualWidth, uint32_t virtualHeight,
                           uint32_t windowWidth, uint32_t windowHeight,
                           ScalingPolicy policy)
    : virtualWidth_(virtualWidth)
    , virtualHeight_(virtualHeight)
    , windowWidth_(windowWidth)
    , windowHeight_(windowHeight)
    , policy_(policy) {
    if (virtualWidth_ == 0 || virtualHeight_ == 0) {
        throw std::invalid_argument("CanvasScaler: virtual resolution must be non-zero");
    }
    recompute();
}

Rect CanvasScaler::computeViewport(ScalingPolicy policy,
                                   uint32_t virtualWidth, uint32_t virtualHeight,
                                   uint32_t windowWidth, uint32_t windowHeight) {
    float vw = static_cast<float>(virtualWidth);
    float vh = static_cast<float>(virtualHeight);
    float ww = static_cast<float>(windowWidth);
    float wh = static_cast<float>(windowHeight);

    int32_t ivw = static_cast<int32_t>(virtualWidth);
    int32_t ivh = static_cast<int32_t>(virtualHeight);
    int32_t iww = static_cast<int32_t>(windowWidth);
    int32_t iwh = static_cast<int32_t>(windowHeight);

    switch (policy) {
        case ScalingPolicy::Fixed:
            return Rect(static_cast<float>((iww - ivw) / 2), static_cast<float>((iwh - ivh) / 2),
                        vw, vh);

        case ScalingPolicy::Stretch:
            return Rect(0.0f, 0.0f, ww, wh);

        case ScalingPolicy::Letterbox:
            return uniformViewport(std::min(ww / vw, wh / vh), vw, vh, ww, wh);

        case ScalingPolicy::CropLetterbox:
            return uniformViewport(std::max(ww / vw, wh / vh), vw, vh, ww, wh);

        case ScalingPolicy::ShowAllPixelPerfect:
            return pixelPerfectViewport(std::min(iww / ivw, iwh / ivh), ivw, ivh, iww, iwh);

        case ScalingPolicy::CropPixelPerfect:
            return pixelPerfectViewport(
                static_cast<int32_t>(std::floor(std::max(ww / vw, wh / vh))),
                ivw, ivh, iww, iwh);
    }
    return Rect(0.0f, 0.0f, ww, wh);
}

void CanvasScaler::recompute() {
    viewport_ = computeViewport(policy_, virtualWidth_, virtualHeight_,
                                windowWidth_, windowHeight_);
    revision_++;

    FINE2D_DEBUG(LogCategory::Scaling,
        std::string("Viewport ") + scalingPolicyToString(policy_) + " " +
        std::to_string(virtualWidth_) + "x" + std::to_string(virtualHeight_) + " in " +
        std::to_string(windowWidth_) + "x" + std::to_string(windowHeight_) + " -> (" +
        std::to_string(viewport_.x) + ", " + std::to_string(viewport_.y) + ", " +
        std::to_string(viewport_.width) + ", " + std::to_string(viewport_.height) + ")");
}

void CanvasScaler::setWindowSize(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        return;  // Minimized
    }
    if (width == windowWidth_ && height == windowHeight_) {
        return;
    }
    windowWidth_ = width;
    windowHeight_ = height;
    recompute();
}

void CanvasScaler::setVirtualResolution(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        throw std::invalid_argument("CanvasScaler: virtual resolution must be non-zero");
    }
    if (width == virtualWidth_ && height == virtualHeight_) {
        return;
    }
    virtualWidth_ = width;
    virtualHeight_ = height;
    recompute();
}

void CanvasScaler::setScalingPolicy(ScalingPolicy policy) {
    if (policy == policy_) {
        return;
    }
    policy_ = policy;
    recompute();
}

glm::vec2 CanvasScaler::scale() const {
    return glm::vec2(viewport_.width / static_cast<float>(virtualWidth_),
                     viewport_.height / static_cast<float>(virtualHeight_));
}

glm::dvec2 CanvasScaler::toVirtualCoords(double windowX, double windowY) const {
    return glm::dvec2(
        static_cast<double>(virtualWidth_) * (windowX - viewport_.x) / viewport_.width,
        static_cast<double>(virtualHeight_) * (windowY - viewport_.y) / viewport_.height);
}

glm::dvec2 CanvasScaler::toWindowCoords(double virtualX, double virtualY) const {
    return glm::dvec2(
        viewport_.x + viewport_.width * virtualX / static_cast<double>(virtualWidth_),
        viewport_.y + viewport_.height * virtualY / static_cast<double>(virtualHeight_));
}

bool CanvasScaler::containsWindowPoint(double windowX, double windowY) const {
    return windowX >= viewport_.x && windowX < viewport_.x + viewport_.width &&
           windowY >= viewport_.y && windowY < viewport_.y + viewport_.height;
}

} // namespace fine2d
