#pragma once

#include "fine2d/graphics/draw_command.hpp"
#include "fine2d/graphics/draw_params.hpp"
#include "fine2d/graphics/rectangle.hpp"

#include <chrono>
#include <cstddef>
#include <vector>

namespace fine2d {

struct AnimationFrame;

/**
 * @brief Frame-by-frame animation over regions of one texture atlas
 *
 * Advanced with elapsed time, usually the fixed tick delta, so playback
 * speed is independent of frame rate. Non-repeating animations hold the
 * last frame once finished.
 */
class Animation {
public:
    using Duration = std::chrono::nanoseconds;

    Animation(TextureHandle texture, std::vector<Rect> frames, Duration frameLength);

    /// Advance playback by dt
    void advance(Duration dt);

    /// Back to frame 0, timer cleared
    void restart();

    TextureHandle texture() const { return texture_; }
    void setTexture(TextureHandle texture) { texture_ = texture; }

    const std::vector<Rect>& frames() const { return frames_; }

    /// Replace the frame list; restarts playback
    void setFrames(std::vector<Rect> frames);

    Duration frameLength() const { return frameLength_; }
    void setFrameLength(Duration frameLength);

    bool isRepeating() const { return repeating_; }
    void setRepeating(bool repeating) { repeating_ = repeating; }

    size_t currentFrameIndex() const { return current_; }
    void setCurrentFrameIndex(size_t index);

    /// Time spent on the current frame
    Duration currentFrameTime() const { return timer_; }

    const Rect& currentFrame() const { return frames_[current_]; }

    /// True once a non-repeating animation has shown its last frame for a full frame length
    bool isFinished() const { return finished_; }

    /// Drawable for the current frame
    AnimationFrame frame(const DrawParams& params = DrawParams()) const;

private:
    TextureHandle texture_;
    std::vector<Rect> frames_;
    Duration frameLength_;
    Duration timer_{0};
    size_t current_ = 0;
    bool repeating_ = true;
    bool finished_ = false;
};

} // namespace fine2d
