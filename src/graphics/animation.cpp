#include "fine2d/graphics/animation.hpp"
#include "fine2d/graphics/drawable.hpp"

#include <stdexcept>

namespace fine2d {

Animation::Animation(TextureHandle texture, std::vector<Rect> frames, Duration frameLength)
    : texture_(texture), frames_(std::move(frames)), frameLength_(frameLength) {
    if (frames_.empty()) {
        throw std::invalid_argument("Animation: frame list cannot be empty");
    }
    if (frameLength_ <= Duration::zero()) {
        throw std::invalid_argument("Animation: frame length must be positive");
    }
}

void Animation::advance(Duration dt) {
    if (finished_) {
        return;
    }

    timer_ += dt;
    while (timer_ >= frameLength_) {
        timer_ -= frameLength_;

        if (current_ + 1 < frames_.size()) {
            current_++;
        } else if (repeating_) {
            current_ = 0;
        } else {
            finished_ = true;
            timer_ = Duration::zero();
            return;
        }
    }
}

void Animation::restart() {
    current_ = 0;
    timer_ = Duration::zero();
    finished_ = false;
}

void Animation::setFrames(std::vector<Rect> frames) {
    if (frames.empty()) {
        throw std::invalid_argument("Animation: frame list cannot be empty");
    }
    frames_ = std::move(frames);
    restart();
}

void Animation::setFrameLength(Duration frameLength) {
    if (frameLength <= Duration::zero()) {
        throw std::invalid_argument("Animation: frame length must be positive");
    }
    frameLength_ = frameLength;
}

void Animation::setCurrentFrameIndex(size_t index) {
    if (index >= frames_.size()) {
        throw std::out_of_range("Animation: frame index out of range");
    }
    current_ = index;
    timer_ = Duration::zero();
    finished_ = false;
}

AnimationFrame Animation::frame(const DrawParams& params) const {
    AnimationFrame f;
    f.texture = texture_;
    f.region = frames_[current_];
    f.params = params;
    return f;
}

} // namespace fine2d
