#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace fine2d {

enum class SoundState {
    Playing,
    Paused,
    Stopped
};

/**
 * @brief Playback parameters of one active sound
 *
 * Written by the game thread, read by the audio mixer thread. Every field
 * is an independent lock-free atomic; no operation blocks.
 */
class AudioParams {
public:
    AudioParams(bool playing = true, bool repeating = false,
                float volume = 1.0f, float speed = 1.0f)
        : playing_(playing), repeating_(repeating), volume_(volume), speed_(speed) {}

    // Non-copyable
    AudioParams(const AudioParams&) = delete;
    AudioParams& operator=(const AudioParams&) = delete;

    void play() {
        stopped_.store(false);
        playing_.store(true);
    }

    /// Stop and rewind to the start
    void stop() {
        playing_.store(false);
        stopped_.store(true);
        rewind_.store(true);
    }

    void pause() { playing_.store(false); }

    SoundState state() const;
    void setState(SoundState state);

    bool playing() const { return playing_.load(); }

    bool repeating() const { return repeating_.load(); }
    void setRepeating(bool repeating) { repeating_.store(repeating); }
    void toggleRepeating();

    float volume() const { return volume_.load(); }
    void setVolume(float volume) { volume_.store(volume); }

    float speed() const { return speed_.load(); }
    void setSpeed(float speed) { speed_.store(speed); }

    /// Mixer side: true once per stop() request
    bool consumeRewind() { return rewind_.exchange(false); }

    /// Rewind requested but not yet consumed by the mixer
    bool rewindPending() const { return rewind_.load(); }

    static bool isLockFree();

private:
    std::atomic<bool> playing_;
    std::atomic<bool> repeating_;
    std::atomic<bool> stopped_{false};
    std::atomic<bool> rewind_{false};
    std::atomic<float> volume_;
    std::atomic<float> speed_;
};

/// Shared between the game-side SoundInstance and the mixer
using AudioParamsRef = std::shared_ptr<AudioParams>;

/**
 * @brief Game-side handle to a playing sound
 *
 * Copies refer to the same sound.
 */
class SoundInstance {
public:
    explicit SoundInstance(AudioParamsRef params) : params_(std::move(params)) {}

    void play() { params_->play(); }
    void stop() { params_->stop(); }
    void pause() { params_->pause(); }

    SoundState state() const { return params_->state(); }
    void setState(SoundState state) { params_->setState(state); }

    void setVolume(float volume) { params_->setVolume(volume); }
    void setSpeed(float speed) { params_->setSpeed(speed); }
    void setRepeating(bool repeating) { params_->setRepeating(repeating); }
    void toggleRepeating() { params_->toggleRepeating(); }

    const AudioParamsRef& params() const { return params_; }

private:
    AudioParamsRef params_;
};

} // namespace fine2d
