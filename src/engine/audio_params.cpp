#include "fine2d/engine/audio_params.hpp"

namespace fine2d {

SoundState AudioParams::state() const {
    if (playing_.load()) {
        return SoundState::Playing;
    }
    return stopped_.load() ? SoundState::Stopped : SoundState::Paused;
}

void AudioParams::setState(SoundState state) {
    switch (state) {
        case SoundState::Playing: play(); break;
        case SoundState::Paused:  pause(); break;
        case SoundState::Stopped: stop(); break;
    }
}

void AudioParams::toggleRepeating() {
    bool current = repeating_.load();
    while (!repeating_.compare_exchange_weak(current, !current)) {
    }
}

bool AudioParams::isLockFree() {
    return std::atomic<bool>::is_always_lock_free && std::atomic<float>::is_always_lock_free;
}

} // namespace fine2d
