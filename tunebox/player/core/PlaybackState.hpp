#pragma once

#include <juce_core/juce_core.h>

namespace tunebox {

enum class PlaybackStatus { Stopped, Playing, Paused };

inline juce::String toString(PlaybackStatus status) {
    switch (status) {
        case PlaybackStatus::Stopped:
            return "Stopped";
        case PlaybackStatus::Playing:
            return "Playing";
        case PlaybackStatus::Paused:
            return "Paused";
    }
    return "Unknown";
}

/**
 * @brief Snapshot of what the player is doing
 *
 * Owned by the PlaybackController and only ever mutated on its drain thread.
 * Everything else sees copies (e.g. the renderer gets one per frame).
 */
struct PlaybackState {
    static constexpr int kMinVolume = 0;
    static constexpr int kMaxVolume = 100;
    static constexpr int kDefaultVolume = 50;

    PlaybackStatus status = PlaybackStatus::Stopped;
    int trackIndex = 0;
    int volume = kDefaultVolume;

    bool isPlaying() const {
        return status == PlaybackStatus::Playing;
    }

    bool operator==(const PlaybackState& other) const {
        return status == other.status && trackIndex == other.trackIndex &&
               volume == other.volume;
    }
    bool operator!=(const PlaybackState& other) const {
        return !(*this == other);
    }
};

}  // namespace tunebox
