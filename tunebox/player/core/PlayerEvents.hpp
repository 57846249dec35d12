#pragma once

#include <juce_core/juce_core.h>

#include <cstdint>
#include <variant>

namespace tunebox {

/** Identity of a media resource loaded into the engine. 0 means nothing loaded. */
using MediaResourceId = std::uint64_t;
constexpr MediaResourceId INVALID_MEDIA_RESOURCE = 0;

enum class ButtonLabel { PlayPause, Next, VolumeDown, VolumeUp };

inline juce::String toString(ButtonLabel label) {
    switch (label) {
        case ButtonLabel::PlayPause:
            return "PlayPause";
        case ButtonLabel::Next:
            return "Next";
        case ButtonLabel::VolumeDown:
            return "VolumeDown";
        case ButtonLabel::VolumeUp:
            return "VolumeUp";
    }
    return "Unknown";
}

// ===== Producer Events =====

/**
 * @brief A debounced press of one of the physical buttons
 */
struct ButtonPressedEvent {
    ButtonLabel label;
};

/**
 * @brief The engine reached the end of a loaded resource
 *
 * Carries the resource that finished so a notification from a track that
 * has since been replaced can be told apart from the current one.
 */
struct MediaEndedEvent {
    MediaResourceId resource = INVALID_MEDIA_RESOURCE;
};

/**
 * @brief Redraw the display without changing state (elapsed-time ticking)
 */
struct RefreshRequestedEvent {};

// ===== The unified PlayerEvent variant =====

/**
 * @brief Union of everything a producer can hand to the PlaybackController
 *
 * Plain values only: events are copied into the queue and consumed once.
 */
using PlayerEvent = std::variant<ButtonPressedEvent, MediaEndedEvent, RefreshRequestedEvent>;

}  // namespace tunebox
