#pragma once

#include <juce_core/juce_core.h>
#include <juce_graphics/juce_graphics.h>

#include <atomic>
#include <cstdint>

#include "EventQueue.hpp"
#include "PlaybackState.hpp"
#include "PlayerEvents.hpp"
#include "TrackCatalog.hpp"

namespace tunebox {

class MediaEngine;
class DisplayPanel;

/**
 * @brief Owns the PlaybackState and applies every event to it
 *
 * Follows a unidirectional data flow pattern:
 * - Producers push PlayerEvents onto the EventQueue
 * - A single drain thread pops them and runs the matching handler
 * - Each handler mutates state and returns flags indicating what changed
 * - Any change is followed by one render of the new state
 *
 * When no event arrives within the tick interval a RefreshRequested event is
 * synthesized, so an idle player redraws once per tick (elapsed time).
 *
 * The controller never blocks a producer and never calls back into one.
 */
class PlaybackController : private juce::Thread {
  public:
    struct Options {
        int volumeStep = 5;
        int tickIntervalMs = 1000;
        float artworkBrightness = 0.3f;
    };

    // ===== Change Flags =====
    enum class ChangeFlags : uint32_t {
        None = 0,
        Status = 1 << 0,
        Track = 1 << 1,
        Volume = 1 << 2,
        Refresh = 1 << 3,
        All = 0xFFFFFFFF
    };

    PlaybackController(const TrackCatalog& catalog, EventQueue& queue, MediaEngine& engine,
                       DisplayPanel& panel, PlaybackState initialState, Options options);
    ~PlaybackController() override;

    // ===== Drain thread =====

    /** Start the drain thread. */
    bool start();

    /**
     * @brief Ask the drain thread to finish and wait for it
     *
     * The event being processed completes; nothing is killed mid-transition.
     */
    void stop();

    bool isRunning() const {
        return isThreadRunning();
    }

    // ===== Event processing =====

    /**
     * @brief Wait up to timeoutMs for one event and process it
     *
     * A timeout is processed as a RefreshRequested event.
     * @return false if the wait was cut short because the drain thread is exiting
     */
    bool processNextEvent(int timeoutMs);

    /**
     * @brief Apply one event, then render if anything changed
     * @return What changed
     */
    ChangeFlags processEvent(const PlayerEvent& event);

    // ===== State Access =====

    /** Copy of the current state (safe from any thread). */
    PlaybackState getState() const;

    /** Number of frames rendered so far. */
    int getRenderCount() const {
        return renderCount_.load();
    }

  private:
    void run() override;

    // ===== Event Handlers =====
    ChangeFlags handleEvent(const ButtonPressedEvent& e);
    ChangeFlags handleEvent(const MediaEndedEvent& e);
    ChangeFlags handleEvent(const RefreshRequestedEvent& e);

    ChangeFlags togglePlayPause();
    ChangeFlags advanceTrack();
    ChangeFlags changeVolume(int delta);

    // ===== Engine helpers =====
    bool startPlayback(int trackIndex);
    void markStopped();

    // ===== Rendering =====
    void render();
    const juce::Image& artworkFor(int trackIndex);

    const TrackCatalog& catalog_;
    EventQueue& queue_;
    MediaEngine& engine_;
    DisplayPanel& panel_;
    Options options_;

    // The single source of truth; written only by the thread processing events
    PlaybackState state_;
    mutable juce::CriticalSection stateLock_;

    int loadedTrackIndex_ = -1;
    MediaResourceId loadedResource_ = INVALID_MEDIA_RESOURCE;

    int artworkTrackIndex_ = -1;
    juce::Image artwork_;

    std::atomic<int> renderCount_{0};
    bool panelFailureLogged_ = false;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(PlaybackController)
};

// Helper operators for ChangeFlags
inline PlaybackController::ChangeFlags operator|(PlaybackController::ChangeFlags a,
                                                 PlaybackController::ChangeFlags b) {
    return static_cast<PlaybackController::ChangeFlags>(static_cast<uint32_t>(a) |
                                                        static_cast<uint32_t>(b));
}

inline PlaybackController::ChangeFlags operator&(PlaybackController::ChangeFlags a,
                                                 PlaybackController::ChangeFlags b) {
    return static_cast<PlaybackController::ChangeFlags>(static_cast<uint32_t>(a) &
                                                        static_cast<uint32_t>(b));
}

inline bool hasFlag(PlaybackController::ChangeFlags flags,
                    PlaybackController::ChangeFlags flag) {
    return (flags & flag) != PlaybackController::ChangeFlags::None;
}

}  // namespace tunebox
