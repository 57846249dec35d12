#pragma once

#include <optional>

#include "../core/PlayerEvents.hpp"
#include "../core/TrackCatalog.hpp"

namespace tunebox {

/**
 * @brief Where playback currently is within the loaded resource
 */
struct PlaybackPosition {
    double positionSeconds = 0.0;
    double lengthSeconds = 0.0;
};

/**
 * @brief Abstract media engine interface
 *
 * This provides a clean abstraction over the actual playback engine.
 * Concrete implementations (e.g., TracktionMediaEngine) inherit from this.
 *
 * Only the PlaybackController calls the transport methods. Implementations
 * report the end of a resource by pushing a MediaEndedEvent onto the
 * EventQueue from their own notification context, never by calling back into
 * the controller.
 */
class MediaEngine {
  public:
    virtual ~MediaEngine() = default;

    // ===== Lifecycle =====
    virtual bool initialize() = 0;
    virtual void shutdown() = 0;

    // ===== Resource =====

    /**
     * @brief Replace the loaded resource with the given track
     *
     * Releases the previous resource first, detaching its end-of-media
     * notification, so a late notification from it cannot be mistaken for the
     * new track finishing.
     * @return false if the track could not be loaded (nothing is loaded then)
     */
    virtual bool load(const TrackInfo& track) = 0;

    /** Identity of the loaded resource, INVALID_MEDIA_RESOURCE if none. */
    virtual MediaResourceId getLoadedResource() const = 0;

    // ===== Transport =====

    /**
     * @brief Start or resume the loaded resource
     *
     * Each play re-arms the end-of-media notification: resuming a resource that
     * already reached its end reports that end again.
     */
    virtual bool play() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;
    virtual bool isPlaying() const = 0;

    /** Engine output volume, 0-100 percent. Applies immediately. */
    virtual void setVolume(int percent) = 0;

    /** Best-effort position; empty when nothing is loaded. */
    virtual std::optional<PlaybackPosition> getPosition() const = 0;
};

}  // namespace tunebox
