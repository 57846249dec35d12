#pragma once

#include <tracktion_engine/tracktion_engine.h>

#include <memory>

#include "../core/EventQueue.hpp"
#include "MediaEngine.hpp"

namespace tunebox {

/**
 * @brief Tracktion Engine implementation of MediaEngine
 *
 * Plays one file at a time: a single Edit with a single audio track, holding
 * one WaveAudioClip for the loaded track. Output volume is the Edit's master
 * volume plugin, so volume changes take effect live.
 *
 * Tracktion objects belong to the JUCE message thread. Calls arriving from
 * the controller's thread take a MessageManagerLock bound to that thread, so a
 * thread that has been asked to exit gives up instead of deadlocking against
 * a message thread that is waiting for it.
 *
 * End of media is detected on the message thread by a per-resource watcher
 * (see LoadedMedia) which pushes MediaEndedEvent onto the EventQueue.
 */
class TracktionMediaEngine : public MediaEngine {
  public:
    static constexpr int END_POLL_INTERVAL_MS = 50;
    static constexpr double END_TOLERANCE_SECONDS = 0.05;

    explicit TracktionMediaEngine(EventQueue& queue);
    ~TracktionMediaEngine() override;

    bool initialize() override;
    void shutdown() override;

    bool load(const TrackInfo& track) override;
    MediaResourceId getLoadedResource() const override;

    bool play() override;
    void pause() override;
    void stop() override;
    bool isPlaying() const override;

    void setVolume(int percent) override;
    int getVolume() const {
        return volumePercent_;
    }

    std::optional<PlaybackPosition> getPosition() const override;

    /** Master volume in dB for a 0-100 percent setting (0 percent is silence). */
    static float percentToDecibels(int percent);

    tracktion::Edit* getEdit() {
        return edit_.get();
    }

  private:
    class LoadedMedia;

    void createEdit();
    void releaseMedia();
    tracktion::AudioTrack* getPlaybackTrack();
    void applyVolume();

    EventQueue& queue_;

    std::unique_ptr<tracktion::Engine> engine_;
    std::unique_ptr<tracktion::Edit> edit_;
    std::unique_ptr<LoadedMedia> media_;

    MediaResourceId nextResourceId_ = 1;
    int volumePercent_ = 50;

    JUCE_DECLARE_NON_COPYABLE(TracktionMediaEngine)
};

}  // namespace tunebox
