#include "TracktionMediaEngine.hpp"

#include "../core/Log.hpp"

namespace tunebox {

namespace te = tracktion;

// =============================================================================
// LoadedMedia
// =============================================================================

/**
 * One loaded resource: the clip on the playback track plus its end-of-media
 * subscription. The subscription is a timer on the message thread that polls
 * the transport, like a playhead position timer does. Destroying the object
 * stops the timer before the clip is removed, so a replaced resource can never
 * report an end.
 *
 * The end is reported once per play: rearm() lets a resumed playback that is
 * already at the end report it again. A notification the queue refuses stays
 * pending and is retried on the next tick.
 */
class TracktionMediaEngine::LoadedMedia : private juce::Timer {
  public:
    LoadedMedia(te::Edit& edit, te::Clip::Ptr clip, MediaResourceId id, double lengthSeconds,
                EventQueue& queue)
        : edit_(edit), clip_(std::move(clip)), id_(id), lengthSeconds_(lengthSeconds),
          queue_(queue) {}

    ~LoadedMedia() override {
        detach();
        if (clip_)
            clip_->removeFromParent();
    }

    void attach() {
        startTimer(END_POLL_INTERVAL_MS);
    }

    void detach() {
        stopTimer();
    }

    void rearm() {
        ended_ = false;
    }

    MediaResourceId getId() const {
        return id_;
    }
    double getLengthSeconds() const {
        return lengthSeconds_;
    }

  private:
    void timerCallback() override {
        if (notifyPending_) {
            notifyEnded();
            return;
        }

        auto& transport = edit_.getTransport();
        if (ended_ || !transport.isPlaying())
            return;

        double position = transport.position.get().inSeconds();
        if (position < lengthSeconds_ - END_TOLERANCE_SECONDS)
            return;

        ended_ = true;
        transport.stop(false, false);
        notifyEnded();
    }

    void notifyEnded() {
        notifyPending_ = !queue_.push(MediaEndedEvent{id_});
        if (notifyPending_ && !retryLogged_) {
            log::warning("Event queue full, end of media will be retried");
            retryLogged_ = true;
        }
    }

    te::Edit& edit_;
    te::Clip::Ptr clip_;
    const MediaResourceId id_;
    const double lengthSeconds_;
    EventQueue& queue_;
    bool ended_ = false;
    bool notifyPending_ = false;
    bool retryLogged_ = false;
};

// =============================================================================
// TracktionMediaEngine
// =============================================================================

TracktionMediaEngine::TracktionMediaEngine(EventQueue& queue) : queue_(queue) {}

TracktionMediaEngine::~TracktionMediaEngine() {
    shutdown();
}

void TracktionMediaEngine::createEdit() {
    // Scratch Edit file, never saved
    auto editFile = juce::File::getSpecialLocation(juce::File::tempDirectory)
                        .getChildFile("tunebox_player.tracktionedit");

    // Delete any existing temp file to ensure clean state
    if (editFile.existsAsFile()) {
        editFile.deleteFile();
    }

    edit_ = te::createEmptyEdit(*engine_, editFile);
    if (!edit_)
        return;

    edit_->ensureNumberOfAudioTracks(1);
    edit_->getTransport().ensureContextAllocated();
}

bool TracktionMediaEngine::initialize() {
    try {
        engine_ = std::make_unique<te::Engine>("TuneBox");

        // Playback only: no inputs, stereo out
        auto& dm = engine_->getDeviceManager();
        dm.initialise(0, 2);

        if (auto* device = dm.deviceManager.getCurrentAudioDevice()) {
            log::info("Audio device: " + device->getName() + " (" +
                      juce::String(device->getCurrentSampleRate()) + " Hz)");
        } else {
            log::warning("No audio output device selected");
        }

        createEdit();
        if (!edit_) {
            log::error("Tracktion Engine initialized but no Edit could be created");
            return false;
        }

        applyVolume();
        log::info("Tracktion Engine initialized");
        return true;

    } catch (const std::exception& e) {
        log::error("Failed to initialize Tracktion Engine: " + juce::String(e.what()));
        return false;
    }
}

void TracktionMediaEngine::shutdown() {
    if (!engine_)
        return;

    // Detach end-of-media watcher and drop the clip before the Edit goes away
    releaseMedia();

    // Stop transport and release playback context BEFORE destroying Edit
    if (edit_) {
        auto& transport = edit_->getTransport();
        if (transport.isPlaying()) {
            transport.stop(false, false);
        }
        transport.freePlaybackContext();
        edit_.reset();
    }

    engine_->getDeviceManager().closeDevices();
    engine_.reset();

    log::info("Tracktion Engine shutdown complete");
}

void TracktionMediaEngine::releaseMedia() {
    if (!media_)
        return;

    DBG("TracktionMediaEngine: releasing resource " << (juce::int64)media_->getId());
    media_->detach();
    media_.reset();
}

te::AudioTrack* TracktionMediaEngine::getPlaybackTrack() {
    edit_->ensureNumberOfAudioTracks(1);
    auto tracks = te::getAudioTracks(*edit_);
    return tracks.isEmpty() ? nullptr : tracks.getFirst();
}

bool TracktionMediaEngine::load(const TrackInfo& track) {
    const juce::MessageManagerLock mml(juce::Thread::getCurrentThread());
    if (!mml.lockWasGained() || !edit_)
        return false;

    auto& transport = edit_->getTransport();
    if (transport.isPlaying())
        transport.stop(false, false);

    releaseMedia();

    if (!track.file.existsAsFile()) {
        log::error("Audio file not found: " + track.file.getFullPathName());
        return false;
    }

    try {
        te::AudioFile audioFile(*engine_, track.file);
        if (!audioFile.isValid()) {
            log::error("Unsupported or unreadable audio file: " + track.file.getFullPathName());
            return false;
        }

        double lengthSeconds = audioFile.getLength();

        auto* playbackTrack = getPlaybackTrack();
        if (!playbackTrack) {
            log::error("No playback track available");
            return false;
        }

        auto timeRange = te::TimeRange(te::TimePosition::fromSeconds(0.0),
                                       te::TimePosition::fromSeconds(lengthSeconds));

        auto clip = te::insertWaveClip(*playbackTrack, track.file.getFileNameWithoutExtension(),
                                       track.file, te::ClipPosition{timeRange},
                                       te::DeleteExistingClips::yes);
        if (!clip) {
            log::error("Failed to create audio clip from: " + track.file.getFullPathName());
            return false;
        }

        transport.setPosition(te::TimePosition::fromSeconds(0.0));

        media_ = std::make_unique<LoadedMedia>(*edit_, clip, nextResourceId_++, lengthSeconds,
                                               queue_);
        media_->attach();

        DBG("TracktionMediaEngine: loaded " << track.displayName << " as resource "
                                            << (juce::int64)media_->getId());
        return true;

    } catch (const std::exception& e) {
        log::error("Failed to load " + track.file.getFullPathName() + ": " + e.what());
        releaseMedia();
        return false;
    }
}

MediaResourceId TracktionMediaEngine::getLoadedResource() const {
    const juce::MessageManagerLock mml(juce::Thread::getCurrentThread());
    if (!mml.lockWasGained() || !media_)
        return INVALID_MEDIA_RESOURCE;
    return media_->getId();
}

bool TracktionMediaEngine::play() {
    const juce::MessageManagerLock mml(juce::Thread::getCurrentThread());
    if (!mml.lockWasGained() || !edit_ || !media_)
        return false;

    media_->rearm();
    edit_->getTransport().play(false);
    return true;
}

void TracktionMediaEngine::pause() {
    const juce::MessageManagerLock mml(juce::Thread::getCurrentThread());
    if (!mml.lockWasGained() || !edit_)
        return;

    // Tracktion has no pause: stop, then put the playhead back where it was
    auto& transport = edit_->getTransport();
    auto position = transport.position.get();
    transport.stop(false, false);
    transport.setPosition(position);
}

void TracktionMediaEngine::stop() {
    const juce::MessageManagerLock mml(juce::Thread::getCurrentThread());
    if (!mml.lockWasGained() || !edit_)
        return;

    auto& transport = edit_->getTransport();
    transport.stop(false, false);
    transport.setPosition(te::TimePosition::fromSeconds(0.0));
}

bool TracktionMediaEngine::isPlaying() const {
    const juce::MessageManagerLock mml(juce::Thread::getCurrentThread());
    if (!mml.lockWasGained() || !edit_)
        return false;
    return edit_->getTransport().isPlaying();
}

float TracktionMediaEngine::percentToDecibels(int percent) {
    auto gain = static_cast<float>(juce::jlimit(0, 100, percent)) / 100.0f;
    return juce::Decibels::gainToDecibels(gain);
}

void TracktionMediaEngine::applyVolume() {
    if (edit_) {
        edit_->getMasterVolumePlugin()->setVolumeDb(percentToDecibels(volumePercent_));
    }
}

void TracktionMediaEngine::setVolume(int percent) {
    const juce::MessageManagerLock mml(juce::Thread::getCurrentThread());
    if (!mml.lockWasGained())
        return;

    volumePercent_ = juce::jlimit(0, 100, percent);
    applyVolume();
}

std::optional<PlaybackPosition> TracktionMediaEngine::getPosition() const {
    const juce::MessageManagerLock mml(juce::Thread::getCurrentThread());
    if (!mml.lockWasGained() || !edit_ || !media_)
        return std::nullopt;

    PlaybackPosition position;
    position.lengthSeconds = media_->getLengthSeconds();
    position.positionSeconds =
        juce::jlimit(0.0, position.lengthSeconds, edit_->getTransport().position.get().inSeconds());
    return position;
}

}  // namespace tunebox
