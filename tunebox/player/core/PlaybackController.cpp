#include "PlaybackController.hpp"

#include "../display/ArtworkLoader.hpp"
#include "../display/DisplayPanel.hpp"
#include "../display/FrameRenderer.hpp"
#include "../engine/MediaEngine.hpp"
#include "Log.hpp"

namespace tunebox {

PlaybackController::PlaybackController(const TrackCatalog& catalog, EventQueue& queue,
                                       MediaEngine& engine, DisplayPanel& panel,
                                       PlaybackState initialState, Options options)
    : juce::Thread("TuneBox Playback"),
      catalog_(catalog),
      queue_(queue),
      engine_(engine),
      panel_(panel),
      options_(options),
      state_(initialState) {
    state_.volume = juce::jlimit(PlaybackState::kMinVolume, PlaybackState::kMaxVolume,
                                 state_.volume);
    if (catalog_.isEmpty() || state_.trackIndex < 0 || state_.trackIndex >= catalog_.size())
        state_.trackIndex = 0;
}

PlaybackController::~PlaybackController() {
    stop();
}

// ===== Drain thread =====

bool PlaybackController::start() {
    if (isThreadRunning())
        return true;
    return startThread();
}

void PlaybackController::stop() {
    if (!isThreadRunning())
        return;

    signalThreadShouldExit();
    queue_.wakeConsumer();
    waitForThreadToExit(-1);
}

void PlaybackController::run() {
    log::debug("Playback drain thread started");

    while (!threadShouldExit())
        processNextEvent(options_.tickIntervalMs);

    log::debug("Playback drain thread finished");
}

// ===== Event processing =====

bool PlaybackController::processNextEvent(int timeoutMs) {
    PlayerEvent event;
    if (!queue_.waitAndPop(event, timeoutMs)) {
        if (threadShouldExit())
            return false;
        event = RefreshRequestedEvent{};
    }

    processEvent(event);
    return true;
}

PlaybackController::ChangeFlags PlaybackController::processEvent(const PlayerEvent& event) {
    ChangeFlags changes =
        std::visit([this](const auto& e) -> ChangeFlags { return this->handleEvent(e); }, event);

    if (changes != ChangeFlags::None)
        render();

    return changes;
}

PlaybackState PlaybackController::getState() const {
    const juce::ScopedLock sl(stateLock_);
    return state_;
}

// ===== Event Handlers =====

PlaybackController::ChangeFlags PlaybackController::handleEvent(const ButtonPressedEvent& e) {
    log::debug("Button: " + toString(e.label));

    switch (e.label) {
        case ButtonLabel::PlayPause:
            return togglePlayPause();
        case ButtonLabel::Next:
            return advanceTrack();
        case ButtonLabel::VolumeDown:
            return changeVolume(-options_.volumeStep);
        case ButtonLabel::VolumeUp:
            return changeVolume(options_.volumeStep);
    }
    return ChangeFlags::None;
}

PlaybackController::ChangeFlags PlaybackController::handleEvent(const MediaEndedEvent& e) {
    if (!state_.isPlaying() || e.resource != loadedResource_) {
        log::debug("Ignoring end of media for resource " + juce::String(e.resource));
        return ChangeFlags::None;
    }

    // Same as pressing Next while playing
    return advanceTrack();
}

PlaybackController::ChangeFlags PlaybackController::handleEvent(const RefreshRequestedEvent&) {
    return ChangeFlags::Refresh;
}

PlaybackController::ChangeFlags PlaybackController::togglePlayPause() {
    if (catalog_.isEmpty())
        return ChangeFlags::None;

    switch (state_.status) {
        case PlaybackStatus::Stopped:
            startPlayback(state_.trackIndex);
            break;

        case PlaybackStatus::Playing: {
            engine_.pause();
            const juce::ScopedLock sl(stateLock_);
            state_.status = PlaybackStatus::Paused;
            log::info("Paused: " + catalog_[state_.trackIndex].displayName);
            break;
        }

        case PlaybackStatus::Paused:
            // Next while paused moves the index without loading; resume means the new track
            if (loadedTrackIndex_ != state_.trackIndex) {
                startPlayback(state_.trackIndex);
            } else if (engine_.play()) {
                const juce::ScopedLock sl(stateLock_);
                state_.status = PlaybackStatus::Playing;
                log::info("Resumed: " + catalog_[state_.trackIndex].displayName);
            } else {
                log::error("Failed to resume " + catalog_[state_.trackIndex].displayName);
                markStopped();
            }
            break;
    }

    return ChangeFlags::Status;
}

PlaybackController::ChangeFlags PlaybackController::advanceTrack() {
    if (catalog_.isEmpty())
        return ChangeFlags::None;

    int next = (state_.trackIndex + 1) % catalog_.size();
    {
        const juce::ScopedLock sl(stateLock_);
        state_.trackIndex = next;
    }

    if (state_.isPlaying()) {
        startPlayback(next);
        return ChangeFlags::Track | ChangeFlags::Status;
    }

    return ChangeFlags::Track;
}

PlaybackController::ChangeFlags PlaybackController::changeVolume(int delta) {
    int volume = juce::jlimit(PlaybackState::kMinVolume, PlaybackState::kMaxVolume,
                              state_.volume + delta);
    if (volume == state_.volume)
        return ChangeFlags::None;

    {
        const juce::ScopedLock sl(stateLock_);
        state_.volume = volume;
    }
    engine_.setVolume(volume);
    log::debug("Volume: " + juce::String(volume) + "%");
    return ChangeFlags::Volume;
}

// ===== Engine helpers =====

bool PlaybackController::startPlayback(int trackIndex) {
    const auto* track = catalog_.getTrack(trackIndex);
    if (track == nullptr)
        return false;

    if (!engine_.load(*track)) {
        log::error("Failed to load " + track->file.getFullPathName());
        loadedTrackIndex_ = -1;
        loadedResource_ = INVALID_MEDIA_RESOURCE;
        markStopped();
        return false;
    }

    loadedTrackIndex_ = trackIndex;
    loadedResource_ = engine_.getLoadedResource();
    engine_.setVolume(state_.volume);

    if (!engine_.play()) {
        log::error("Failed to start playback of " + track->displayName);
        markStopped();
        return false;
    }

    const juce::ScopedLock sl(stateLock_);
    state_.status = PlaybackStatus::Playing;
    log::info("Playing: " + track->displayName);
    return true;
}

void PlaybackController::markStopped() {
    const juce::ScopedLock sl(stateLock_);
    state_.status = PlaybackStatus::Stopped;
}

// ===== Rendering =====

const juce::Image& PlaybackController::artworkFor(int trackIndex) {
    if (trackIndex != artworkTrackIndex_) {
        artworkTrackIndex_ = trackIndex;
        artwork_ = {};
        if (const auto* track = catalog_.getTrack(trackIndex))
            artwork_ = ArtworkLoader::loadBackground(track->file, panel_.getWidth(),
                                                     panel_.getHeight(),
                                                     options_.artworkBrightness);
    }
    return artwork_;
}

void PlaybackController::render() {
    FrameModel model;
    model.state = state_;
    model.track = catalog_.getTrack(state_.trackIndex);
    if (state_.isPlaying())
        model.position = engine_.getPosition();
    model.background = artworkFor(state_.trackIndex);

    auto frame = FrameRenderer::render(model, panel_.getWidth(), panel_.getHeight());
    ++renderCount_;

    if (panel_.isOpen() && panel_.push(frame)) {
        panelFailureLogged_ = false;
        return;
    }

    // A missing panel would otherwise log once per tick
    if (!panelFailureLogged_) {
        log::error("Failed to push frame to display");
        panelFailureLogged_ = true;
    } else {
        log::debug("Frame dropped");
    }
}

}  // namespace tunebox
