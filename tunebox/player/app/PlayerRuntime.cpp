#include "PlayerRuntime.hpp"

#include "../core/Config.hpp"
#include "../core/Log.hpp"

namespace tunebox {

RuntimeSettings RuntimeSettings::fromConfig(const Config& config) {
    RuntimeSettings settings;
    settings.libraryDirectory =
        juce::File::getCurrentWorkingDirectory().getChildFile(config.getLibraryPath());
    settings.extensions = TrackCatalog::parseExtensionList(config.getAudioExtensions());
    settings.shuffleStartTrack = config.getShuffleStartTrack();
    settings.defaultVolume = config.getDefaultVolume();
    settings.volumeStep = config.getVolumeStep();
    settings.tickIntervalMs = config.getTickIntervalMs();
    settings.debounceMs = config.getDebounceMs();
    settings.artworkBrightness = static_cast<float>(config.getArtworkDimming());
    settings.buttons = InputEventSource::defaultMappings();
    return settings;
}

PlayerRuntime::PlayerRuntime(RuntimeSettings settings,
                             std::unique_ptr<InputLineDriver> inputDriver,
                             MediaEngineFactory engineFactory,
                             std::unique_ptr<DisplayPanel> panel)
    : settings_(std::move(settings)),
      inputDriver_(std::move(inputDriver)),
      engineFactory_(std::move(engineFactory)),
      panel_(std::move(panel)) {}

PlayerRuntime::~PlayerRuntime() {
    shutdown();
}

bool PlayerRuntime::startup() {
    if (running_)
        return true;

    // 1. Catalog
    if (!catalog_.loadFromDirectory(settings_.libraryDirectory, settings_.extensions)) {
        log::error("No playable tracks, not starting");
        return false;
    }

    // 2. Input lines
    if (inputDriver_ == nullptr) {
        log::error("No input driver");
        return false;
    }
    inputSource_ = std::make_unique<InputEventSource>(queue_, *inputDriver_, settings_.buttons,
                                                      settings_.debounceMs);
    if (!inputSource_->start()) {
        shutdown();
        return false;
    }

    // 3. Media engine
    engine_ = engineFactory_ ? engineFactory_(queue_) : nullptr;
    if (engine_ == nullptr || !engine_->initialize()) {
        log::error("Failed to initialize media engine");
        shutdown();
        return false;
    }
    engineInitialised_ = true;

    // 4. Display (frames are dropped if it is not there)
    if (panel_ == nullptr) {
        log::error("No display panel");
        shutdown();
        return false;
    }
    if (!panel_->open())
        log::error("Display unavailable, frames will be dropped");

    // 5. Initial state and volume
    PlaybackState initial;
    initial.volume = juce::jlimit(PlaybackState::kMinVolume, PlaybackState::kMaxVolume,
                                  settings_.defaultVolume);
    initial.trackIndex =
        catalog_.chooseStartIndex(settings_.shuffleStartTrack, juce::Random::getSystemRandom());
    engine_->setVolume(initial.volume);

    // 6. Controller
    PlaybackController::Options options;
    options.volumeStep = settings_.volumeStep;
    options.tickIntervalMs = settings_.tickIntervalMs;
    options.artworkBrightness = settings_.artworkBrightness;

    controller_ = std::make_unique<PlaybackController>(catalog_, queue_, *engine_, *panel_,
                                                       initial, options);
    if (!controller_->start()) {
        log::error("Failed to start playback thread");
        shutdown();
        return false;
    }
    running_ = true;

    // 7. First frame
    queue_.push(RefreshRequestedEvent{});

    log::info("TuneBox ready: " + juce::String(catalog_.size()) + " tracks, starting at " +
              catalog_[initial.trackIndex].displayName);
    return true;
}

void PlayerRuntime::shutdown() {
    if (controller_ != nullptr) {
        controller_->stop();
        controller_.reset();
    }

    if (engine_ != nullptr) {
        if (engineInitialised_) {
            engine_->stop();
            engine_->shutdown();
            engineInitialised_ = false;
        }
        engine_.reset();
    }

    if (inputSource_ != nullptr) {
        inputSource_->stop();
        inputSource_.reset();
    }

    if (panel_ != nullptr && panel_->isOpen())
        panel_->close();

    queue_.clear();

    if (running_)
        log::info("TuneBox stopped");
    running_ = false;
}

}  // namespace tunebox
