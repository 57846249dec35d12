#pragma once

#include <juce_core/juce_core.h>

#include <functional>
#include <memory>
#include <vector>

#include "../core/EventQueue.hpp"
#include "../core/PlaybackController.hpp"
#include "../core/TrackCatalog.hpp"
#include "../display/DisplayPanel.hpp"
#include "../engine/MediaEngine.hpp"
#include "../input/InputEventSource.hpp"
#include "../input/InputLineDriver.hpp"

namespace tunebox {

class Config;

/**
 * @brief Settings the runtime needs, resolved from Config and the command line
 */
struct RuntimeSettings {
    juce::File libraryDirectory;
    juce::StringArray extensions;
    bool shuffleStartTrack = true;
    int defaultVolume = PlaybackState::kDefaultVolume;
    int volumeStep = 5;
    int tickIntervalMs = 1000;
    int debounceMs = ButtonDebouncer::kDefaultWindowMs;
    float artworkBrightness = 0.3f;
    std::vector<ButtonMapping> buttons;

    static RuntimeSettings fromConfig(const Config& config);
};

/** Creates the media engine once the runtime's EventQueue exists. */
using MediaEngineFactory = std::function<std::unique_ptr<MediaEngine>(EventQueue&)>;

/**
 * @brief Wires the catalog, input, engine, display and controller together
 *
 * Owns every component and brings them up and down in a fixed order. The
 * hardware-facing pieces are injected so tests can substitute them.
 */
class PlayerRuntime {
  public:
    PlayerRuntime(RuntimeSettings settings, std::unique_ptr<InputLineDriver> inputDriver,
                  MediaEngineFactory engineFactory, std::unique_ptr<DisplayPanel> panel);
    ~PlayerRuntime();

    /**
     * @brief Bring the player up
     *
     * Order: catalog, input lines, media engine, display panel, initial
     * volume, controller, first frame. A missing or empty library, input
     * lines that cannot be configured or an engine that fails to initialise
     * abort startup before anything is rendered. A display that fails to open
     * does not; frames are then dropped.
     * @return false if startup failed (everything started so far is torn down)
     */
    bool startup();

    /** Stop the controller, then release engine, input and display. Safe to call twice. */
    void shutdown();

    bool isRunning() const {
        return running_;
    }

    EventQueue& getQueue() {
        return queue_;
    }
    const TrackCatalog& getCatalog() const {
        return catalog_;
    }
    PlaybackController* getController() {
        return controller_.get();
    }
    MediaEngine* getMediaEngine() {
        return engine_.get();
    }

  private:
    RuntimeSettings settings_;

    EventQueue queue_;
    TrackCatalog catalog_;

    std::unique_ptr<InputLineDriver> inputDriver_;
    std::unique_ptr<InputEventSource> inputSource_;
    MediaEngineFactory engineFactory_;
    std::unique_ptr<MediaEngine> engine_;
    std::unique_ptr<DisplayPanel> panel_;
    std::unique_ptr<PlaybackController> controller_;

    bool running_ = false;
    bool engineInitialised_ = false;

    JUCE_DECLARE_NON_COPYABLE(PlayerRuntime)
};

}  // namespace tunebox
