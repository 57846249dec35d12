#pragma once

#include <juce_graphics/juce_graphics.h>

#include <optional>

#include "../core/PlaybackState.hpp"
#include "../core/TrackCatalog.hpp"
#include "../engine/MediaEngine.hpp"

namespace tunebox {

/**
 * @brief Everything one frame shows
 *
 * Built by the PlaybackController from its own snapshot, so the renderer
 * never reads shared state.
 */
struct FrameModel {
    PlaybackState state;
    const TrackInfo* track = nullptr;
    std::optional<PlaybackPosition> position;
    juce::Image background;  // Dimmed artwork, or invalid for a black background
};

/**
 * @brief Draws the player screen into an image
 *
 * Stateless; safe to call from any thread that owns the image it returns.
 */
class FrameRenderer {
  public:
    static constexpr int MARGIN = 10;
    static constexpr float HEADER_FONT_SIZE = 18.0f;
    static constexpr float LEGEND_FONT_SIZE = 14.0f;

    static juce::Image render(const FrameModel& model, int width, int height);

    /** A frame filled with one colour (panel test pattern). */
    static juce::Image renderSolid(juce::Colour colour, int width, int height);

    /** "Time: 12s / 240s" */
    static juce::String formatTime(const PlaybackPosition& position);

    static juce::Colour trackNameColour(PlaybackStatus status);
};

}  // namespace tunebox
