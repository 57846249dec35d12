#include "FrameRenderer.hpp"

namespace tunebox {

namespace {

const juce::Colour kTextColour = juce::Colours::white;
const juce::Colour kLegendColour = juce::Colour(200, 200, 200);
const juce::Colour kPlayingColour = juce::Colour(0, 255, 0);
const juce::Colour kIdleColour = juce::Colour(255, 0, 0);

const char* const kLegend[] = {"A: Play/Pause", "B: Next Track", "X: Vol Down", "Y: Vol Up"};

// Text is positioned by its top-left corner
void drawLine(juce::Graphics& g, const juce::String& text, int x, int y, int width,
              float fontSize) {
    g.drawText(text, x, y, width, static_cast<int>(fontSize) + 6, juce::Justification::topLeft,
               true);
}

}  // namespace

juce::Colour FrameRenderer::trackNameColour(PlaybackStatus status) {
    return status == PlaybackStatus::Playing ? kPlayingColour : kIdleColour;
}

juce::String FrameRenderer::formatTime(const PlaybackPosition& position) {
    auto elapsed = static_cast<int>(position.positionSeconds);
    auto total = static_cast<int>(position.lengthSeconds);
    return "Time: " + juce::String(elapsed) + "s / " + juce::String(total) + "s";
}

juce::Image FrameRenderer::render(const FrameModel& model, int width, int height) {
    juce::Image frame(juce::Image::RGB, width, height, true);
    juce::Graphics g(frame);

    if (model.background.isValid())
        g.drawImageAt(model.background, 0, 0);
    else
        g.fillAll(juce::Colours::black);

    const int textWidth = width - 2 * MARGIN;

    // ===== Now playing =====
    g.setFont(juce::Font(HEADER_FONT_SIZE, juce::Font::bold));
    g.setColour(kTextColour);
    drawLine(g, "Now Playing:", MARGIN, 20, textWidth, HEADER_FONT_SIZE);

    g.setColour(trackNameColour(model.state.status));
    drawLine(g, model.track != nullptr ? model.track->displayName : juce::String("No track"),
             MARGIN, 45, textWidth, HEADER_FONT_SIZE);

    g.setColour(kTextColour);
    drawLine(g, "Volume: " + juce::String(model.state.volume) + "%", MARGIN, 85, textWidth,
             HEADER_FONT_SIZE);

    if (model.state.isPlaying() && model.position.has_value())
        drawLine(g, formatTime(*model.position), MARGIN, 120, textWidth, HEADER_FONT_SIZE);

    // ===== Controls legend =====
    g.setFont(juce::Font(LEGEND_FONT_SIZE, juce::Font::plain));
    g.setColour(kLegendColour);
    int y = 160;
    for (auto* line : kLegend) {
        drawLine(g, line, MARGIN, y, textWidth, LEGEND_FONT_SIZE);
        y += 20;
    }

    return frame;
}

juce::Image FrameRenderer::renderSolid(juce::Colour colour, int width, int height) {
    juce::Image frame(juce::Image::RGB, width, height, false);
    frame.clear(frame.getBounds(), colour);
    return frame;
}

}  // namespace tunebox
