#include "PanelTestPattern.hpp"

#include "../core/Log.hpp"
#include "../display/FrameRenderer.hpp"

namespace tunebox {

PanelTestPattern::PanelTestPattern(DisplayPanel& panel) : panel_(panel) {}

PanelTestPattern::~PanelTestPattern() {
    stop();
}

bool PanelTestPattern::start() {
    if (!panel_.isOpen() && !panel_.open())
        return false;

    log::info("Showing test pattern, press Ctrl+C to stop");
    startTimer(FRAME_INTERVAL_MS);
    return true;
}

void PanelTestPattern::stop() {
    stopTimer();
    if (panel_.isOpen())
        panel_.close();
}

bool PanelTestPattern::pushNextFrame() {
    auto colour = juce::Colour::fromHSV(hue_, 1.0f, 1.0f, 1.0f);
    hue_ += HUE_STEP;
    if (hue_ >= 1.0f)
        hue_ -= 1.0f;

    return panel_.push(FrameRenderer::renderSolid(colour, panel_.getWidth(), panel_.getHeight()));
}

void PanelTestPattern::timerCallback() {
    if (!pushNextFrame())
        log::debug("Test pattern frame dropped");
}

}  // namespace tunebox
