#pragma once

#include <juce_events/juce_events.h>
#include <juce_graphics/juce_graphics.h>

#include "../display/DisplayPanel.hpp"

namespace tunebox {

/**
 * @brief Cycles the panel through the colour wheel
 *
 * Used to check panel wiring, rotation and colour order without the player
 * running. Frames are pushed from the message thread.
 */
class PanelTestPattern : private juce::Timer {
  public:
    static constexpr int FRAME_INTERVAL_MS = 33;
    static constexpr float HUE_STEP = 0.01f;

    explicit PanelTestPattern(DisplayPanel& panel);
    ~PanelTestPattern() override;

    /** Open the panel and start cycling. */
    bool start();
    void stop();

    float getHue() const {
        return hue_;
    }

    /** Push the current colour and advance the hue. */
    bool pushNextFrame();

  private:
    void timerCallback() override;

    DisplayPanel& panel_;
    float hue_ = 0.0f;

    JUCE_DECLARE_NON_COPYABLE(PanelTestPattern)
};

}  // namespace tunebox
