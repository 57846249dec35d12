#pragma once

#include <juce_core/juce_core.h>

#include <vector>

#include "../core/EventQueue.hpp"
#include "../core/PlayerEvents.hpp"
#include "ButtonDebouncer.hpp"
#include "InputLineDriver.hpp"

namespace tunebox {

/**
 * @brief Which physical line drives which button
 */
struct ButtonMapping {
    int lineOffset;
    ButtonLabel label;
};

/**
 * @brief Turns hardware edges into ButtonPressedEvents
 *
 * Runs entirely inside the driver's callback context: look up the button for
 * the line, debounce, push onto the EventQueue. It never waits on anything,
 * never reads playback state and never renders.
 */
class InputEventSource {
  public:
    /** The four buttons of the reference board (A, B, X, Y). */
    static std::vector<ButtonMapping> defaultMappings();

    InputEventSource(EventQueue& queue, InputLineDriver& driver,
                     std::vector<ButtonMapping> mappings,
                     int debounceMs = ButtonDebouncer::kDefaultWindowMs);
    ~InputEventSource();

    /**
     * @brief Configure the input lines and start delivering presses
     * @return false if the lines could not be configured (fatal for startup)
     */
    bool start();

    /** Deconfigure the lines. */
    void stop();

    /**
     * @brief Handle one falling edge (called from the driver's callback context)
     * @return true if a ButtonPressedEvent was queued
     */
    bool handleEdge(int lineOffset, juce::int64 timestampMs);

    const std::vector<ButtonMapping>& getMappings() const {
        return mappings_;
    }

  private:
    int findSlot(int lineOffset) const;

    EventQueue& queue_;
    InputLineDriver& driver_;
    std::vector<ButtonMapping> mappings_;
    ButtonDebouncer debouncer_;

    JUCE_DECLARE_NON_COPYABLE(InputEventSource)
};

}  // namespace tunebox
