#pragma once

#include <juce_graphics/juce_graphics.h>

namespace tunebox {

/**
 * @brief Abstract display panel: takes finished frames and shows them
 */
class DisplayPanel {
  public:
    virtual ~DisplayPanel() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /** Logical frame size (before any rotation the panel applies). */
    virtual int getWidth() const = 0;
    virtual int getHeight() const = 0;

    /**
     * @brief Show a frame
     * @return false if the frame could not be delivered (caller logs and carries on)
     */
    virtual bool push(const juce::Image& frame) = 0;
};

}  // namespace tunebox
