#pragma once

#include <juce_core/juce_core.h>

#include <functional>
#include <vector>

namespace tunebox {

/**
 * @brief Abstract source of falling-edge callbacks for a set of input lines
 *
 * Concrete implementations (e.g. GpioLineDriver) configure the hardware lines
 * and invoke onFallingEdge from their own callback context, once per detected
 * edge. The callback must not block.
 */
class InputLineDriver {
  public:
    virtual ~InputLineDriver() = default;

    /**
     * @brief Configure the given lines as pulled-up inputs with falling-edge detection
     * @return false if any line could not be configured (nothing is left configured)
     */
    virtual bool open(const std::vector<int>& lineOffsets) = 0;

    /** Deconfigure all lines and stop delivering callbacks. Safe to call twice. */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /** Called with (line offset, monotonic timestamp in ms) for every falling edge. */
    std::function<void(int, juce::int64)> onFallingEdge;
};

}  // namespace tunebox
