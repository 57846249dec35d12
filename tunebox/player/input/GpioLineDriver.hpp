#pragma once

#include <juce_core/juce_core.h>

#include <memory>
#include <string>
#include <vector>

#include "InputLineDriver.hpp"

namespace tunebox {

/**
 * @brief InputLineDriver backed by the Linux GPIO character device (uAPI v2)
 *
 * Each line is requested separately as input + pull-up + falling-edge
 * detection and gets its own watcher thread, which blocks in poll() on the
 * line's fd and forwards kernel edge events (with their monotonic
 * timestamps) to onFallingEdge. close() stops the watchers and releases the
 * line fds, which returns the lines to the kernel.
 */
class GpioLineDriver : public InputLineDriver {
  public:
    explicit GpioLineDriver(std::string chipPath);
    ~GpioLineDriver() override;

    bool open(const std::vector<int>& lineOffsets) override;
    void close() override;
    bool isOpen() const override {
        return !watchers_.empty();
    }

    const std::string& getChipPath() const {
        return chipPath_;
    }

  private:
    class LineWatcher;

    std::unique_ptr<LineWatcher> requestLine(int chipFd, int lineOffset);

    std::string chipPath_;
    std::vector<std::unique_ptr<LineWatcher>> watchers_;

    JUCE_DECLARE_NON_COPYABLE(GpioLineDriver)
};

}  // namespace tunebox
