#pragma once

#include <juce_core/juce_core.h>

#include <atomic>
#include <limits>
#include <memory>

namespace tunebox {

/**
 * @brief Collapses contact bounce into one logical press per button
 *
 * One slot per button. An edge is accepted when nothing was accepted on the
 * same slot during the last windowMs; everything inside the window is dropped.
 * Slots are independent atomics, so each line's watcher thread can call
 * accept() without any lock.
 */
class ButtonDebouncer {
  public:
    static constexpr int kDefaultWindowMs = 250;

    explicit ButtonDebouncer(int numSlots, int windowMs = kDefaultWindowMs);

    /**
     * @brief Decide whether an edge on a slot is a new press
     * @param slot         Button slot, 0 <= slot < getNumSlots()
     * @param timestampMs  Monotonic time of the edge
     * @return true if this edge should produce an event
     */
    bool accept(int slot, juce::int64 timestampMs);

    /** Forget all previous presses. */
    void reset();

    int getNumSlots() const {
        return numSlots_;
    }
    int getWindowMs() const {
        return windowMs_;
    }

  private:
    static constexpr juce::int64 kNeverAccepted = std::numeric_limits<juce::int64>::min();

    const int numSlots_;
    const int windowMs_;
    std::unique_ptr<std::atomic<juce::int64>[]> lastAccepted_;
};

}  // namespace tunebox
