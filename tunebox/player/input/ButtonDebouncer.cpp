#include "ButtonDebouncer.hpp"

namespace tunebox {

ButtonDebouncer::ButtonDebouncer(int numSlots, int windowMs)
    : numSlots_(juce::jmax(0, numSlots)),
      windowMs_(juce::jmax(0, windowMs)),
      lastAccepted_(
          std::make_unique<std::atomic<juce::int64>[]>(static_cast<size_t>(numSlots_))) {
    reset();
}

bool ButtonDebouncer::accept(int slot, juce::int64 timestampMs) {
    if (slot < 0 || slot >= numSlots_)
        return false;

    auto& last = lastAccepted_[static_cast<size_t>(slot)];
    auto previous = last.load(std::memory_order_acquire);

    for (;;) {
        if (previous != kNeverAccepted && timestampMs - previous < windowMs_)
            return false;  // Still bouncing

        if (last.compare_exchange_weak(previous, timestampMs, std::memory_order_acq_rel))
            return true;
    }
}

void ButtonDebouncer::reset() {
    for (int i = 0; i < numSlots_; ++i)
        lastAccepted_[static_cast<size_t>(i)].store(kNeverAccepted, std::memory_order_relaxed);
}

}  // namespace tunebox
