#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "PlayerEvents.hpp"

namespace tunebox {

/**
 * @brief Multi-producer / single-consumer FIFO between event sources and the controller
 *
 * Button watcher threads and the engine's notification thread push, the
 * PlaybackController's drain thread pops. Pushing only takes the internal
 * mutex for the duration of a deque insert and never waits for the consumer.
 * Ordering is preserved per producer; nothing is promised across producers.
 */
class EventQueue {
  public:
    static constexpr std::size_t kMaxPendingEvents = 256;

    EventQueue() = default;
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /**
     * @brief Push an event (any thread)
     * @return true if queued, false if the queue was full and the event was dropped
     */
    bool push(const PlayerEvent& event);

    /**
     * @brief Pop the oldest event, waiting up to timeoutMs for one to arrive
     * @return true if an event was written to @p event, false on timeout or wake-up
     */
    bool waitAndPop(PlayerEvent& event, int timeoutMs);

    /**
     * @brief Make a pending waitAndPop() return early (used when shutting down)
     */
    void wakeConsumer();

    std::size_t size() const;
    bool isEmpty() const;
    void clear();

  private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<PlayerEvent> events_;
    bool wakeRequested_ = false;
};

}  // namespace tunebox
