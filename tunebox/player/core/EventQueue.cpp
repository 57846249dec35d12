#include "EventQueue.hpp"

#include <chrono>

namespace tunebox {

bool EventQueue::push(const PlayerEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.size() >= kMaxPendingEvents) {
            return false;  // Queue full - drop event
        }
        events_.push_back(event);
    }
    available_.notify_one();
    return true;
}

bool EventQueue::waitAndPop(PlayerEvent& event, int timeoutMs) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto ready = [this] { return !events_.empty() || wakeRequested_; };
    if (!available_.wait_for(lock, std::chrono::milliseconds(timeoutMs), ready)) {
        return false;
    }

    if (events_.empty()) {
        // Woken without an event
        wakeRequested_ = false;
        return false;
    }

    event = events_.front();
    events_.pop_front();
    return true;
}

void EventQueue::wakeConsumer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wakeRequested_ = true;
    }
    available_.notify_all();
}

std::size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

bool EventQueue::isEmpty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty();
}

void EventQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
    wakeRequested_ = false;
}

}  // namespace tunebox
