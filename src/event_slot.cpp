#include "event_slot.hpp"

namespace rune::device {

void EventSlot::post(const ButtonEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_) ++coalesced_;
        pending_ = event;
    }
    cv_.notify_one();
}

std::optional<ButtonEvent> EventSlot::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<ButtonEvent> event;
    event.swap(pending_);
    return event;
}

std::optional<ButtonEvent> EventSlot::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return pending_.has_value() || closed_; });
    std::optional<ButtonEvent> event;
    event.swap(pending_);
    return event;
}

void EventSlot::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventSlot::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::uint64_t EventSlot::coalesced() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return coalesced_;
}

} // namespace rune::device
