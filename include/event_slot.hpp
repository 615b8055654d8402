#ifndef RUNE_DEVICE_EVENT_SLOT_HPP
#define RUNE_DEVICE_EVENT_SLOT_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

#include "collaborators.hpp"

namespace rune::device {

/// Single-slot mailbox between the button monitor and the engine.
///
/// post() never waits for the consumer: a new edge replaces one that has not
/// been taken yet, so at most one event is ever pending.
class EventSlot {
public:
    EventSlot() = default;

    EventSlot(const EventSlot&) = delete;
    EventSlot& operator=(const EventSlot&) = delete;

    void post(const ButtonEvent& event);

    /// Take the pending event, if any, without blocking.
    std::optional<ButtonEvent> take();

    /// Wait up to `timeout` for an event. Returns early with nothing after
    /// close().
    std::optional<ButtonEvent> wait_for(std::chrono::milliseconds timeout);

    /// Wake any waiter; later waits return immediately.
    void close();

    bool closed() const;

    /// Events that were overwritten before being taken.
    std::uint64_t coalesced() const;

private:
    mutable std::mutex         mutex_;
    std::condition_variable    cv_;
    std::optional<ButtonEvent> pending_;
    bool                       closed_    = false;
    std::uint64_t              coalesced_ = 0;
};

} // namespace rune::device

#endif // RUNE_DEVICE_EVENT_SLOT_HPP
