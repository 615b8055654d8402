#ifndef RUNE_DEVICE_BUTTON_MONITOR_HPP
#define RUNE_DEVICE_BUTTON_MONITOR_HPP

#include <atomic>
#include <chrono>
#include <thread>

#include "collaborators.hpp"
#include "event_slot.hpp"

namespace rune::device {

/// Polls the push-to-talk level on its own thread and posts edges.
///
/// Runs independently of the engine, so edges are seen within one poll
/// interval however long a session takes.
class ButtonMonitor {
public:
    ButtonMonitor(ButtonInput& input, EventSlot& slot,
                  std::chrono::milliseconds poll_interval = std::chrono::milliseconds(10));
    ~ButtonMonitor();

    ButtonMonitor(const ButtonMonitor&) = delete;
    ButtonMonitor& operator=(const ButtonMonitor&) = delete;

    /// Start the polling thread. Returns false if it is already running.
    bool start();

    /// Stop and join the polling thread.
    void stop();

    bool running() const noexcept { return running_.load(); }

    /// Sample the button once; posts an event on a level change.
    /// Returns true if an edge was posted.
    bool poll_once();

private:
    ButtonInput&              input_;
    EventSlot&                slot_;
    std::chrono::milliseconds poll_interval_;
    std::atomic<bool>         running_{false};
    std::thread               thread_;
    bool                      pressed_ = false;   // last level seen

    void loop();
};

} // namespace rune::device

#endif // RUNE_DEVICE_BUTTON_MONITOR_HPP
