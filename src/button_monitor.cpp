#include "button_monitor.hpp"

#include <cstdio>

namespace rune::device {

ButtonMonitor::ButtonMonitor(ButtonInput& input, EventSlot& slot,
                             std::chrono::milliseconds poll_interval)
    : input_(input), slot_(slot), poll_interval_(poll_interval) {}

ButtonMonitor::~ButtonMonitor() { stop(); }

bool ButtonMonitor::start() {
    if (running_.exchange(true)) return false;
    thread_ = std::thread(&ButtonMonitor::loop, this);
    return true;
}

void ButtonMonitor::stop() {
    running_.store(false);
    if (thread_.joinable()) thread_.join();
}

bool ButtonMonitor::poll_once() {
    const bool level = input_.is_pressed();
    if (level == pressed_) return false;

    pressed_ = level;
    ButtonEvent event;
    event.kind = level ? ButtonEvent::Kind::Pressed : ButtonEvent::Kind::Released;
    event.timestamp = Clock::now();
    slot_.post(event);
    return true;
}

void ButtonMonitor::loop() {
    std::fprintf(stderr, "[button] monitor started (%lld ms poll)\n",
                 static_cast<long long>(poll_interval_.count()));
    while (running_.load()) {
        poll_once();
        std::this_thread::sleep_for(poll_interval_);
    }
    std::fprintf(stderr, "[button] monitor stopped\n");
}

} // namespace rune::device
