#ifndef RUNE_DEVICE_CONSOLE_BUTTON_HPP
#define RUNE_DEVICE_CONSOLE_BUTTON_HPP

#include <atomic>

#include "collaborators.hpp"

namespace rune::device {

/// Push-to-talk on a terminal: each Enter toggles pressed/released.
///
/// Stands in for the GPIO button on machines without one. Reads standard
/// input without blocking, so it can be polled from the button monitor.
class ConsoleButton : public ButtonInput {
public:
    explicit ConsoleButton(int fd = 0);

    bool is_pressed() override;

    /// Standard input reached end of file.
    bool eof() const noexcept { return eof_.load(); }

private:
    int               fd_;
    bool              pressed_ = false;
    std::atomic<bool> eof_{false};
};

} // namespace rune::device

#endif // RUNE_DEVICE_CONSOLE_BUTTON_HPP
