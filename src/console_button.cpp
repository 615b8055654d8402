#include "console_button.hpp"

#include <cstdio>

#include <poll.h>
#include <unistd.h>

namespace rune::device {

ConsoleButton::ConsoleButton(int fd)
    : fd_(fd) {}

bool ConsoleButton::is_pressed() {
    if (eof_.load()) return false;

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    while (::poll(&pfd, 1, 0) > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
        char buf[64];
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n <= 0) {
            eof_.store(true);
            pressed_ = false;
            break;
        }
        for (ssize_t i = 0; i < n; ++i) {
            if (buf[i] == '\n') {
                pressed_ = !pressed_;
                std::printf("[button] %s\n", pressed_ ? "pressed (Enter to release)"
                                                      : "released");
                std::fflush(stdout);
            }
        }
    }
    return pressed_;
}

} // namespace rune::device
