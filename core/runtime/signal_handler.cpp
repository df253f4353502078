#include "signal_handler.hpp"

#include <signal.h>

namespace minder {
namespace runtime {

std::atomic<int> SignalHandler::received_{0};

bool SignalHandler::install() {
    struct sigaction action {};
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: a blocked read should see EINTR and let the loop notice
    action.sa_flags = 0;

    return sigaction(SIGINT, &action, nullptr) == 0 && sigaction(SIGTERM, &action, nullptr) == 0;
}

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: lock-free atomic store only
    received_.store(signal);
}

}  // namespace runtime
}  // namespace minder
