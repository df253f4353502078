#pragma once

#include <atomic>

namespace minder {
namespace runtime {

// Turns SIGINT/SIGTERM into a shutdown request the main loop polls for.
// The handler itself only stores the signal number.
class SignalHandler {
public:
    // Returns false if a handler could not be installed
    static bool install();

    static bool is_shutdown_requested() { return last_signal() != 0; }

    // Signal that requested shutdown, 0 if none
    static int last_signal() { return received_.load(); }

    static void reset() { received_.store(0); }

private:
    static void handle_signal(int signal);
    static std::atomic<int> received_;
};

}  // namespace runtime
}  // namespace minder
