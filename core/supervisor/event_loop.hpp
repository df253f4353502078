#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace minder {
namespace supervisor {

// ControlLoop runs posted tasks later, in FIFO order, on a single thread.
// This is the only facility the supervisor needs from the application's
// event loop.
class ControlLoop {
public:
    using Task = std::function<void()>;

    virtual ~ControlLoop() = default;

    // Thread-safe. Never blocks on the loop thread.
    virtual void post(Task task) = 0;
};

/**
 * @brief Minimal single-threaded event loop
 *
 * Whichever thread calls run() (or run_for()) becomes the loop thread for the
 * duration of the call. post() may be called from any thread. A task that
 * throws is logged and the loop continues.
 */
class EventLoop : public ControlLoop {
public:
    EventLoop() = default;

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    void post(Task task) override;

    // Run tasks until stop() is called
    void run();

    // Run tasks until stop() is called or timeout elapses.
    // Returns true if stopped, false on timeout.
    bool run_for(std::chrono::milliseconds timeout);

    // Run the tasks queued right now without waiting for more.
    // Returns the number of tasks run.
    size_t run_pending();

    // Make run()/run_for() return after the current task. Thread-safe.
    void stop();

    bool in_loop_thread() const { return loop_thread_.load() == std::this_thread::get_id(); }

    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stop_requested_ = false;
    std::atomic<std::thread::id> loop_thread_{};

    // Waits until a task is available, stop() was called or deadline passed
    bool next_task(Task &task, const std::chrono::steady_clock::time_point *deadline);
    void execute(Task &task);
};

}  // namespace supervisor
}  // namespace minder
