#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "channel/framed_stream.hpp"
#include "channel/message_codec.hpp"
#include "event_loop.hpp"

namespace minder {
namespace supervisor {

// Why a reader thread stopped reading
enum class QuitReason {
    NONE,         // Still running
    NORMAL,       // Worker sent its stop sentinel
    CLOSED_PIPE,  // End of stream without a stop sentinel
    READ_ERROR,   // Read failed, oversized frame or unparsable payload
    UNEXPECTED    // Any other failure inside the thread
};

const char *quit_reason_to_string(QuitReason reason);

// ReaderThread blocks reading frames from a worker's stdout and hands every
// decoded message to the control loop. It never calls into the application
// itself.
//
// Lifecycle: start() once; when the stream ends the thread records its quit
// reason and then posts on_finished to the control loop exactly once. The
// owner joins it afterwards.
class ReaderThread {
public:
    // Runs on the control loop, once per inbound message, in arrival order
    using DeliverCallback = std::function<void(const channel::FromWorker &)>;
    // Runs on the control loop after the quit reason was recorded
    using FinishedCallback = std::function<void()>;

    ReaderThread(int stdout_fd, ControlLoop &loop, DeliverCallback deliver, FinishedCallback on_finished);
    ~ReaderThread();

    ReaderThread(const ReaderThread &) = delete;
    ReaderThread &operator=(const ReaderThread &) = delete;

    void start();

    // Wait up to timeout for the thread to stop reading. Returns true if it did.
    bool wait_finished(std::chrono::milliseconds timeout);

    bool is_finished() const { return quit_reason() != QuitReason::NONE; }

    // NONE until the thread has stopped
    QuitReason quit_reason() const { return quit_reason_.load(std::memory_order_acquire); }

    void join();

    // Number of messages handed to the control loop
    size_t delivered_count() const { return delivered_count_.load(std::memory_order_relaxed); }

private:
    channel::FrameReader reader_;
    ControlLoop &loop_;
    DeliverCallback deliver_;
    FinishedCallback on_finished_;
    std::thread thread_;
    std::atomic<QuitReason> quit_reason_{QuitReason::NONE};
    std::atomic<size_t> delivered_count_{0};
    std::mutex mutex_;
    std::condition_variable cv_;

    void run();
    QuitReason read_loop();
    void finish(QuitReason reason);
};

}  // namespace supervisor
}  // namespace minder
