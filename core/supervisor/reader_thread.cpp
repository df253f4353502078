#include "reader_thread.hpp"

#include "logging/logger.hpp"

namespace minder {
namespace supervisor {

const char *quit_reason_to_string(QuitReason reason) {
    switch (reason) {
        case QuitReason::NONE:
            return "none";
        case QuitReason::NORMAL:
            return "normal";
        case QuitReason::CLOSED_PIPE:
            return "closed-pipe";
        case QuitReason::READ_ERROR:
            return "read-error";
        case QuitReason::UNEXPECTED:
            return "unexpected";
        default:
            return "unknown";
    }
}

ReaderThread::ReaderThread(int stdout_fd, ControlLoop &loop, DeliverCallback deliver, FinishedCallback on_finished)
    : reader_(stdout_fd), loop_(loop), deliver_(std::move(deliver)), on_finished_(std::move(on_finished)) {}

ReaderThread::~ReaderThread() { join(); }

void ReaderThread::start() { thread_ = std::thread(&ReaderThread::run, this); }

void ReaderThread::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool ReaderThread::wait_finished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return is_finished(); });
}

void ReaderThread::run() {
    QuitReason reason;
    try {
        reason = read_loop();
    } catch (const std::exception &e) {
        LOG_ERROR("[Reader] Unexpected failure: " << e.what());
        reason = QuitReason::UNEXPECTED;
    } catch (...) {
        LOG_ERROR("[Reader] Unexpected non-standard exception");
        reason = QuitReason::UNEXPECTED;
    }
    finish(reason);
}

QuitReason ReaderThread::read_loop() {
    channel::FromWorker msg;
    std::string error;

    while (true) {
        auto status = channel::read_envelope(reader_, msg, error);
        switch (status) {
            case channel::FrameStatus::OK:
                break;
            case channel::FrameStatus::END_OF_STREAM:
                return QuitReason::CLOSED_PIPE;
            default:
                LOG_WARN("[Reader] Quitting on read error (" << channel::frame_status_to_string(status)
                                                             << "): " << error);
                return QuitReason::READ_ERROR;
        }

        if (channel::is_stop(msg)) {
            return QuitReason::NORMAL;
        }

        if (msg.kind_case() == channel::FromWorker::KIND_NOT_SET) {
            LOG_WARN("[Reader] Quitting on message without a kind");
            return QuitReason::READ_ERROR;
        }

        // Hand off to the control thread; never call the application from here
        DeliverCallback deliver = deliver_;
        loop_.post([deliver, msg]() { deliver(msg); });
        delivered_count_.fetch_add(1, std::memory_order_relaxed);
    }
}

void ReaderThread::finish(QuitReason reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        quit_reason_.store(reason, std::memory_order_release);
    }
    cv_.notify_all();

    LOG_DEBUG("[Reader] Finished (" << quit_reason_to_string(reason) << ")");
    loop_.post(on_finished_);
}

}  // namespace supervisor
}  // namespace minder
