#include "supervisor.hpp"

#include <signal.h>

#include <algorithm>
#include <functional>

#include "logging/logger.hpp"

namespace minder {
namespace supervisor {

namespace {

// How long a replaced worker gets to exit on its own before it is killed
constexpr int kRestartReapGraceMs = 200;

// Run a responder callback; a throwing responder must not break supervision
void trap_call(const std::string &worker_id, const char *what, const std::function<void()> &fn) {
    try {
        fn();
    } catch (const std::exception &e) {
        LOG_ERROR("[" << worker_id << "] Responder " << what << " failed: " << e.what());
    }
}

}  // namespace

const char *supervisor_state_to_string(SupervisorState state) {
    switch (state) {
        case SupervisorState::STOPPED:
            return "STOPPED";
        case SupervisorState::RUNNING:
            return "RUNNING";
        case SupervisorState::RESTARTING:
            return "RESTARTING";
        default:
            return "UNKNOWN";
    }
}

Supervisor::Supervisor(SupervisorConfig config, Responder &responder, ControlLoop &loop)
    : config_(std::move(config)), responder_(responder), loop_(loop), alive_token_(std::make_shared<int>(0)) {
    // Writes to a dead worker must fail with EPIPE instead of killing us
    signal(SIGPIPE, SIG_IGN);
}

Supervisor::~Supervisor() {
    shutdown();
    alive_token_.reset();
}

bool Supervisor::start() {
    if (is_running()) {
        return true;
    }
    if (!start_worker()) {
        return false;
    }
    trap_call(config_.id, "on_start", [this] { responder_.on_start(); });
    return true;
}

bool Supervisor::start_worker() {
    process_ = std::make_unique<WorkerProcess>(config_.id, config_.command, config_.args);
    if (!process_->spawn()) {
        error_ = process_->last_error();
        process_.reset();
        state_ = SupervisorState::STOPPED;
        return false;
    }

    const uint64_t generation = ++generation_;
    std::weak_ptr<int> alive = alive_token_;

    reader_ = std::make_unique<ReaderThread>(
        process_->stdout_fd(), loop_,
        [this, alive](const channel::FromWorker &msg) {
            if (alive.expired()) {
                return;
            }
            responder_.dispatch(msg);
        },
        [this, alive, generation]() {
            if (alive.expired()) {
                return;
            }
            on_reader_finished(generation);
        });
    reader_->start();

    writer_.set_fd(process_->stdin_fd());
    state_ = SupervisorState::RUNNING;
    error_.clear();

    if (!send_startup_info()) {
        // The worker sees EOF mid-handshake and gives up; reap it
        std::string reason = error_;
        release_worker(0);
        ++generation_;
        state_ = SupervisorState::STOPPED;
        error_ = reason;
        return false;
    }
    return true;
}

bool Supervisor::send_startup_info() {
    channel::ToWorker startup;
    auto *config = startup.mutable_startup_info()->mutable_config();
    for (const auto &[key, value] : config_.startup_config) {
        (*config)[key] = value;
    }
    if (config->find("log_level") == config->end()) {
        (*config)["log_level"] = logging::level_to_string(logging::Logger::level());
    }
    if (config->find("process_name") == config->end()) {
        (*config)["process_name"] = config_.id;
    }
    if (!write_to_worker(startup)) {
        return false;
    }

    channel::ToWorker handler;
    auto *info = handler.mutable_handler_info();
    info->set_handler_name(config_.handler_name);
    for (const auto &arg : config_.handler_args) {
        info->add_args(arg);
    }
    return write_to_worker(handler);
}

bool Supervisor::send(const google::protobuf::Message &command) {
    if (!is_running()) {
        error_ = "Worker not running";
        LOG_WARN("[" << config_.id << "] Cannot send " << command.GetTypeName() << ": " << error_);
        return false;
    }
    return write_to_worker(channel::make_command(command));
}

bool Supervisor::write_to_worker(const channel::ToWorker &msg) {
    std::string error;
    auto status = channel::write_envelope(writer_, msg, error);
    switch (status) {
        case channel::FrameStatus::OK:
            return true;
        case channel::FrameStatus::IO_ERROR:
            // Recovery is driven by the reader thread noticing the dead worker
            LOG_WARN("[" << config_.id << "] Failed to send " << channel::kind_name(msg) << ": " << error);
            return true;
        default:
            // Nothing was written; the channel is still usable
            error_ = std::string("Cannot send ") + channel::kind_name(msg) + ": " + error;
            LOG_ERROR("[" << config_.id << "] " << error_);
            return false;
    }
}

void Supervisor::shutdown() { shutdown(std::chrono::milliseconds(config_.shutdown_timeout_ms)); }

void Supervisor::shutdown(std::chrono::milliseconds timeout) {
    if (!is_running()) {
        return;
    }

    LOG_INFO("[" << config_.id << "] Shutting down worker (PID=" << worker_pid() << ")");
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    trap_call(config_.id, "on_stop", [this] { responder_.on_stop(); });

    // Politely ask the worker to stop; it answers with its own stop sentinel
    // A stop sentinel always frames; an I/O failure was logged and the reader will notice
    write_to_worker(channel::make_stop_to_worker());

    bool acknowledged = reader_->wait_finished(timeout);
    if (acknowledged) {
        LOG_DEBUG("[" << config_.id << "] Worker acknowledged stop ("
                      << quit_reason_to_string(reader_->quit_reason()) << ")");
    }

    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    release_worker(static_cast<int>(std::max<int64_t>(remaining, 0)));

    // The reader's finished notification may still be queued; it is stale now
    ++generation_;
    state_ = SupervisorState::STOPPED;
    LOG_INFO("[" << config_.id << "] Worker stopped");
}

void Supervisor::on_reader_finished(uint64_t generation) {
    // Queued while shutdown() was running, or from a replaced worker
    if (!is_running() || generation != generation_ || !reader_) {
        return;
    }

    QuitReason reason = reader_->quit_reason();
    if (reason == QuitReason::NORMAL) {
        LOG_INFO("[" << config_.id << "] Worker exited cleanly");
        release_worker(config_.shutdown_timeout_ms);
        state_ = SupervisorState::STOPPED;
        return;
    }

    restart(reason);
}

void Supervisor::restart(QuitReason reason) {
    LOG_WARN("[" << config_.id << "] Restarting failed worker (reason: " << quit_reason_to_string(reason) << ")");
    state_ = SupervisorState::RESTARTING;

    // The old worker may still be alive with a wedged channel
    process_->close_stdin();
    release_worker(kRestartReapGraceMs);

    ++restart_count_;
    if (!start_worker()) {
        LOG_ERROR("[" << config_.id << "] Restart failed: " << error_);
        return;
    }

    trap_call(config_.id, "on_start", [this] { responder_.on_start(); });
    trap_call(config_.id, "on_restart", [this] { responder_.on_restart(); });
}

void Supervisor::release_worker(int grace_ms) {
    if (!process_) {
        reader_.reset();
        return;
    }

    process_->close_stdin();
    writer_.set_fd(-1);

    if (!process_->wait_for_exit(grace_ms)) {
        LOG_WARN("[" << config_.id << "] Worker did not exit within " << grace_ms << "ms, terminating");
        process_->force_terminate();
        process_->wait_for_exit(500);
    } else {
        LOG_DEBUG("[" << config_.id << "] Worker exited (" << process_->describe_exit() << ")");
    }

    // With the process gone the reader sees EOF and finishes
    if (reader_) {
        reader_->join();
        reader_.reset();
    }
    process_->close_stdout();
    process_.reset();
}

}  // namespace supervisor
}  // namespace minder
