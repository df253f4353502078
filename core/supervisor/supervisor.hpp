#pragma once

#include <google/protobuf/message.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "channel/framed_stream.hpp"
#include "channel/message_codec.hpp"
#include "event_loop.hpp"
#include "reader_thread.hpp"
#include "responder.hpp"
#include "supervisor_config.hpp"
#include "worker_process.hpp"

namespace minder {
namespace supervisor {

enum class SupervisorState { STOPPED, RUNNING, RESTARTING };

const char *supervisor_state_to_string(SupervisorState state);

// Supervisor owns the lifecycle of one worker process: spawning, the startup
// handshake, forwarding commands, telling a clean exit from a crash and
// restarting after a crash.
//
// Threading: every public method must be called on the control loop thread.
// Inbound messages and lifecycle callbacks reach the Responder on that thread
// too; the per-worker reader thread only posts to the loop.
//
// Restarts are unconditional: every abnormal exit is followed by a respawn.
class Supervisor {
public:
    Supervisor(SupervisorConfig config, Responder &responder, ControlLoop &loop);
    ~Supervisor();

    Supervisor(const Supervisor &) = delete;
    Supervisor &operator=(const Supervisor &) = delete;

    // Spawn the worker and send StartupInfo + HandlerInfo.
    // No-op (returns true) if already running. Returns false if the worker
    // could not be spawned (sets last_error).
    bool start();

    // Send a command to the worker.
    // Returns false (sets last_error) if the worker is not running or the
    // command cannot be framed (e.g. larger than kMaxFrameSize). A broken pipe
    // is logged and otherwise ignored: the reader thread will see the worker
    // go away and trigger the restart.
    bool send(const google::protobuf::Message &command);

    // Ask the worker to stop, wait up to the configured timeout for it to
    // acknowledge, then kill it if it is still around. No-op if not running.
    void shutdown();
    void shutdown(std::chrono::milliseconds timeout);

    bool is_running() const { return state_ != SupervisorState::STOPPED; }
    SupervisorState state() const { return state_; }

    // Number of crash restarts since construction
    int restart_count() const { return restart_count_; }

    // PID of the current worker, -1 when stopped
    pid_t worker_pid() const { return process_ ? process_->pid() : -1; }

    const SupervisorConfig &config() const { return config_; }
    const std::string &last_error() const { return error_; }

private:
    SupervisorConfig config_;
    Responder &responder_;
    ControlLoop &loop_;

    SupervisorState state_ = SupervisorState::STOPPED;
    std::unique_ptr<WorkerProcess> process_;
    std::unique_ptr<ReaderThread> reader_;
    channel::FrameWriter writer_;
    uint64_t generation_ = 0;  // Bumped for every spawned worker
    int restart_count_ = 0;
    std::string error_;

    // Callbacks posted to the loop hold a weak reference to this token and
    // turn into no-ops once the supervisor is gone.
    std::shared_ptr<int> alive_token_;

    bool start_worker();
    bool send_startup_info();
    // False (sets last_error) if msg could not be framed; I/O failures are
    // only logged
    bool write_to_worker(const channel::ToWorker &msg);
    void on_reader_finished(uint64_t generation);
    void restart(QuitReason reason);
    void release_worker(int grace_ms);
};

}  // namespace supervisor
}  // namespace minder
