#pragma once

#include <sys/types.h>

#include <optional>
#include <string>
#include <vector>

namespace minder {
namespace supervisor {

// WorkerProcess owns one spawned worker process and its two pipes.
// Responsibilities:
// - Spawn process with stdin/stdout redirected to pipes (stderr inherited)
// - Report whether it is still running, reap it
// - Forced termination
// All methods are called from the supervisor's control thread only.
class WorkerProcess {
public:
    WorkerProcess(const std::string &worker_id, const std::string &executable_path,
                  const std::vector<std::string> &args = {});
    ~WorkerProcess();

    // Delete copy/move
    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;

    // Spawn the worker process
    // Returns true on success, false on failure (sets error_)
    bool spawn();

    // Check if the process is still running (reaps it if it has exited)
    bool is_running();

    // Wait up to timeout_ms for the process to exit. Returns true once reaped.
    bool wait_for_exit(int timeout_ms);

    // SIGKILL the process
    void force_terminate();

    // Close our end of the worker's stdin (the worker sees EOF)
    void close_stdin();

    // Close our end of the worker's stdout
    void close_stdout();

    // Pipe ends owned by this object (-1 once closed)
    int stdin_fd() const { return stdin_write_fd_; }
    int stdout_fd() const { return stdout_read_fd_; }

    pid_t pid() const { return pid_; }
    const std::string &worker_id() const { return worker_id_; }

    // Raw waitpid() status once the process has been reaped
    std::optional<int> exit_status() const { return exit_status_; }

    // Human readable description of exit_status(), e.g. "exit code 0" or "signal 9"
    std::string describe_exit() const;

    const std::string &last_error() const { return error_; }

private:
    std::string worker_id_;
    std::string executable_path_;
    std::vector<std::string> args_;
    std::string error_;

    pid_t pid_;
    int stdin_write_fd_;
    int stdout_read_fd_;
    std::optional<int> exit_status_;

    // waitpid(WNOHANG); true if the process has been reaped
    bool try_reap();
};

}  // namespace supervisor
}  // namespace minder
