#include "worker_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>

#include "logging/logger.hpp"

namespace minder {
namespace supervisor {

namespace {
constexpr int kReapAfterKillMs = 500;
}  // namespace

WorkerProcess::WorkerProcess(const std::string &worker_id, const std::string &executable_path,
                             const std::vector<std::string> &args)
    : worker_id_(worker_id),
      executable_path_(executable_path),
      args_(args),
      pid_(-1),
      stdin_write_fd_(-1),
      stdout_read_fd_(-1) {}

WorkerProcess::~WorkerProcess() {
    if (is_running()) {
        LOG_WARN("[" << worker_id_ << "] Process still running at destruction, killing PID=" << pid_);
        force_terminate();
        wait_for_exit(kReapAfterKillMs);
    }
    close_stdin();
    close_stdout();
}

bool WorkerProcess::spawn() {
    LOG_INFO("[" << worker_id_ << "] Spawning: " << executable_path_);

    std::error_code ec;
    if (executable_path_.empty() || !std::filesystem::exists(executable_path_, ec)) {
        error_ = "Executable not found: " + executable_path_;
        LOG_ERROR("[" << worker_id_ << "] " << error_);
        return false;
    }
    if (access(executable_path_.c_str(), X_OK) != 0) {
        error_ = "Executable not runnable: " + executable_path_ + " (" + strerror(errno) + ")";
        LOG_ERROR("[" << worker_id_ << "] " << error_);
        return false;
    }

    // Parent ends are close-on-exec so later workers don't inherit them
    int stdin_pipe[2];
    int stdout_pipe[2];

    if (pipe2(stdin_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdin pipe: " + std::string(strerror(errno));
        return false;
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create stdout pipe: " + std::string(strerror(errno));
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        return false;
    }

    // Build argv before fork: nothing in the child may allocate
    std::string abs_path = std::filesystem::absolute(executable_path_).string();
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(abs_path.c_str()));
    for (const auto &arg : args_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Child process. dup2 clears close-on-exec on the targets.
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);

        // stderr stays connected to parent's stderr

        // Own process group: terminal signals (Ctrl-C, Ctrl-Z) go to the
        // supervisor only, which then shuts the worker down over the pipe
        setpgid(0, 0);

        // Ignored signals survive exec; the worker decides for itself
        signal(SIGPIPE, SIG_DFL);

        execv(abs_path.c_str(), argv.data());

        // If we get here, exec failed. Only async-signal-safe calls from here.
        static const char kMsg[] = "minder: exec of worker failed\n";
        ssize_t ignored = write(STDERR_FILENO, kMsg, sizeof(kMsg) - 1);
        (void)ignored;
        _exit(127);
    }

    // Parent process. Set the group here too so it holds before exec;
    // EACCES means the child got there first and already exec'd.
    if (setpgid(pid, pid) < 0 && errno != EACCES) {
        LOG_WARN("[" << worker_id_ << "] setpgid failed: " << strerror(errno));
    }
    close(stdin_pipe[0]);   // Close read end of stdin pipe
    close(stdout_pipe[1]);  // Close write end of stdout pipe

    pid_ = pid;
    stdin_write_fd_ = stdin_pipe[1];
    stdout_read_fd_ = stdout_pipe[0];
    exit_status_.reset();
    error_.clear();

    LOG_INFO("[" << worker_id_ << "] Process spawned successfully (PID=" << pid_ << ")");
    return true;
}

bool WorkerProcess::try_reap() {
    if (pid_ <= 0) {
        return true;
    }

    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            exit_status_ = status;
            LOG_DEBUG("[" << worker_id_ << "] Reaped PID=" << pid_ << " (" << describe_exit() << ")");
            pid_ = -1;
            return true;
        }
        if (result == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // ECHILD: someone else reaped it
        pid_ = -1;
        return true;
    }
}

bool WorkerProcess::is_running() { return !try_reap(); }

bool WorkerProcess::wait_for_exit(int timeout_ms) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        if (try_reap()) {
            return true;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void WorkerProcess::force_terminate() {
    if (pid_ > 0) {
        LOG_WARN("[" << worker_id_ << "] Killing PID=" << pid_);
        kill(pid_, SIGKILL);
    }
}

void WorkerProcess::close_stdin() {
    if (stdin_write_fd_ >= 0) {
        close(stdin_write_fd_);
        stdin_write_fd_ = -1;
    }
}

void WorkerProcess::close_stdout() {
    if (stdout_read_fd_ >= 0) {
        close(stdout_read_fd_);
        stdout_read_fd_ = -1;
    }
}

std::string WorkerProcess::describe_exit() const {
    if (!exit_status_) {
        return "not exited";
    }
    int status = *exit_status_;
    if (WIFEXITED(status)) {
        return "exit code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "signal " + std::to_string(WTERMSIG(status));
    }
    return "status " + std::to_string(status);
}

}  // namespace supervisor
}  // namespace minder
