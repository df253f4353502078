#include "worker_runtime.hpp"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "logging/logger.hpp"
#include "messages/error_report.hpp"

namespace minder {
namespace worker {

const char *handshake_status_to_string(HandshakeStatus status) {
    switch (status) {
        case HandshakeStatus::OK:
            return "OK";
        case HandshakeStatus::END_OF_STREAM:
            return "END_OF_STREAM";
        case HandshakeStatus::READ_ERROR:
            return "READ_ERROR";
        case HandshakeStatus::PROTOCOL_VIOLATION:
            return "PROTOCOL_VIOLATION";
        case HandshakeStatus::UNKNOWN_HANDLER:
            return "UNKNOWN_HANDLER";
        case HandshakeStatus::CONSTRUCTION_FAILED:
            return "CONSTRUCTION_FAILED";
        default:
            return "UNKNOWN";
    }
}

namespace {

// Read one bootstrap envelope; maps codec failures onto handshake statuses
HandshakeStatus read_bootstrap(channel::FrameReader &input, channel::ToWorker &msg, std::string &error) {
    auto status = channel::read_envelope(input, msg, error);
    switch (status) {
        case channel::FrameStatus::OK:
            return HandshakeStatus::OK;
        case channel::FrameStatus::END_OF_STREAM:
            return HandshakeStatus::END_OF_STREAM;
        case channel::FrameStatus::PARSE_ERROR:
            return HandshakeStatus::PROTOCOL_VIOLATION;
        default:
            return HandshakeStatus::READ_ERROR;
    }
}

}  // namespace

void apply_startup_config(const std::map<std::string, std::string> &config) {
    auto level_it = config.find("log_level");
    if (level_it != config.end() && logging::is_valid_level(level_it->second)) {
        logging::Logger::set_level(logging::string_to_level(level_it->second));
    }

    auto name_it = config.find("process_name");
    if (name_it != config.end() && !name_it->second.empty()) {
        logging::Logger::set_tag("worker:" + name_it->second);
    }
}

HandshakeResult perform_handshake(channel::FrameReader &input, const HandlerRegistry &registry) {
    HandshakeResult result;
    channel::ToWorker msg;

    // 1. StartupInfo
    result.status = read_bootstrap(input, msg, result.message);
    if (result.status != HandshakeStatus::OK) {
        result.message = "Reading StartupInfo: " + result.message;
        return result;
    }
    if (msg.kind_case() != channel::ToWorker::kStartupInfo) {
        result.status = HandshakeStatus::PROTOCOL_VIOLATION;
        result.message = std::string("First message must be StartupInfo, got ") + channel::kind_name(msg);
        return result;
    }
    for (const auto &[key, value] : msg.startup_info().config()) {
        result.context.config[key] = value;
    }
    apply_startup_config(result.context.config);

    // 2. HandlerInfo
    result.status = read_bootstrap(input, msg, result.message);
    if (result.status != HandshakeStatus::OK) {
        result.message = "Reading HandlerInfo: " + result.message;
        return result;
    }
    if (msg.kind_case() != channel::ToWorker::kHandlerInfo) {
        result.status = HandshakeStatus::PROTOCOL_VIOLATION;
        result.message = std::string("Second message must be HandlerInfo, got ") + channel::kind_name(msg);
        return result;
    }
    result.handler_name = msg.handler_info().handler_name();
    result.context.args.assign(msg.handler_info().args().begin(), msg.handler_info().args().end());

    if (!registry.contains(result.handler_name)) {
        result.status = HandshakeStatus::UNKNOWN_HANDLER;
        result.message = "Unknown handler '" + result.handler_name + "'";
        return result;
    }

    result.handler = registry.create(result.handler_name, result.context, result.message);
    if (!result.handler) {
        result.status = HandshakeStatus::CONSTRUCTION_FAILED;
        return result;
    }

    return result;
}

WorkerRuntime::WorkerRuntime(const HandlerRegistry &registry, int input_fd, int output_fd)
    : registry_(registry), input_(input_fd), sink_(output_fd) {}

WorkerRuntime::~WorkerRuntime() {
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
}

int WorkerRuntime::run() {
    dispatched_count_ = 0;

    auto handshake = perform_handshake(input_, registry_);
    if (!handshake.ok()) {
        LOG_ERROR("[Worker] Startup failed (" << handshake_status_to_string(handshake.status)
                                              << "): " << handshake.message);
        report_error(messages::format_error_report("worker startup", handshake.message), false);
        send_stop();
        return 1;
    }

    LOG_INFO("[Worker] Handler '" << handshake.handler_name << "' ready (pid=" << getpid() << ")");

    handshake.handler->attach(&sink_);

    reader_thread_ = std::thread(&WorkerRuntime::reader_loop, this);
    main_loop(*handshake.handler);
    reader_thread_.join();

    handshake.handler->attach(nullptr);
    send_stop();
    LOG_INFO("[Worker] Shut down after " << dispatched_count_ << " message(s)");
    return 0;
}

void WorkerRuntime::reader_loop() {
    channel::ToWorker msg;
    std::string error;

    while (true) {
        auto status = channel::read_envelope(input_, msg, error);
        if (status != channel::FrameStatus::OK) {
            // Nothing to report to: the supervisor side of the pipe is gone or
            // unreadable. Stopping the loop is all we can do.
            if (status != channel::FrameStatus::END_OF_STREAM) {
                LOG_WARN("[Worker] Input read failed (" << channel::frame_status_to_string(status) << "): " << error);
            }
            break;
        }

        if (channel::is_stop(msg)) {
            LOG_DEBUG("[Worker] Stop requested by supervisor");
            break;
        }

        if (msg.kind_case() != channel::ToWorker::kCommand) {
            LOG_WARN("[Worker] Ignoring unexpected " << channel::kind_name(msg) << " after startup");
            continue;
        }

        queue_.push(QueueItem(std::move(*msg.mutable_command())));
    }

    queue_.push(std::nullopt);
}

void WorkerRuntime::main_loop(WorkerHandler &handler) {
    try {
        handler.on_start();
    } catch (const std::exception &e) {
        report_error(messages::format_error_report("on_start", e), false);
    } catch (...) {
        report_error(messages::format_error_report("on_start", std::string("unknown exception")), false);
    }

    while (true) {
        QueueItem item = queue_.pop();
        if (!item) {
            break;
        }

        ++dispatched_count_;
        const std::string kind = messages::kind_of(*item);
        try {
            handler.handle(*item);
        } catch (const std::exception &e) {
            LOG_WARN("[Worker] Handler failed on " << kind << ": " << e.what());
            report_error(messages::format_error_report("handling " + kind, e), true);
        } catch (...) {
            LOG_WARN("[Worker] Handler failed on " << kind << " with a non-standard exception");
            report_error(messages::format_error_report("handling " + kind, std::string("unknown exception")), true);
        }
    }

    try {
        handler.on_stop();
    } catch (const std::exception &e) {
        report_error(messages::format_error_report("on_stop", e), true);
    } catch (...) {
        report_error(messages::format_error_report("on_stop", std::string("unknown exception")), true);
    }
}

void WorkerRuntime::report_error(const std::string &report, bool recoverable) {
    sink_.send(channel::make_worker_error(report, recoverable));
}

void WorkerRuntime::send_stop() { sink_.send(channel::make_stop_from_worker()); }

int run_worker(const HandlerRegistry &registry) {
    // A supervisor that went away must show up as EPIPE, not kill us
    signal(SIGPIPE, SIG_IGN);
    // Ctrl-C is for the supervisor; the worker stops when told to over the pipe
    signal(SIGINT, SIG_IGN);

    int protocol_fd = fcntl(STDOUT_FILENO, F_DUPFD_CLOEXEC, 3);
    if (protocol_fd < 0) {
        LOG_ERROR("[Worker] Failed to duplicate stdout: " << strerror(errno));
        return 1;
    }
    if (dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
        LOG_ERROR("[Worker] Failed to redirect stdout: " << strerror(errno));
        close(protocol_fd);
        return 1;
    }

    int rc;
    {
        WorkerRuntime runtime(registry, STDIN_FILENO, protocol_fd);
        rc = runtime.run();
    }
    close(protocol_fd);
    return rc;
}

}  // namespace worker
}  // namespace minder
