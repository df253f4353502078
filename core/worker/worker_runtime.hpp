#pragma once

#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "blocking_queue.hpp"
#include "channel/framed_stream.hpp"
#include "channel/message_codec.hpp"
#include "handler_registry.hpp"
#include "worker_handler.hpp"

namespace minder {
namespace worker {

enum class HandshakeStatus {
    OK,
    END_OF_STREAM,        // Input closed before both bootstrap messages arrived
    READ_ERROR,           // I/O failure or oversized frame
    PROTOCOL_VIOLATION,   // Frame was not the expected bootstrap message
    UNKNOWN_HANDLER,      // HandlerInfo named a handler the registry lacks
    CONSTRUCTION_FAILED   // Handler factory threw or returned nothing
};

const char *handshake_status_to_string(HandshakeStatus status);

struct HandshakeResult {
    HandshakeStatus status = HandshakeStatus::OK;
    std::string message;
    std::string handler_name;
    HandlerContext context;
    std::unique_ptr<WorkerHandler> handler;

    bool ok() const { return status == HandshakeStatus::OK; }
};

// Read StartupInfo then HandlerInfo from input, apply the startup config to
// process-local state and construct the named handler.
HandshakeResult perform_handshake(channel::FrameReader &input, const HandlerRegistry &registry);

// Apply a StartupInfo config map to process-local state (log level, log tag)
void apply_startup_config(const std::map<std::string, std::string> &config);

// WorkerRuntime turns a process into a message-handling loop over a pair of
// pipes. Threads:
// - reader thread: reads frames from input_fd and queues the commands
// - calling thread: dispatches queued commands to the handler one at a time
class WorkerRuntime {
public:
    WorkerRuntime(const HandlerRegistry &registry, int input_fd, int output_fd);
    ~WorkerRuntime();

    WorkerRuntime(const WorkerRuntime &) = delete;
    WorkerRuntime &operator=(const WorkerRuntime &) = delete;

    // Handshake, then run the main loop until the supervisor sends the stop
    // sentinel or closes the input. Always ends by writing the stop sentinel.
    // Returns 0 after a clean session, 1 if the handshake failed.
    int run();

    // Messages dispatched by the last run (including failed ones)
    size_t dispatched_count() const { return dispatched_count_; }

private:
    // std::nullopt is the queue-local stop marker
    using QueueItem = std::optional<google::protobuf::Any>;

    const HandlerRegistry &registry_;
    channel::FrameReader input_;
    PipeResponseSink sink_;
    BlockingQueue<QueueItem> queue_;
    std::thread reader_thread_;
    size_t dispatched_count_ = 0;

    void reader_loop();
    void main_loop(WorkerHandler &handler);
    void report_error(const std::string &report, bool recoverable);
    void send_stop();
};

// Entry point for worker executables: moves the protocol off fd 1 so stray
// output from application code cannot corrupt it, ignores SIGPIPE and runs a
// WorkerRuntime on stdin/stdout. Returns the process exit code.
int run_worker(const HandlerRegistry &registry);

}  // namespace worker
}  // namespace minder
