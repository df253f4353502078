#pragma once

#include <google/protobuf/any.pb.h>
#include <google/protobuf/message.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "channel/framed_stream.hpp"
#include "channel/message_codec.hpp"
#include "messages/message_table.hpp"

namespace minder {
namespace worker {

// Outbound message sink of the worker: every message sent is written to the
// supervisor immediately.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    // Returns false if the message could not be written
    virtual bool send(const channel::FromWorker &msg) = 0;
};

// ResponseSink bound to the worker's output pipe
class PipeResponseSink : public ResponseSink {
public:
    explicit PipeResponseSink(int output_fd) : writer_(output_fd) {}

    bool send(const channel::FromWorker &msg) override;

private:
    std::mutex mutex_;
    channel::FrameWriter writer_;
};

// What a handler factory gets to build its handler from
struct HandlerContext {
    std::map<std::string, std::string> config;  // StartupInfo config map
    std::vector<std::string> args;              // HandlerInfo arguments
};

// WorkerHandler is the application object running inside the worker process.
//
// Subclasses register one callback per command kind in their constructor:
//
//     EchoHandler(...) {
//         table().on<EchoRequest>([this](const EchoRequest &req) { ... });
//     }
//
// All callbacks run on the worker's dispatch thread, one message at a time.
// A callback may throw; the worker runtime reports that as a recoverable
// WorkerError and continues with the next message.
class WorkerHandler {
public:
    virtual ~WorkerHandler() = default;

    // Called once before the first message is dispatched
    virtual void on_start() {}

    // Called once after the last message was dispatched
    virtual void on_stop() {}

    // Dispatch a command by kind. Throws std::runtime_error for unknown kinds.
    virtual void handle(const google::protobuf::Any &msg);

    // Installed by the worker runtime after construction
    void attach(ResponseSink *sink) { sink_ = sink; }

protected:
    // Send a response message to the supervisor
    bool send(const google::protobuf::Message &response);

    messages::MessageTable &table() { return table_; }

private:
    messages::MessageTable table_;
    ResponseSink *sink_ = nullptr;
};

}  // namespace worker
}  // namespace minder
