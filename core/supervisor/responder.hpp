#pragma once

#include <google/protobuf/any.pb.h>

#include <string>

#include "channel/message_codec.hpp"
#include "messages/message_table.hpp"
#include "protocol.pb.h"

namespace minder {
namespace supervisor {

// Responder is the application object on the supervising side. Every method
// runs on the control loop thread.
//
// Responses are dispatched by kind through table(); subclasses fill the table
// in their constructor.
class Responder {
public:
    virtual ~Responder() = default;

    // Lifecycle notifications
    virtual void on_start() {}     // After the startup handshake was sent
    virtual void on_stop() {}      // Before shutdown() asks the worker to stop
    virtual void on_restart() {}   // After a crashed worker was replaced

    // Entry point for every inbound message
    virtual void dispatch(const channel::FromWorker &msg);

    // Default: recoverable errors are logged, others are logged and passed to
    // on_worker_failure()
    virtual void handle_worker_error(const minder::protocol::v1::WorkerError &error);

    // A non-recoverable worker error the operator should hear about
    virtual void on_worker_failure(const std::string &report) { (void)report; }

    // A response whose kind has no table entry
    virtual void on_unhandled(const google::protobuf::Any &response);

protected:
    messages::MessageTable &table() { return table_; }

private:
    messages::MessageTable table_;
};

}  // namespace supervisor
}  // namespace minder
