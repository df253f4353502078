#pragma once

#include <string>

#include "echo.pb.h"
#include "worker/handler_registry.hpp"
#include "worker/worker_handler.hpp"

namespace minder {
namespace handlers {

// EchoHandler answers every EchoRequest with an EchoReply carrying the same
// sequence number and text. Arguments: optional prefix prepended to the text.
class EchoHandler : public worker::WorkerHandler {
public:
    explicit EchoHandler(const worker::HandlerContext &context);

    void on_start() override;
    void on_stop() override;

    size_t handled_count() const { return handled_count_; }

private:
    std::string prefix_;
    std::string greeting_;
    size_t handled_count_ = 0;

    void handle_echo(const minder::echo::v1::EchoRequest &request);
};

constexpr const char *kEchoHandlerName = "echo";

// Register the handlers shipped with minder-worker.
// Returns false if a name was already taken in registry.
bool register_builtin_handlers(worker::HandlerRegistry &registry);

}  // namespace handlers
}  // namespace minder
