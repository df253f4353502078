#include "echo_handler.hpp"

#include <unistd.h>

#include "logging/logger.hpp"

namespace minder {
namespace handlers {

EchoHandler::EchoHandler(const worker::HandlerContext &context) {
    if (!context.args.empty()) {
        prefix_ = context.args.front();
    }
    auto it = context.config.find("greeting");
    if (it != context.config.end()) {
        greeting_ = it->second;
    }

    table().on<minder::echo::v1::EchoRequest>(
        [this](const minder::echo::v1::EchoRequest &request) { handle_echo(request); });
}

void EchoHandler::on_start() { LOG_DEBUG("[Echo] Started (prefix='" << prefix_ << "')"); }

void EchoHandler::on_stop() { LOG_DEBUG("[Echo] Stopping after " << handled_count_ << " request(s)"); }

void EchoHandler::handle_echo(const minder::echo::v1::EchoRequest &request) {
    minder::echo::v1::EchoReply reply;
    reply.set_sequence(request.sequence());
    reply.set_text(prefix_ + request.text());
    reply.set_greeting(greeting_);
    reply.set_worker_pid(static_cast<int64_t>(getpid()));
    ++handled_count_;
    send(reply);
}

bool register_builtin_handlers(worker::HandlerRegistry &registry) {
    return registry.register_handler(kEchoHandlerName, [](const worker::HandlerContext &context) {
        return std::make_unique<EchoHandler>(context);
    });
}

}  // namespace handlers
}  // namespace minder
