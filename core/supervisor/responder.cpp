#include "responder.hpp"

#include "logging/logger.hpp"

namespace minder {
namespace supervisor {

void Responder::dispatch(const channel::FromWorker &msg) {
    switch (msg.kind_case()) {
        case channel::FromWorker::kResponse:
            if (!table_.dispatch(msg.response())) {
                on_unhandled(msg.response());
            }
            break;
        case channel::FromWorker::kWorkerError:
            handle_worker_error(msg.worker_error());
            break;
        default:
            LOG_WARN("[Responder] Ignoring " << channel::kind_name(msg) << " message");
            break;
    }
}

void Responder::handle_worker_error(const minder::protocol::v1::WorkerError &error) {
    if (error.recoverable()) {
        LOG_WARN("[Responder] Error in worker:\n" << error.report());
        return;
    }
    LOG_ERROR("[Responder] Fatal error in worker:\n" << error.report());
    on_worker_failure(error.report());
}

void Responder::on_unhandled(const google::protobuf::Any &response) {
    LOG_WARN("[Responder] No handler for response kind '" << messages::kind_of(response) << "'");
}

}  // namespace supervisor
}  // namespace minder
