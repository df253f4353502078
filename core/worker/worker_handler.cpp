#include "worker_handler.hpp"

#include <stdexcept>

#include "logging/logger.hpp"

namespace minder {
namespace worker {

bool PipeResponseSink::send(const channel::FromWorker &msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string error;
    auto status = channel::write_envelope(writer_, msg, error);
    if (status != channel::FrameStatus::OK) {
        LOG_WARN("[Worker] Failed to send " << channel::kind_name(msg) << ": " << error);
        return false;
    }
    return true;
}

void WorkerHandler::handle(const google::protobuf::Any &msg) {
    if (!table_.dispatch(msg)) {
        throw std::runtime_error("No handler for message kind '" + messages::kind_of(msg) + "'");
    }
}

bool WorkerHandler::send(const google::protobuf::Message &response) {
    if (sink_ == nullptr) {
        LOG_WARN("[Worker] No response sink attached, dropping " << response.GetTypeName());
        return false;
    }
    return sink_->send(channel::make_response(response));
}

}  // namespace worker
}  // namespace minder
