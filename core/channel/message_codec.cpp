#include "message_codec.hpp"

#include <vector>

namespace minder {
namespace channel {

FrameStatus write_envelope(FrameWriter &writer, const google::protobuf::Message &envelope, std::string &error) {
    std::string serialized;
    if (!envelope.SerializeToString(&serialized)) {
        error = "Failed to serialize " + envelope.GetTypeName();
        return FrameStatus::PARSE_ERROR;
    }

    FrameStatus status = writer.write_frame(serialized);
    if (status != FrameStatus::OK) {
        error = writer.last_error();
    }
    return status;
}

FrameStatus read_envelope(FrameReader &reader, google::protobuf::Message &envelope, std::string &error) {
    std::vector<uint8_t> frame;
    FrameStatus status = reader.read_frame(frame);
    if (status != FrameStatus::OK) {
        error = reader.last_error();
        return status;
    }

    envelope.Clear();
    if (!envelope.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
        error = "Failed to parse " + envelope.GetTypeName() + " (" + std::to_string(frame.size()) + " bytes)";
        return FrameStatus::PARSE_ERROR;
    }
    return FrameStatus::OK;
}

ToWorker make_stop_to_worker() {
    ToWorker msg;
    msg.mutable_stop();
    return msg;
}

FromWorker make_stop_from_worker() {
    FromWorker msg;
    msg.mutable_stop();
    return msg;
}

ToWorker make_command(const google::protobuf::Message &command) {
    ToWorker msg;
    msg.mutable_command()->PackFrom(command);
    return msg;
}

FromWorker make_response(const google::protobuf::Message &response) {
    FromWorker msg;
    msg.mutable_response()->PackFrom(response);
    return msg;
}

FromWorker make_worker_error(const std::string &report, bool recoverable) {
    FromWorker msg;
    auto *err = msg.mutable_worker_error();
    err->set_report(report);
    err->set_recoverable(recoverable);
    return msg;
}

const char *kind_name(const ToWorker &msg) {
    switch (msg.kind_case()) {
        case ToWorker::kStartupInfo:
            return "StartupInfo";
        case ToWorker::kHandlerInfo:
            return "HandlerInfo";
        case ToWorker::kCommand:
            return "Command";
        case ToWorker::kStop:
            return "Stop";
        default:
            return "<unset>";
    }
}

const char *kind_name(const FromWorker &msg) {
    switch (msg.kind_case()) {
        case FromWorker::kResponse:
            return "Response";
        case FromWorker::kWorkerError:
            return "WorkerError";
        case FromWorker::kStop:
            return "Stop";
        default:
            return "<unset>";
    }
}

}  // namespace channel
}  // namespace minder
