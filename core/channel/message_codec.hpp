#pragma once

#include <google/protobuf/message.h>

#include <string>

#include "framed_stream.hpp"
#include "protocol.pb.h"

namespace minder {
namespace channel {

using ToWorker = minder::protocol::v1::ToWorker;
using FromWorker = minder::protocol::v1::FromWorker;

// Serialize an envelope and write it as one frame
FrameStatus write_envelope(FrameWriter &writer, const google::protobuf::Message &envelope, std::string &error);

// Read one frame and parse it into envelope. Returns PARSE_ERROR if the
// payload is not a valid envelope.
FrameStatus read_envelope(FrameReader &reader, google::protobuf::Message &envelope, std::string &error);

// Stop sentinel: "no further messages in this direction"
ToWorker make_stop_to_worker();
FromWorker make_stop_from_worker();
inline bool is_stop(const ToWorker &msg) { return msg.kind_case() == ToWorker::kStop; }
inline bool is_stop(const FromWorker &msg) { return msg.kind_case() == FromWorker::kStop; }

// Wrap an application message
ToWorker make_command(const google::protobuf::Message &command);
FromWorker make_response(const google::protobuf::Message &response);
FromWorker make_worker_error(const std::string &report, bool recoverable);

// Short name of the envelope's kind for logs
const char *kind_name(const ToWorker &msg);
const char *kind_name(const FromWorker &msg);

}  // namespace channel
}  // namespace minder
