#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace minder {
namespace channel {

// Maximum frame size: 1 MiB
constexpr uint32_t kMaxFrameSize = 1024u * 1024u;

// Size of the length prefix in front of every frame
constexpr size_t kFrameHeaderSize = 4;

enum class FrameStatus {
    OK,
    END_OF_STREAM,  // Fewer bytes than the header or payload declared
    IO_ERROR,       // read()/write() failed (EPIPE, EBADF, ...)
    TOO_LARGE,      // Declared or requested length exceeds kMaxFrameSize
    PARSE_ERROR     // Payload did not deserialize
};

const char *frame_status_to_string(FrameStatus status);

// Encode/decode the 4-byte big-endian length prefix
void encode_frame_header(uint32_t len, uint8_t out[kFrameHeaderSize]);
uint32_t decode_frame_header(const uint8_t in[kFrameHeaderSize]);

// FrameWriter writes length-prefixed frames to a pipe.
// Frames are: uint32_be (length) + payload bytes. Every frame is written in
// full before write_frame returns; there is exactly one writer per pipe.
// The descriptor is borrowed, not owned.
class FrameWriter {
public:
    explicit FrameWriter(int fd = -1) : fd_(fd) {}

    void set_fd(int fd) { fd_ = fd; }
    int fd() const { return fd_; }

    FrameStatus write_frame(const uint8_t *data, size_t len);
    FrameStatus write_frame(const std::string &payload) {
        return write_frame(reinterpret_cast<const uint8_t *>(payload.data()), payload.size());
    }

    const std::string &last_error() const { return error_; }

private:
    int fd_;
    std::string error_;

    // Low-level write exactly n bytes (handles partial writes, EINTR, etc.)
    FrameStatus write_exact(const uint8_t *buf, size_t n);
};

// FrameReader reads length-prefixed frames from a pipe. A short read is never
// resumed: it always ends the stream. The descriptor is borrowed, not owned.
class FrameReader {
public:
    explicit FrameReader(int fd = -1) : fd_(fd) {}

    void set_fd(int fd) { fd_ = fd; }
    int fd() const { return fd_; }

    // Blocks until a whole frame arrived, the stream ended or an error occurred
    FrameStatus read_frame(std::vector<uint8_t> &out);

    const std::string &last_error() const { return error_; }

private:
    int fd_;
    std::string error_;

    // Low-level read exactly n bytes
    FrameStatus read_exact(uint8_t *buf, size_t n);
};

}  // namespace channel
}  // namespace minder
