#include "framed_stream.hpp"

#include <errno.h>
#include <unistd.h>

#include <cstring>

namespace minder {
namespace channel {

const char *frame_status_to_string(FrameStatus status) {
    switch (status) {
        case FrameStatus::OK:
            return "OK";
        case FrameStatus::END_OF_STREAM:
            return "END_OF_STREAM";
        case FrameStatus::IO_ERROR:
            return "IO_ERROR";
        case FrameStatus::TOO_LARGE:
            return "TOO_LARGE";
        case FrameStatus::PARSE_ERROR:
            return "PARSE_ERROR";
        default:
            return "UNKNOWN";
    }
}

void encode_frame_header(uint32_t len, uint8_t out[kFrameHeaderSize]) {
    out[0] = (len >> 24) & 0xFF;
    out[1] = (len >> 16) & 0xFF;
    out[2] = (len >> 8) & 0xFF;
    out[3] = (len >> 0) & 0xFF;
}

uint32_t decode_frame_header(const uint8_t in[kFrameHeaderSize]) {
    return (uint32_t(in[0]) << 24) | (uint32_t(in[1]) << 16) | (uint32_t(in[2]) << 8) | (uint32_t(in[3]) << 0);
}

FrameStatus FrameWriter::write_frame(const uint8_t *data, size_t len) {
    error_.clear();

    if (len > kMaxFrameSize) {
        error_ = "Frame too large: " + std::to_string(len) + " bytes";
        return FrameStatus::TOO_LARGE;
    }

    uint8_t len_buf[kFrameHeaderSize];
    encode_frame_header(static_cast<uint32_t>(len), len_buf);

    FrameStatus status = write_exact(len_buf, kFrameHeaderSize);
    if (status != FrameStatus::OK) {
        return status;
    }

    if (len > 0) {
        status = write_exact(data, len);
    }
    return status;
}

FrameStatus FrameWriter::write_exact(const uint8_t *buf, size_t n) {
    if (fd_ < 0) {
        error_ = "Write on closed pipe";
        return FrameStatus::IO_ERROR;
    }

    size_t total = 0;
    while (total < n) {
        ssize_t w = write(fd_, buf + total, n - total);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE) {
                error_ = "Broken pipe (peer terminated)";
            } else {
                error_ = "Write failed: " + std::string(strerror(errno));
            }
            return FrameStatus::IO_ERROR;
        }
        if (w == 0) {
            error_ = "Write returned 0 bytes";
            return FrameStatus::IO_ERROR;
        }
        total += static_cast<size_t>(w);
    }
    return FrameStatus::OK;
}

FrameStatus FrameReader::read_frame(std::vector<uint8_t> &out) {
    error_.clear();

    uint8_t len_buf[kFrameHeaderSize];
    FrameStatus status = read_exact(len_buf, kFrameHeaderSize);
    if (status != FrameStatus::OK) {
        if (status == FrameStatus::END_OF_STREAM && error_.empty()) {
            error_ = "EOF reading frame length";
        }
        return status;
    }

    uint32_t len = decode_frame_header(len_buf);
    if (len > kMaxFrameSize) {
        error_ = "Frame too large: " + std::to_string(len) + " bytes";
        return FrameStatus::TOO_LARGE;
    }

    out.resize(len);
    if (len > 0) {
        status = read_exact(out.data(), len);
        if (status == FrameStatus::END_OF_STREAM && error_.empty()) {
            error_ = "EOF reading frame payload";
        }
    }
    return status;
}

FrameStatus FrameReader::read_exact(uint8_t *buf, size_t n) {
    if (fd_ < 0) {
        error_ = "Read on closed pipe";
        return FrameStatus::IO_ERROR;
    }

    size_t total = 0;
    while (total < n) {
        ssize_t r = read(fd_, buf + total, n - total);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = "Read failed: " + std::string(strerror(errno));
            return FrameStatus::IO_ERROR;
        }
        if (r == 0) {
            // EOF
            return FrameStatus::END_OF_STREAM;
        }
        total += static_cast<size_t>(r);
    }
    return FrameStatus::OK;
}

}  // namespace channel
}  // namespace minder
