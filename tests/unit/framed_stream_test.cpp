/**
 * framed_stream_test.cpp - Length-prefixed framing over pipes
 *
 * Tests:
 * - Big-endian length prefix encoding
 * - Frame round trip, including empty payloads
 * - Short header and short payload are END_OF_STREAM
 * - Oversized frames are rejected on both sides
 * - Writing to a pipe without reader is IO_ERROR
 */

#include "channel/framed_stream.hpp"

#include <gtest/gtest.h>
#include <signal.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "test_utils.hpp"

using namespace minder::channel;
using minder::tests::Pipe;

TEST(FramedStreamTest, HeaderIsBigEndian) {
    uint8_t buf[kFrameHeaderSize];
    encode_frame_header(0x01020304u, buf);
    EXPECT_EQ(buf[0], 0x01);
    EXPECT_EQ(buf[1], 0x02);
    EXPECT_EQ(buf[2], 0x03);
    EXPECT_EQ(buf[3], 0x04);
    EXPECT_EQ(decode_frame_header(buf), 0x01020304u);
}

TEST(FramedStreamTest, WriteThenReadFrame) {
    Pipe pipe;
    FrameWriter writer(pipe.write_fd);
    FrameReader reader(pipe.read_fd);

    ASSERT_EQ(writer.write_frame(std::string("hello")), FrameStatus::OK);
    ASSERT_EQ(writer.write_frame(std::string("world!")), FrameStatus::OK);

    std::vector<uint8_t> out;
    ASSERT_EQ(reader.read_frame(out), FrameStatus::OK);
    EXPECT_EQ(std::string(out.begin(), out.end()), "hello");
    ASSERT_EQ(reader.read_frame(out), FrameStatus::OK);
    EXPECT_EQ(std::string(out.begin(), out.end()), "world!");
}

TEST(FramedStreamTest, EmptyPayloadIsAFrame) {
    Pipe pipe;
    FrameWriter writer(pipe.write_fd);
    FrameReader reader(pipe.read_fd);

    ASSERT_EQ(writer.write_frame(std::string()), FrameStatus::OK);
    std::vector<uint8_t> out{1, 2, 3};
    ASSERT_EQ(reader.read_frame(out), FrameStatus::OK);
    EXPECT_TRUE(out.empty());
}

TEST(FramedStreamTest, ClosedStreamIsEndOfStream) {
    Pipe pipe;
    pipe.close_write();

    FrameReader reader(pipe.read_fd);
    std::vector<uint8_t> out;
    EXPECT_EQ(reader.read_frame(out), FrameStatus::END_OF_STREAM);
    EXPECT_NE(reader.last_error().find("length"), std::string::npos);
}

TEST(FramedStreamTest, ShortHeaderIsEndOfStream) {
    Pipe pipe;
    const uint8_t partial[2] = {0x00, 0x00};
    ASSERT_EQ(write(pipe.write_fd, partial, sizeof(partial)), 2);
    pipe.close_write();

    FrameReader reader(pipe.read_fd);
    std::vector<uint8_t> out;
    EXPECT_EQ(reader.read_frame(out), FrameStatus::END_OF_STREAM);
}

TEST(FramedStreamTest, ShortPayloadIsEndOfStream) {
    Pipe pipe;
    uint8_t header[kFrameHeaderSize];
    encode_frame_header(10, header);
    ASSERT_EQ(write(pipe.write_fd, header, sizeof(header)), 4);
    ASSERT_EQ(write(pipe.write_fd, "abc", 3), 3);
    pipe.close_write();

    FrameReader reader(pipe.read_fd);
    std::vector<uint8_t> out;
    EXPECT_EQ(reader.read_frame(out), FrameStatus::END_OF_STREAM);
    EXPECT_NE(reader.last_error().find("payload"), std::string::npos);
}

TEST(FramedStreamTest, OversizedDeclaredLengthIsRejected) {
    Pipe pipe;
    uint8_t header[kFrameHeaderSize];
    encode_frame_header(kMaxFrameSize + 1, header);
    ASSERT_EQ(write(pipe.write_fd, header, sizeof(header)), 4);

    FrameReader reader(pipe.read_fd);
    std::vector<uint8_t> out;
    EXPECT_EQ(reader.read_frame(out), FrameStatus::TOO_LARGE);
}

TEST(FramedStreamTest, OversizedWriteIsRejected) {
    Pipe pipe;
    FrameWriter writer(pipe.write_fd);
    std::vector<uint8_t> big(kMaxFrameSize + 1, 0xAB);
    EXPECT_EQ(writer.write_frame(big.data(), big.size()), FrameStatus::TOO_LARGE);
    EXPECT_FALSE(writer.last_error().empty());
}

TEST(FramedStreamTest, WriteToPipeWithoutReaderIsIoError) {
    signal(SIGPIPE, SIG_IGN);
    Pipe pipe;
    pipe.close_read();

    FrameWriter writer(pipe.write_fd);
    EXPECT_EQ(writer.write_frame(std::string("lost")), FrameStatus::IO_ERROR);
    EXPECT_NE(writer.last_error().find("Broken pipe"), std::string::npos);
}

TEST(FramedStreamTest, InvalidDescriptorIsIoError) {
    FrameWriter writer;
    FrameReader reader;
    std::vector<uint8_t> out;
    EXPECT_EQ(writer.write_frame(std::string("x")), FrameStatus::IO_ERROR);
    EXPECT_EQ(reader.read_frame(out), FrameStatus::IO_ERROR);
}
