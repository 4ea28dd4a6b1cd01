#include <array>
#include <string>

#include <gtest/gtest.h>

#include "scanport/net/framing.hpp"
#include "scanport/net/stream.hpp"
#include "test_support.hpp"

namespace net = scanport::net;
using scanport::core::StatusCode;

static net::BufferMut mut(std::array<net::u8, net::kFrameHeaderBytes>& buf) {
    return {buf.data(), static_cast<net::u32>(buf.size())};
}

static net::BufferView view(const std::array<net::u8, net::kFrameHeaderBytes>& buf) {
    return {buf.data(), static_cast<net::u32>(buf.size())};
}

TEST(NetFraming, HeaderRoundTrip) {
    net::FrameHeader in{};
    in.version = 1;
    in.type = net::FrameType::Chunk;
    in.flags = 0x1234;
    in.payload_len = 0x01020304;
    in.sequence = 0xaabbccdd;

    std::array<net::u8, net::kFrameHeaderBytes> buf{};
    ASSERT_EQ(net::frame_write_header(in, mut(buf)), net::kFrameHeaderBytes);

    // big-endian on the wire
    EXPECT_EQ(buf[3], 3);
    EXPECT_EQ(buf[8], 0x01);
    EXPECT_EQ(buf[11], 0x04);

    net::FrameHeader out{};
    ASSERT_EQ(net::frame_read_header(view(buf), &out), net::FrameParseResult::Ok);
    EXPECT_EQ(out.version, in.version);
    EXPECT_EQ(out.type, in.type);
    EXPECT_EQ(out.flags, in.flags);
    EXPECT_EQ(out.payload_len, in.payload_len);
    EXPECT_EQ(out.sequence, in.sequence);
}

TEST(NetFraming, NeedMoreWhenShort){
    std::array<net::u8, net::kFrameHeaderBytes - 1> buf{};
    net::FrameHeader out{};
    EXPECT_EQ(net::frame_read_header({buf.data(), static_cast<net::u32>(buf.size())}, &out),
              net::FrameParseResult::NeedMore);
}

TEST(NetFraming, InvalidWhenReservedNonZero){
    net::FrameHeader in{};
    std::array<net::u8, net::kFrameHeaderBytes> buf{};
    ASSERT_EQ(net::frame_write_header(in, mut(buf)), net::kFrameHeaderBytes);

    // reserved field is bytes 6-7
    buf[6] = 0x12;
    buf[7] = 0x34;

    net::FrameHeader out{};
    EXPECT_EQ(net::frame_read_header(view(buf), &out), net::FrameParseResult::Invalid);
}

TEST(NetFraming, InvalidWhenUnknownType){
    net::FrameHeader in{};
    std::array<net::u8, net::kFrameHeaderBytes> buf{};
    ASSERT_EQ(net::frame_write_header(in, mut(buf)), net::kFrameHeaderBytes);

    buf[2] = 0;
    buf[3] = 9;

    net::FrameHeader out{};
    EXPECT_EQ(net::frame_read_header(view(buf), &out), net::FrameParseResult::Invalid);
}

TEST(NetFraming, InvalidWhenVersionNotOne){
    net::FrameHeader in{};
    in.version = 2;
    std::array<net::u8, net::kFrameHeaderBytes> buf{};
    ASSERT_EQ(net::frame_write_header(in, mut(buf)), net::kFrameHeaderBytes);

    net::FrameHeader out{};
    EXPECT_EQ(net::frame_read_header(view(buf), &out), net::FrameParseResult::Invalid);
}

TEST(NetFraming, WriteRejectsShortBuffer){
    std::array<net::u8, 4> buf{};
    EXPECT_EQ(net::frame_write_header(net::FrameHeader{}, {buf.data(), 4}), 0u);
}

TEST(NetStream, SendAndReceiveFrame){
    net::FdStream a, b;
    scanport::test::make_stream_pair(&a, &b);

    const std::string body = "{\"chunkSize\":4}";
    ASSERT_EQ(scanport::test::send_text(b, net::FrameType::Metadata, 7, body).code, StatusCode::Ok);

    net::Frame f{};
    ASSERT_EQ(net::frame_recv(a, 1024, 1000, &f).code, StatusCode::Ok);
    EXPECT_EQ(f.header.type, net::FrameType::Metadata);
    EXPECT_EQ(f.header.sequence, 7u);
    EXPECT_EQ(std::string(f.payload.begin(), f.payload.end()), body);
}

TEST(NetStream, EmptyPayloadFrame){
    net::FdStream a, b;
    scanport::test::make_stream_pair(&a, &b);
    ASSERT_EQ(net::frame_send(b, net::FrameType::Chunk, 2, {nullptr, 0}).code, StatusCode::Ok);

    net::Frame f{};
    ASSERT_EQ(net::frame_recv(a, 16, 1000, &f).code, StatusCode::Ok);
    EXPECT_EQ(f.header.type, net::FrameType::Chunk);
    EXPECT_TRUE(f.payload.empty());
}

TEST(NetStream, OversizedPayloadIsOverflow){
    net::FdStream a, b;
    scanport::test::make_stream_pair(&a, &b);
    ASSERT_EQ(scanport::test::send_text(b, net::FrameType::Chunk, 2, "0123456789").code, StatusCode::Ok);

    net::Frame f{};
    const scanport::core::Status s = net::frame_recv(a, 4, 1000, &f);
    EXPECT_EQ(s.code, StatusCode::Overflow);
    EXPECT_EQ(s.aux, 10u);
}

TEST(NetStream, GarbageHeaderIsUnexpectedSegment){
    net::FdStream a, b;
    scanport::test::make_stream_pair(&a, &b);
    std::array<net::u8, net::kFrameHeaderBytes> junk{};
    junk.fill(0xff);
    ASSERT_EQ(b.write_all(junk.data(), static_cast<net::u32>(junk.size())).code, StatusCode::Ok);

    net::Frame f{};
    EXPECT_EQ(net::frame_recv(a, 1024, 1000, &f).code, StatusCode::UnexpectedSegment);
}

TEST(NetStream, EofMidHeaderIsClosed){
    net::FdStream a, b;
    scanport::test::make_stream_pair(&a, &b);
    const net::u8 partial[5] = {0, 1, 0, 3, 0};
    ASSERT_EQ(b.write_all(partial, 5).code, StatusCode::Ok);
    b.close();

    net::Frame f{};
    const scanport::core::Status s = net::frame_recv(a, 1024, 1000, &f);
    EXPECT_EQ(s.code, StatusCode::Closed);
    EXPECT_TRUE(a.peer_closed());
}

TEST(NetStream, SilentPeerTimesOut){
    net::FdStream a, b;
    scanport::test::make_stream_pair(&a, &b);

    net::Frame f{};
    EXPECT_EQ(net::frame_recv(a, 1024, 50, &f).code, StatusCode::Timeout);
}

TEST(NetStream, MoveTransfersOwnership){
    net::FdStream a, b;
    scanport::test::make_stream_pair(&a, &b);
    const int fd = a.fd();
    net::FdStream c(std::move(a));
    EXPECT_FALSE(a.is_open());
    EXPECT_EQ(c.fd(), fd);
}
