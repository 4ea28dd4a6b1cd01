#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "scanport/session/segment_decoder.hpp"
#include "test_support.hpp"

namespace net = scanport::net;
namespace session = scanport::session;
using scanport::core::StatusCode;

namespace {
    class StringSink final : public session::ChunkSink {
    public:
        scanport::core::Status consume(session::BufferView chunk) noexcept override {
            data.append(reinterpret_cast<const char*>(chunk.data), chunk.len);
            return scanport::core::ok_status();
        }
        std::string data;
    };

    session::DecoderOptions quick_options() {
        session::DecoderOptions o{};
        o.read_timeout_ms = 1000;
        return o;
    }
}

TEST(SegmentDecoder, ReadsAllThreeSegments){
    net::FdStream server, client;
    scanport::test::make_stream_pair(&server, &client);
    net::ScanConfig cfg = scanport::test::sample_config();
    cfg.extra.emplace_back("foo", "bar");

    ASSERT_EQ(scanport::test::send_metadata(client, 4, 8).code, StatusCode::Ok);
    ASSERT_EQ(scanport::test::send_config(client, cfg).code, StatusCode::Ok);
    ASSERT_EQ(scanport::test::send_text(client, net::FrameType::Chunk, 2, "ABCD").code, StatusCode::Ok);
    ASSERT_EQ(scanport::test::send_text(client, net::FrameType::Chunk, 3, "EFGH").code, StatusCode::Ok);

    session::SegmentDecoder dec(server, quick_options());
    std::string detail;

    EXPECT_EQ(dec.next(), session::SegmentDecoder::Next::Metadata);
    net::TransferMetadata meta{};
    ASSERT_EQ(dec.read_metadata(&meta, &detail).code, StatusCode::Ok) << detail;
    EXPECT_EQ(meta.chunk_size, 4u);
    EXPECT_EQ(meta.length, 8u);

    EXPECT_EQ(dec.next(), session::SegmentDecoder::Next::Config);
    net::ScanConfig got{};
    ASSERT_EQ(dec.read_config(&got, &detail).code, StatusCode::Ok) << detail;
    EXPECT_EQ(got.project_name, "demo");
    ASSERT_EQ(got.extra.size(), 1u);

    EXPECT_EQ(dec.next(), session::SegmentDecoder::Next::Archive);
    StringSink sink;
    scanport::core::u64 received = 0;
    ASSERT_EQ(dec.read_archive(meta, &sink, &received, &detail).code, StatusCode::Ok) << detail;
    EXPECT_EQ(sink.data, "ABCDEFGH");
    EXPECT_EQ(received, 8u);
    EXPECT_EQ(dec.next(), session::SegmentDecoder::Next::Done);
}

TEST(SegmentDecoder, ChunkBeforeMetadata){
    net::FdStream server, client;
    scanport::test::make_stream_pair(&server, &client);
    ASSERT_EQ(scanport::test::send_text(client, net::FrameType::Chunk, 0, "ABCD").code, StatusCode::Ok);

    session::SegmentDecoder dec(server, quick_options());
    net::TransferMetadata meta{};
    std::string detail;
    const auto s = dec.read_metadata(&meta, &detail);
    EXPECT_EQ(s.code, StatusCode::UnexpectedSegment);
    EXPECT_EQ(s.domain, scanport::core::StatusDomain::Session);
    EXPECT_EQ(detail, "expected Metadata frame, got Chunk");
    EXPECT_EQ(dec.next(), session::SegmentDecoder::Next::Metadata);
}

TEST(SegmentDecoder, ConfigBeforeMetadata){
    net::FdStream server, client;
    scanport::test::make_stream_pair(&server, &client);
    ASSERT_EQ(scanport::test::send_config(client, scanport::test::sample_config()).code, StatusCode::Ok);

    session::SegmentDecoder dec(server, quick_options());
    net::TransferMetadata meta{};
    std::string detail;
    EXPECT_EQ(dec.read_metadata(&meta, &detail).code, StatusCode::UnexpectedSegment);
}

TEST(SegmentDecoder, OutOfOrderCallsAreInvalid){
    net::FdStream server, client;
    scanport::test::make_stream_pair(&server, &client);
    session::SegmentDecoder dec(server, quick_options());

    net::ScanConfig cfg{};
    std::string detail;
    EXPECT_EQ(dec.read_config(&cfg, &detail).code, StatusCode::Invalid);

    StringSink sink;
    scanport::core::u64 received = 0;
    EXPECT_EQ(dec.read_archive({4, 4}, &sink, &received, &detail).code, StatusCode::Invalid);
}

TEST(SegmentDecoder, MalformedMetadataKeepsSessionDomain){
    net::FdStream server, client;
    scanport::test::make_stream_pair(&server, &client);
    ASSERT_EQ(scanport::test::send_text(client, net::FrameType::Metadata, 0, R"({"chunkSize":0,"length":4})").code,
              StatusCode::Ok);

    session::SegmentDecoder dec(server, quick_options());
    net::TransferMetadata meta{};
    std::string detail;
    const auto s = dec.read_metadata(&meta, &detail);
    EXPECT_EQ(s.code, StatusCode::MalformedMetadata);
    EXPECT_EQ(s.domain, scanport::core::StatusDomain::Session);
    EXPECT_FALSE(detail.empty());
}

TEST(SegmentDecoder, OversizedControlFrameIsOverflow){
    net::FdStream server, client;
    scanport::test::make_stream_pair(&server, &client);
    const std::string big(300, 'x');
    ASSERT_EQ(scanport::test::send_text(client, net::FrameType::Metadata, 0, big).code, StatusCode::Ok);

    session::DecoderOptions o = quick_options();
    o.max_frame_bytes = 128;
    session::SegmentDecoder dec(server, o);
    net::TransferMetadata meta{};
    std::string detail;
    EXPECT_EQ(dec.read_metadata(&meta, &detail).code, StatusCode::Overflow);
}

TEST(SegmentDecoder, TruncatedArchiveReportsCounts){
    net::FdStream server, client;
    scanport::test::make_stream_pair(&server, &client);
    ASSERT_EQ(scanport::test::send_metadata(client, 4, 8).code, StatusCode::Ok);
    ASSERT_EQ(scanport::test::send_config(client, scanport::test::sample_config()).code, StatusCode::Ok);
    ASSERT_EQ(scanport::test::send_text(client, net::FrameType::Chunk, 2, "ABCD").code, StatusCode::Ok);
    ASSERT_EQ(scanport::test::send_text(client, net::FrameType::Chunk, 3, "E").code, StatusCode::Ok);
    client.close();

    session::SegmentDecoder dec(server, quick_options());
    net::TransferMetadata meta{};
    net::ScanConfig cfg{};
    std::string detail;
    ASSERT_EQ(dec.read_metadata(&meta, &detail).code, StatusCode::Ok);
    ASSERT_EQ(dec.read_config(&cfg, &detail).code, StatusCode::Ok);

    StringSink sink;
    scanport::core::u64 received = 0;
    EXPECT_EQ(dec.read_archive(meta, &sink, &received, &detail).code, StatusCode::TruncatedStream);
    EXPECT_EQ(received, 5u);
    EXPECT_EQ(detail, "archive truncated: received 5 of 8 bytes");
}
