#include "scanport/session/segment_decoder.hpp"

#include <cstdio>

namespace scanport::session {

using scanport::core::StatusCode;
using scanport::core::StatusDomain;
using scanport::core::is_ok;
using scanport::core::make_status;
using scanport::core::ok_status;
using scanport::net::Frame;
using scanport::net::FrameType;

namespace {
    void describe_transport(Status st, const char* what, std::string* detail) {
        char buf[160];
        switch (st.code) {
            case StatusCode::TruncatedStream:
                std::snprintf(buf, sizeof(buf), "stream ended while waiting for %s (%u bytes in)", what, st.aux);
                break;
            case StatusCode::Overflow:
                std::snprintf(buf, sizeof(buf), "%s frame of %u bytes exceeds the frame limit", what, st.aux);
                break;
            case StatusCode::UnexpectedSegment:
                std::snprintf(buf, sizeof(buf), "invalid frame header while waiting for %s", what);
                break;
            default:
                std::snprintf(buf, sizeof(buf), "receiving %s failed: %s", what,
                              scanport::core::status_code_name(st.code));
                break;
        }
        *detail = buf;
    }
} // namespace

Status SegmentDecoder::expect_frame(FrameType want, Frame* out, std::string* detail) noexcept {
    const Status st = map_transport_status(
        scanport::net::frame_recv(stream_, opts_.max_frame_bytes, opts_.read_timeout_ms, out));
    if (!is_ok(st)) {
        describe_transport(st, scanport::net::frame_type_name(want), detail);
        return st;
    }
    if (out->header.type != want) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "expected %s frame, got %s",
                      scanport::net::frame_type_name(want),
                      scanport::net::frame_type_name(out->header.type));
        *detail = buf;
        return make_status(StatusDomain::Session, StatusCode::UnexpectedSegment,
                           static_cast<u32>(out->header.type));
    }
    return ok_status();
}

Status SegmentDecoder::read_metadata(scanport::net::TransferMetadata* out, std::string* detail) noexcept {
    if (out == nullptr || detail == nullptr || next_ != Next::Metadata) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    detail->clear();

    Frame frame{};
    Status st = expect_frame(FrameType::Metadata, &frame, detail);
    if (!is_ok(st)) {
        return st;
    }

    st = scanport::net::decode_metadata({frame.payload.data(), frame.header.payload_len},
                                        opts_.metadata, out, detail);
    if (!is_ok(st)) {
        return make_status(StatusDomain::Session, st.code, st.aux);
    }
    next_ = Next::Config;
    return ok_status();
}

Status SegmentDecoder::read_config(scanport::net::ScanConfig* out, std::string* detail) noexcept {
    if (out == nullptr || detail == nullptr || next_ != Next::Config) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    detail->clear();

    Frame frame{};
    Status st = expect_frame(FrameType::Config, &frame, detail);
    if (!is_ok(st)) {
        return st;
    }

    st = scanport::net::decode_config({frame.payload.data(), frame.header.payload_len}, out, detail);
    if (!is_ok(st)) {
        return make_status(StatusDomain::Session, st.code, st.aux);
    }
    next_ = Next::Archive;
    return ok_status();
}

Status SegmentDecoder::read_archive(const scanport::net::TransferMetadata& meta,
                                    ChunkSink* sink,
                                    u64* received,
                                    std::string* detail) noexcept {
    if (sink == nullptr || received == nullptr || detail == nullptr || next_ != Next::Archive) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    detail->clear();

    ChunkReadOptions ropts{};
    ropts.read_timeout_ms = opts_.read_timeout_ms;
    ropts.trailing_window_ms = opts_.trailing_window_ms;

    const Status st = read_chunks(stream_, meta.chunk_size, meta.length, ropts, sink, received);
    if (!is_ok(st)) {
        char buf[160];
        const unsigned long long got = static_cast<unsigned long long>(*received);
        const unsigned long long want = static_cast<unsigned long long>(meta.length);
        switch (st.code) {
            case StatusCode::TruncatedStream:
                std::snprintf(buf, sizeof(buf), "archive truncated: received %llu of %llu bytes", got, want);
                break;
            case StatusCode::Overflow:
                std::snprintf(buf, sizeof(buf),
                              "archive overflow: chunk limit %u, declared length %llu, %llu bytes accepted",
                              meta.chunk_size, want, got);
                break;
            case StatusCode::UnexpectedSegment:
                std::snprintf(buf, sizeof(buf), "expected Chunk frame after %llu of %llu archive bytes", got, want);
                break;
            default:
                std::snprintf(buf, sizeof(buf), "storing archive failed: %s (%s)",
                              scanport::core::status_code_name(st.code),
                              scanport::core::status_domain_name(st.domain));
                break;
        }
        *detail = buf;
        return st;
    }
    next_ = Next::Done;
    return ok_status();
}

} // namespace scanport::session
