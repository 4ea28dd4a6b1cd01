#include "scanport/session/chunk_reader.hpp"

#include <new>

namespace scanport::session {

using scanport::core::StatusCode;
using scanport::core::StatusDomain;
using scanport::core::is_ok;
using scanport::core::make_status;
using scanport::core::ok_status;
using scanport::net::FdStream;
using scanport::net::Frame;
using scanport::net::FrameType;

namespace {
    class VectorSink final : public ChunkSink {
    public:
        explicit VectorSink(std::vector<scanport::core::u8>* out) noexcept : out_(out) {}

        Status consume(BufferView chunk) noexcept override {
            try {
                out_->insert(out_->end(), chunk.data, chunk.data + chunk.len);
            } catch (const std::bad_alloc&) {
                return make_status(StatusDomain::Session, StatusCode::Overflow, chunk.len);
            }
            return ok_status();
        }

    private:
        std::vector<scanport::core::u8>* out_;
    };

    u32 clamp_u32(u64 v) noexcept {
        return v > 0xffffffffull ? 0xffffffffu : static_cast<u32>(v);
    }

    // Once the declared length is in, any inbound byte within the trailing
    // window means the peer sent too much. Only a clean EOF (or silence)
    // ends the archive.
    Status check_trailing(FdStream& stream, u32 chunk_size, u64 total_length, const ChunkReadOptions& opts) noexcept {
        bool ready = false;
        Status st = stream.wait_readable(opts.trailing_window_ms, &ready);
        if (!is_ok(st) || !ready) {
            return ok_status();
        }

        bool pending = false;
        st = stream.pending_input(&pending);
        if (st.code == StatusCode::Closed || !pending) {
            return ok_status();
        }
        if (!is_ok(st)) {
            return map_transport_status(st);
        }

        const u32 overflow_aux = clamp_u32(total_length + 1);
        Frame extra{};
        const u32 wait_ms = opts.trailing_window_ms > 0 ? opts.trailing_window_ms : 1;
        st = scanport::net::frame_recv(stream, chunk_size, wait_ms, &extra);
        if (st.code == StatusCode::UnexpectedSegment) {
            return make_status(StatusDomain::Session, StatusCode::UnexpectedSegment);
        }
        if (!is_ok(st)) {
            // Oversized, cut short or still in flight: bytes past the end either way.
            return make_status(StatusDomain::Session, StatusCode::Overflow, overflow_aux);
        }
        if (extra.header.type == FrameType::Chunk) {
            return make_status(StatusDomain::Session, StatusCode::Overflow,
                               clamp_u32(total_length + extra.header.payload_len));
        }
        return make_status(StatusDomain::Session, StatusCode::UnexpectedSegment,
                           static_cast<u32>(extra.header.type));
    }
} // namespace

Status map_transport_status(Status st) noexcept {
    switch (st.code) {
        case StatusCode::Ok:
            return st;
        case StatusCode::Closed:
        case StatusCode::Timeout:
        case StatusCode::Io:
            return make_status(StatusDomain::Session, StatusCode::TruncatedStream, st.aux);
        case StatusCode::UnexpectedSegment:
        case StatusCode::Overflow:
            return make_status(StatusDomain::Session, st.code, st.aux);
        default:
            return st;
    }
}

Status read_chunks(FdStream& stream,
                   u32 chunk_size,
                   u64 total_length,
                   const ChunkReadOptions& opts,
                   ChunkSink* sink,
                   u64* received) noexcept {
    if (sink == nullptr || received == nullptr || chunk_size == 0) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    *received = 0;

    Frame frame{};
    while (*received < total_length) {
        Status st = scanport::net::frame_recv(stream, chunk_size, opts.read_timeout_ms, &frame);
        if (!is_ok(st)) {
            if (st.code == StatusCode::Closed || st.code == StatusCode::Timeout || st.code == StatusCode::Io) {
                return make_status(StatusDomain::Session, StatusCode::TruncatedStream, clamp_u32(*received));
            }
            return map_transport_status(st);
        }
        if (frame.header.type != FrameType::Chunk) {
            return make_status(StatusDomain::Session, StatusCode::UnexpectedSegment,
                               static_cast<u32>(frame.header.type));
        }

        const u64 len = frame.header.payload_len;
        if (len > total_length - *received) {
            return make_status(StatusDomain::Session, StatusCode::Overflow, clamp_u32(*received + len));
        }
        if (len == 0) {
            continue;
        }

        st = sink->consume(BufferView{frame.payload.data(), frame.header.payload_len});
        if (!is_ok(st)) {
            return st;
        }
        *received += len;
    }

    return check_trailing(stream, chunk_size, total_length, opts);
}

Status read_chunks(FdStream& stream,
                   u32 chunk_size,
                   u64 total_length,
                   const ChunkReadOptions& opts,
                   std::vector<scanport::core::u8>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    out->clear();
    VectorSink sink(out);
    u64 received = 0;
    return read_chunks(stream, chunk_size, total_length, opts, &sink, &received);
}

} // namespace scanport::session
