#pragma once

#include <vector>

#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"
#include "scanport/net/framing.hpp"
#include "scanport/net/stream.hpp"

namespace scanport::session {
    using u32 = scanport::core::u32;
    using u64 = scanport::core::u64;
    using Status = scanport::core::Status;
    using BufferView = scanport::net::BufferView;

    // Receives archive bytes in arrival order, one chunk at a time.
    class ChunkSink {
    public:
        virtual ~ChunkSink() = default;
        [[nodiscard]] virtual Status consume(BufferView chunk) noexcept = 0;
    };

    // How long read_chunks keeps listening for excess data once the declared
    // length is in.
    inline constexpr u32 kDefaultTrailingWindowMs = 250;

    struct ChunkReadOptions {
        u32 read_timeout_ms{0};     // per Chunk frame; 0 = wait forever
        u32 trailing_window_ms{kDefaultTrailingWindowMs};
    };

    // Maps a frame_recv failure onto the session taxonomy: Closed, Timeout and
    // Io become TruncatedStream; UnexpectedSegment and Overflow pass through.
    // The byte count in aux is preserved.
    [[nodiscard]] Status map_transport_status(Status st) noexcept;

    // Reads Chunk frames until exactly total_length bytes arrived, handing
    // each payload to sink. A chunk above chunk_size or one that would pass
    // total_length is Overflow, a non-Chunk frame is UnexpectedSegment, and
    // a closed or silent peer is TruncatedStream. Any byte that shows up
    // within the trailing window after the last one is Overflow (a non-Chunk
    // frame there is UnexpectedSegment); EOF there is fine. Errors from the
    // sink are returned unchanged. received counts the bytes accepted so far.
    [[nodiscard]] Status read_chunks(scanport::net::FdStream& stream,
                                     u32 chunk_size,
                                     u64 total_length,
                                     const ChunkReadOptions& opts,
                                     ChunkSink* sink,
                                     u64* received) noexcept;

    // Buffered form for small archives and tests.
    [[nodiscard]] Status read_chunks(scanport::net::FdStream& stream,
                                     u32 chunk_size,
                                     u64 total_length,
                                     const ChunkReadOptions& opts,
                                     std::vector<scanport::core::u8>* out) noexcept;

} // namespace scanport::session
