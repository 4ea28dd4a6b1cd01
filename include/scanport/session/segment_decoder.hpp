#pragma once

#include <string>

#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"
#include "scanport/net/protocol.hpp"
#include "scanport/net/stream.hpp"
#include "scanport/session/chunk_reader.hpp"

namespace scanport::session {
    using u8 = scanport::core::u8;

    struct DecoderOptions {
        u32 max_frame_bytes{1u << 20};     // Metadata/Config payload cap
        scanport::net::MetadataLimits metadata{};
        u32 read_timeout_ms{0};
        u32 trailing_window_ms{kDefaultTrailingWindowMs};
    };

    // Pulls the three inbound segments off one connection in strict order:
    // Metadata, Config, then the archive Chunk frames. Each read_* call must
    // follow the previous one; calling out of order is Invalid and reads
    // nothing. The wire sending a frame of the wrong kind is
    // UnexpectedSegment. Every failure leaves a human-readable detail.
    class SegmentDecoder {
    public:
        enum class Next : u8 {
            Metadata = 0,
            Config,
            Archive,
            Done,
        };

        SegmentDecoder(scanport::net::FdStream& stream, const DecoderOptions& opts) noexcept
            : stream_(stream), opts_(opts) {}

        [[nodiscard]] Next next() const noexcept { return next_; }

        [[nodiscard]] Status read_metadata(scanport::net::TransferMetadata* out, std::string* detail) noexcept;

        [[nodiscard]] Status read_config(scanport::net::ScanConfig* out, std::string* detail) noexcept;

        // Streams length bytes into sink. received reports progress even on failure.
        [[nodiscard]] Status read_archive(const scanport::net::TransferMetadata& meta,
                                          ChunkSink* sink,
                                          u64* received,
                                          std::string* detail) noexcept;

    private:
        [[nodiscard]] Status expect_frame(scanport::net::FrameType want,
                                          scanport::net::Frame* out,
                                          std::string* detail) noexcept;

        scanport::net::FdStream& stream_;
        DecoderOptions opts_;
        Next next_{Next::Metadata};
    };

} // namespace scanport::session
