#pragma once

#include <string>

#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"
#include "scanport/net/protocol.hpp"
#include "scanport/net/stream.hpp"

namespace scanport::client {
    using u16 = scanport::core::u16;
    using u32 = scanport::core::u32;
    using Status = scanport::core::Status;

    // Largest reply frame accepted; result detail carries engine output.
    inline constexpr u32 kMaxReplyBytes = 64u << 20;

    struct SubmitOptions {
        u32 chunk_size{1u << 20};
        u32 reply_timeout_ms{0}; // 0 = wait for the scan however long it takes
    };

    // What the server answered with: a Result or an early Error.
    struct SubmitReply {
        scanport::net::FrameType type{scanport::net::FrameType::Error};
        scanport::net::ScanOutcome outcome{};
        scanport::net::ErrorMessage error{};
    };

    [[nodiscard]] Status connect_tcp(const std::string& host, u16 port, scanport::net::FdStream* out) noexcept;

    // Reads a scan configuration JSON file (the Config frame body).
    [[nodiscard]] Status load_config_file(const std::string& path,
                                          scanport::net::ScanConfig* out,
                                          std::string* detail) noexcept;

    // Sends metadata, config and the archive at archive_path, then waits for
    // the reply. A server that answers early (Error) while chunks are still
    // going out is reported as that Error, not as a write failure.
    //
    // The write side stays open until the reply arrives. The server reads a
    // half-closed connection as a client that went away and abandons the scan.
    [[nodiscard]] Status submit_file(scanport::net::FdStream& stream,
                                     const scanport::net::ScanConfig& cfg,
                                     const std::string& archive_path,
                                     const SubmitOptions& opts,
                                     SubmitReply* out) noexcept;

    // Same, for an archive already in memory.
    [[nodiscard]] Status submit_bytes(scanport::net::FdStream& stream,
                                      const scanport::net::ScanConfig& cfg,
                                      scanport::net::BufferView archive,
                                      const SubmitOptions& opts,
                                      SubmitReply* out) noexcept;

    // Waits for one Result or Error frame.
    [[nodiscard]] Status read_reply(scanport::net::FdStream& stream, u32 timeout_ms, SubmitReply* out) noexcept;

} // namespace scanport::client
