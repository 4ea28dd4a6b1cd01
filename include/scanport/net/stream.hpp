#pragma once

#include <chrono>
#include <vector>

#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"
#include "scanport/net/framing.hpp"

namespace scanport::net {
    using Status = scanport::core::Status;

    // A received frame: header plus its payload_len bytes.
    struct Frame {
        FrameHeader header{};
        std::vector<u8> payload;
    };

    // Blocking byte stream over a connected socket (or any fd). Owns the fd.
    //
    // Read errors: Closed on orderly EOF or reset, Timeout when the deadline
    // passes, Io otherwise (aux = errno). Once the peer is seen gone,
    // peer_closed() stays true and writes are refused.
    class FdStream {
    public:
        FdStream() noexcept = default;
        explicit FdStream(int fd) noexcept : fd_(fd) {}
        ~FdStream() noexcept;

        FdStream(const FdStream&) = delete;
        FdStream& operator=(const FdStream&) = delete;
        FdStream(FdStream&& other) noexcept;
        FdStream& operator=(FdStream&& other) noexcept;

        [[nodiscard]] int fd() const noexcept { return fd_; }
        [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
        [[nodiscard]] bool peer_closed() const noexcept { return peer_closed_; }

        using Deadline = std::chrono::steady_clock::time_point;

        // Reads exactly len bytes within timeout_ms (0 = no deadline).
        [[nodiscard]] Status read_exact(u8* buf, u32 len, u32 timeout_ms) noexcept;

        // Same, against an absolute deadline shared by several reads.
        // A default-constructed Deadline means no deadline.
        [[nodiscard]] Status read_exact_until(u8* buf, u32 len, Deadline deadline) noexcept;

        [[nodiscard]] Status write_all(const u8* buf, u32 len) noexcept;

        // Waits up to timeout_ms for readable data or EOF.
        [[nodiscard]] Status wait_readable(u32 timeout_ms, bool* ready) noexcept;

        // Non-blocking peek: pending is true when unread bytes are queued.
        // Closed once the peer has sent EOF and nothing is left to read.
        [[nodiscard]] Status pending_input(bool* pending) noexcept;

        void shutdown_write() noexcept;
        void close() noexcept;

    private:
        int fd_{-1};
        bool peer_closed_{false};
    };

    // Receives one frame. The whole frame (header and payload) must arrive
    // within timeout_ms. An invalid header maps to UnexpectedSegment; a
    // payload above max_payload maps to Overflow (aux = declared length).
    [[nodiscard]] Status frame_recv(FdStream& s, u32 max_payload, u32 timeout_ms, Frame* out) noexcept;

    [[nodiscard]] Status frame_send(FdStream& s, FrameType type, u32 sequence, BufferView payload) noexcept;

} // namespace scanport::net
