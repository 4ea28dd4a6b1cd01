#include "scanport/net/stream.hpp"

#include <array>
#include <cerrno>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace scanport::net {

using scanport::core::StatusCode;
using scanport::core::StatusDomain;
using scanport::core::make_status;
using scanport::core::ok_status;
using scanport::core::is_ok;

namespace {
    using Clock = std::chrono::steady_clock;

    // Milliseconds left until deadline; -1 means wait forever.
    int remaining_ms(FdStream::Deadline deadline) noexcept {
        if (deadline == FdStream::Deadline{}) {
            return -1;
        }
        const auto now = Clock::now();
        if (now >= deadline) {
            return 0;
        }
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        return ms <= 0 ? 1 : static_cast<int>(ms);
    }

    FdStream::Deadline deadline_after(u32 timeout_ms) noexcept {
        if (timeout_ms == 0) {
            return FdStream::Deadline{};
        }
        return Clock::now() + std::chrono::milliseconds(timeout_ms);
    }

    bool is_disconnect_errno(int e) noexcept {
        return e == ECONNRESET || e == EPIPE || e == ENOTCONN;
    }
} // namespace

FdStream::~FdStream() noexcept {
    close();
}

FdStream::FdStream(FdStream&& other) noexcept
    : fd_(other.fd_), peer_closed_(other.peer_closed_) {
    other.fd_ = -1;
    other.peer_closed_ = false;
}

FdStream& FdStream::operator=(FdStream&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        peer_closed_ = other.peer_closed_;
        other.fd_ = -1;
        other.peer_closed_ = false;
    }
    return *this;
}

Status FdStream::read_exact(u8* buf, u32 len, u32 timeout_ms) noexcept {
    return read_exact_until(buf, len, deadline_after(timeout_ms));
}

Status FdStream::read_exact_until(u8* buf, u32 len, Deadline deadline) noexcept {
    if (fd_ < 0 || (buf == nullptr && len > 0)) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }

    u32 total_read = 0;
    while (total_read < len) {
        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        const int rc = poll(&pfd, 1, remaining_ms(deadline));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return make_status(StatusDomain::Net, StatusCode::Io, static_cast<u32>(errno));
        }
        if (rc == 0) {
            return make_status(StatusDomain::Net, StatusCode::Timeout, total_read);
        }

        const ssize_t n = read(fd_, buf + total_read, len - total_read);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            if (is_disconnect_errno(errno)) {
                peer_closed_ = true;
                return make_status(StatusDomain::Net, StatusCode::Closed, total_read);
            }
            return make_status(StatusDomain::Net, StatusCode::Io, static_cast<u32>(errno));
        }
        if (n == 0) {
            peer_closed_ = true;
            return make_status(StatusDomain::Net, StatusCode::Closed, total_read);
        }
        total_read += static_cast<u32>(n);
    }
    return ok_status();
}

Status FdStream::write_all(const u8* buf, u32 len) noexcept {
    if (fd_ < 0 || (buf == nullptr && len > 0)) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }
    if (peer_closed_) {
        return make_status(StatusDomain::Net, StatusCode::Closed);
    }

    bool use_send = true;
    u32 total_written = 0;
    while (total_written < len) {
        ssize_t n = 0;
        if (use_send) {
            n = send(fd_, buf + total_written, len - total_written, MSG_NOSIGNAL);
            if (n < 0 && errno == ENOTSOCK) {
                use_send = false;
                continue;
            }
        } else {
            n = write(fd_, buf + total_written, len - total_written);
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            if (is_disconnect_errno(errno)) {
                peer_closed_ = true;
                return make_status(StatusDomain::Net, StatusCode::Closed, total_written);
            }
            return make_status(StatusDomain::Net, StatusCode::Io, static_cast<u32>(errno));
        }
        total_written += static_cast<u32>(n);
    }
    return ok_status();
}

Status FdStream::wait_readable(u32 timeout_ms, bool* ready) noexcept {
    if (ready == nullptr || fd_ < 0) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }
    *ready = false;

    struct pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int rc = 0;
    do {
        rc = poll(&pfd, 1, static_cast<int>(timeout_ms));
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        return make_status(StatusDomain::Net, StatusCode::Io, static_cast<u32>(errno));
    }
    *ready = rc > 0;
    return ok_status();
}

Status FdStream::pending_input(bool* pending) noexcept {
    if (pending == nullptr || fd_ < 0) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }
    *pending = false;

    u8 peeked = 0;
    ssize_t n = 0;
    do {
        n = recv(fd_, &peeked, 1, MSG_PEEK | MSG_DONTWAIT);
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        *pending = true;
        return ok_status();
    }
    if (n == 0) {
        peer_closed_ = true;
        return make_status(StatusDomain::Net, StatusCode::Closed);
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return ok_status();
    }
    if (errno == ENOTSOCK) {
        // Pipes and files cannot be peeked; readable is the best answer.
        return wait_readable(0, pending);
    }
    if (is_disconnect_errno(errno)) {
        peer_closed_ = true;
        return make_status(StatusDomain::Net, StatusCode::Closed);
    }
    return make_status(StatusDomain::Net, StatusCode::Io, static_cast<u32>(errno));
}

void FdStream::shutdown_write() noexcept {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_WR);
    }
}

void FdStream::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Status frame_recv(FdStream& s, u32 max_payload, u32 timeout_ms, Frame* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }

    const FdStream::Deadline deadline = deadline_after(timeout_ms);

    std::array<u8, kFrameHeaderBytes> hdr{};
    Status st = s.read_exact_until(hdr.data(), kFrameHeaderBytes, deadline);
    if (!is_ok(st)) {
        return st;
    }

    FrameHeader h{};
    if (frame_read_header({hdr.data(), kFrameHeaderBytes}, &h) != FrameParseResult::Ok) {
        return make_status(StatusDomain::Net, StatusCode::UnexpectedSegment);
    }
    if (h.payload_len > max_payload) {
        return make_status(StatusDomain::Net, StatusCode::Overflow, h.payload_len);
    }

    out->header = h;
    out->payload.resize(h.payload_len);
    if (h.payload_len > 0) {
        st = s.read_exact_until(out->payload.data(), h.payload_len, deadline);
    }
    return st;
}

Status frame_send(FdStream& s, FrameType type, u32 sequence, BufferView payload) noexcept {
    if (payload.len > 0 && payload.data == nullptr) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }

    FrameHeader h{};
    h.version = kFrameVersion;
    h.type = type;
    h.payload_len = payload.len;
    h.sequence = sequence;

    std::array<u8, kFrameHeaderBytes> hdr{};
    if (frame_write_header(h, {hdr.data(), kFrameHeaderBytes}) != kFrameHeaderBytes) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }

    Status st = s.write_all(hdr.data(), kFrameHeaderBytes);
    if (!is_ok(st)) {
        return st;
    }
    if (payload.len > 0) {
        st = s.write_all(payload.data, payload.len);
    }
    return st;
}

} // namespace scanport::net
