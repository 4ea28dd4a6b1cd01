#include "scanport/client/submit.hpp"

#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace scanport::client {

using scanport::core::StatusCode;
using scanport::core::StatusDomain;
using scanport::core::is_ok;
using scanport::core::make_status;
using scanport::core::ok_status;
using scanport::net::BufferView;
using scanport::net::FdStream;
using scanport::net::FrameType;

namespace {
    // Hard cap on a config file; the server rejects larger frames anyway.
    constexpr off_t kMaxConfigBytes = 1 << 20;

    class ChunkSource {
    public:
        virtual ~ChunkSource() = default;
        virtual Status next(std::vector<scanport::core::u8>* buf, u32 max, u32* got) noexcept = 0;
    };

    class MemorySource final : public ChunkSource {
    public:
        explicit MemorySource(BufferView data) noexcept : data_(data) {}

        Status next(std::vector<scanport::core::u8>* buf, u32 max, u32* got) noexcept override {
            const u32 left = data_.len - offset_;
            const u32 n = left < max ? left : max;
            buf->assign(data_.data + offset_, data_.data + offset_ + n);
            offset_ += n;
            *got = n;
            return ok_status();
        }

    private:
        BufferView data_;
        u32 offset_{0};
    };

    class FileSource final : public ChunkSource {
    public:
        explicit FileSource(int fd) noexcept : fd_(fd) {}

        Status next(std::vector<scanport::core::u8>* buf, u32 max, u32* got) noexcept override {
            buf->resize(max);
            u32 filled = 0;
            while (filled < max) {
                const ssize_t n = ::read(fd_, buf->data() + filled, max - filled);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return make_status(StatusDomain::Cli, StatusCode::Io, errno);
                }
                if (n == 0) {
                    break;
                }
                filled += static_cast<u32>(n);
            }
            buf->resize(filled);
            *got = filled;
            return ok_status();
        }

    private:
        int fd_;
    };

    Status send_json(FdStream& stream, FrameType type, u32 seq, const std::string& body) noexcept {
        return scanport::net::frame_send(stream, type, seq, scanport::net::as_view(body));
    }

    Status submit(FdStream& stream,
                  const scanport::net::ScanConfig& cfg,
                  ChunkSource& source,
                  scanport::core::u64 length,
                  const SubmitOptions& opts,
                  SubmitReply* out) noexcept {
        if (out == nullptr || opts.chunk_size == 0) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        std::string body;
        Status st = scanport::net::encode_metadata({opts.chunk_size, length}, &body);
        if (is_ok(st)) {
            st = send_json(stream, FrameType::Metadata, 0, body);
        }
        if (is_ok(st)) {
            st = scanport::net::encode_config(cfg, &body);
        }
        if (is_ok(st)) {
            st = send_json(stream, FrameType::Config, 1, body);
        }

        std::vector<scanport::core::u8> chunk;
        u32 seq = 2;
        scanport::core::u64 sent = 0;
        while (is_ok(st) && sent < length) {
            u32 got = 0;
            st = source.next(&chunk, opts.chunk_size, &got);
            if (!is_ok(st)) {
                return st;
            }
            if (got == 0) {
                // Source shrank under us; let the server see the short stream.
                break;
            }
            st = scanport::net::frame_send(stream, FrameType::Chunk, seq++, {chunk.data(), got});
            sent += got;
        }

        // On a write failure the server may still have queued an Error frame.
        if (!is_ok(st) && st.code != StatusCode::Closed) {
            return st;
        }
        const Status rs = read_reply(stream, opts.reply_timeout_ms, out);
        if (!is_ok(rs) && !is_ok(st)) {
            return st;
        }
        return rs;
    }
} // namespace

Status connect_tcp(const std::string& host, u16 port, FdStream* out) noexcept {
    if (out == nullptr || host.empty()) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    const int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        return make_status(StatusDomain::Cli, StatusCode::NotFound, static_cast<u32>(gai < 0 ? -gai : gai));
    }

    int last_errno = ECONNREFUSED;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            freeaddrinfo(res);
            *out = FdStream(fd);
            return ok_status();
        }
        last_errno = errno;
        ::close(fd);
    }
    freeaddrinfo(res);
    return make_status(StatusDomain::Cli, StatusCode::Network, static_cast<u32>(last_errno));
}

Status load_config_file(const std::string& path, scanport::net::ScanConfig* out, std::string* detail) noexcept {
    if (out == nullptr || detail == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        *detail = "cannot open " + path;
        return make_status(StatusDomain::Cli, StatusCode::NotFound, errno);
    }
    struct stat st{};
    if (fstat(fd, &st) != 0 || st.st_size > kMaxConfigBytes) {
        ::close(fd);
        *detail = path + " is not a readable config file";
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    std::string text(static_cast<std::size_t>(st.st_size), '\0');
    std::size_t filled = 0;
    while (filled < text.size()) {
        const ssize_t n = ::read(fd, text.data() + filled, text.size() - filled);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int e = errno;
            ::close(fd);
            return make_status(StatusDomain::Cli, StatusCode::Io, e);
        }
        if (n == 0) break;
        filled += static_cast<std::size_t>(n);
    }
    ::close(fd);
    text.resize(filled);

    const Status s = scanport::net::decode_config(scanport::net::as_view(text), out, detail);
    if (!is_ok(s)) {
        return make_status(StatusDomain::Cli, s.code, s.aux);
    }
    return ok_status();
}

Status submit_file(FdStream& stream,
                   const scanport::net::ScanConfig& cfg,
                   const std::string& archive_path,
                   const SubmitOptions& opts,
                   SubmitReply* out) noexcept {
    const int fd = ::open(archive_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return make_status(StatusDomain::Cli, StatusCode::NotFound, errno);
    }
    struct stat st{};
    if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        ::close(fd);
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    FileSource source(fd);
    const Status s = submit(stream, cfg, source, static_cast<scanport::core::u64>(st.st_size), opts, out);
    ::close(fd);
    return s;
}

Status submit_bytes(FdStream& stream,
                    const scanport::net::ScanConfig& cfg,
                    BufferView archive,
                    const SubmitOptions& opts,
                    SubmitReply* out) noexcept {
    if (archive.len > 0 && archive.data == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    MemorySource source(archive);
    return submit(stream, cfg, source, archive.len, opts, out);
}

Status read_reply(FdStream& stream, u32 timeout_ms, SubmitReply* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    scanport::net::Frame frame{};
    Status st = scanport::net::frame_recv(stream, kMaxReplyBytes, timeout_ms, &frame);
    if (!is_ok(st)) {
        return st;
    }

    const BufferView body{frame.payload.data(), frame.header.payload_len};
    out->type = frame.header.type;
    if (frame.header.type == FrameType::Result) {
        return scanport::net::decode_result(body, &out->outcome);
    }
    if (frame.header.type == FrameType::Error) {
        return scanport::net::decode_error(body, &out->error);
    }
    return make_status(StatusDomain::Net, StatusCode::UnexpectedSegment, static_cast<u32>(frame.header.type));
}

} // namespace scanport::client
