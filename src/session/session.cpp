#include "scanport/session/session.hpp"

#include <chrono>
#include <cinttypes>
#include <cstdio>
#include <optional>
#include <unistd.h>
#include <utility>

#include "scanport/core/log.hpp"
#include "scanport/security/secrets.hpp"

namespace scanport::session {

using scanport::core::StatusDomain;
using scanport::core::is_ok;
using scanport::core::make_status;
using scanport::core::ok_status;
using scanport::net::FrameType;
using scanport::net::OutcomeStatus;

namespace {
    // After an Error frame, unread input is discarded for at most this long
    // so closing with queued bytes does not reset the connection before the
    // peer reads the error.
    constexpr u32 kDrainWindowMs = 200;
    constexpr u32 kDrainMaxBytes = 1u << 20;

    // Info-level progress is logged on each tenth of the archive.
    constexpr u64 kProgressSteps = 10;

    class ArchiveSink final : public ChunkSink {
    public:
        ArchiveSink(scanport::storage::ArchiveWriter& writer, const char* tag) noexcept
            : writer_(writer), tag_(tag) {}

        Status consume(BufferView chunk) noexcept override {
            const Status st = writer_.write(chunk);
            if (!is_ok(st)) {
                return st;
            }
            log_progress();
            return ok_status();
        }

    private:
        void log_progress() noexcept {
            const u64 got = writer_.bytes_written();
            const u64 total = writer_.expected_bytes();
            char a[32];
            char b[32];
            scanport::core::format_size(got, a, sizeof(a));
            scanport::core::format_size(total, b, sizeof(b));

            const u64 step = total == 0 ? kProgressSteps : (got * kProgressSteps) / total;
            if (step != last_step_) {
                last_step_ = step;
                SCANPORT_LOG_INFO(tag_, "%s/%s (%" PRIu64 "/%" PRIu64 ")", a, b, got, total);
            } else {
                SCANPORT_LOG_DEBUG(tag_, "%s/%s (%" PRIu64 "/%" PRIu64 ")", a, b, got, total);
            }
        }

        scanport::storage::ArchiveWriter& writer_;
        const char* tag_;
        u64 last_step_{0};
    };
} // namespace

const char* state_name(SessionState s) noexcept {
    switch (s) {
        case SessionState::AwaitingMetadata: return "AWAITING_METADATA";
        case SessionState::AwaitingConfig: return "AWAITING_CONFIG";
        case SessionState::ReceivingArchive: return "RECEIVING_ARCHIVE";
        case SessionState::Scanning: return "SCANNING";
        case SessionState::Succeeded: return "SUCCEEDED";
        case SessionState::Failed: return "FAILED";
        case SessionState::Closed: return "CLOSED";
    }
    return "UNKNOWN";
}

Session::Session(scanport::net::FdStream stream, const SessionResources& res) noexcept
    : stream_(std::move(stream)), res_(res), cancel_(stream_.fd(), res.stop) {
    transitions_.reserve(8);
    transitions_.push_back(state_);
}

Session::~Session() noexcept {
    teardown();
}

void Session::enter(SessionState next) noexcept {
    SCANPORT_LOG_DEBUG(tag(), "%s -> %s", state_name(state_), state_name(next));
    state_ = next;
    transitions_.push_back(next);
}

const char* Session::tag() const noexcept {
    if (!tag_.empty()) {
        return tag_.c_str();
    }
    return id_.is_valid() ? id_.c_str() : nullptr;
}

Status Session::fail(Status st, const std::string& detail) noexcept {
    outcome_.status = OutcomeStatus::Failure;
    outcome_.error = st.code;
    outcome_.detail = detail;
    enter(SessionState::Failed);

    if (stream_.peer_closed()) {
        peer_gone_ = true;
        SCANPORT_LOG_WARN(tag(), "peer disconnected: %s", detail.c_str());
        return st;
    }

    SCANPORT_LOG_ERROR(tag(), "%s: %s", scanport::core::error_kind_name(st.code), detail.c_str());

    std::string payload;
    const Status es = scanport::net::encode_error(st.code, detail, &payload);
    if (!is_ok(es)) {
        SCANPORT_LOG_ERROR(tag(), "cannot encode error frame: %s", scanport::core::status_code_name(es.code));
        return st;
    }
    const Status ws = scanport::net::frame_send(stream_, FrameType::Error, 0, scanport::net::as_view(payload));
    if (is_ok(ws)) {
        response_ = Response::Error;
    } else {
        peer_gone_ = stream_.peer_closed();
        SCANPORT_LOG_WARN(tag(), "could not send error frame: %s", scanport::core::status_code_name(ws.code));
    }
    return st;
}

void Session::send_result() noexcept {
    if (stream_.peer_closed() || cancel_.cancelled()) {
        peer_gone_ = true;
        return;
    }

    std::string payload;
    const Status es = scanport::net::encode_result(outcome_, &payload);
    if (!is_ok(es)) {
        SCANPORT_LOG_ERROR(tag(), "cannot encode result frame: %s", scanport::core::status_code_name(es.code));
        return;
    }
    const Status ws = scanport::net::frame_send(stream_, FrameType::Result, 0, scanport::net::as_view(payload));
    if (is_ok(ws)) {
        response_ = Response::Result;
    } else {
        peer_gone_ = stream_.peer_closed();
        SCANPORT_LOG_WARN(tag(), "could not send result frame: %s", scanport::core::status_code_name(ws.code));
    }
}

Status Session::run() noexcept {
    if (res_.scratch == nullptr || res_.invoker == nullptr) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }
    if (state_ != SessionState::AwaitingMetadata || transitions_.size() != 1) {
        return make_status(StatusDomain::Session, StatusCode::Invalid);
    }

    Status st = scanport::security::make_session_id(&id_);
    if (!is_ok(st)) {
        st = fail(st, "cannot allocate a session id");
        teardown();
        return st;
    }

    SegmentDecoder decoder(stream_, res_.decoder);
    std::string detail;

    st = decoder.read_metadata(&meta_, &detail);
    if (!is_ok(st)) {
        st = fail(st, detail);
        teardown();
        return st;
    }
    enter(SessionState::AwaitingConfig);

    st = decoder.read_config(&config_, &detail);
    if (!is_ok(st)) {
        st = fail(st, detail);
        teardown();
        return st;
    }
    tag_ = config_.project_name;
    enter(SessionState::ReceivingArchive);

    st = receive_archive(decoder);
    if (!is_ok(st)) {
        teardown();
        return st;
    }

    enter(SessionState::Scanning);
    st = scan();
    teardown();
    return st;
}

Status Session::receive_archive(SegmentDecoder& decoder) noexcept {
    char size_buf[32];
    scanport::core::format_size(meta_.length, size_buf, sizeof(size_buf));
    SCANPORT_LOG_INFO(tag(), "transfer start: %s in chunks of up to %u bytes", size_buf, meta_.chunk_size);

    Status st = res_.scratch->create_session_dir(id_, &dir_);
    if (!is_ok(st)) {
        return fail(st, std::string("cannot create scratch directory: ") + scanport::core::status_code_name(st.code));
    }

    scanport::storage::ArchiveWriter writer;
    st = writer.open(dir_, meta_.length);
    if (!is_ok(st)) {
        return fail(st, std::string("cannot open scratch archive: ") + scanport::core::status_code_name(st.code));
    }

    ArchiveSink sink(writer, tag());
    std::string detail;
    st = decoder.read_archive(meta_, &sink, &received_, &detail);
    if (!is_ok(st)) {
        writer.abort();
        return fail(st, detail);
    }

    st = writer.commit(&archive_);
    if (!is_ok(st)) {
        return fail(st, std::string("cannot publish archive: ") + scanport::core::status_code_name(st.code));
    }

    char hex[65];
    scanport::storage::hash_to_hex(archive_.digest, hex, sizeof(hex));
    SCANPORT_LOG_INFO(tag(), "transfer done: %s blake3=%s", archive_.path.c_str(), hex);
    return ok_status();
}

Status Session::scan() noexcept {
    // A peer that hung up after the last chunk gets no scan.
    if (stream_.peer_closed() || cancel_.cancelled()) {
        SCANPORT_LOG_WARN(tag(), "peer gone before scan start");
        return abandon(make_status(StatusDomain::Session, StatusCode::Cancelled));
    }

    std::optional<scanport::scan::SlotLease> lease;
    if (res_.slots != nullptr) {
        const Status st = res_.slots->acquire(cancel_);
        if (!is_ok(st)) {
            SCANPORT_LOG_WARN(tag(), "cancelled while waiting for an invocation slot");
            return abandon(st);
        }
        lease.emplace(res_.slots);
    }

    // Bytes that arrived after the trailing window (or while queued for a
    // slot) are still past the declared length.
    bool pending = false;
    const Status ps = stream_.pending_input(&pending);
    if (ps.code == StatusCode::Closed) {
        SCANPORT_LOG_WARN(tag(), "peer gone before scan start");
        return abandon(make_status(StatusDomain::Session, StatusCode::Cancelled));
    }
    if (!is_ok(ps)) {
        SCANPORT_LOG_WARN(tag(), "connection check failed: %s", scanport::core::status_code_name(ps.code));
        return abandon(make_status(StatusDomain::Session, StatusCode::Cancelled, ps.aux));
    }
    if (pending) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "archive overflow: data after the declared %llu bytes",
                      static_cast<unsigned long long>(meta_.length));
        const u64 past = received_ + 1;
        return fail(make_status(StatusDomain::Session, StatusCode::Overflow,
                                past > 0xffffffffull ? 0xffffffffu : static_cast<u32>(past)),
                    buf);
    }

    SCANPORT_LOG_INFO(tag(), "scan start");
    const auto started = std::chrono::steady_clock::now();
    scanport::net::ScanOutcome result{};
    const Status st = res_.invoker->invoke(config_, archive_.path, cancel_, &result);
    const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (st.code == StatusCode::Cancelled) {
        outcome_.detail = std::move(result.detail);
        SCANPORT_LOG_WARN(tag(), "scan cancelled after %lld ms", static_cast<long long>(took));
        return abandon(st);
    }

    outcome_ = std::move(result);
    if (!is_ok(st)) {
        outcome_.status = OutcomeStatus::Failure;
        if (outcome_.error == StatusCode::Ok) {
            outcome_.error = st.code;
        }
        if (outcome_.detail.empty()) {
            outcome_.detail = scanport::core::error_kind_name(st.code);
        }
    } else if (outcome_.status == OutcomeStatus::Pending) {
        SCANPORT_LOG_ERROR(tag(), "invoker returned Ok without a verdict");
        outcome_.status = OutcomeStatus::Failure;
        outcome_.error = StatusCode::ScanInvocation;
        outcome_.detail = "invoker returned no verdict";
    }

    if (outcome_.status == OutcomeStatus::Success) {
        enter(SessionState::Succeeded);
        SCANPORT_LOG_INFO(tag(), "scan succeeded in %lld ms", static_cast<long long>(took));
    } else {
        enter(SessionState::Failed);
        SCANPORT_LOG_WARN(tag(), "scan failed in %lld ms (exit %d, %s)", static_cast<long long>(took),
                          outcome_.exit_code,
                          outcome_.error == StatusCode::Ok ? "ScanFailure"
                                                           : scanport::core::error_kind_name(outcome_.error));
    }
    send_result();
    return is_ok(st) ? ok_status() : st;
}

Status Session::abandon(Status st) noexcept {
    outcome_.status = OutcomeStatus::Failure;
    outcome_.error = StatusCode::Cancelled;
    peer_gone_ = true;
    enter(SessionState::Failed);
    return st;
}

void Session::drain_input() noexcept {
    stream_.shutdown_write();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kDrainWindowMs);
    u8 buf[4096];
    u32 drained = 0;
    while (drained < kDrainMaxBytes) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        bool ready = false;
        if (!is_ok(stream_.wait_readable(static_cast<u32>(left > 0 ? left : 1), &ready)) || !ready) {
            break;
        }
        const ssize_t n = ::read(stream_.fd(), buf, sizeof(buf));
        if (n <= 0) {
            break;
        }
        drained += static_cast<u32>(n);
    }
}

void Session::teardown() noexcept {
    if (torn_down_) {
        return;
    }
    torn_down_ = true;

    if (id_.is_valid() && res_.scratch != nullptr && !dir_.empty()) {
        const Status st = res_.scratch->remove_session_dir(id_);
        if (is_ok(st)) {
            ++scratch_removals_;
        } else {
            SCANPORT_LOG_WARN(tag(), "cannot remove %s: %s", dir_.c_str(), scanport::core::status_code_name(st.code));
        }
    }

    scanport::security::wipe_config(&config_);

    if (response_ == Response::Error && stream_.is_open()) {
        drain_input();
    }
    stream_.close();

    if (state_ != SessionState::Closed) {
        enter(SessionState::Closed);
    }
    SCANPORT_LOG_DEBUG(tag(), "session closed");
}

} // namespace scanport::session
