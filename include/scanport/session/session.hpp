#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"
#include "scanport/net/protocol.hpp"
#include "scanport/net/stream.hpp"
#include "scanport/scan/invoker.hpp"
#include "scanport/scan/slots.hpp"
#include "scanport/session/segment_decoder.hpp"
#include "scanport/storage/scratch.hpp"

namespace scanport::session {
    using StatusCode = scanport::core::StatusCode;

    enum class SessionState : u8 {
        AwaitingMetadata = 0,
        AwaitingConfig,
        ReceivingArchive,
        Scanning,
        Succeeded,
        Failed,
        Closed,
    };

    [[nodiscard]] const char* state_name(SessionState s) noexcept;

    // Which outbound frame, if any, the session wrote.
    enum class Response : u8 {
        None = 0,
        Error,
        Result,
    };

    // Process-wide collaborators handed to every session. None are owned.
    struct SessionResources {
        scanport::storage::ScratchArea* scratch{nullptr};
        scanport::scan::InvocationSlots* slots{nullptr};
        scanport::scan::ScanInvoker* invoker{nullptr};
        DecoderOptions decoder{};
        const std::atomic<bool>* stop{nullptr};
    };

    // One upload, end to end, on one connection. run() drives the state
    // machine to Closed; teardown releases scratch, credentials and the fd and
    // runs at most once (the destructor calls it too).
    class Session {
    public:
        Session(scanport::net::FdStream stream, const SessionResources& res) noexcept;
        ~Session() noexcept;

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        // Returns the status that ended the session: Ok when a scan verdict
        // (success or engine failure) was reached.
        [[nodiscard]] Status run() noexcept;

        void teardown() noexcept;

        [[nodiscard]] SessionState state() const noexcept { return state_; }
        [[nodiscard]] const std::vector<SessionState>& transitions() const noexcept { return transitions_; }
        [[nodiscard]] const scanport::core::SessionId& id() const noexcept { return id_; }

        [[nodiscard]] const scanport::net::TransferMetadata& metadata() const noexcept { return meta_; }
        [[nodiscard]] u64 bytes_received() const noexcept { return received_; }
        [[nodiscard]] const std::string& archive_path() const noexcept { return archive_.path; }
        [[nodiscard]] const scanport::core::Hash256& archive_digest() const noexcept { return archive_.digest; }
        [[nodiscard]] const std::string& scratch_dir() const noexcept { return dir_; }

        [[nodiscard]] const scanport::net::ScanOutcome& outcome() const noexcept { return outcome_; }
        [[nodiscard]] StatusCode error() const noexcept { return outcome_.error; }
        [[nodiscard]] Response response() const noexcept { return response_; }
        [[nodiscard]] bool peer_gone() const noexcept { return peer_gone_; }

        // How many times the scratch directory was actually deleted (0 or 1).
        [[nodiscard]] u32 scratch_removals() const noexcept { return scratch_removals_; }

    private:
        void enter(SessionState next) noexcept;
        [[nodiscard]] const char* tag() const noexcept;

        Status receive_archive(SegmentDecoder& decoder) noexcept;
        Status scan() noexcept;

        // Ends the session before Scanning: Failed, then an Error frame
        // unless the peer is gone.
        Status fail(Status st, const std::string& detail) noexcept;
        // Scan abandoned because the peer left or the server is stopping.
        Status abandon(Status st) noexcept;
        void send_result() noexcept;
        void drain_input() noexcept;

        scanport::net::FdStream stream_;
        SessionResources res_;
        scanport::core::CancelToken cancel_;

        SessionState state_{SessionState::AwaitingMetadata};
        std::vector<SessionState> transitions_;
        scanport::core::SessionId id_{};
        std::string tag_;

        scanport::net::TransferMetadata meta_{};
        scanport::net::ScanConfig config_{};
        u64 received_{0};
        std::string dir_;
        scanport::storage::ArchiveInfo archive_{};

        scanport::net::ScanOutcome outcome_{};
        Response response_{Response::None};
        bool peer_gone_{false};
        bool torn_down_{false};
        u32 scratch_removals_{0};
    };

} // namespace scanport::session
