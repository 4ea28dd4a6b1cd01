#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"

namespace scanport::scan {
    using u32 = scanport::core::u32;
    using Status = scanport::core::Status;

    inline constexpr const char* kAgentDownloadUrl =
        "https://github.com/whitesource/unified-agent-distribution/releases/latest/download/wss-unified-agent.jar";

    // Global libcurl setup; call once before any worker thread starts.
    // Unavailable if libcurl cannot initialize.
    [[nodiscard]] Status fetch_init() noexcept;

    // Downloads url into dest. The body is written to a temp file beside dest
    // and renamed over it only after a complete transfer, so readers (and
    // hard links) see either the old file or the new one. Network on a
    // transport or HTTP failure (aux = HTTP status when there was one, else
    // the curl code), Io on local file errors (aux = errno).
    [[nodiscard]] Status fetch_to_file(const std::string& url,
                                       const std::string& dest,
                                       u32 timeout_ms,
                                       std::string* detail) noexcept;

    struct AgentSource {
        std::string url{kAgentDownloadUrl};
        std::string jar_path;
        u32 max_age_s{24 * 60 * 60};
        u32 timeout_ms{10 * 60 * 1000};
    };

    // Keeps the unified agent jar on disk and fresh. Downloads are
    // serialised: concurrent callers wait for the one in flight and then see
    // its result on disk.
    class AgentUpdater {
    public:
        explicit AgentUpdater(AgentSource src);
        ~AgentUpdater();

        AgentUpdater(const AgentUpdater&) = delete;
        AgentUpdater& operator=(const AgentUpdater&) = delete;

        // Blocks on a download when the jar is missing. Ok if it exists.
        [[nodiscard]] Status ensure_present() noexcept;

        // Jar exists and its mtime is older than max_age_s.
        [[nodiscard]] bool is_stale() const noexcept;

        // Downloads unconditionally.
        [[nodiscard]] Status refresh() noexcept;

        // Starts a refresh on a worker thread when the jar is stale and no
        // refresh is running. Returns whether one was started.
        bool refresh_in_background() noexcept;

        // Joins a background refresh, if any.
        void wait() noexcept;

        [[nodiscard]] const AgentSource& source() const noexcept { return src_; }
        [[nodiscard]] u32 downloads() const noexcept { return downloads_.load(); }

    private:
        [[nodiscard]] Status download_locked() noexcept;

        AgentSource src_;
        std::mutex fetch_mutex_;
        std::mutex worker_mutex_;
        std::thread worker_;
        std::atomic<bool> busy_{false};
        std::atomic<u32> downloads_{0};
    };

} // namespace scanport::scan
