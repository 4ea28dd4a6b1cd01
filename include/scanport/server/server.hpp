#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <unordered_map>

#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"
#include "scanport/session/session.hpp"

namespace scanport::server {
    using u16 = scanport::core::u16;
    using u32 = scanport::core::u32;
    using Status = scanport::core::Status;

    struct ServerConfig {
        std::string bind_address{"0.0.0.0"};
        u16 port{8000}; // 0 = pick an ephemeral port
        u32 accept_poll_ms{200};
    };

    // Listening socket plus one worker thread per accepted connection. Each
    // worker owns a Session built from the shared resources.
    class Server {
    public:
        Server(ServerConfig cfg, const scanport::session::SessionResources& res) noexcept;
        ~Server() noexcept;

        Server(const Server&) = delete;
        Server& operator=(const Server&) = delete;

        [[nodiscard]] Status listen() noexcept;

        // Bound port, valid after listen().
        [[nodiscard]] u16 port() const noexcept { return bound_port_; }

        // Accepts until request_stop(), then shuts down live connections and
        // waits for their workers.
        [[nodiscard]] Status serve() noexcept;

        // Async-signal-safe.
        void request_stop() noexcept { stop_.store(true, std::memory_order_relaxed); }
        [[nodiscard]] bool stop_requested() const noexcept { return stop_.load(std::memory_order_relaxed); }

        [[nodiscard]] u32 active_sessions() const noexcept;
        [[nodiscard]] u32 sessions_started() const noexcept { return started_.load(std::memory_order_relaxed); }

    private:
        void handle(scanport::core::u64 token, int fd) noexcept;
        void shutdown_active() noexcept;

        ServerConfig cfg_;
        scanport::session::SessionResources res_;
        int listen_fd_{-1};
        u16 bound_port_{0};
        std::atomic<bool> stop_{false};
        std::atomic<u32> started_{0};

        mutable std::mutex mutex_;
        std::condition_variable idle_cv_;
        // Connection number to a duplicate of its socket, used for shutdown.
        std::unordered_map<scanport::core::u64, int> active_;
        scanport::core::u64 next_token_{0};
    };

} // namespace scanport::server
