#include "scanport/server/server.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>

#include "scanport/core/log.hpp"

namespace scanport::server {

using scanport::core::StatusCode;
using scanport::core::StatusDomain;
using scanport::core::is_ok;
using scanport::core::make_status;
using scanport::core::ok_status;

Server::Server(ServerConfig cfg, const scanport::session::SessionResources& res) noexcept
    : cfg_(std::move(cfg)), res_(res) {
    // Sessions watch this server's flag; a caller-supplied flag is not used.
    res_.stop = &stop_;
}

Server::~Server() noexcept {
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

Status Server::listen() noexcept {
    if (listen_fd_ >= 0) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(cfg_.port);
    if (cfg_.bind_address.empty() || cfg_.bind_address == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, cfg_.bind_address.c_str(), &addr.sin_addr) != 1) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return make_status(StatusDomain::Net, StatusCode::Io, errno);
    }

    const int opt = 1;
    (void)setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        const int e = errno;
        ::close(fd);
        return make_status(StatusDomain::Net, e == EADDRINUSE ? StatusCode::Busy : StatusCode::Io, e);
    }
    if (::listen(fd, SOMAXCONN) < 0) {
        const int e = errno;
        ::close(fd);
        return make_status(StatusDomain::Net, StatusCode::Io, e);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = cfg_.port;
    }

    listen_fd_ = fd;
    SCANPORT_LOG_INFO(nullptr, "listening on %s:%u", cfg_.bind_address.c_str(), static_cast<unsigned>(bound_port_));
    return ok_status();
}

Status Server::serve() noexcept {
    if (listen_fd_ < 0) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }

    Status result = ok_status();
    while (!stop_requested()) {
        struct pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        const int rc = poll(&pfd, 1, static_cast<int>(cfg_.accept_poll_ms));
        if (rc < 0) {
            if (errno == EINTR) continue;
            result = make_status(StatusDomain::Net, StatusCode::Io, errno);
            break;
        }
        if (rc == 0) {
            continue;
        }

        sockaddr_in peer{};
        socklen_t peer_len = sizeof(peer);
        const int client = accept4(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) continue;
            if (errno == EMFILE || errno == ENFILE) {
                SCANPORT_LOG_WARN(nullptr, "accept: out of file descriptors");
                std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.accept_poll_ms));
                continue;
            }
            result = make_status(StatusDomain::Net, StatusCode::Io, errno);
            break;
        }

        char remote[INET_ADDRSTRLEN] = "unknown";
        (void)inet_ntop(AF_INET, &peer.sin_addr, remote, sizeof(remote));
        SCANPORT_LOG_DEBUG(nullptr, "connection from %s:%u", remote, static_cast<unsigned>(ntohs(peer.sin_port)));

        // The registry holds its own descriptor for the socket so shutdown
        // never hits a number the worker already closed and the kernel reused.
        const int control = fcntl(client, F_DUPFD_CLOEXEC, 0);
        if (control < 0) {
            SCANPORT_LOG_WARN(nullptr, "dup: %s, dropping connection", std::strerror(errno));
            ::close(client);
            continue;
        }
        scanport::core::u64 token = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            token = next_token_++;
            active_.emplace(token, control);
        }
        started_.fetch_add(1, std::memory_order_relaxed);

        try {
            std::thread(&Server::handle, this, token, client).detach();
        } catch (const std::system_error& e) {
            SCANPORT_LOG_ERROR(nullptr, "cannot start session worker: %s", e.what());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                active_.erase(token);
            }
            ::close(control);
            ::close(client);
        }
    }

    ::close(listen_fd_);
    listen_fd_ = -1;

    shutdown_active();
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return active_.empty(); });
    }
    SCANPORT_LOG_INFO(nullptr, "server stopped");
    return result;
}

void Server::handle(scanport::core::u64 token, int fd) noexcept {
    {
        scanport::session::Session session(scanport::net::FdStream(fd), res_);
        const Status st = session.run();
        if (!is_ok(st)) {
            SCANPORT_LOG_DEBUG(session.id().c_str(), "session ended with %s (%s)",
                               scanport::core::status_code_name(st.code),
                               scanport::core::status_domain_name(st.domain));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = active_.find(token);
    if (it != active_.end()) {
        ::close(it->second);
        active_.erase(it);
    }
    if (active_.empty()) {
        idle_cv_.notify_all();
    }
}

void Server::shutdown_active() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [token, fd] : active_) {
        (void)token;
        ::shutdown(fd, SHUT_RDWR);
    }
    if (res_.slots != nullptr) {
        res_.slots->notify_all();
    }
}

u32 Server::active_sessions() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<u32>(active_.size());
}

} // namespace scanport::server
