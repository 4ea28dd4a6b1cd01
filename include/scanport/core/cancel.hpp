#pragma once

#include <atomic>

namespace scanport::core {

    // Cancellation source for blocking waits: the peer hanging up on
    // watch_fd, or the server-wide stop flag. Cheap to copy; does not own
    // the fd.
    class CancelToken {
    public:
        CancelToken() noexcept = default;
        CancelToken(int watch_fd, const std::atomic<bool>* stop) noexcept
            : watch_fd_(watch_fd), stop_(stop) {}

        [[nodiscard]] int watch_fd() const noexcept { return watch_fd_; }

        [[nodiscard]] bool stop_requested() const noexcept {
            return stop_ != nullptr && stop_->load(std::memory_order_relaxed);
        }

        // Non-blocking. A half-closed peer (POLLRDHUP) counts as gone.
        [[nodiscard]] bool cancelled() const noexcept;

        // poll(2) events to register for watch_fd alongside other fds.
        [[nodiscard]] static short hangup_events() noexcept;
        [[nodiscard]] static bool is_hangup(short revents) noexcept;

    private:
        int watch_fd_{-1};
        const std::atomic<bool>* stop_{nullptr};
    };

} // namespace scanport::core
