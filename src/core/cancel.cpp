#include "scanport/core/cancel.hpp"

#include <cerrno>
#include <poll.h>

namespace scanport::core {

short CancelToken::hangup_events() noexcept {
    return POLLRDHUP;
}

bool CancelToken::is_hangup(short revents) noexcept {
    return (revents & (POLLRDHUP | POLLHUP | POLLERR | POLLNVAL)) != 0;
}

bool CancelToken::cancelled() const noexcept {
    if (stop_requested()) {
        return true;
    }
    if (watch_fd_ < 0) {
        return false;
    }

    struct pollfd pfd{};
    pfd.fd = watch_fd_;
    pfd.events = hangup_events();
    int rc = 0;
    do {
        rc = poll(&pfd, 1, 0);
    } while (rc < 0 && errno == EINTR);

    return rc > 0 && is_hangup(pfd.revents);
}

} // namespace scanport::core
