#include "scanport/scan/slots.hpp"

#include <chrono>

namespace scanport::scan {

using scanport::core::StatusCode;
using scanport::core::StatusDomain;
using scanport::core::make_status;
using scanport::core::ok_status;

namespace {
    // Hangups on the watched socket do not signal the condvar, so waiters
    // re-check their token on this period.
    constexpr auto kRecheck = std::chrono::milliseconds(100);
} // namespace

Status InvocationSlots::acquire(const scanport::core::CancelToken& cancel) noexcept {
    std::unique_lock<std::mutex> lock(mutex_);
    while (in_use_ >= capacity_) {
        if (cancel.cancelled()) {
            return make_status(StatusDomain::Scan, StatusCode::Cancelled);
        }
        cv_.wait_for(lock, kRecheck);
    }
    if (cancel.cancelled()) {
        return make_status(StatusDomain::Scan, StatusCode::Cancelled);
    }
    ++in_use_;
    return ok_status();
}

bool InvocationSlots::try_acquire() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ >= capacity_) {
        return false;
    }
    ++in_use_;
    return true;
}

void InvocationSlots::release() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

void InvocationSlots::notify_all() noexcept {
    cv_.notify_all();
}

u32 InvocationSlots::in_use() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

} // namespace scanport::scan
