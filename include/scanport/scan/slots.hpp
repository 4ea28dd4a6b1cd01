#pragma once

#include <condition_variable>
#include <mutex>

#include "scanport/core/cancel.hpp"
#include "scanport/core/errors.hpp"
#include "scanport/core/types.hpp"

namespace scanport::scan {
    using u32 = scanport::core::u32;
    using Status = scanport::core::Status;

    // Bounded pool of concurrent engine runs. Sessions queue here while
    // staying cancellable.
    class InvocationSlots {
    public:
        explicit InvocationSlots(u32 capacity) noexcept : capacity_(capacity == 0 ? 1 : capacity) {}

        InvocationSlots(const InvocationSlots&) = delete;
        InvocationSlots& operator=(const InvocationSlots&) = delete;

        // Blocks until a slot frees up. Cancelled if cancel fires first.
        [[nodiscard]] Status acquire(const scanport::core::CancelToken& cancel) noexcept;
        [[nodiscard]] bool try_acquire() noexcept;
        void release() noexcept;

        // Wakes all waiters so they re-check their cancel tokens.
        void notify_all() noexcept;

        [[nodiscard]] u32 capacity() const noexcept { return capacity_; }
        [[nodiscard]] u32 in_use() const noexcept;

    private:
        const u32 capacity_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        u32 in_use_{0};
    };

    // Releases an acquired slot on scope exit.
    class SlotLease {
    public:
        SlotLease() noexcept = default;
        explicit SlotLease(InvocationSlots* slots) noexcept : slots_(slots) {}
        ~SlotLease() noexcept {
            if (slots_ != nullptr) {
                slots_->release();
            }
        }

        SlotLease(const SlotLease&) = delete;
        SlotLease& operator=(const SlotLease&) = delete;

    private:
        InvocationSlots* slots_{nullptr};
    };

} // namespace scanport::scan
