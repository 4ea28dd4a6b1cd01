#include <atomic>
#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "scanport/scan/slots.hpp"

using scanport::core::CancelToken;
using scanport::core::StatusCode;
using scanport::scan::InvocationSlots;
using scanport::scan::SlotLease;

TEST(ScanSlots, BoundedByCapacity) {
    InvocationSlots slots(2);
    EXPECT_EQ(slots.capacity(), 2u);
    EXPECT_TRUE(slots.try_acquire());
    EXPECT_TRUE(slots.try_acquire());
    EXPECT_FALSE(slots.try_acquire());
    EXPECT_EQ(slots.in_use(), 2u);
    slots.release();
    EXPECT_TRUE(slots.try_acquire());
}

TEST(ScanSlots, ZeroCapacityMeansOne) {
    InvocationSlots slots(0);
    EXPECT_EQ(slots.capacity(), 1u);
}

TEST(ScanSlots, LeaseReleasesOnScopeExit) {
    InvocationSlots slots(1);
    ASSERT_EQ(slots.acquire(CancelToken{}).code, StatusCode::Ok);
    {
        SlotLease lease(&slots);
        EXPECT_EQ(slots.in_use(), 1u);
    }
    EXPECT_EQ(slots.in_use(), 0u);
}

TEST(ScanSlots, WaiterProceedsAfterRelease) {
    InvocationSlots slots(1);
    ASSERT_TRUE(slots.try_acquire());

    std::atomic<bool> got{false};
    std::thread waiter([&] {
        if (slots.acquire(CancelToken{}).code == StatusCode::Ok) {
            got.store(true);
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(got.load());
    slots.release();
    waiter.join();
    EXPECT_TRUE(got.load());
    EXPECT_EQ(slots.in_use(), 1u);
}

TEST(ScanSlots, StopCancelsWaiter) {
    InvocationSlots slots(1);
    ASSERT_TRUE(slots.try_acquire());

    std::atomic<bool> stop{false};
    scanport::core::Status result{};
    std::thread waiter([&] { result = slots.acquire(CancelToken(-1, &stop)); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    stop.store(true);
    slots.notify_all();
    waiter.join();
    EXPECT_EQ(result.code, StatusCode::Cancelled);
    EXPECT_EQ(slots.in_use(), 1u);
}
