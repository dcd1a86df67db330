/**
 * @file test_execution_gate.cpp
 * @brief Admission order and cancellation of queued executions
 */

#include "sentrybox/core/execution_gate.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using sentrybox::core::ExecutionGate;
using namespace std::chrono_literals;

namespace {

// Spin until the gate reports @p n waiters
bool WaitForWaiting(const ExecutionGate& gate, std::size_t n) {
    for (int i = 0; i < 400; ++i) {
        if (gate.Waiting() == n) return true;
        std::this_thread::sleep_for(5ms);
    }
    return false;
}

} // namespace

TEST(ExecutionGateTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(ExecutionGate(0), std::invalid_argument);
}

TEST(ExecutionGateTest, PermitsAreReleasedOnDestruction) {
    ExecutionGate gate(2);
    {
        auto a = gate.Acquire();
        auto b = gate.Acquire();
        EXPECT_TRUE(a.Valid());
        EXPECT_TRUE(b.Valid());
        EXPECT_EQ(gate.InFlight(), 2u);
    }
    EXPECT_EQ(gate.InFlight(), 0u);
}

TEST(ExecutionGateTest, MovedPermitReleasesOnce) {
    ExecutionGate gate(1);
    auto a = gate.Acquire();
    ExecutionGate::Permit b = std::move(a);
    EXPECT_FALSE(a.Valid());
    EXPECT_TRUE(b.Valid());
    b.Release();
    b.Release();
    EXPECT_EQ(gate.InFlight(), 0u);
}

TEST(ExecutionGateTest, WaitersAreAdmittedInArrivalOrder) {
    ExecutionGate gate(1);
    auto held = gate.Acquire();

    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i] {
            auto permit = gate.Acquire();
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(i);
        });
        // Each thread takes its ticket before the next one starts
        ASSERT_TRUE(WaitForWaiting(gate, static_cast<std::size_t>(i + 1)));
    }

    held.Release();
    for (auto& t : threads) t.join();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST(ExecutionGateTest, CancelledWaiterLeavesQueue) {
    ExecutionGate gate(1);
    auto held = gate.Acquire();

    std::atomic<bool> cancelled{false};
    bool admitted = true;
    std::thread waiter([&] {
        auto permit = gate.Acquire(cancelled);
        admitted = permit.has_value();
    });
    ASSERT_TRUE(WaitForWaiting(gate, 1));

    cancelled = true;
    gate.Wake();
    waiter.join();

    EXPECT_FALSE(admitted);
    EXPECT_EQ(gate.Waiting(), 0u);

    // The abandoned ticket must not block later arrivals
    held.Release();
    auto next = gate.Acquire();
    EXPECT_TRUE(next.Valid());
}

TEST(ExecutionGateTest, NeverExceedsCapacity) {
    ExecutionGate gate(3);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&] {
            auto permit = gate.Acquire();
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(10ms);
            --running;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}
