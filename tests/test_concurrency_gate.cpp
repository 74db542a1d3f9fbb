/// @file test_concurrency_gate.cpp
/// Unit tests for ConcurrencyGate.hpp: admission permits.

#include "ConcurrencyGate.hpp"
#include "Errors.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace resilient_http;
using std::chrono::milliseconds;

// ============================================================================
// Counting
// ============================================================================

TEST(ConcurrencyGate, LimitIsClampedToOne) {
    auto gate = ConcurrencyGate::create(0);
    EXPECT_EQ(gate->limit(), 1u);
}

TEST(ConcurrencyGate, AcquireAndRelease) {
    auto gate = ConcurrencyGate::create(2);
    auto a = gate->acquire();
    auto b = gate->acquire();
    EXPECT_EQ(gate->available(), 0u);
    EXPECT_EQ(gate->inUse(), 2u);
    EXPECT_FALSE(gate->tryAcquire().has_value());

    EXPECT_TRUE(a.release());
    EXPECT_EQ(gate->available(), 1u);
    EXPECT_TRUE(gate->release(b));
    EXPECT_EQ(gate->available(), 2u);
}

TEST(ConcurrencyGate, ReleaseIsIdempotent) {
    auto gate = ConcurrencyGate::create(1);
    auto permit = gate->acquire();
    EXPECT_TRUE(permit.release());
    EXPECT_FALSE(permit.release());
    EXPECT_FALSE(gate->release(permit));
    EXPECT_EQ(gate->available(), 1u);
}

TEST(ConcurrencyGate, PermitFromOtherGateIsRejected) {
    auto first = ConcurrencyGate::create(1);
    auto second = ConcurrencyGate::create(1);
    auto permit = first->acquire();
    EXPECT_FALSE(second->release(permit));
    EXPECT_TRUE(permit.held());
    EXPECT_EQ(first->available(), 0u);
    EXPECT_EQ(second->available(), 1u);
}

TEST(ConcurrencyGate, DestructorReleases) {
    auto gate = ConcurrencyGate::create(1);
    {
        auto permit = gate->acquire();
        EXPECT_EQ(gate->available(), 0u);
    }
    EXPECT_EQ(gate->available(), 1u);
}

TEST(ConcurrencyGate, MovedFromPermitHoldsNothing) {
    auto gate = ConcurrencyGate::create(1);
    auto permit = gate->acquire();
    ConcurrencyGate::Permit moved(std::move(permit));
    EXPECT_FALSE(permit.held());
    EXPECT_FALSE(permit.release());
    EXPECT_EQ(gate->available(), 0u);
    EXPECT_TRUE(moved.release());
    EXPECT_EQ(gate->available(), 1u);
}

// ============================================================================
// Waiting
// ============================================================================

TEST(ConcurrencyGate, TryAcquireForTimesOut) {
    auto gate = ConcurrencyGate::create(1);
    auto held = gate->acquire();
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(gate->tryAcquireFor(milliseconds(50)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, milliseconds(45));
}

TEST(ConcurrencyGate, WaiterWakesOnRelease) {
    auto gate = ConcurrencyGate::create(1);
    auto held = gate->acquire();

    std::atomic<bool> acquired{false};
    std::thread waiter([&]() {
        auto permit = gate->acquire();
        acquired = true;
    });

    std::this_thread::sleep_for(milliseconds(50));
    EXPECT_FALSE(acquired.load());
    held.release();
    waiter.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(gate->available(), 1u);
}

TEST(ConcurrencyGate, NeverExceedsLimit) {
    auto gate = ConcurrencyGate::create(3);
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&]() {
            auto permit = gate->acquire();
            int now = ++inside;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(milliseconds(10));
            --inside;
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_LE(peak.load(), 3);
    EXPECT_EQ(gate->available(), 3u);
}

TEST(ConcurrencyGate, CloseWakesWaitersWithError) {
    auto gate = ConcurrencyGate::create(1);
    auto held = gate->acquire();

    std::atomic<bool> threw{false};
    std::thread waiter([&]() {
        try {
            gate->acquire();
        } catch (const InternalError&) {
            threw = true;
        }
    });

    std::this_thread::sleep_for(milliseconds(20));
    gate->close();
    waiter.join();
    EXPECT_TRUE(threw.load());
    EXPECT_TRUE(gate->closed());
    EXPECT_FALSE(gate->tryAcquire().has_value());
}
