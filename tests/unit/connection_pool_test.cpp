#include "upstream/connection_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <utility>
#include <vector>

using namespace vrm::upstream;
using namespace std::chrono_literals;

// No requests are sent here; only lease bookkeeping is exercised

TEST(ConnectionPoolTest, StartsWithAllClientsIdle) {
    ConnectionPool pool("http://127.0.0.1:1", 3, 1000ms);

    EXPECT_EQ(pool.size(), 3u);
    EXPECT_EQ(pool.idle_count(), 3u);
    EXPECT_EQ(pool.origin(), "http://127.0.0.1:1");
}

TEST(ConnectionPoolTest, LeaseReturnsClientOnDestruction) {
    ConnectionPool pool("http://127.0.0.1:1", 2, 1000ms);
    {
        auto lease = pool.acquire(10ms);
        ASSERT_TRUE(lease.has_value());
        EXPECT_EQ(pool.idle_count(), 1u);
    }
    EXPECT_EQ(pool.idle_count(), 2u);
}

TEST(ConnectionPoolTest, ExhaustedPoolTimesOut) {
    ConnectionPool pool("http://127.0.0.1:1", 1, 1000ms);
    auto held = pool.acquire(10ms);
    ASSERT_TRUE(held.has_value());

    auto start = std::chrono::steady_clock::now();
    auto second = pool.acquire(50ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(second.has_value());
    EXPECT_GE(elapsed, 40ms);
}

TEST(ConnectionPoolTest, WaiterGetsReleasedClient) {
    ConnectionPool pool("http://127.0.0.1:1", 1, 1000ms);
    auto held = pool.acquire(10ms);
    ASSERT_TRUE(held.has_value());

    std::thread releaser([&held]() {
        std::this_thread::sleep_for(20ms);
        held.reset();
    });

    auto next = pool.acquire(2000ms);
    releaser.join();

    EXPECT_TRUE(next.has_value());
    EXPECT_EQ(pool.idle_count(), 0u);
}

TEST(ConnectionPoolTest, MovedLeaseReleasesOnce) {
    ConnectionPool pool("http://127.0.0.1:1", 2, 1000ms);
    {
        auto lease = pool.acquire(10ms);
        ASSERT_TRUE(lease.has_value());
        ConnectionPool::Lease moved(std::move(*lease));
        lease.reset();
        EXPECT_EQ(pool.idle_count(), 1u);
    }
    EXPECT_EQ(pool.idle_count(), 2u);
}

TEST(ConnectionPoolTest, ConcurrentLeasesNeverExceedSize) {
    ConnectionPool pool("http://127.0.0.1:1", 2, 1000ms);
    std::atomic<int> in_use{0};
    std::atomic<int> max_in_use{0};
    std::atomic<int> acquired{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 20; ++i) {
                auto lease = pool.acquire(2000ms);
                if (!lease) {
                    continue;
                }
                acquired.fetch_add(1);
                int now = in_use.fetch_add(1) + 1;
                int prev = max_in_use.load();
                while (now > prev && !max_in_use.compare_exchange_weak(prev, now)) {
                }
                std::this_thread::sleep_for(100us);
                in_use.fetch_sub(1);
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(acquired.load(), 160);
    EXPECT_LE(max_in_use.load(), 2);
    EXPECT_EQ(pool.idle_count(), 2u);
}
