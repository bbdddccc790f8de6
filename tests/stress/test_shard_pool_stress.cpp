/**
 * @file test_shard_pool_stress.cpp
 * @brief High-load stability tests for ShardPool and its handles
 *
 * Test scenarios:
 * 1. Concurrent exclusive leases (exclusivity + accounting)
 * 2. Capacity invariant under churn with fallback items and detaches
 * 3. Shared leases cloned across threads (exactly-once return)
 * 4. Unfreeze while the same thread holds a random number of clones
 * 5. Unfreeze retried while another thread releases the last clone
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <thread>
#include <vector>

#include <shardpool/shard_pool.hpp>

namespace {

#if defined(SHARDPOOL_CI_LIGHTWEIGHT_TESTS) || SHARDPOOL_ENABLE_SANITIZERS
constexpr std::size_t kOpsPerThread = 5000;
#else
constexpr std::size_t kOpsPerThread = 50000;
#endif

// Tracked object for leak and exclusivity detection
struct TrackedItem {
    inline static std::atomic<std::size_t> created{0};
    inline static std::atomic<std::size_t> destroyed{0};

    std::atomic<int> exclusive_owners{0};
    std::uint64_t payload[8];  // 64 bytes payload

    TrackedItem() {
        created.fetch_add(1, std::memory_order_relaxed);
        for (auto& p : payload) {
            p = 0;
        }
    }

    ~TrackedItem() { destroyed.fetch_add(1, std::memory_order_relaxed); }

    static void reset() {
        created.store(0, std::memory_order_relaxed);
        destroyed.store(0, std::memory_order_relaxed);
    }

    static void print_stats(const char* label) {
        std::cout << "[" << label << "] created=" << created.load()
                  << " destroyed=" << destroyed.load() << std::endl;
    }
};

// Barrier for synchronized thread start
class SpinBarrier {
   public:
    explicit SpinBarrier(std::size_t count) : count_(count) {}

    void arrive_and_wait() {
        arrived_.fetch_add(1, std::memory_order_acq_rel);
        while (arrived_.load(std::memory_order_acquire) < count_) {
            std::this_thread::yield();
        }
    }

   private:
    std::size_t count_;
    std::atomic<std::size_t> arrived_{0};
};

std::size_t StressThreadCount() {
    const std::size_t hc = std::max<std::size_t>(2u, std::thread::hardware_concurrency());
    return std::min<std::size_t>(16u, hc);
}

// Marks the item as exclusively held; returns false if someone else already holds it.
bool Enter(TrackedItem& item) {
    return item.exclusive_owners.fetch_add(1, std::memory_order_acq_rel) == 0;
}

void Leave(TrackedItem& item) { item.exclusive_owners.fetch_sub(1, std::memory_order_acq_rel); }

void PrintPoolStats(const char* label, const shardpool::PoolStats& s) {
    std::cout << "[" << label << "] pulls=" << s.pulls << " hits=" << s.pull_hits()
              << " fallbacks=" << s.fallback_creates << " returns=" << s.returns
              << " discarded=" << s.returns_discarded << " detached=" << s.detached
              << std::endl;
}

}  // namespace

// ============================================================================
// Test 1: Concurrent exclusive leases
// ============================================================================

TEST(ShardPoolStress, ExclusiveLeasesNeverAlias) {
    TrackedItem::reset();
    const std::size_t thread_count = StressThreadCount();
    std::atomic<std::size_t> violations{0};

    {
        shardpool::ShardPool<TrackedItem> pool(8, 16, [] { return new TrackedItem(); });
        SpinBarrier barrier(thread_count);

        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (std::size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back([&, t] {
                barrier.arrive_and_wait();
                for (std::size_t i = 0; i < kOpsPerThread; ++i) {
                    auto h = (i % 3 == 0) ? pool.PullWithFallback() : pool.TryPullAnyShard();
                    if (!h) {
                        continue;
                    }
                    if (!Enter(*h)) {
                        violations.fetch_add(1, std::memory_order_relaxed);
                    }
                    h->payload[0] = t;
                    h->payload[7] = i;
                    if (h->payload[0] != t || h->payload[7] != i) {
                        violations.fetch_add(1, std::memory_order_relaxed);
                    }
                    Leave(*h);
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }

        const shardpool::PoolStats stats = pool.Stats();
        PrintPoolStats("ExclusiveLeases", stats);
        EXPECT_LE(pool.SizeApprox(), 8u * 16u);
        // Everything built is either cached or was shed on return.
        EXPECT_EQ(TrackedItem::created.load(), pool.SizeApprox() + TrackedItem::destroyed.load());
        EXPECT_EQ(TrackedItem::destroyed.load(), stats.returns_discarded);
    }

    TrackedItem::print_stats("ExclusiveLeases");
    EXPECT_EQ(violations.load(), 0u);
    EXPECT_EQ(TrackedItem::created.load(), TrackedItem::destroyed.load());
}

// ============================================================================
// Test 2: Capacity invariant under churn
// ============================================================================

TEST(ShardPoolStress, ShardsNeverExceedCapacity) {
    TrackedItem::reset();
    constexpr std::size_t kShards = 4;
    constexpr std::size_t kCapacity = 4;
    const std::size_t thread_count = StressThreadCount();

    shardpool::ShardPool<TrackedItem> pool(kShards, kCapacity, [] { return new TrackedItem(); });
    std::atomic<bool> stop{false};
    std::atomic<std::size_t> over_capacity{0};
    std::atomic<std::size_t> detached_destroyed{0};

    std::thread watcher([&] {
        while (!stop.load(std::memory_order_acquire)) {
            for (std::size_t s = 0; s < kShards; ++s) {
                if (pool.ShardSize(s) > kCapacity) {
                    over_capacity.fetch_add(1, std::memory_order_relaxed);
                }
            }
            std::this_thread::yield();
        }
    });

    SpinBarrier barrier(thread_count);
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (std::size_t t = 0; t < thread_count; ++t) {
        threads.emplace_back([&, t] {
            std::mt19937 rng(static_cast<unsigned>(t));
            std::uniform_int_distribution<int> dist(0, 99);
            std::vector<shardpool::Pooled<TrackedItem>> held;

            barrier.arrive_and_wait();
            for (std::size_t i = 0; i < kOpsPerThread; ++i) {
                const int roll = dist(rng);
                if (roll < 40) {
                    // Over-allocate so that returns regularly find full shards.
                    held.push_back(pool.PullWithFallback());
                } else if (roll < 70) {
                    if (auto h = pool.TryPull()) {
                        held.push_back(std::move(h));
                    }
                } else if (roll < 72 && !held.empty()) {
                    std::unique_ptr<TrackedItem> owned = held.back().Detach();
                    held.pop_back();
                    owned.reset();
                    detached_destroyed.fetch_add(1, std::memory_order_relaxed);
                } else if (!held.empty()) {
                    held.pop_back();
                }
                if (held.size() > 8) {
                    held.clear();
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    stop.store(true, std::memory_order_release);
    watcher.join();

    const shardpool::PoolStats stats = pool.Stats();
    PrintPoolStats("Capacity", stats);
    EXPECT_EQ(over_capacity.load(), 0u);
    for (std::size_t s = 0; s < kShards; ++s) {
        EXPECT_LE(pool.ShardSize(s), kCapacity);
    }
    EXPECT_EQ(stats.detached, detached_destroyed.load());
    EXPECT_EQ(TrackedItem::created.load(), pool.SizeApprox() + TrackedItem::destroyed.load());
    EXPECT_EQ(TrackedItem::destroyed.load(), stats.returns_discarded + stats.detached);
}

// ============================================================================
// Test 3: Shared leases cloned across threads
// ============================================================================

TEST(ShardPoolStress, SharedLeasesReturnExactlyOnce) {
    TrackedItem::reset();
    const std::size_t thread_count = StressThreadCount();
#if defined(SHARDPOOL_CI_LIGHTWEIGHT_TESTS) || SHARDPOOL_ENABLE_SANITIZERS
    constexpr std::size_t kRounds = 200;
#else
    constexpr std::size_t kRounds = 2000;
#endif

    {
        // Capacity equals the number of items, so a double return would be visible as a size
        // above the number of items ever built, or as a duplicate lease.
        shardpool::ShardPool<TrackedItem> pool(2, 2, [] { return new TrackedItem(); });

        for (std::size_t round = 0; round < kRounds; ++round) {
            auto h = pool.TryPullAnyShard();
            ASSERT_TRUE(h) << "round " << round;
            h->payload[1] = round;
            auto shared = h.Freeze();

            SpinBarrier barrier(thread_count);
            std::vector<std::thread> threads;
            threads.reserve(thread_count);
            for (std::size_t t = 0; t < thread_count; ++t) {
                threads.emplace_back([&barrier, owner = shared.Clone(), round]() mutable {
                    barrier.arrive_and_wait();
                    // Clone chains: every thread makes and drops extra owners.
                    for (int k = 0; k < 4; ++k) {
                        auto extra = owner.Clone();
                        if (extra->payload[1] != round) {
                            ADD_FAILURE() << "stale payload";
                        }
                    }
                    owner.Reset();
                });
            }
            shared.Reset();
            for (auto& th : threads) {
                th.join();
            }
            ASSERT_EQ(pool.SizeApprox(), 4u) << "round " << round;
        }

        const shardpool::PoolStats stats = pool.Stats();
        PrintPoolStats("SharedLeases", stats);
        EXPECT_EQ(stats.returns, kRounds);
        EXPECT_EQ(stats.returns_discarded, 0u);
        EXPECT_EQ(TrackedItem::created.load(), 4u);
        EXPECT_EQ(TrackedItem::destroyed.load(), 0u);
    }
    EXPECT_EQ(TrackedItem::destroyed.load(), 4u);
}

// ============================================================================
// Test 4: Unfreeze while the same thread holds clones
// ============================================================================

TEST(ShardPoolStress, UnfreezeOnlySucceedsForSoleOwner) {
    TrackedItem::reset();
    const std::size_t thread_count = StressThreadCount();
    std::atomic<std::size_t> violations{0};
    std::atomic<std::size_t> unfreezes{0};

    {
        shardpool::ShardPool<TrackedItem> pool(4, 8, [] { return new TrackedItem(); });
        SpinBarrier barrier(thread_count);

        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (std::size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back([&, t] {
                std::mt19937 rng(static_cast<unsigned>(t + 17));
                std::uniform_int_distribution<int> dist(0, 3);

                barrier.arrive_and_wait();
                for (std::size_t i = 0; i < kOpsPerThread / 10; ++i) {
                    auto shared = pool.PullWithFallback().Freeze();
                    std::vector<shardpool::SharedPooled<TrackedItem>> clones;
                    const int extra = dist(rng);
                    for (int k = 0; k < extra; ++k) {
                        clones.push_back(shared.Clone());
                    }

                    std::optional<shardpool::Pooled<TrackedItem>> back = shared.TryUnfreeze();
                    if (extra > 0 && back.has_value()) {
                        violations.fetch_add(1, std::memory_order_relaxed);
                    }
                    if (extra == 0) {
                        if (!back.has_value()) {
                            violations.fetch_add(1, std::memory_order_relaxed);
                            continue;
                        }
                        unfreezes.fetch_add(1, std::memory_order_relaxed);
                        if (!Enter(**back)) {
                            violations.fetch_add(1, std::memory_order_relaxed);
                        }
                        (*back)->payload[2] = i;
                        Leave(**back);
                    }
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }

        const shardpool::PoolStats stats = pool.Stats();
        PrintPoolStats("Unfreeze", stats);
        EXPECT_GT(unfreezes.load(), 0u);
        EXPECT_EQ(TrackedItem::created.load(), pool.SizeApprox() + TrackedItem::destroyed.load());
    }
    EXPECT_EQ(violations.load(), 0u);
    EXPECT_EQ(TrackedItem::created.load(), TrackedItem::destroyed.load());
}

// ============================================================================
// Test 5: Unfreeze retried while another thread releases the last clone
// ============================================================================

TEST(ShardPoolStress, UnfreezeWaitsForCloneReleasedElsewhere) {
    TrackedItem::reset();
    const std::size_t pair_count = std::max<std::size_t>(1u, StressThreadCount() / 2);
    const std::size_t rounds = kOpsPerThread / 10;
    std::atomic<std::size_t> violations{0};
    std::atomic<std::size_t> failed_attempts{0};

    struct Mailbox {
        std::mutex mu;
        std::optional<shardpool::SharedPooled<TrackedItem>> clone;
        std::atomic<bool> done{false};
    };

    {
        shardpool::ShardPool<TrackedItem> pool(4, 4, [] { return new TrackedItem(); });
        std::vector<Mailbox> mailboxes(pair_count);
        SpinBarrier barrier(pair_count * 2);

        std::vector<std::thread> threads;
        threads.reserve(pair_count * 2);
        for (std::size_t p = 0; p < pair_count; ++p) {
            // Releaser: takes each clone, reads through it, then drops it.
            threads.emplace_back([&, p] {
                Mailbox& box = mailboxes[p];
                barrier.arrive_and_wait();
                for (;;) {
                    std::optional<shardpool::SharedPooled<TrackedItem>> taken;
                    {
                        std::lock_guard<std::mutex> lock(box.mu);
                        taken.swap(box.clone);
                    }
                    if (taken.has_value()) {
                        if ((*taken)->exclusive_owners.load(std::memory_order_acquire) != 0) {
                            violations.fetch_add(1, std::memory_order_relaxed);
                        }
                        std::this_thread::yield();
                        taken.reset();
                        continue;
                    }
                    if (box.done.load(std::memory_order_acquire)) {
                        std::lock_guard<std::mutex> lock(box.mu);
                        if (!box.clone.has_value()) {
                            return;
                        }
                        continue;
                    }
                    std::this_thread::yield();
                }
            });

            // Owner: freezes, hands out one clone, and spins on TryUnfreeze until it is sole owner.
            threads.emplace_back([&, p] {
                Mailbox& box = mailboxes[p];
                barrier.arrive_and_wait();
                for (std::size_t i = 0; i < rounds; ++i) {
                    auto lease = pool.PullWithFallback();
                    const std::uint64_t stamp = (static_cast<std::uint64_t>(p) << 32) | i;
                    lease->payload[3] = stamp;
                    auto shared = lease.Freeze();
                    {
                        std::lock_guard<std::mutex> lock(box.mu);
                        box.clone = shared.Clone();
                    }

                    std::optional<shardpool::Pooled<TrackedItem>> back;
                    while (!(back = shared.TryUnfreeze()).has_value()) {
                        if (!shared) {
                            violations.fetch_add(1, std::memory_order_relaxed);
                            break;
                        }
                        failed_attempts.fetch_add(1, std::memory_order_relaxed);
                        std::this_thread::yield();
                    }
                    if (!back.has_value()) {
                        continue;
                    }
                    if (shared || !Enter(**back)) {
                        violations.fetch_add(1, std::memory_order_relaxed);
                        continue;
                    }
                    if ((*back)->payload[3] != stamp) {
                        violations.fetch_add(1, std::memory_order_relaxed);
                    }
                    Leave(**back);
                }
                box.done.store(true, std::memory_order_release);
            });
        }
        for (auto& th : threads) {
            th.join();
        }

        const shardpool::PoolStats stats = pool.Stats();
        PrintPoolStats("UnfreezeElsewhere", stats);
        std::cout << "[UnfreezeElsewhere] failed TryUnfreeze attempts=" << failed_attempts.load()
                  << std::endl;
        EXPECT_EQ(TrackedItem::created.load(), pool.SizeApprox() + TrackedItem::destroyed.load());
    }
    EXPECT_EQ(violations.load(), 0u);
    EXPECT_EQ(TrackedItem::created.load(), TrackedItem::destroyed.load());
}
