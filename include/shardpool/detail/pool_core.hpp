#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <shardpool/detail/likely.hpp>
#include <shardpool/detail/pool_shard.hpp>
#include <shardpool/errors.hpp>
#include <shardpool/pool_stats.hpp>

namespace shardpool::detail {

/**
 * @brief Shared, sharded storage behind ShardPool and its handles.
 *
 * The core is always owned through std::shared_ptr: the ShardPool facades and every live
 * Pooled/SharedPooled handle hold a reference, so the shards outlive all outstanding leases.
 *
 * Shard selection:
 * - Pulls start at `pull_counter_++ % N`; returns start at `return_counter_++ % N`. The counters
 *   are load-distribution hints only and are incremented with relaxed ordering.
 * - Probing is a bounded linear scan (at most N shards), so no operation waits for another
 *   thread to release an item. The only waits are the per-shard constant-time critical sections.
 *
 * Notes:
 * - Shard sizes never exceed `capacity_per_shard`. A return that finds every shard full
 *   destroys the item (capacity shedding).
 * - Statistics for the common path come from the two round-robin counters; the extra atomics
 *   are only touched on misses, fallbacks, discards and detaches.
 */
template <class T>
class PoolCore {
   public:
    using value_type = T;
    using pointer = T*;
    using Factory = std::function<pointer()>;

    /**
     * @brief Build `shard_count` shards and pre-fill each with `capacity_per_shard` items.
     *
     * @throws Whatever `factory` throws, or std::bad_alloc if it returns nullptr. Items built
     * before the failure are destroyed.
     */
    PoolCore(std::size_t shard_count, std::size_t capacity_per_shard, Factory factory)
        : factory_(std::move(factory)),
          capacity_per_shard_(capacity_per_shard),
          shards_(std::max<std::size_t>(1, shard_count)) {
        for (Shard& shard : shards_) {
            shard.capacity = capacity_per_shard_;
            shard.objects.reserve(capacity_per_shard_);
            for (std::size_t i = 0; i < capacity_per_shard_; ++i) {
                shard.objects.push_back(Create(factory_));
            }
            shard.approx_size.store(shard.objects.size(), std::memory_order_relaxed);
        }
    }

    PoolCore(const PoolCore&) = delete;
    PoolCore& operator=(const PoolCore&) = delete;
    PoolCore(PoolCore&&) = delete;
    PoolCore& operator=(PoolCore&&) = delete;

    ~PoolCore() = default;

    /** @brief Round-robin starting shard for the next pull. */
    std::size_t NextPullIndex() noexcept {
        return static_cast<std::size_t>(pull_counter_.fetch_add(1, std::memory_order_relaxed) %
                                        shards_.size());
    }

    /** @brief Pop from exactly one shard; nullptr on a miss. */
    std::unique_ptr<T> PopFrom(std::size_t shard_index) {
        std::unique_ptr<T> obj = shards_[shard_index].TryPop();
        if (SHARDPOOL_UNLIKELY(obj == nullptr)) {
            pull_misses_.fetch_add(1, std::memory_order_relaxed);
        }
        return obj;
    }

    /**
     * @brief Pop from the first non-empty shard, probing from `start` and wrapping.
     * @param start First shard to try.
     * @param shard_index Receives the shard that served the item (unchanged on a miss).
     */
    std::unique_ptr<T> PopProbing(std::size_t start, std::size_t& shard_index) {
        const std::size_t n = shards_.size();
        for (std::size_t step = 0; step < n; ++step) {
            const std::size_t index = (start + step) % n;
            if (std::unique_ptr<T> obj = shards_[index].TryPop()) {
                shard_index = index;
                return obj;
            }
        }
        pull_misses_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    /**
     * @brief Invoke `factory` for a fallback item.
     * @throws Whatever `factory` throws, or std::bad_alloc if it yields nullptr.
     */
    std::unique_ptr<T> CreateFallback(const Factory& factory) {
        std::unique_ptr<T> obj = Create(factory);
        fallback_creates_.fetch_add(1, std::memory_order_relaxed);
        return obj;
    }

    /**
     * @brief Hand a released item back to the shards.
     *
     * Starts at `return_counter_++ % N` and stores the item in the first shard below capacity.
     * When every shard is full the item is destroyed here and counted in `returns_discarded`.
     */
    void ReturnItem(std::unique_ptr<T> obj) noexcept {
        if (obj == nullptr) {
            return;
        }
        const std::size_t n = shards_.size();
        const std::size_t start =
            static_cast<std::size_t>(return_counter_.fetch_add(1, std::memory_order_relaxed) % n);
        for (std::size_t step = 0; step < n; ++step) {
            if (SHARDPOOL_LIKELY(shards_[(start + step) % n].TryPush(obj))) {
                return;
            }
        }
        returns_discarded_.fetch_add(1, std::memory_order_relaxed);
    }

    void NoteDetached() noexcept { detached_.fetch_add(1, std::memory_order_relaxed); }

    void Clear() {
        for (Shard& shard : shards_) {
            shard.Clear();
        }
    }

    std::size_t SizeApprox() const noexcept {
        std::size_t total = 0;
        for (const Shard& shard : shards_) {
            total += shard.approx_size.load(std::memory_order_relaxed);
        }
        return total;
    }

    std::size_t ShardSize(std::size_t shard_index) const {
        if (shard_index >= shards_.size()) {
            throw std::out_of_range("shardpool: shard index out of range");
        }
        return shards_[shard_index].Size();
    }

    PoolStats Stats() const noexcept {
        PoolStats stats;
        stats.pulls = pull_counter_.load(std::memory_order_relaxed);
        stats.pull_misses = pull_misses_.load(std::memory_order_relaxed);
        stats.fallback_creates = fallback_creates_.load(std::memory_order_relaxed);
        stats.returns = return_counter_.load(std::memory_order_relaxed);
        stats.returns_discarded = returns_discarded_.load(std::memory_order_relaxed);
        stats.detached = detached_.load(std::memory_order_relaxed);
        return stats;
    }

    std::size_t ShardCount() const noexcept { return shards_.size(); }
    std::size_t CapacityPerShard() const noexcept { return capacity_per_shard_; }
    const Factory& GetFactory() const noexcept { return factory_; }

   private:
    using Shard = PoolShard<T>;

    static std::unique_ptr<T> Create(const Factory& factory) {
        std::unique_ptr<T> obj(factory ? factory() : nullptr);
        if (obj == nullptr) {
            ThrowFactoryReturnedNull();
        }
        return obj;
    }

    Factory factory_;
    std::size_t capacity_per_shard_;
    std::vector<Shard> shards_;

    std::atomic<std::uint64_t> pull_counter_{0};
    std::atomic<std::uint64_t> return_counter_{0};
    std::atomic<std::uint64_t> pull_misses_{0};
    std::atomic<std::uint64_t> fallback_creates_{0};
    std::atomic<std::uint64_t> returns_discarded_{0};
    std::atomic<std::uint64_t> detached_{0};
};

}  // namespace shardpool::detail
