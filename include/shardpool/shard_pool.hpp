/**
 * @file shard_pool.hpp
 * @brief Concurrent, sharded, capacity-bounded object pool with RAII leases.
 * @author shardpool contributors
 * @version 0.1.0
 *
 * The pool keeps `shard_count` independently locked shards, each pre-filled with
 * `capacity_per_shard` items built by a factory. Pulls and returns pick their starting shard
 * from two round-robin counters so that concurrent threads tend to hit different mutexes.
 * Nothing ever waits for an item: an empty pool yields an empty handle (or a freshly built item
 * with PullWithFallback), and a return that finds every shard full destroys the item.
 */

#ifndef SHARDPOOL_SHARD_POOL_HPP_
#define SHARDPOOL_SHARD_POOL_HPP_

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>

#include <shardpool/config.hpp>
#include <shardpool/detail/pool_core.hpp>
#include <shardpool/pool_stats.hpp>
#include <shardpool/pooled.hpp>
#include <shardpool/shared_pooled.hpp>

namespace shardpool {

/**
 * @class ShardPool
 * @brief Thread-safe pool of pre-built `T` objects handed out as Pooled leases.
 *
 * @tparam T Item type managed by the pool.
 *
 * Copying a ShardPool is cheap: all copies share the same shards and counters. The shards live
 * until the last ShardPool copy and the last outstanding lease are gone.
 *
 * Thread-safety: all public methods are thread-safe.
 *
 * Example:
 * @code
 * shardpool::ShardPool<std::vector<std::uint8_t>> pool(8, 1000, [] {
 *     auto* v = new std::vector<std::uint8_t>();
 *     v->reserve(4096);
 *     return v;
 * });
 * auto buf = pool.PullWithFallback();
 * buf->push_back(1);
 * shardpool::SharedPooled<std::vector<std::uint8_t>> shared = buf.Freeze();
 * auto reader = shared.Clone();  // item returns once both are released
 * @endcode
 */
template <class T>
class ShardPool {
   public:
    /** @brief Object type managed by the pool. */
    using value_type = T;
    /** @brief Pointer type produced by factories. */
    using pointer = T*;
    /**
     * @brief Factory used to build items.
     *
     * Must return a heap-allocated `T` whose ownership passes to the pool. Returning nullptr is
     * reported as std::bad_alloc; exceptions thrown by the factory propagate unchanged.
     */
    using Factory = std::function<pointer()>;
    /** @brief Exclusive lease type. */
    using Handle = Pooled<T>;
    /** @brief Shared lease type. */
    using SharedHandle = SharedPooled<T>;

    /**
     * @brief Construct the pool and pre-fill every shard.
     * @param shard_count Number of shards. If 0, it will be treated as 1.
     * @param capacity_per_shard Items built per shard, and the most a shard will ever hold.
     * @param factory Item factory, also used by PullWithFallback().
     * @throws Whatever `factory` throws, or std::bad_alloc.
     */
    ShardPool(std::size_t shard_count, std::size_t capacity_per_shard, Factory factory)
        : core_(std::make_shared<detail::PoolCore<T>>(shard_count, capacity_per_shard,
                                                      std::move(factory))) {}

    /**
     * @brief Pull from the next round-robin shard only.
     * @return A non-empty handle on success, an empty one if that shard had no item.
     */
    Handle TryPull() {
        const std::size_t shard_index = core_->NextPullIndex();
        std::unique_ptr<T> obj = core_->PopFrom(shard_index);
        if (obj == nullptr) {
            return Handle();
        }
        return Handle(core_, std::move(obj), shard_index);
    }

    /**
     * @brief Pull from the next round-robin shard, probing every other shard on a miss.
     * @return A non-empty handle on success, an empty one if all shards were empty.
     */
    Handle TryPullAnyShard() {
        std::size_t shard_index = core_->NextPullIndex();
        std::unique_ptr<T> obj = core_->PopProbing(shard_index, shard_index);
        if (obj == nullptr) {
            return Handle();
        }
        return Handle(core_, std::move(obj), shard_index);
    }

    /**
     * @brief Pull like TryPullAnyShard(), building a new item with `factory` on a miss.
     * @return Always a non-empty handle.
     * @throws Whatever `factory` throws, or std::bad_alloc if it returns nullptr.
     */
    Handle PullWithFallback(const Factory& factory) {
        std::size_t shard_index = core_->NextPullIndex();
        std::unique_ptr<T> obj = core_->PopProbing(shard_index, shard_index);
        if (obj == nullptr) {
            obj = core_->CreateFallback(factory);
        }
        return Handle(core_, std::move(obj), shard_index);
    }

    /** @brief PullWithFallback() using the factory given at construction. */
    Handle PullWithFallback() { return PullWithFallback(core_->GetFactory()); }

    /**
     * @brief Destroy every item currently cached in the shards.
     *
     * @note Outstanding leases are not affected and return to the pool as usual.
     */
    void Clear() { core_->Clear(); }

    /** @brief Approximate number of cached items (exact when no other thread is active). */
    std::size_t SizeApprox() const noexcept { return core_->SizeApprox(); }

    /**
     * @brief Exact size of one shard, read under its lock.
     * @throws std::out_of_range If `shard_index >= ShardCount()`.
     */
    std::size_t ShardSize(std::size_t shard_index) const { return core_->ShardSize(shard_index); }

    std::size_t ShardCount() const noexcept { return core_->ShardCount(); }
    std::size_t CapacityPerShard() const noexcept { return core_->CapacityPerShard(); }

    /** @brief Snapshot of usage counters, including discarded returns. */
    PoolStats Stats() const noexcept { return core_->Stats(); }

   private:
    std::shared_ptr<detail::PoolCore<T>> core_;
};

}  // namespace shardpool

#endif  // SHARDPOOL_SHARD_POOL_HPP_
