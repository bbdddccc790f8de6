/**
 * @file pool_stats.hpp
 * @brief Point-in-time counters describing how a ShardPool has been used.
 * @author shardpool contributors
 * @version 0.1.0
 */

#ifndef SHARDPOOL_POOL_STATS_HPP_
#define SHARDPOOL_POOL_STATS_HPP_

#include <cstdint>

namespace shardpool {

/**
 * @struct PoolStats
 * @brief Snapshot of a pool's counters.
 *
 * Counters are read with relaxed loads one after another, so under concurrency a snapshot may
 * mix slightly different instants. They never influence pool behavior.
 */
struct PoolStats {
    /** @brief Pull attempts (TryPull, TryPullAnyShard, PullWithFallback). */
    std::uint64_t pulls = 0;
    /** @brief Pull attempts that found no item in any probed shard. */
    std::uint64_t pull_misses = 0;
    /** @brief Items manufactured by PullWithFallback after a miss. */
    std::uint64_t fallback_creates = 0;
    /** @brief Items handed back by released handles. */
    std::uint64_t returns = 0;
    /** @brief Returned items destroyed because every shard was at capacity. */
    std::uint64_t returns_discarded = 0;
    /** @brief Items removed from pool management via Pooled::Detach(). */
    std::uint64_t detached = 0;

    /** @brief Pulls served from a shard. */
    std::uint64_t pull_hits() const noexcept { return pulls > pull_misses ? pulls - pull_misses : 0; }
    /** @brief Returns that landed in a shard. */
    std::uint64_t returns_stored() const noexcept { return returns > returns_discarded ? returns - returns_discarded : 0; }
};

}  // namespace shardpool

#endif  // SHARDPOOL_POOL_STATS_HPP_
