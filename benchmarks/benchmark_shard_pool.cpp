// benchmark_shard_pool.cpp - Pull/release throughput for ShardPool under thread contention
//
// Every iteration pulls one pre-reserved byte buffer and releases it immediately, which is the
// allocation pattern the pool is meant to amortize. The pool is shared by all benchmark threads
// and is rebuilt for each (block size, thread count) pair.

#include <benchmark/benchmark.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <shardpool/shard_pool.hpp>

#include "benchmark_utils.hpp"

namespace {

constexpr std::size_t kKiB = 1024;
constexpr std::size_t kShards = 8;
constexpr std::size_t kCapacityPerShard = 128;

using Block = std::vector<std::uint8_t>;
using BlockPool = shardpool::ShardPool<Block>;

BlockPool::Factory MakeBlockFactory(std::size_t block_size) {
    return [block_size] {
        auto* block = new Block();
        block->reserve(block_size);
        return block;
    };
}

struct SharedContext {
    SharedContext(int threads, std::size_t block_size)
        : pool(kShards, kCapacityPerShard, MakeBlockFactory(block_size)), sync(threads) {}

    BlockPool pool;
    shardpool_bench::RunSync sync;
};

// Thread 0 builds the context; the others wait for it to be published.
SharedContext* AcquireContext(benchmark::State& state, std::atomic<SharedContext*>& slot) {
    return shardpool_bench::PublishContext(state.thread_index(), slot, [&] {
        return new SharedContext(state.threads(), static_cast<std::size_t>(state.range(0)));
    });
}

void ReleaseContext(benchmark::State& state, std::atomic<SharedContext*>& slot,
                    SharedContext* ctx) {
    shardpool_bench::RetireContext(state.thread_index(), slot, ctx);
}

void ReportCounters(benchmark::State& state, const shardpool::PoolStats& stats) {
    state.SetBytesProcessed(state.iterations() * state.range(0));
    if (state.thread_index() == 0) {
        state.counters["hit_rate"] =
            stats.pulls == 0 ? 0.0
                             : static_cast<double>(stats.pull_hits()) /
                                   static_cast<double>(stats.pulls);
        state.counters["discarded"] = static_cast<double>(stats.returns_discarded);
    }
}

}  // namespace

static void BM_ShardPool_TryPull(benchmark::State& state) {
    static std::atomic<SharedContext*> g_ctx{nullptr};
    SharedContext* ctx = AcquireContext(state, g_ctx);

    for (auto _ : state) {
        auto block = ctx->pool.TryPull();
        benchmark::DoNotOptimize(block.Get());
    }

    ReportCounters(state, ctx->pool.Stats());
    ReleaseContext(state, g_ctx, ctx);
}

static void BM_ShardPool_TryPullAnyShard(benchmark::State& state) {
    static std::atomic<SharedContext*> g_ctx{nullptr};
    SharedContext* ctx = AcquireContext(state, g_ctx);

    for (auto _ : state) {
        auto block = ctx->pool.TryPullAnyShard();
        benchmark::DoNotOptimize(block.Get());
    }

    ReportCounters(state, ctx->pool.Stats());
    ReleaseContext(state, g_ctx, ctx);
}

static void BM_ShardPool_PullWithFallback_Hold4(benchmark::State& state) {
    static std::atomic<SharedContext*> g_ctx{nullptr};
    SharedContext* ctx = AcquireContext(state, g_ctx);
    const BlockPool::Factory fallback = MakeBlockFactory(static_cast<std::size_t>(state.range(0)));

    // Each thread keeps a few leases alive so the shards drain under load.
    std::vector<shardpool::Pooled<Block>> held(4);
    std::size_t slot = 0;
    for (auto _ : state) {
        held[slot] = ctx->pool.PullWithFallback(fallback);
        benchmark::DoNotOptimize(held[slot].Get());
        slot = (slot + 1) % held.size();
    }
    held.clear();

    ReportCounters(state, ctx->pool.Stats());
    ReleaseContext(state, g_ctx, ctx);
}

// Baseline: allocate and free a reserved buffer on every iteration.
static void BM_NewDelete_Baseline(benchmark::State& state) {
    const std::size_t block_size = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        Block block;
        block.reserve(block_size);
        benchmark::DoNotOptimize(block.data());
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}

// Block sizes 4 KiB..512 KiB, 1..32 threads.
static void PoolArgs(benchmark::internal::Benchmark* b) {
    b->RangeMultiplier(4)
        ->Range(static_cast<std::int64_t>(4 * kKiB), static_cast<std::int64_t>(512 * kKiB))
        ->ThreadRange(1, 32)
        ->UseRealTime();
}

BENCHMARK(BM_ShardPool_TryPull)->Apply(PoolArgs);
BENCHMARK(BM_ShardPool_TryPullAnyShard)->Apply(PoolArgs);
BENCHMARK(BM_ShardPool_PullWithFallback_Hold4)->Apply(PoolArgs);
BENCHMARK(BM_NewDelete_Baseline)->Apply(PoolArgs);

BENCHMARK_MAIN();
