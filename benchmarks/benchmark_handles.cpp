/**
 * @file benchmark_handles.cpp
 * @brief Microbenchmarks for the lease lifecycle (pull/release, freeze/clone, unfreeze).
 */

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>

#include <shardpool/shard_pool.hpp>

namespace {

struct Item {
    std::uint64_t payload = 0;
};

shardpool::ShardPool<Item> MakePool() {
    return shardpool::ShardPool<Item>(1, 4, [] { return new Item(); });
}

}  // namespace

static void BM_Pooled_PullRelease(benchmark::State& state) {
    auto pool = MakePool();

    for (auto _ : state) {
        auto h = pool.TryPull();
        benchmark::DoNotOptimize(h.Get());
        h->payload++;
    }
}
BENCHMARK(BM_Pooled_PullRelease)->Threads(1);

static void BM_MakeUnique_Baseline(benchmark::State& state) {
    for (auto _ : state) {
        auto p = std::make_unique<Item>();
        benchmark::DoNotOptimize(p.get());
        p->payload++;
    }
}
BENCHMARK(BM_MakeUnique_Baseline)->Threads(1);

static void BM_Pooled_FreezeRelease(benchmark::State& state) {
    auto pool = MakePool();

    for (auto _ : state) {
        auto shared = pool.TryPull().Freeze();
        benchmark::DoNotOptimize(shared.Get());
    }
}
BENCHMARK(BM_Pooled_FreezeRelease)->Threads(1);

static void BM_SharedPooled_Clone(benchmark::State& state) {
    auto pool = MakePool();
    auto shared = pool.TryPull().Freeze();

    for (auto _ : state) {
        auto clone = shared.Clone();
        benchmark::DoNotOptimize(clone.Get());
    }
}
BENCHMARK(BM_SharedPooled_Clone)->Threads(1);

static void BM_SharedPooled_FreezeUnfreeze(benchmark::State& state) {
    auto pool = MakePool();
    auto h = pool.TryPull();

    for (auto _ : state) {
        auto shared = h.Freeze();
        h = shared.Unfreeze();
        benchmark::DoNotOptimize(h.Get());
    }
}
BENCHMARK(BM_SharedPooled_FreezeUnfreeze)->Threads(1);

BENCHMARK_MAIN();
