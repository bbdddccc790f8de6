#include <shardpool/shard_pool.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

int main() {
    std::cout << "shardpool examples - simple usage\n\n";

    using Buffer = std::vector<std::uint8_t>;

    // -----------------------------------------------------------------------------
    // 1) Build a pool: 4 shards, 2 pre-reserved 4 KiB buffers per shard.
    // -----------------------------------------------------------------------------
    shardpool::ShardPool<Buffer> pool(4, 2, [] {
        auto* buf = new Buffer();
        buf->reserve(4096);
        return buf;
    });
    std::cout << "[pool] shards=" << pool.ShardCount()
              << " capacity/shard=" << pool.CapacityPerShard()
              << " cached=" << pool.SizeApprox() << "\n";

    // -----------------------------------------------------------------------------
    // 2) Exclusive lease: mutate, then let the scope return it.
    // -----------------------------------------------------------------------------
    {
        auto buf = pool.TryPull();
        if (!buf) {
            std::cerr << "ERROR: freshly built pool returned no item\n";
            return 1;
        }
        buf->assign({1, 2, 3});
        std::cout << "[lease] shard=" << buf.ShardIndex() << " size=" << buf->size()
                  << " cached=" << pool.SizeApprox() << "\n";
    }
    std::cout << "[lease] released, cached=" << pool.SizeApprox() << "\n\n";

    // -----------------------------------------------------------------------------
    // 3) Shared lease: freeze, hand clones to readers, the last one returns the item.
    // -----------------------------------------------------------------------------
    {
        auto writer = pool.PullWithFallback();
        writer->assign(64, 0x5A);
        shardpool::SharedPooled<Buffer> shared = writer.Freeze();

        std::vector<std::thread> readers;
        for (int i = 0; i < 3; ++i) {
            readers.emplace_back([reader = shared.Clone(), i] {
                std::cout << "  reader " << i << " sees " << reader->size() << " bytes\n";
            });
        }
        for (auto& t : readers) {
            t.join();
        }
        std::cout << "[shared] owners left=" << shared.UseCount() << "\n";

        // Sole owner again: take it back for writing.
        auto exclusive = shared.Unfreeze();
        exclusive->clear();
    }
    std::cout << "[shared] released, cached=" << pool.SizeApprox() << "\n\n";

    // -----------------------------------------------------------------------------
    // 4) Drain the pool, fall back to construction, and watch the overflow get shed.
    // -----------------------------------------------------------------------------
    {
        std::vector<shardpool::Pooled<Buffer>> held;
        while (auto buf = pool.TryPullAnyShard()) {
            held.push_back(std::move(buf));
        }
        held.push_back(pool.PullWithFallback());
        std::cout << "[drain] holding " << held.size() << " buffers, cached=" << pool.SizeApprox()
                  << "\n";
    }
    const shardpool::PoolStats stats = pool.Stats();
    std::cout << "[drain] cached=" << pool.SizeApprox() << " fallbacks=" << stats.fallback_creates
              << " discarded=" << stats.returns_discarded << "\n";

    // -----------------------------------------------------------------------------
    // 5) Detach: keep a buffer for good.
    // -----------------------------------------------------------------------------
    std::unique_ptr<Buffer> mine = pool.PullWithFallback().Detach();
    std::cout << "[detach] kept buffer with capacity " << mine->capacity()
              << ", cached=" << pool.SizeApprox() << "\n";

    return 0;
}
