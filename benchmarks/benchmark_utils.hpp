#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include <utility>

namespace shardpool_bench {

class CyclicBarrier {
   public:
    explicit CyclicBarrier(int parties) : parties_(parties) {}

    void arrive_and_wait() {
        std::unique_lock<std::mutex> lock(mu_);
        const std::size_t gen = generation_;
        if (++arrived_ == static_cast<std::size_t>(parties_)) {
            arrived_ = 0;
            ++generation_;
            cv_.notify_all();
            return;
        }
        cv_.wait(lock, [&] { return generation_ != gen; });
    }

   private:
    int parties_;
    std::size_t arrived_ = 0;
    std::size_t generation_ = 0;
    std::mutex mu_;
    std::condition_variable cv_;
};

// Per-run state shared by every benchmark thread. Benchmarks embed it in their context struct.
struct RunSync {
    explicit RunSync(int threads) : threads(threads), finish(threads) {}

    int threads;
    CyclicBarrier finish;
    // Threads (other than thread 0) that have returned from `finish`.
    std::atomic<int> departed{0};
};

// Thread 0 builds the context with `make()` and publishes it; the others wait for it.
template <class Ctx, class Make>
Ctx* PublishContext(int thread_index, std::atomic<Ctx*>& slot, Make&& make) {
    if (thread_index == 0) {
        slot.store(std::forward<Make>(make)(), std::memory_order_release);
    }
    Ctx* ctx = nullptr;
    while ((ctx = slot.load(std::memory_order_acquire)) == nullptr) {
        std::this_thread::yield();
    }
    return ctx;
}

// Every thread calls this once at the end of a run. Thread 0 frees the context only after all
// other threads have left the barrier, so no waiter is still inside its mutex or condition
// variable when it is destroyed.
template <class Ctx>
void RetireContext(int thread_index, std::atomic<Ctx*>& slot, Ctx* ctx) {
    ctx->sync.finish.arrive_and_wait();
    if (thread_index != 0) {
        ctx->sync.departed.fetch_add(1, std::memory_order_release);
        return;
    }
    while (ctx->sync.departed.load(std::memory_order_acquire) != ctx->sync.threads - 1) {
        std::this_thread::yield();
    }
    slot.store(nullptr, std::memory_order_release);
    delete ctx;
}

}  // namespace shardpool_bench
