#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace shardpool::detail {

/**
 * @brief One independently locked, bounded bucket of pre-built items.
 *
 * `objects.size() <= capacity` holds whenever observed under `mutex`. `approx_size` mirrors the
 * size for lock-free, approximate reads.
 */
template <class T>
struct PoolShard {
    mutable std::mutex mutex;
    std::vector<std::unique_ptr<T>> objects;
    std::size_t capacity = 0;
    std::atomic<std::size_t> approx_size{0};

    // Pops the most recently pushed item, or returns nullptr when the shard is empty.
    std::unique_ptr<T> TryPop() {
        std::unique_ptr<T> obj;
        std::lock_guard<std::mutex> lock(mutex);
        if (objects.empty()) {
            return obj;
        }
        obj = std::move(objects.back());
        objects.pop_back();
        approx_size.fetch_sub(1, std::memory_order_relaxed);
        return obj;
    }

    // Takes ownership of `obj` only if the shard is under capacity; otherwise `obj` is left
    // untouched and false is returned. `objects` is reserved to `capacity`, so the push never
    // reallocates.
    bool TryPush(std::unique_ptr<T>& obj) {
        std::lock_guard<std::mutex> lock(mutex);
        if (objects.size() >= capacity) {
            return false;
        }
        objects.push_back(std::move(obj));
        approx_size.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return objects.size();
    }

    void Clear() {
        std::vector<std::unique_ptr<T>> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex);
            dropped.swap(objects);
            objects.reserve(capacity);
            approx_size.store(0, std::memory_order_relaxed);
        }
        // Item destructors run outside the lock.
    }
};

}  // namespace shardpool::detail
