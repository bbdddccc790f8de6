/**
 * @file pooled.hpp
 * @brief Exclusive, scoped lease over one pooled item.
 * @author shardpool contributors
 * @version 0.1.0
 */

#ifndef SHARDPOOL_POOLED_HPP_
#define SHARDPOOL_POOLED_HPP_

#include <cstddef>
#include <memory>
#include <utility>

#include <shardpool/detail/pool_core.hpp>
#include <shardpool/errors.hpp>

namespace shardpool {

template <class T>
class ShardPool;
template <class T>
class SharedPooled;

/**
 * @class Pooled
 * @brief Move-only handle granting read/write access to one item leased from a ShardPool.
 *
 * @tparam T Item type.
 *
 * Ownership model:
 * - A non-empty handle is the only owner of its item.
 * - When the handle is destroyed or `Reset()` is called, the item goes back to the pool (or is
 *   destroyed if every shard is full). This happens on every scope exit, exceptions included.
 * - `Detach()` and `Freeze()` consume the item; the handle is empty afterwards and returns
 *   nothing.
 * - An empty handle (failed TryPull, moved-from, consumed) must not be dereferenced.
 *
 * Example:
 * @code
 * shardpool::ShardPool<std::vector<char>> pool(4, 16, [] { return new std::vector<char>(); });
 * if (auto buf = pool.TryPull()) {
 *     buf->assign(4096, 0);
 * }  // buffer goes back to the pool here
 * @endcode
 */
template <class T>
class Pooled {
   public:
    using value_type = T;
    using pointer = T*;

    /** @brief Construct an empty handle. */
    Pooled() noexcept = default;

    Pooled(const Pooled&) = delete;
    Pooled& operator=(const Pooled&) = delete;

    Pooled(Pooled&& other) noexcept
        : pool_(std::move(other.pool_)),
          item_(std::move(other.item_)),
          shard_index_(other.shard_index_) {}

    /** @brief Release the currently held item (if any), then take over `other`'s lease. */
    Pooled& operator=(Pooled&& other) noexcept {
        if (this != &other) {
            Reset();
            pool_ = std::move(other.pool_);
            item_ = std::move(other.item_);
            shard_index_ = other.shard_index_;
        }
        return *this;
    }

    ~Pooled() { Reset(); }

    T& operator*() const noexcept { return *item_; }
    pointer operator->() const noexcept { return item_.get(); }
    pointer Get() const noexcept { return item_.get(); }

    /** @brief True while the handle holds an item. */
    explicit operator bool() const noexcept { return item_ != nullptr; }

    /**
     * @brief Shard this lease came from. For fallback items, the first shard that was probed.
     */
    std::size_t ShardIndex() const noexcept { return shard_index_; }

    /**
     * @brief Take permanent ownership of the item; it will never return to the pool.
     * @throws EmptyHandleError If the handle holds no item.
     */
    std::unique_ptr<T> Detach() {
        if (item_ == nullptr) {
            throw EmptyHandleError("Detach");
        }
        pool_->NoteDetached();
        pool_.reset();
        return std::move(item_);
    }

    /**
     * @brief Convert this lease into a shared lease with a reference count of 1.
     * @throws EmptyHandleError If the handle holds no item.
     * @throws std::bad_alloc If the shared control block cannot be allocated (the handle is left
     * unchanged).
     */
    SharedPooled<T> Freeze();

    /** @brief Return the item to the pool now instead of at scope exit. */
    void Reset() noexcept {
        if (item_ != nullptr) {
            pool_->ReturnItem(std::move(item_));
        }
        pool_.reset();
    }

   private:
    friend class ShardPool<T>;
    friend class SharedPooled<T>;

    Pooled(std::shared_ptr<detail::PoolCore<T>> pool, std::unique_ptr<T> item,
           std::size_t shard_index) noexcept
        : pool_(std::move(pool)), item_(std::move(item)), shard_index_(shard_index) {}

    std::shared_ptr<detail::PoolCore<T>> pool_;
    std::unique_ptr<T> item_;
    std::size_t shard_index_ = 0;
};

}  // namespace shardpool

// Freeze() is defined alongside SharedPooled.
#include <shardpool/shared_pooled.hpp>

#endif  // SHARDPOOL_POOLED_HPP_
