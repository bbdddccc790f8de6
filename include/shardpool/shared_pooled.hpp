/**
 * @file shared_pooled.hpp
 * @brief Reference-counted, read-only lease over one pooled item.
 * @author shardpool contributors
 * @version 0.1.0
 *
 * A SharedPooled is produced by Pooled::Freeze(). Copies alias the same item; the item goes
 * back to the pool when the last copy is released. Unfreeze() turns a uniquely owned shared
 * lease back into an exclusive one.
 */

#ifndef SHARDPOOL_SHARED_POOLED_HPP_
#define SHARDPOOL_SHARED_POOLED_HPP_

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>

#include <shardpool/detail/pool_core.hpp>
#include <shardpool/errors.hpp>
#include <shardpool/pooled.hpp>

namespace shardpool {

/**
 * @class SharedPooled
 * @brief Copyable handle granting const access to an item shared by several owners.
 *
 * @tparam T Item type.
 *
 * Thread-safety: distinct SharedPooled objects aliasing the same item may be copied, read and
 * destroyed concurrently from different threads. A single SharedPooled object is not safe to
 * mutate (assign, Reset, Unfreeze) concurrently with other uses of that same object.
 *
 * The release that drops the count from 1 to 0 is the one that returns the item; it is decided
 * by a single atomic decrement, so concurrent releases never return an item twice.
 */
template <class T>
class SharedPooled {
   public:
    using value_type = T;
    using const_pointer = const T*;

    /** @brief Construct an empty handle. */
    SharedPooled() noexcept = default;

    SharedPooled(const SharedPooled& other) noexcept : state_(other.state_) {
        if (state_ != nullptr) {
            state_->refs.fetch_add(1, std::memory_order_relaxed);
        }
    }

    SharedPooled(SharedPooled&& other) noexcept : state_(std::exchange(other.state_, nullptr)) {}

    SharedPooled& operator=(const SharedPooled& other) noexcept {
        SharedPooled copy(other);
        std::swap(state_, copy.state_);
        return *this;
    }

    SharedPooled& operator=(SharedPooled&& other) noexcept {
        if (this != &other) {
            Reset();
            state_ = std::exchange(other.state_, nullptr);
        }
        return *this;
    }

    ~SharedPooled() { Reset(); }

    const T& operator*() const noexcept { return *state_->item; }
    const_pointer operator->() const noexcept { return state_->item.get(); }
    const_pointer Get() const noexcept { return state_ != nullptr ? state_->item.get() : nullptr; }

    explicit operator bool() const noexcept { return state_ != nullptr; }

    std::size_t ShardIndex() const noexcept {
        return state_ != nullptr ? state_->shard_index : 0;
    }

    /**
     * @brief Number of handles currently sharing the item (0 for an empty handle).
     *
     * Other threads may change the count at any time unless this is the only owner.
     */
    std::size_t UseCount() const noexcept {
        return state_ != nullptr ? state_->refs.load(std::memory_order_acquire) : 0;
    }

    bool IsUnique() const noexcept { return UseCount() == 1; }

    /**
     * @brief Create another owner of the same item.
     * @throws EmptyHandleError If the handle holds no item.
     */
    SharedPooled Clone() const {
        if (state_ == nullptr) {
            throw EmptyHandleError("Clone");
        }
        return SharedPooled(*this);
    }

    /**
     * @brief Convert back into an exclusive lease.
     *
     * Only legal while this is the sole owner. A count of 1 cannot grow concurrently because
     * clones can only be made from an existing owner.
     *
     * @throws OwnershipError If other owners exist; the handle is left unchanged.
     * @throws EmptyHandleError If the handle holds no item.
     */
    Pooled<T> Unfreeze() {
        if (state_ == nullptr) {
            throw EmptyHandleError("Unfreeze");
        }
        const std::size_t refs = state_->refs.load(std::memory_order_acquire);
        if (refs != 1) {
            throw OwnershipError(refs);
        }
        return TakeExclusive();
    }

    /**
     * @brief Non-throwing Unfreeze(): std::nullopt when the handle is empty or shared.
     */
    std::optional<Pooled<T>> TryUnfreeze() noexcept {
        if (state_ == nullptr || state_->refs.load(std::memory_order_acquire) != 1) {
            return std::nullopt;
        }
        return TakeExclusive();
    }

    /** @brief Drop this owner; the last owner returns the item to the pool. */
    void Reset() noexcept {
        State* state = std::exchange(state_, nullptr);
        if (state == nullptr) {
            return;
        }
        if (state->refs.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            state->pool->ReturnItem(std::move(state->item));
            delete state;
        }
    }

   private:
    friend class Pooled<T>;

    struct State {
        State(std::shared_ptr<detail::PoolCore<T>> p, std::unique_ptr<T> i,
              std::size_t index) noexcept
            : pool(std::move(p)), item(std::move(i)), shard_index(index) {}

        std::shared_ptr<detail::PoolCore<T>> pool;
        std::unique_ptr<T> item;
        std::size_t shard_index;
        std::atomic<std::size_t> refs{1};
    };

    explicit SharedPooled(State* state) noexcept : state_(state) {}

    Pooled<T> TakeExclusive() noexcept {
        std::unique_ptr<State> state(std::exchange(state_, nullptr));
        return Pooled<T>(std::move(state->pool), std::move(state->item), state->shard_index);
    }

    State* state_ = nullptr;
};

template <class T>
SharedPooled<T> Pooled<T>::Freeze() {
    if (item_ == nullptr) {
        throw EmptyHandleError("Freeze");
    }
    // The allocation happens before the members are moved, so a bad_alloc leaves *this intact.
    auto* state =
        new typename SharedPooled<T>::State(std::move(pool_), std::move(item_), shard_index_);
    return SharedPooled<T>(state);
}

}  // namespace shardpool

#endif  // SHARDPOOL_SHARED_POOLED_HPP_
