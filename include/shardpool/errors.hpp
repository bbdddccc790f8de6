/**
 * @file errors.hpp
 * @brief Exception types reported for handle misuse.
 * @author shardpool contributors
 * @version 0.1.0
 *
 * Exhaustion is not an error (pulls return an empty handle) and factory failures propagate
 * unchanged, so these types only cover contract violations on handles.
 */

#ifndef SHARDPOOL_ERRORS_HPP_
#define SHARDPOOL_ERRORS_HPP_

#include <cstddef>
#include <stdexcept>

namespace shardpool {

/**
 * @class OwnershipError
 * @brief Thrown by SharedPooled::Unfreeze() when other owners of the item still exist.
 */
class OwnershipError : public std::logic_error {
   public:
    /** @param use_count Reference count observed at the time of the call. */
    explicit OwnershipError(std::size_t use_count);

    /** @brief Reference count observed when the conversion was refused. */
    std::size_t use_count() const noexcept { return use_count_; }

   private:
    std::size_t use_count_;
};

/**
 * @class EmptyHandleError
 * @brief Thrown when a consuming operation is applied to a handle that holds no item.
 */
class EmptyHandleError : public std::logic_error {
   public:
    /** @param operation Name of the refused operation, e.g. "Detach". */
    explicit EmptyHandleError(const char* operation);
};

namespace detail {

// Raised when a factory yields nullptr; the pool reports it as std::bad_alloc.
[[noreturn]] void ThrowFactoryReturnedNull();

}  // namespace detail

}  // namespace shardpool

#endif  // SHARDPOOL_ERRORS_HPP_
