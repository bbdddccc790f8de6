#include <shardpool/errors.hpp>

#include <new>
#include <string>

namespace shardpool {

OwnershipError::OwnershipError(std::size_t use_count)
    : std::logic_error("shardpool: cannot unfreeze a shared item with " +
                       std::to_string(use_count) + " owners (requires exactly 1)"),
      use_count_(use_count) {}

EmptyHandleError::EmptyHandleError(const char* operation)
    : std::logic_error(std::string("shardpool: ") + operation + " called on an empty handle") {}

namespace detail {

void ThrowFactoryReturnedNull() { throw std::bad_alloc(); }

}  // namespace detail

}  // namespace shardpool
