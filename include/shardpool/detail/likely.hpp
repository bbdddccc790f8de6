#pragma once

#include <shardpool/config.hpp>

// Branch prediction hints for the pull/return hot paths (no behavioral change).
#if defined(__clang__) || defined(__GNUC__)
#define SHARDPOOL_LIKELY(x) (__builtin_expect(!!(x), 1))
#define SHARDPOOL_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define SHARDPOOL_LIKELY(x) (!!(x))
#define SHARDPOOL_UNLIKELY(x) (!!(x))
#endif
