/**
 * @file config.hpp
 * @brief Public configuration constants and build/target detection macros.
 * @author shardpool contributors
 * @version 0.1.0
 *
 * This header is standalone and can be included by all public pool headers.
 *
 * Example:
 * @code
 * // Construct a pool using the project defaults.
 * shardpool::ShardPool<Buffer> pool(shardpool::config::DefaultShardCount(),
 *                                   shardpool::config::DEFAULT_SHARD_CAPACITY,
 *                                   [] { return new Buffer(); });
 * @endcode
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <thread>

/** @def SHARDPOOL_ENABLE_SANITIZERS
 * @brief Build-time toggle indicating sanitizer instrumentation is enabled.
 *
 * This macro is typically provided by CMake. Stress tests shrink their loops when it is set.
 */
#ifndef SHARDPOOL_ENABLE_SANITIZERS
#define SHARDPOOL_ENABLE_SANITIZERS 0
#endif

/** @def SHARDPOOL_COMPILER_CLANG
 * @brief Defined to 1 when building with Clang, otherwise 0.
 */
#if defined(__clang__)
#define SHARDPOOL_COMPILER_CLANG 1
#else
#define SHARDPOOL_COMPILER_CLANG 0
#endif

namespace shardpool {

/** @brief ABI version for public headers (bumped on breaking changes). */
inline constexpr std::uint32_t kAbiVersion = 0;
/** @brief Whether sanitizers are enabled at build time. */
inline constexpr bool kEnableSanitizers = (SHARDPOOL_ENABLE_SANITIZERS != 0);

namespace config {

/**
 * @brief Default number of pre-built items kept per shard.
 *
 * @note Matches the 8 x 1000 configuration the throughput benchmarks run with.
 */
inline constexpr std::size_t DEFAULT_SHARD_CAPACITY = 1000;

/**
 * @brief Default shard count: twice the hardware concurrency, at least 1.
 */
inline std::size_t DefaultShardCount() {
    // std::thread::hardware_concurrency() is allowed to return 0.
    const unsigned int hc = std::thread::hardware_concurrency();
    const std::size_t base = std::max<std::size_t>(1, hc);
    return base * 2;
}

}  // namespace config

}  // namespace shardpool
