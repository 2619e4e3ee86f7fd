/**
 * @file config.hpp
 * @brief Public configuration constants and build/target detection macros.
 * @author lfqueue contributors
 * @version 0.1.0
 *
 * This header is standalone and can be included by all public headers.
 *
 * Example:
 * @code
 * // Reclamation domain that scans for reclaimable nodes every 256 retirements.
 * lfq::EBRManager ebr(2 * lfq::config::DEFAULT_RECLAIM_THRESHOLD);
 * @endcode
 */

#pragma once

#include <cstddef>
#include <cstdint>

/** @def LFQ_ENABLE_SANITIZERS
 * @brief Build-time toggle indicating sanitizer instrumentation is enabled.
 *
 * This macro is typically provided by CMake. Tests use it to scale down stress workloads.
 */
#ifndef LFQ_ENABLE_SANITIZERS
#define LFQ_ENABLE_SANITIZERS 0
#endif

/** @def LFQ_PLATFORM_WINDOWS
 * @brief Defined to 1 when building for Windows, otherwise 0.
 */
#if defined(_WIN32) || defined(_WIN64)
#define LFQ_PLATFORM_WINDOWS 1
#else
#define LFQ_PLATFORM_WINDOWS 0
#endif

/** @def LFQ_PLATFORM_LINUX
 * @brief Defined to 1 when building for Linux, otherwise 0.
 */
#if defined(__linux__)
#define LFQ_PLATFORM_LINUX 1
#else
#define LFQ_PLATFORM_LINUX 0
#endif

/** @def LFQ_ARCH_X86
 * @brief Defined to 1 when building for x86 or x86_64, otherwise 0.
 */
#if defined(_M_X64) || defined(__x86_64__) || defined(_M_IX86) || defined(__i386__)
#define LFQ_ARCH_X86 1
#else
#define LFQ_ARCH_X86 0
#endif

/** @def LFQ_COMPILER_MSVC
 * @brief Defined to 1 when building with MSVC, otherwise 0.
 */
#if defined(_MSC_VER)
#define LFQ_COMPILER_MSVC 1
#else
#define LFQ_COMPILER_MSVC 0
#endif

namespace lfq {

/** @brief ABI version for public headers (bumped on breaking changes). */
inline constexpr std::uint32_t kAbiVersion = 0;
/** @brief Whether sanitizers are enabled at build time. */
inline constexpr bool kEnableSanitizers = (LFQ_ENABLE_SANITIZERS != 0);

namespace config {

/**
 * @brief Default number of retired nodes a thread accumulates before it tries to advance the
 * epoch and free what it can.
 *
 * @note Smaller values reclaim sooner at the cost of more frequent scans of the thread registry.
 */
inline constexpr std::size_t DEFAULT_RECLAIM_THRESHOLD = 128;

/** @brief Alignment used to keep the queue's head and tail on separate cache lines. */
inline constexpr std::size_t kCacheLineSize = 64;

}  // namespace config

}  // namespace lfq
