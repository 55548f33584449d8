#pragma once
/**
 * @file trl_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * Every file that needs platform macros (TESTRELAY_PLATFORM_LINUX, TESTRELAY_IS_POSIX, ...)
 * should include this. It is self-contained and can be included at any point.
 *
 * testrelay targets POSIX hosts only: the worker spawns test engines with fork/exec and
 * the transport relies on ZeroMQ TCP endpoints.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_APPLE)
#define TESTRELAY_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define TESTRELAY_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define TESTRELAY_PLATFORM_LINUX 1
#else
// Fallback detection
#if defined(__APPLE__) && defined(__MACH__)
#define TESTRELAY_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define TESTRELAY_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define TESTRELAY_PLATFORM_LINUX 1
#else
#define TESTRELAY_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(TESTRELAY_PLATFORM_APPLE) || defined(TESTRELAY_PLATFORM_FREEBSD) ||                  \
    defined(TESTRELAY_PLATFORM_LINUX)
#define TESTRELAY_IS_POSIX 1
#else
#error "testrelay requires a POSIX platform (Linux, macOS or FreeBSD)."
#endif

// --- Require C++20 or later --------------------------------------------------
// The codebase uses std::span, designated initializers and __VA_OPT__ in the logging
// macros. Fail early with a clear message when an older language standard is used.
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif

#include "testrelay_core_export.h"

namespace testrelay::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
TESTRELAY_CORE_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 */
TESTRELAY_CORE_EXPORT uint64_t get_pid() noexcept;

/**
 * @brief Gets the host name of this machine, or "unknown" on failure.
 */
TESTRELAY_CORE_EXPORT std::string get_hostname();

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
TESTRELAY_CORE_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @return Nanoseconds elapsed since start_ns; 0 if start_ns is in the future.
 */
TESTRELAY_CORE_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace testrelay::platform
