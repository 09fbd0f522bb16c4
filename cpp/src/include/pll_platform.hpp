#pragma once
/**
 * @file pll_platform.hpp
 * @brief Layer 0: Platform detection and the few OS queries the rest of the code needs.
 *
 * Every file that needs platform macros (PLUSHLINK_PLATFORM_LINUX, PLUSHLINK_IS_POSIX, etc.)
 * should include this. Prefer build-system macros (PLATFORM_LINUX, ...); fall back to
 * compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)
#define PLUSHLINK_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define PLUSHLINK_PLATFORM_APPLE 1
#elif defined(PLATFORM_LINUX)
#define PLUSHLINK_PLATFORM_LINUX 1
#else
// Fallback detection
#if defined(_WIN64)
#define PLUSHLINK_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define PLUSHLINK_PLATFORM_APPLE 1
#elif defined(__linux__)
#define PLUSHLINK_PLATFORM_LINUX 1
#else
#define PLUSHLINK_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(PLUSHLINK_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#define PLUSHLINK_IS_WINDOWS 1
#elif defined(PLUSHLINK_PLATFORM_APPLE) || defined(PLUSHLINK_PLATFORM_LINUX)
#define PLUSHLINK_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "plushlink_utils_export.h"

namespace plushlink::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
PLUSHLINK_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 */
PLUSHLINK_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 * @return The executable name, or "unknown" on failure.
 */
PLUSHLINK_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
PLUSHLINK_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @return Nanoseconds elapsed; 0 if start_ns is in the future.
 */
PLUSHLINK_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace plushlink::platform
