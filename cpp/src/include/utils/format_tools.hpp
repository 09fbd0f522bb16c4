// Tools for formatting strings and byte buffers
#pragma once
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "plushlink_utils_export.h"

namespace plushlink::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
PLUSHLINK_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Renders bytes as space-separated lowercase hex ("24 02 01").
 * @param bytes The bytes to render.
 * @param max_bytes Output is truncated after this many bytes and suffixed with "..".
 */
PLUSHLINK_UTILS_EXPORT std::string hex_bytes(std::span<const uint8_t> bytes,
                                             size_t max_bytes = 32);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto pos = file_path.find_last_of("/\\");
    if (pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(pos + 1);
}

} // namespace plushlink::format_tools
