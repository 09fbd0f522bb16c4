#include "utils/format_tools.hpp"

#include <fmt/chrono.h>

namespace plushlink::format_tools
{

// Computes the fractional microsecond part and appends it with a two-step format so the
// output does not depend on fmt's chrono subsecond support.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string hex_bytes(std::span<const uint8_t> bytes, size_t max_bytes)
{
    const size_t shown = bytes.size() < max_bytes ? bytes.size() : max_bytes;
    fmt::memory_buffer mb;
    mb.reserve(shown * 3 + 2);
    for (size_t i = 0; i < shown; ++i)
    {
        if (i != 0)
        {
            mb.push_back(' ');
        }
        fmt::format_to(std::back_inserter(mb), "{:02x}", bytes[i]);
    }
    if (shown < bytes.size())
    {
        fmt::format_to(std::back_inserter(mb), "..");
    }
    return fmt::to_string(mb);
}

} // namespace plushlink::format_tools
