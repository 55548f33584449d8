#include "utils/format_tools.hpp"

#include <ctime>

#include <fmt/format.h>

namespace testrelay::format_tools
{

// Two-step formatting (seconds via strftime-style chrono, then the fraction) keeps the
// output identical across fmt versions whose chrono sub-second support differs.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_ms = std::chrono::time_point_cast<std::chrono::milliseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_ms);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp_ms - secs).count();
    // normalize to 0..999 even for negative timestamps
    int fractional_ms = static_cast<int>(ms % 1000);
    if (fractional_ms < 0)
    {
        fractional_ms += 1000;
        secs -= std::chrono::seconds(1);
    }

    const std::time_t tt = std::chrono::system_clock::to_time_t(secs);
    std::tm local_tm{};
    if (::localtime_r(&tt, &local_tm) == nullptr)
    {
        return fmt::format("{}.{:03d}", static_cast<long long>(tt), fractional_ms);
    }
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}", local_tm.tm_year + 1900,
                       local_tm.tm_mon + 1, local_tm.tm_mday, local_tm.tm_hour, local_tm.tm_min,
                       local_tm.tm_sec, fractional_ms);
}

std::string truncate_for_log(std::string_view text, std::size_t max_len)
{
    if (text.size() <= max_len)
    {
        return std::string(text);
    }
    std::string out(text.substr(0, max_len));
    out += "...";
    return out;
}

} // namespace testrelay::format_tools
