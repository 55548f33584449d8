// Tools for formatting strings
#pragma once
#include <chrono>
#include <string>
#include <string_view>

#include "testrelay_core_export.h"

namespace testrelay::format_tools
{

/**
 * @brief Formats a system_clock time_point into a local-time string with millisecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.mmm".
 */
TESTRELAY_CORE_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Shortens @p text to at most @p max_len characters, appending "..." when cut.
 * @details Used when echoing engine output or peer-supplied strings into log lines.
 */
TESTRELAY_CORE_EXPORT std::string truncate_for_log(std::string_view text, std::size_t max_len = 200);

} // namespace testrelay::format_tools
