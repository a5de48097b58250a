// Tools for formatting strings
#pragma once
#include "gwbridge_core_export.h"

#include <chrono>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace gwbridge::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us" (local time).
 */
GWBRIDGE_CORE_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Shortens @p text to at most @p max_len characters for log output.
 *
 * Wire frames can be arbitrarily long; log lines quoting them are clipped and
 * marked with a trailing "...(N bytes)" suffix carrying the original size.
 */
GWBRIDGE_CORE_EXPORT std::string clip_for_log(std::string_view text, std::size_t max_len = 160);

} // namespace gwbridge::format_tools
