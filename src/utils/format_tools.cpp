// format_tools.cpp
#include "gwb_base.hpp"

#include <ctime>

namespace gwbridge::format_tools
{

// Local time with microsecond fraction. fmt's chrono subsecond support varies
// between releases, so the fraction is always appended in a second step.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;

    std::time_t tt = std::chrono::system_clock::to_time_t(secs);
    std::tm local_tm{};
    localtime_r(&tt, &local_tm);
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:06d}", local_tm.tm_year + 1900,
                       local_tm.tm_mon + 1, local_tm.tm_mday, local_tm.tm_hour, local_tm.tm_min,
                       local_tm.tm_sec, fractional_us);
}

std::string clip_for_log(std::string_view text, std::size_t max_len)
{
    if (text.size() <= max_len)
        return std::string(text);
    return fmt::format("{}...({} bytes)", text.substr(0, max_len), text.size());
}

} // namespace gwbridge::format_tools
