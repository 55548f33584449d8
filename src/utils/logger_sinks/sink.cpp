#include "utils/logger_sinks/sink.hpp"
#include "utils/format_tools.hpp"

#include <string_view>

namespace testrelay::utils
{

// Returns a string representation for a given log level.
const char *Sink::level_to_string_internal(int lvl)
{
    // Plain ints mirror Logger::Level so this file does not depend on logger.hpp.
    constexpr int kTraceLevel = 0;
    constexpr int kDebugLevel = 1;
    constexpr int kInfoLevel = 2;
    constexpr int kWarnLevel = 3;
    constexpr int kErrorLevel = 4;
    constexpr int kSystemLevel = 5;
    switch (lvl)
    {
    case kTraceLevel:
        return "TRACE";
    case kDebugLevel:
        return "DEBUG";
    case kInfoLevel:
        return "INFO";
    case kWarnLevel:
        return "WARN";
    case kErrorLevel:
        return "ERROR";
    case kSystemLevel:
        return "SYSTEM";
    default:
        return "UNK";
    }
}

// Formats a LogMessage into the standard single-line record.
std::string Sink::format_logmsg(const LogMessage &msg)
{
    return fmt::format("[{}] [{:<6}] [PID:{:5} TID:{:5}] {}\n",
                       format_tools::formatted_time(msg.timestamp),
                       level_to_string_internal(msg.level), msg.process_id, msg.thread_id,
                       std::string_view(msg.body.data(), msg.body.size()));
}

} // namespace testrelay::utils
