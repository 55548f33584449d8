#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/format.h>

namespace testrelay::utils
{

// Represents a single log record travelling from an API thread to the worker.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // int keeps this header free of logger.hpp.
    fmt::memory_buffer body;
};

// Abstract interface for a log message destination. Only the logger worker thread
// touches a sink, so implementations need no locking of their own.
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string_internal(int lvl);
    static std::string format_logmsg(const LogMessage &msg);
};

} // namespace testrelay::utils
