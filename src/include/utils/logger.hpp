/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Design: Command-Queue Pattern**
 * Logging must not stall the relay loops (a ROUTER poll cycle, a chunk stream, an
 * engine run), so the Logger is decoupled from I/O:
 *
 * 1.  **Non-Blocking API**: `LOGGER_INFO(...)` formats the body on the calling thread
 *     and pushes a command onto a queue under a brief lock.
 * 2.  **Asynchronous Worker Thread**: one background thread, started lazily by the
 *     first command, is the sole consumer of the queue and the only thread that
 *     touches the active sink.
 * 3.  **Sink Abstraction**: `ConsoleSink` (stderr, the default) and `FileSink`.
 * 4.  **Bounded Queue**: above the soft limit new log records are dropped (control
 *     commands are still accepted up to the hard limit); the worker writes a summary
 *     of how many records were lost once the backlog clears.
 * 5.  **Robustness**: sink I/O errors never propagate to the logging thread; they are
 *     reported through an optional write-error callback.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_INFO("Dispatcher: job {} admitted ({} bytes)", job_id, size);
 *
 * auto &logger = Logger::instance();
 * logger.set_logfile("/var/log/testrelay/dispatcher.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * logger.shutdown(); // Blocks until every queued record is written
 * ```
 ******************************************************************************/

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "testrelay_core_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (512u)
#endif

namespace testrelay::utils
{

class TESTRELAY_CORE_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    // Singleton accessor
    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Sink switches are queued behind earlier records and block until the worker
    // has applied them, so records logged afterwards are guaranteed to land in
    // the new sink.

    /**
     * @brief Switch logging to the console (stderr).
     * @return true if the switch was applied.
     */
    bool set_console();

    /**
     * @brief Switch logging to a file (created if missing, appended otherwise).
     * @return false if the file cannot be opened; logging stays on the previous sink
     *         and the failure is reported through the write-error callback.
     */
    bool set_logfile(const std::string &utf8_path);

    /**
     * @brief Gracefully shuts down the logger.
     *
     * Blocks until the worker has written every queued record and exited. Records
     * logged after shutdown are dropped.
     */
    void shutdown();

    /**
     * @brief Blocks until every record queued before this call has been written.
     */
    void flush();

    // --- Configuration & Diagnostics ---
    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    /// Parses "trace", "debug", "info", "warn"/"warning", "error", "system" (case-insensitive).
    static std::optional<Level> level_from_string(std::string_view name);

    void set_max_queue_size(size_t max_size);
    [[nodiscard]] size_t max_queue_size() const;
    [[nodiscard]] size_t total_dropped() const;

    /**
     * @brief Sets a callback invoked when a sink fails to open or write.
     *
     * The callback runs on the logger worker thread; it must not log.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

// ----------------- Template implementation (must be in header) -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            (void)enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            fmt::memory_buffer mb;
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
            (void)enqueue_log(lvl, std::move(mb));
        }
    }
}

} // namespace testrelay::utils

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::testrelay::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::testrelay::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::testrelay::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::testrelay::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::testrelay::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::testrelay::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
