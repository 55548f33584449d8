/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "trl_platform.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace testrelay::utils
{

namespace
{
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

LogMessage make_internal_record(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}
} // anonymous namespace

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;

// A promise is fulfilled at most once; the worker is its only writer after enqueue.
static void promise_set(const std::shared_ptr<std::promise<bool>> &p, bool value)
{
    if (p)
    {
        p->set_value(value);
    }
}

struct Logger::Impl
{
    Impl() : sink_(std::make_unique<ConsoleSink>()) {}

    void ensure_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void process(Command &cmd);
    void report_error(const std::string &message);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::unique_ptr<Sink> sink_;
    std::thread worker_thread_;
    std::once_flag worker_once_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::chrono::system_clock::time_point dropping_since_;
    size_t max_queue_size_{10000};
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> was_dropping_{false};
    std::atomic<size_t> messages_dropped_{0};
    std::atomic<size_t> total_dropped_{0};
};

void Logger::Impl::ensure_worker()
{
    std::call_once(worker_once_,
                   [this] { worker_thread_ = std::thread(&Logger::Impl::worker_loop, this); });
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set(arg.promise, false);
            }
        },
        cmd);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    if (shutdown_requested_.load(std::memory_order_acquire))
    {
        reject_command(cmd);
        return false;
    }
    ensure_worker();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }

        const size_t current = queue_.size();
        const bool is_record = std::holds_alternative<LogMessage>(cmd);
        if (current >= max_queue_size_ * 2 || (is_record && current >= max_queue_size_))
        {
            messages_dropped_.fetch_add(1, std::memory_order_relaxed);
            total_dropped_.fetch_add(1, std::memory_order_relaxed);
            if (!was_dropping_.exchange(true, std::memory_order_relaxed))
            {
                dropping_since_ = std::chrono::system_clock::now();
            }
            reject_command(cmd);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::report_error(const std::string &message)
{
    if (!error_callback_)
    {
        return;
    }
    try
    {
        error_callback_(message);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[testrelay logger] write-error callback threw: {}\n", e.what());
    }
}

void Logger::Impl::process(Command &cmd)
{
    std::visit(
        [this](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, LogMessage>)
            {
                if (sink_ && arg.level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                {
                    sink_->write(arg);
                }
            }
            else if constexpr (std::is_same_v<T, SetSinkCommand>)
            {
                const std::string old_desc = sink_ ? sink_->description() : "null";
                const std::string new_desc = arg.new_sink ? arg.new_sink->description() : "null";
                if (sink_)
                {
                    sink_->write(make_internal_record(
                        Logger::Level::L_SYSTEM, make_buffer("Switching log sink to: {}", new_desc)));
                    sink_->flush();
                }
                sink_ = std::move(arg.new_sink);
                if (sink_)
                {
                    sink_->write(make_internal_record(
                        Logger::Level::L_SYSTEM, make_buffer("Log sink switched from: {}", old_desc)));
                }
                promise_set(arg.promise, true);
            }
            else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
            {
                report_error(arg.error_message);
                promise_set(arg.promise, false);
            }
            else if constexpr (std::is_same_v<T, FlushCommand>)
            {
                if (sink_)
                {
                    sink_->flush();
                }
                promise_set(arg.promise, true);
            }
            else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
            {
                error_callback_ = std::move(arg.callback);
                promise_set(arg.promise, true);
            }
        },
        cmd);
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stopping = false;
        size_t dropped_count = 0;
        double dropping_duration_s = 0.0;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            stopping = shutdown_requested_.load();

            if (was_dropping_.exchange(false, std::memory_order_relaxed))
            {
                dropped_count = messages_dropped_.exchange(0, std::memory_order_relaxed);
                dropping_duration_s = std::chrono::duration_cast<std::chrono::duration<double>>(
                                          std::chrono::system_clock::now() - dropping_since_)
                                          .count();
            }
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                process(cmd);
            }
            catch (const std::exception &e)
            {
                reject_command(cmd);
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }
        local_queue.clear();

        if (dropped_count > 0 && sink_)
        {
            try
            {
                sink_->write(make_internal_record(
                    Logger::Level::L_WARNING,
                    make_buffer("Logger dropped {} messages over {:.2f}s due to a full queue.",
                                dropped_count, dropping_duration_s)));
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }

        if (stopping)
        {
            // enqueue_command() re-checks the flag under the queue lock, so nothing can
            // be added after the swap that observed it.
            if (sink_)
            {
                try
                {
                    sink_->write(make_internal_record(Logger::Level::L_SYSTEM,
                                                      make_buffer("Logger is shutting down.")));
                    sink_->flush();
                }
                catch (const std::exception &e)
                {
                    report_error(fmt::format("Logger worker error: {}", e.what()));
                }
            }
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
}

// Logger Public API Implementation
Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger()
{
    if (pImpl)
    {
        pImpl->shutdown();
    }
}

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::set_console()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    std::unique_ptr<Sink> sink;
    std::string error_message;
    try
    {
        sink = std::make_unique<FileSink>(utf8_path);
    }
    catch (const std::exception &e)
    {
        error_message = fmt::format("Failed to create FileSink: {}", e.what());
    }

    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (sink)
    {
        pImpl->enqueue_command(SetSinkCommand{std::move(sink), promise});
    }
    else
    {
        pImpl->enqueue_command(SinkCreationErrorCommand{std::move(error_message), promise});
    }
    return future.get();
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::flush()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "trace")
        return Level::L_TRACE;
    if (lowered == "debug")
        return Level::L_DEBUG;
    if (lowered == "info")
        return Level::L_INFO;
    if (lowered == "warn" || lowered == "warning")
        return Level::L_WARNING;
    if (lowered == "error")
        return Level::L_ERROR;
    if (lowered == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

void Logger::set_max_queue_size(size_t max_size)
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    pImpl->max_queue_size_ = (max_size > 0) ? max_size : 1;
}

size_t Logger::max_queue_size() const
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    return pImpl->max_queue_size_;
}

size_t Logger::total_dropped() const
{
    return pImpl->total_dropped_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    return !pImpl->shutdown_requested_.load(std::memory_order_relaxed) &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        return pImpl->enqueue_command(make_internal_record(lvl, std::move(body)));
    }
    catch (const std::exception &)
    {
        // Thread creation or allocation failed; the record is lost but the caller
        // must not be disturbed by logging.
        pImpl->total_dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
}

} // namespace testrelay::utils
