#include "dispatch/dispatcher_config.hpp"

#include "utils/config_utils.hpp"
#include "utils/logger.hpp"

#include <stdexcept>

namespace testrelay::dispatch
{

namespace
{
constexpr const char *kWhat = "Dispatcher config";
} // namespace

void DispatcherConfig::validate() const
{
    if (control_endpoint.empty() || event_endpoint.empty())
        throw std::runtime_error("Dispatcher config: endpoints must not be empty");
    // Two wildcard binds ("tcp://127.0.0.1:*") resolve to different ports.
    if (control_endpoint == event_endpoint && control_endpoint.find('*') == std::string::npos)
        throw std::runtime_error("Dispatcher config: control and event endpoints must differ");
    if (job_timeout.count() <= 0)
        throw std::runtime_error("Dispatcher config: job_timeout_s must be positive");
    if (max_job_timeout.count() <= 0 ||
        static_cast<uint64_t>(max_job_timeout.count()) > config::kMaxDurationMs)
        throw std::runtime_error("Dispatcher config: max_job_timeout_s must be between 1 s and one week");
    if (job_timeout > max_job_timeout)
        throw std::runtime_error("Dispatcher config: job_timeout_s must not exceed max_job_timeout_s");
    if (shutdown_timeout.count() < 0 ||
        static_cast<uint64_t>(shutdown_timeout.count()) > config::kMaxDurationMs)
        throw std::runtime_error("Dispatcher config: shutdown_timeout_s must not exceed one week");
    if (chunk_size == 0)
        throw std::runtime_error("Dispatcher config: chunk_size must be positive");
    if (keepalive_interval.count() <= 0)
        throw std::runtime_error("Dispatcher config: keepalive_interval_ms must be positive");
    if (max_payload_size == 0)
        throw std::runtime_error("Dispatcher config: max_payload_size must be positive");
    if (!utils::Logger::level_from_string(log_level))
        throw std::runtime_error("Dispatcher config: invalid log_level '" + log_level + "'");
}

DispatcherConfig DispatcherConfig::from_json(const nlohmann::json &root)
{
    const nlohmann::json &j =
        (root.contains("dispatcher") && root["dispatcher"].is_object()) ? root["dispatcher"] : root;
    if (!j.is_object())
        throw std::runtime_error("Dispatcher config: expected a JSON object");

    DispatcherConfig cfg;
    cfg.control_endpoint = config::string_value(j, "control_endpoint", cfg.control_endpoint);
    cfg.event_endpoint = config::string_value(j, "event_endpoint", cfg.event_endpoint);
    cfg.job_timeout = std::chrono::seconds(
        config::unsigned_value(j, "job_timeout_s", 30, kWhat, config::kMaxDurationSeconds));
    cfg.max_job_timeout = std::chrono::seconds(
        config::unsigned_value(j, "max_job_timeout_s", 86400, kWhat, config::kMaxDurationSeconds));
    cfg.chunk_size = config::unsigned_value(j, "chunk_size", cfg.chunk_size, kWhat);
    cfg.chunk_interval =
        std::chrono::milliseconds(config::unsigned_value(j, "chunk_interval_ms", 0, kWhat, config::kMaxDurationMs));
    cfg.keepalive_interval =
        std::chrono::milliseconds(config::unsigned_value(j, "keepalive_interval_ms", 5000, kWhat, config::kMaxDurationMs));
    cfg.max_payload_size = config::unsigned_value(j, "max_payload_size", cfg.max_payload_size, kWhat);
    cfg.shutdown_timeout =
        std::chrono::seconds(config::unsigned_value(j, "shutdown_timeout_s", 30, kWhat, config::kMaxDurationSeconds));
    cfg.notify_worker_on_shutdown = config::bool_value(j, "notify_worker_on_shutdown", true, kWhat);
    cfg.log_level = config::string_value(j, "log_level", cfg.log_level);
    cfg.log_file = config::string_value(j, "log_file", cfg.log_file);

    cfg.validate();
    return cfg;
}

DispatcherConfig DispatcherConfig::from_json_file(const std::string &path)
{
    return from_json(config::load_json_file(path, kWhat));
}

} // namespace testrelay::dispatch
