#include "worker/worker_config.hpp"

#include "utils/config_utils.hpp"
#include "utils/logger.hpp"

#include <limits>
#include <stdexcept>

namespace testrelay::worker
{

namespace
{
constexpr const char *kWhat = "Worker config";
} // namespace

void WorkerConfig::validate() const
{
    if (control_endpoint.empty() || event_endpoint.empty())
        throw std::runtime_error("Worker config: endpoints must not be empty");
    if (engine_timeout().count() <= 0)
        throw std::runtime_error(
            "Worker config: job_timeout_s must exceed engine_timeout_margin_ms");
    if (heartbeat_interval.count() <= 0)
        throw std::runtime_error("Worker config: heartbeat_interval_ms must be positive");
    if (idle_timeout.count() <= 0)
        throw std::runtime_error("Worker config: idle_timeout_ms must be positive");
    if (connect_timeout.count() <= 0)
        throw std::runtime_error("Worker config: connect_timeout_ms must be positive");
    if (max_reconnect_attempts < 0)
        throw std::runtime_error("Worker config: max_reconnect_attempts must not be negative");
    if (report_timeout.count() <= 0)
        throw std::runtime_error("Worker config: report_timeout_ms must be positive");
    if (max_bundle_size == 0)
        throw std::runtime_error("Worker config: max_bundle_size must be positive");
    if (!utils::Logger::level_from_string(log_level))
        throw std::runtime_error("Worker config: invalid log_level '" + log_level + "'");
}

WorkerConfig WorkerConfig::from_json(const nlohmann::json &root)
{
    const nlohmann::json &j =
        (root.contains("worker") && root["worker"].is_object()) ? root["worker"] : root;
    if (!j.is_object())
        throw std::runtime_error("Worker config: expected a JSON object");

    WorkerConfig cfg;
    cfg.name = config::string_value(j, "name", cfg.name);
    cfg.control_endpoint = config::string_value(j, "control_endpoint", cfg.control_endpoint);
    cfg.event_endpoint = config::string_value(j, "event_endpoint", cfg.event_endpoint);
    const auto seconds_value = [&j](const char *key, uint64_t fallback) {
        return std::chrono::seconds(
            config::unsigned_value(j, key, fallback, kWhat, config::kMaxDurationSeconds));
    };
    const auto ms_value = [&j](const char *key, uint64_t fallback) {
        return std::chrono::milliseconds(
            config::unsigned_value(j, key, fallback, kWhat, config::kMaxDurationMs));
    };
    cfg.job_timeout = seconds_value("job_timeout_s", 30);
    cfg.engine_timeout_margin = ms_value("engine_timeout_margin_ms", 1000);
    cfg.heartbeat_interval = ms_value("heartbeat_interval_ms", 1000);
    cfg.idle_timeout = ms_value("idle_timeout_ms", 15000);
    cfg.connect_timeout = ms_value("connect_timeout_ms", 3000);
    cfg.max_reconnect_attempts = static_cast<int>(config::unsigned_value(
        j, "max_reconnect_attempts", 10, kWhat, std::numeric_limits<int>::max()));
    cfg.max_reconnect_delay = seconds_value("max_reconnect_delay_s", 30);
    cfg.report_timeout = ms_value("report_timeout_ms", 5000);
    cfg.await_dispatcher = config::bool_value(j, "await_dispatcher", true, kWhat);
    cfg.max_bundle_size = config::unsigned_value(j, "max_bundle_size", cfg.max_bundle_size, kWhat);

    if (j.contains("engine"))
    {
        if (!j["engine"].is_object())
            throw std::runtime_error("Worker config: 'engine' must be an object");
        cfg.engine_command = config::string_value(j["engine"], "command", cfg.engine_command);
    }

    cfg.log_level = config::string_value(j, "log_level", cfg.log_level);
    cfg.log_file = config::string_value(j, "log_file", cfg.log_file);

    cfg.validate();
    return cfg;
}

WorkerConfig WorkerConfig::from_json_file(const std::string &path)
{
    return from_json(config::load_json_file(path, kWhat));
}

} // namespace testrelay::worker
