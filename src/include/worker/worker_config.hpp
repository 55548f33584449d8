#pragma once
/**
 * @file worker_config.hpp
 * @brief Worker configuration, built in code or loaded from JSON.
 *
 * JSON layout (every field optional except engine.command for testrelay-worker):
 * @code
 * {
 *   "worker": {
 *     "name": "runner",
 *     "control_endpoint": "tcp://127.0.0.1:8325",
 *     "event_endpoint":   "tcp://127.0.0.1:8326",
 *     "job_timeout_s": 30,
 *     "engine_timeout_margin_ms": 1000,
 *     "heartbeat_interval_ms": 1000,
 *     "idle_timeout_ms": 15000,
 *     "connect_timeout_ms": 3000,
 *     "max_reconnect_attempts": 10,
 *     "max_reconnect_delay_s": 30,
 *     "report_timeout_ms": 5000,
 *     "await_dispatcher": true,
 *     "max_bundle_size": 52428800,
 *     "engine": { "command": "run-tests --bundle {bundle}" },
 *     "log_level": "info",
 *     "log_file": ""
 *   }
 * }
 * @endcode
 */
#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "testrelay_core_export.h"
#include "worker/reassembly_store.hpp"

namespace testrelay::worker
{

struct TESTRELAY_CORE_EXPORT WorkerConfig
{
    /// Prefix of the worker uid reported in SUBSCRIBE_REQ and heartbeats.
    std::string name{"worker"};

    std::string control_endpoint{"tcp://127.0.0.1:8325"};
    std::string event_endpoint{"tcp://127.0.0.1:8326"};

    /// Must match the dispatcher's job_timeout; the engine gets job_timeout - margin.
    std::chrono::milliseconds job_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds engine_timeout_margin{1000};

    std::chrono::milliseconds heartbeat_interval{1000};

    /// No event (keep_alive included) for this long closes the connection.
    std::chrono::milliseconds idle_timeout{15000};

    /// How long a subscribe may take before the attempt counts as failed.
    std::chrono::milliseconds connect_timeout{3000};

    int max_reconnect_attempts{10};
    std::chrono::seconds max_reconnect_delay{30};

    std::chrono::milliseconds report_timeout{5000};

    /// Poll HEALTH_REQ with backoff until the dispatcher answers before subscribing.
    bool await_dispatcher{true};

    std::size_t max_bundle_size{kDefaultMaxBundleSize};

    /// Shell command for CommandEngine; "{bundle}" is replaced by the bundle path.
    std::string engine_command;

    std::string log_level{"info"};
    std::string log_file;

    [[nodiscard]] std::chrono::milliseconds engine_timeout() const noexcept
    {
        return job_timeout - engine_timeout_margin;
    }

    /// @throws std::runtime_error if a value is out of range.
    void validate() const;

    /// Reads the "worker" object of @p j (or @p j itself when that key is absent).
    static WorkerConfig from_json(const nlohmann::json &j);

    /// @throws std::runtime_error on I/O, parse or validation errors.
    static WorkerConfig from_json_file(const std::string &path);
};

} // namespace testrelay::worker
