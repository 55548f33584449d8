#pragma once
/**
 * @file dispatcher_config.hpp
 * @brief Dispatcher configuration, built in code or loaded from JSON.
 *
 * JSON layout (every field optional):
 * @code
 * {
 *   "dispatcher": {
 *     "control_endpoint": "tcp://127.0.0.1:8325",
 *     "event_endpoint":   "tcp://127.0.0.1:8326",
 *     "job_timeout_s": 30,
 *     "max_job_timeout_s": 86400,
 *     "chunk_size": 8192,
 *     "chunk_interval_ms": 0,
 *     "keepalive_interval_ms": 5000,
 *     "max_payload_size": 52428800,
 *     "shutdown_timeout_s": 30,
 *     "notify_worker_on_shutdown": true,
 *     "log_level": "info",
 *     "log_file": ""
 *   }
 * }
 * @endcode
 * String values of the form "env:VAR" are read from the environment.
 */
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "relay/chunk_codec.hpp"
#include "testrelay_core_export.h"

namespace testrelay::dispatch
{

struct TESTRELAY_CORE_EXPORT DispatcherConfig
{
    std::string control_endpoint{"tcp://127.0.0.1:8325"};
    std::string event_endpoint{"tcp://127.0.0.1:8326"};

    /// Default deadline for a submission, measured from admission (queueing included).
    std::chrono::milliseconds job_timeout{std::chrono::seconds(30)};

    /// Longest deadline a submission may ask for (SUBMIT_REQ "deadline_ms" included).
    std::chrono::milliseconds max_job_timeout{std::chrono::hours(24)};

    std::size_t chunk_size{relay::kDefaultChunkSize};

    /// Pause between consecutive chunks of one job. 0 streams back to back.
    std::chrono::milliseconds chunk_interval{0};

    /// Keep-alive period on the event channel; also bounds worker-loss detection.
    std::chrono::milliseconds keepalive_interval{5000};

    std::size_t max_payload_size{50U * 1024U * 1024U};

    /// How long stop() waits for queued and in-flight jobs before aborting them.
    std::chrono::milliseconds shutdown_timeout{std::chrono::seconds(30)};

    bool notify_worker_on_shutdown{true};

    std::string log_level{"info"};
    std::string log_file;

    /// Optional: called from run() once both endpoints are bound, with the bound
    /// addresses (useful with "tcp://127.0.0.1:*" in tests).
    std::function<void(const std::string &control, const std::string &event)> on_ready;

    /// @throws std::runtime_error if a value is out of range.
    void validate() const;

    /// Reads the "dispatcher" object of @p j (or @p j itself when that key is absent).
    static DispatcherConfig from_json(const nlohmann::json &j);

    /// @throws std::runtime_error on I/O, parse or validation errors.
    static DispatcherConfig from_json_file(const std::string &path);
};

} // namespace testrelay::dispatch
