#pragma once
/**
 * @file dispatcher.hpp
 * @brief Accepts test bundles, streams them to the single worker, and hands each
 *        caller the terminal outcome of its job.
 *
 * In-process callers use submit() (blocking) or submit_async(). Remote callers and
 * the worker talk to the control endpoint served by run():
 *
 *   SUBMIT_REQ {correlation_id, deadline_ms?} + bundle -> SUBMIT_ACK (when terminal)
 *   RESULT_REQ {job_id, outcome}                        -> RESULT_ACK {accepted|discarded}
 *   HEARTBEAT_REQ {worker_uid}                          (no reply)
 *   HEALTH_REQ {}                                       -> HEALTH_ACK
 *
 * The control loop never blocks on a job: pending network submissions are answered
 * as soon as their outcome is ready. All socket I/O is confined to run() and the
 * event stream thread; submit(), ingest_result(), health() and stop() are thread-safe.
 */
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dispatch/dispatcher_config.hpp"
#include "dispatch/job_registry.hpp"
#include "relay/outcome.hpp"
#include "testrelay_core_export.h"

namespace testrelay::dispatch
{

class DispatcherImpl;

class TESTRELAY_CORE_EXPORT Dispatcher
{
  public:
    explicit Dispatcher(DispatcherConfig cfg);
    ~Dispatcher();

    Dispatcher(const Dispatcher &) = delete;
    Dispatcher &operator=(const Dispatcher &) = delete;

    /// Blocking submit with the configured job timeout.
    relay::Outcome submit(std::vector<uint8_t> payload);

    /**
     * @brief Admits @p payload and blocks until its job is terminal.
     *
     * Returns a Validation failure without creating a job when the payload is empty,
     * larger than max_payload_size, or the dispatcher is shutting down. Otherwise the
     * returned outcome is the job's terminal outcome: the worker's report, Timeout once
     * @p timeout has elapsed since admission, or WorkerDisconnect.
     */
    relay::Outcome submit(std::vector<uint8_t> payload, std::chrono::milliseconds timeout);

    /**
     * @brief Admits @p payload without waiting.
     *
     * A rejected payload yields a ticket with an empty job id whose outcome is
     * already available. The deadline of an admitted job is enforced by run(); a caller
     * that waits on the ticket itself should wait no longer than @p timeout.
     */
    JobTicket submit_async(std::vector<uint8_t> payload, std::chrono::milliseconds timeout);

    /// Delivers a worker-reported outcome. Anything but the in-flight job is discarded.
    ResolveStatus ingest_result(const std::string &job_id, relay::Outcome outcome);

    /**
     * @brief Binds both endpoints and serves them until stop(). Blocks.
     *
     * On stop(): stops admitting, waits up to shutdown_timeout for outstanding jobs,
     * aborts whatever remains, optionally sends `shutdown` to the worker, and returns.
     *
     * @throws zmq::error_t if an endpoint cannot be bound.
     */
    void run();

    /// Requests run() to wind down. Thread-safe; may be called before run().
    void stop();

    [[nodiscard]] bool is_accepting() const noexcept;
    [[nodiscard]] bool worker_connected() const noexcept;

    /**
     * @brief Snapshot of dispatcher state, as returned by HEALTH_REQ:
     * status, worker_connected, worker_uid, last_heartbeat_age_ms, queued, in_flight,
     * accepting, late_results.
     */
    [[nodiscard]] nlohmann::json health() const;

    [[nodiscard]] const JobRegistry &registry() const noexcept;

  private:
    std::unique_ptr<DispatcherImpl> pImpl;
};

} // namespace testrelay::dispatch
