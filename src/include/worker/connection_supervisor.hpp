#pragma once
/**
 * @file connection_supervisor.hpp
 * @brief Keeps the worker's single event session alive and feeds it into the executor.
 *
 * run() is one explicit loop:
 *
 *   [await dispatcher] -> connect -> receive events -> (closure) -> backoff -> connect ...
 *
 * - Before the first subscribe, the optional readiness check is retried with
 *   ReadinessBackoff until it succeeds.
 * - A successful connect resets the attempt counter and clears every reassembly buffer.
 * - An unexpected closure (transport error, idle_timeout without any event) or a
 *   failed connect increments the counter; past max_reconnect_attempts the supervisor
 *   gives up, otherwise it waits ReconnectBackoff::delay_for(attempts).
 * - A `shutdown` event or stop() ends the loop deliberately.
 *
 * Jobs are reassembled, executed and reported on the run() thread, one at a time.
 * Heartbeats are sent from a separate thread every heartbeat_interval regardless of
 * job activity. Every wait is cut short by stop() or signal_stop().
 */
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "relay/chunk_codec.hpp"
#include "relay/events.hpp"
#include "testrelay_core_export.h"
#include "utils/backoff_strategy.hpp"
#include "worker/event_source.hpp"
#include "worker/reassembly_store.hpp"
#include "worker/worker_config.hpp"
#include "worker/worker_executor.hpp"

namespace testrelay::worker
{

enum class SupervisorState : int
{
    Idle,
    AwaitingDispatcher,
    Connecting,
    Connected,
    Backoff,
    Stopped, ///< stop() or a shutdown event
    GaveUp,  ///< max_reconnect_attempts exceeded
};

TESTRELAY_CORE_EXPORT std::string_view to_string(SupervisorState state) noexcept;

enum class ExitReason : int
{
    Stopped,       ///< stop() was called
    ShutdownEvent, ///< the dispatcher sent `shutdown`
    GaveUp,        ///< reconnect attempts exhausted
};

TESTRELAY_CORE_EXPORT std::string_view to_string(ExitReason reason) noexcept;

class TESTRELAY_CORE_EXPORT ConnectionSupervisor
{
  public:
    /// Returns true once the dispatcher reports itself healthy.
    using ReadinessCheck = std::function<bool()>;
    /// Sends one heartbeat; called on the heartbeat thread. The result is only logged.
    using HeartbeatFn = std::function<bool()>;

    ConnectionSupervisor(const WorkerConfig &cfg, EventSource &source, WorkerExecutor &executor,
                         ReadinessCheck readiness = {}, HeartbeatFn heartbeat = {});
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor &) = delete;
    ConnectionSupervisor &operator=(const ConnectionSupervisor &) = delete;

    /// Blocks until stop(), a shutdown event, or giving up.
    ExitReason run();

    /// Thread-safe; interrupts any wait. A job being executed runs to completion first.
    void stop();

    /**
     * @brief Async-signal-safe stop request: only sets an atomic flag. Waits and
     *        receives notice it within one 100 ms slice.
     */
    void signal_stop() noexcept;

    [[nodiscard]] SupervisorState state() const noexcept { return m_state.load(std::memory_order_acquire); }
    [[nodiscard]] bool active() const noexcept;

    /// Consecutive failed connects or closures since the last successful connect.
    [[nodiscard]] int attempts() const noexcept { return m_attempts.load(std::memory_order_acquire); }
    [[nodiscard]] uint64_t connections() const noexcept { return m_connections.load(std::memory_order_acquire); }
    [[nodiscard]] uint64_t protocol_errors() const noexcept { return m_protocol_errors.load(std::memory_order_acquire); }
    [[nodiscard]] uint64_t heartbeats_sent() const noexcept { return m_heartbeats.load(std::memory_order_acquire); }

    [[nodiscard]] std::chrono::seconds reconnect_delay(int attempt) const noexcept
    {
        return m_reconnect_backoff.delay_for(attempt);
    }

  private:
    enum class SessionEnd
    {
        Closed,
        Shutdown,
        Stopped,
    };

    bool await_dispatcher();
    SessionEnd run_session();
    bool on_event(const relay::KeepAlive &ev);
    bool on_event(const relay::JobStart &ev);
    bool on_event(const relay::JobChunk &ev);
    bool on_event(const relay::JobEnd &ev);
    bool on_event(const relay::Shutdown &ev);
    /// Reports @p job_id as failed once, drops its buffer and ignores its remaining events.
    void fail_job(const std::string &job_id, relay::ProtocolError err);

    void heartbeat_loop();
    void stop_heartbeat();

    /// Sleeps for @p d unless stop() is called. @return false if interrupted.
    bool wait_for(std::chrono::milliseconds d);
    [[nodiscard]] bool stopping() const noexcept { return m_stop.load(std::memory_order_acquire); }

    const WorkerConfig &m_cfg;
    EventSource &m_source;
    WorkerExecutor &m_executor;
    ReadinessCheck m_readiness;
    HeartbeatFn m_heartbeat;

    utils::ReconnectBackoff m_reconnect_backoff;
    utils::ReadinessBackoff m_readiness_backoff;
    ReassemblyStore m_store;

    /// Job whose protocol error was already reported; its remaining events are ignored.
    std::optional<std::string> m_failed_job;
    /// Deadline announced by the open job's job_start, on the local clock.
    std::optional<std::chrono::steady_clock::time_point> m_job_deadline;
    std::chrono::steady_clock::time_point m_last_event{};

    std::atomic<SupervisorState> m_state{SupervisorState::Idle};
    std::atomic<int> m_attempts{0};
    std::atomic<uint64_t> m_connections{0};
    std::atomic<uint64_t> m_protocol_errors{0};
    std::atomic<uint64_t> m_heartbeats{0};

    std::atomic<bool> m_stop{false};
    std::atomic<bool> m_heartbeat_stop{false};
    std::mutex m_wait_mu;
    std::condition_variable m_wait_cv;
    std::thread m_heartbeat_thread;
};

} // namespace testrelay::worker
