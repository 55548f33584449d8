#include "worker/connection_supervisor.hpp"

#include "utils/config_utils.hpp"
#include "utils/logger.hpp"

#include <algorithm>

namespace testrelay::worker
{

namespace
{
// Upper bound for one receive() call or wait slice, so stop requests and the idle
// check stay responsive.
constexpr std::chrono::milliseconds kReceiveSlice{100};
} // namespace

using relay::FailureKind;
using relay::Outcome;
using relay::ProtocolError;

std::string_view to_string(SupervisorState state) noexcept
{
    switch (state)
    {
    case SupervisorState::Idle:               return "idle";
    case SupervisorState::AwaitingDispatcher: return "awaiting_dispatcher";
    case SupervisorState::Connecting:         return "connecting";
    case SupervisorState::Connected:          return "connected";
    case SupervisorState::Backoff:            return "backoff";
    case SupervisorState::Stopped:            return "stopped";
    case SupervisorState::GaveUp:             return "gave_up";
    }
    return "unknown";
}

std::string_view to_string(ExitReason reason) noexcept
{
    switch (reason)
    {
    case ExitReason::Stopped:       return "stopped";
    case ExitReason::ShutdownEvent: return "shutdown_event";
    case ExitReason::GaveUp:        return "gave_up";
    }
    return "unknown";
}

ConnectionSupervisor::ConnectionSupervisor(const WorkerConfig &cfg, EventSource &source,
                                           WorkerExecutor &executor, ReadinessCheck readiness,
                                           HeartbeatFn heartbeat)
    : m_cfg(cfg), m_source(source), m_executor(executor), m_readiness(std::move(readiness)),
      m_heartbeat(std::move(heartbeat)), m_reconnect_backoff{cfg.max_reconnect_delay},
      m_store(cfg.max_bundle_size)
{
}

ConnectionSupervisor::~ConnectionSupervisor()
{
    stop();
    stop_heartbeat();
}

bool ConnectionSupervisor::active() const noexcept
{
    switch (state())
    {
    case SupervisorState::AwaitingDispatcher:
    case SupervisorState::Connecting:
    case SupervisorState::Connected:
    case SupervisorState::Backoff:
        return true;
    default:
        return false;
    }
}

void ConnectionSupervisor::signal_stop() noexcept
{
    m_stop.store(true, std::memory_order_release);
}

void ConnectionSupervisor::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_wait_mu);
        m_stop.store(true, std::memory_order_release);
    }
    m_wait_cv.notify_all();
}

bool ConnectionSupervisor::wait_for(std::chrono::milliseconds d)
{
    // Woken by stop(); signal_stop() only sets the flag, seen at the next slice.
    const auto until = std::chrono::steady_clock::now() + d;
    std::unique_lock<std::mutex> lock(m_wait_mu);
    while (!stopping())
    {
        const auto now = std::chrono::steady_clock::now();
        if (now >= until)
        {
            return true;
        }
        m_wait_cv.wait_until(lock, std::min(until, now + kReceiveSlice));
    }
    return false;
}

// ============================================================================
// Main loop
// ============================================================================

ExitReason ConnectionSupervisor::run()
{
    if (m_heartbeat && !m_heartbeat_thread.joinable())
    {
        m_heartbeat_stop.store(false, std::memory_order_release);
        m_heartbeat_thread = std::thread(&ConnectionSupervisor::heartbeat_loop, this);
    }

    ExitReason reason = ExitReason::Stopped;
    try
    {
        if (m_cfg.await_dispatcher && m_readiness && !await_dispatcher())
        {
            m_state.store(SupervisorState::Stopped, std::memory_order_release);
            stop_heartbeat();
            return ExitReason::Stopped;
        }

        m_attempts.store(0, std::memory_order_release);
        while (!stopping())
        {
            m_state.store(SupervisorState::Connecting, std::memory_order_release);
            if (m_source.connect(m_cfg.connect_timeout))
            {
                m_attempts.store(0, std::memory_order_release);
                m_connections.fetch_add(1, std::memory_order_acq_rel);
                if (m_store.size() > 0)
                {
                    LOGGER_WARN("ConnectionSupervisor: dropping partial bundle of job {} from the previous session",
                                m_store.open_job().value_or(""));
                }
                m_store.clear();
                m_failed_job.reset();
                m_job_deadline.reset();
                m_state.store(SupervisorState::Connected, std::memory_order_release);
                LOGGER_INFO("ConnectionSupervisor: event session {} established",
                            m_connections.load());

                const SessionEnd end = run_session();
                if (end == SessionEnd::Shutdown)
                {
                    LOGGER_INFO("ConnectionSupervisor: dispatcher requested shutdown");
                    m_source.close(true);
                    reason = ExitReason::ShutdownEvent;
                    break;
                }
                if (end == SessionEnd::Stopped)
                {
                    m_source.close(true);
                    break;
                }
                m_source.close(false);
                LOGGER_WARN("ConnectionSupervisor: event session closed unexpectedly");
            }
            else if (stopping())
            {
                break;
            }

            const int attempts = m_attempts.fetch_add(1, std::memory_order_acq_rel) + 1;
            if (attempts > m_cfg.max_reconnect_attempts)
            {
                LOGGER_ERROR("ConnectionSupervisor: giving up after {} reconnect attempts",
                             m_cfg.max_reconnect_attempts);
                m_state.store(SupervisorState::GaveUp, std::memory_order_release);
                stop_heartbeat();
                return ExitReason::GaveUp;
            }
            const auto delay = m_reconnect_backoff.delay_for(attempts);
            LOGGER_INFO("ConnectionSupervisor: reconnect attempt {}/{} in {}s", attempts,
                        m_cfg.max_reconnect_attempts, delay.count());
            m_state.store(SupervisorState::Backoff, std::memory_order_release);
            if (!wait_for(delay))
            {
                break;
            }
        }
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("ConnectionSupervisor: fatal error: {}", e.what());
        m_state.store(SupervisorState::Stopped, std::memory_order_release);
        stop_heartbeat();
        throw;
    }

    m_state.store(SupervisorState::Stopped, std::memory_order_release);
    stop_heartbeat();
    LOGGER_INFO("ConnectionSupervisor: exiting ({})", to_string(reason));
    return reason;
}

bool ConnectionSupervisor::await_dispatcher()
{
    m_state.store(SupervisorState::AwaitingDispatcher, std::memory_order_release);
    for (int attempt = 1; !stopping(); ++attempt)
    {
        if (m_readiness())
        {
            LOGGER_INFO("ConnectionSupervisor: dispatcher is ready");
            return true;
        }
        const auto delay = m_readiness_backoff.delay_for(attempt);
        LOGGER_INFO("ConnectionSupervisor: dispatcher not ready; retrying in {} ms", delay.count());
        if (!wait_for(delay))
        {
            break;
        }
    }
    return false;
}

ConnectionSupervisor::SessionEnd ConnectionSupervisor::run_session()
{
    m_last_event = std::chrono::steady_clock::now();
    const auto slice = std::min(kReceiveSlice, m_cfg.idle_timeout);

    while (!stopping())
    {
        ReceiveResult r = m_source.receive(slice);
        switch (r.kind)
        {
        case ReceiveResult::Kind::Timeout:
            if (std::chrono::steady_clock::now() - m_last_event >= m_cfg.idle_timeout)
            {
                LOGGER_WARN("ConnectionSupervisor: no event for {} ms", m_cfg.idle_timeout.count());
                return SessionEnd::Closed;
            }
            break;

        case ReceiveResult::Kind::Closed:
            return SessionEnd::Closed;

        case ReceiveResult::Kind::Malformed:
            m_last_event = std::chrono::steady_clock::now();
            if (r.error == relay::DecodeError::ChunkSizeMismatch && m_store.open_job())
            {
                fail_job(*m_store.open_job(), ProtocolError::ChunkSizeMismatch);
            }
            else
            {
                LOGGER_WARN("ConnectionSupervisor: ignoring undecodable event ({})",
                            relay::to_string(r.error));
            }
            break;

        case ReceiveResult::Kind::Event:
            m_last_event = std::chrono::steady_clock::now();
            if (!std::visit([this](const auto &ev) { return on_event(ev); }, *r.event))
            {
                return SessionEnd::Shutdown;
            }
            break;
        }
    }
    return SessionEnd::Stopped;
}

// ============================================================================
// Event handlers (return false to end the session on `shutdown`)
// ============================================================================

bool ConnectionSupervisor::on_event(const relay::KeepAlive & /*ev*/)
{
    LOGGER_TRACE("ConnectionSupervisor: keep_alive");
    return true;
}

bool ConnectionSupervisor::on_event(const relay::JobStart &ev)
{
    auto opened = m_store.open(ev.job_id, ev.total_size);
    if (opened.is_error() && opened.error() == ProtocolError::BufferAlreadyOpen)
    {
        const std::string previous = m_store.open_job().value_or("");
        fail_job(previous, ProtocolError::BufferAlreadyOpen);
        opened = m_store.open(ev.job_id, ev.total_size);
    }
    if (opened.is_error())
    {
        fail_job(ev.job_id, opened.error());
        return true;
    }
    m_failed_job.reset();
    m_job_deadline.reset();
    if (ev.deadline_ms)
    {
        m_job_deadline = std::chrono::steady_clock::now() +
                         std::chrono::milliseconds(
                             std::min<uint64_t>(*ev.deadline_ms, config::kMaxDurationMs));
    }
    LOGGER_INFO("ConnectionSupervisor: receiving job {} ({} bytes)", ev.job_id, ev.total_size);
    return true;
}

bool ConnectionSupervisor::on_event(const relay::JobChunk &ev)
{
    if (m_failed_job == ev.job_id)
    {
        return true;
    }
    auto appended = m_store.append(ev.job_id, ev.data);
    if (appended.is_error())
    {
        fail_job(ev.job_id, appended.error());
        return true;
    }
    LOGGER_TRACE("ConnectionSupervisor: job {} chunk, {} bytes so far", ev.job_id, appended.content());
    return true;
}

bool ConnectionSupervisor::on_event(const relay::JobEnd &ev)
{
    if (m_failed_job == ev.job_id)
    {
        m_failed_job.reset();
        return true;
    }
    auto finished = m_store.finish(ev.job_id);
    if (finished.is_error())
    {
        fail_job(ev.job_id, finished.error());
        m_failed_job.reset();
        return true;
    }

    const std::vector<uint8_t> bundle = std::move(finished).content();
    std::optional<std::chrono::milliseconds> job_timeout;
    if (m_job_deadline)
    {
        job_timeout = engine_budget(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        *m_job_deadline - std::chrono::steady_clock::now()),
                                    m_cfg.engine_timeout_margin);
        m_job_deadline.reset();
    }
    static_cast<void>(m_executor.run(ev.job_id, bundle, job_timeout));
    // Idle detection restarts once the job has been processed.
    m_last_event = std::chrono::steady_clock::now();
    return true;
}

bool ConnectionSupervisor::on_event(const relay::Shutdown & /*ev*/)
{
    return false;
}

void ConnectionSupervisor::fail_job(const std::string &job_id, ProtocolError err)
{
    m_protocol_errors.fetch_add(1, std::memory_order_acq_rel);
    static_cast<void>(m_store.discard(job_id));
    m_failed_job = job_id;
    LOGGER_WARN("ConnectionSupervisor: protocol error for job {}: {}", job_id, relay::to_string(err));
    static_cast<void>(m_executor.report(
        job_id, Outcome::failure(FailureKind::Execution,
                                 fmt::format("protocol error while receiving the bundle: {}",
                                             relay::to_string(err)))));
}

// ============================================================================
// Heartbeat thread
// ============================================================================

void ConnectionSupervisor::heartbeat_loop()
{
    LOGGER_DEBUG("ConnectionSupervisor: heartbeat thread started ({} ms)",
                 m_cfg.heartbeat_interval.count());
    while (true)
    {
        if (m_heartbeat())
        {
            m_heartbeats.fetch_add(1, std::memory_order_acq_rel);
        }
        else
        {
            LOGGER_DEBUG("ConnectionSupervisor: heartbeat not sent");
        }
        std::unique_lock<std::mutex> lock(m_wait_mu);
        if (m_wait_cv.wait_for(lock, m_cfg.heartbeat_interval,
                               [this] { return m_heartbeat_stop.load(std::memory_order_acquire); }))
        {
            break;
        }
    }
}

void ConnectionSupervisor::stop_heartbeat()
{
    {
        std::lock_guard<std::mutex> lock(m_wait_mu);
        m_heartbeat_stop.store(true, std::memory_order_release);
    }
    m_wait_cv.notify_all();
    if (m_heartbeat_thread.joinable())
    {
        m_heartbeat_thread.join();
    }
}

} // namespace testrelay::worker
