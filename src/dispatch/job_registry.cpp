#include "dispatch/job_registry.hpp"

#include "utils/logger.hpp"
#include "utils/uid_utils.hpp"

#include <algorithm>

namespace testrelay::dispatch
{

using relay::FailureKind;
using relay::Outcome;

std::string_view to_string(JobState state) noexcept
{
    switch (state)
    {
    case JobState::Queued:    return "queued";
    case JobState::InFlight:  return "in_flight";
    case JobState::Completed: return "completed";
    case JobState::Failed:    return "failed";
    case JobState::TimedOut:  return "timed_out";
    case JobState::Aborted:   return "aborted";
    }
    return "unknown";
}

std::string_view to_string(ResolveStatus status) noexcept
{
    switch (status)
    {
    case ResolveStatus::Accepted:        return "accepted";
    case ResolveStatus::UnknownJob:      return "unknown_job";
    case ResolveStatus::AlreadyTerminal: return "already_terminal";
    case ResolveStatus::NotInFlight:     return "not_in_flight";
    }
    return "unknown";
}

JobRegistry::JobRegistry(std::size_t history_size) : m_history_size(std::max<std::size_t>(history_size, 1))
{
}

JobTicket JobRegistry::admit(std::shared_ptr<const std::vector<uint8_t>> payload,
                             Clock::time_point deadline)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string id = uid::generate_job_id();
    while (m_jobs.count(id) != 0 || m_history.count(id) != 0)
    {
        id = uid::generate_job_id();
    }

    Job job;
    job.id = id;
    job.payload = std::move(payload);
    job.submitted_at = Clock::now();
    job.deadline = deadline;
    JobTicket ticket{id, job.promise.get_future().share()};
    const std::size_t size = job.payload ? job.payload->size() : 0;

    m_jobs.emplace(id, std::move(job));
    m_queue.push_back(id);
    promote_locked();

    LOGGER_INFO("JobRegistry: admitted job {} ({} bytes, {})", id, size,
                to_string(m_jobs.at(id).state));
    return ticket;
}

std::optional<StreamTask> JobRegistry::next_to_stream()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_in_flight)
    {
        return std::nullopt;
    }
    auto &job = m_jobs.at(*m_in_flight);
    if (job.stream != StreamState::Pending)
    {
        return std::nullopt;
    }
    job.stream = StreamState::Streaming;
    return StreamTask{job.id, job.payload, job.deadline};
}

bool JobRegistry::mark_streamed(const std::string &job_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_in_flight != job_id)
    {
        return false;
    }
    m_jobs.at(job_id).stream = StreamState::Streamed;
    return true;
}

bool JobRegistry::mark_stream_interrupted(const std::string &job_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_in_flight != job_id)
    {
        return false;
    }
    m_jobs.at(job_id).stream = StreamState::Interrupted;
    LOGGER_WARN("JobRegistry: streaming of job {} was interrupted; it will not be resent",
                job_id);
    return true;
}

ResolveStatus JobRegistry::resolve(const std::string &job_id, Outcome outcome)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_in_flight == job_id)
    {
        const JobState terminal = outcome.is_success() ? JobState::Completed : JobState::Failed;
        finish_locked(job_id, terminal, std::move(outcome));
        return ResolveStatus::Accepted;
    }

    if (m_jobs.count(job_id) != 0)
    {
        LOGGER_WARN("JobRegistry: discarding result for job {} which is still queued", job_id);
        return ResolveStatus::NotInFlight;
    }

    const auto hist = m_history.find(job_id);
    if (hist != m_history.end())
    {
        ++m_late_results;
        LOGGER_WARN("JobRegistry: discarding late result for job {} (already {}); {} late so far",
                    job_id, to_string(hist->second), m_late_results);
        return ResolveStatus::AlreadyTerminal;
    }

    LOGGER_WARN("JobRegistry: discarding result for unknown job {}", job_id);
    return ResolveStatus::UnknownJob;
}

std::size_t JobRegistry::expire(Clock::time_point now, bool worker_connected)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::string> due;
    for (const auto &[id, job] : m_jobs)
    {
        if (job.deadline <= now)
        {
            due.push_back(id);
        }
    }
    // Queued jobs first, so an overdue queued job is never promoted into the slot the
    // in-flight job frees in the same pass.
    std::sort(due.begin(), due.end(), [this](const std::string &a, const std::string &b)
              { return (m_in_flight != a) && (m_in_flight == b); });
    for (const auto &id : due)
    {
        expire_locked(m_jobs.at(id), worker_connected);
    }
    return due.size();
}

bool JobRegistry::expire_job(const std::string &job_id, bool worker_connected)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_jobs.find(job_id);
    if (it == m_jobs.end())
    {
        return false;
    }
    expire_locked(it->second, worker_connected);
    return true;
}

void JobRegistry::note_worker_lost()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_in_flight)
    {
        m_jobs.at(*m_in_flight).worker_lost = true;
        LOGGER_WARN("JobRegistry: worker lost while job {} is in flight", *m_in_flight);
    }
}

std::size_t JobRegistry::cancel_all(FailureKind kind, const std::string &message)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    ids.reserve(m_jobs.size());
    for (const auto &[id, job] : m_jobs)
    {
        ids.push_back(id);
    }
    // Clear the queue first so finishing the in-flight job promotes nothing.
    m_queue.clear();
    for (const auto &id : ids)
    {
        finish_locked(id, JobState::Aborted, Outcome::failure(kind, message));
    }
    return ids.size();
}

std::optional<JobState> JobRegistry::state(const std::string &job_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (const auto it = m_jobs.find(job_id); it != m_jobs.end())
    {
        return it->second.state;
    }
    if (const auto it = m_history.find(job_id); it != m_history.end())
    {
        return it->second;
    }
    return std::nullopt;
}

std::size_t JobRegistry::queued_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

std::size_t JobRegistry::in_flight_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_in_flight ? 1U : 0U;
}

std::optional<std::string> JobRegistry::in_flight_id() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_in_flight;
}

bool JobRegistry::idle() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.empty();
}

uint64_t JobRegistry::late_results() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_late_results;
}

// ============================================================================
// Private helpers (m_mutex held)
// ============================================================================

void JobRegistry::expire_locked(Job &job, bool worker_connected)
{
    const std::string id = job.id;
    const double waited_s = std::chrono::duration<double>(Clock::now() - job.submitted_at).count();

    if (job.state == JobState::Queued)
    {
        m_queue.erase(std::remove(m_queue.begin(), m_queue.end(), id), m_queue.end());
        finish_locked(id, JobState::TimedOut,
                      Outcome::failure(FailureKind::Timeout,
                                       fmt::format("job timed out after {:.1f}s while queued",
                                                   waited_s)));
        return;
    }

    if (job.worker_lost && !worker_connected)
    {
        finish_locked(id, JobState::Aborted,
                      Outcome::failure(FailureKind::WorkerDisconnect,
                                       "worker disconnected while the job was in flight"));
        return;
    }
    finish_locked(id, JobState::TimedOut,
                  Outcome::failure(FailureKind::Timeout,
                                   fmt::format("job timed out after {:.1f}s", waited_s)));
}

void JobRegistry::finish_locked(const std::string &job_id, JobState terminal, Outcome outcome)
{
    auto node = m_jobs.extract(job_id);
    if (node.empty())
    {
        return;
    }
    Job &job = node.mapped();
    job.state = terminal;
    job.promise.set_value(std::move(outcome));
    remember_locked(job_id, terminal);

    if (terminal == JobState::Completed || terminal == JobState::Failed)
    {
        LOGGER_INFO("JobRegistry: job {} {}", job_id, to_string(terminal));
    }
    else
    {
        LOGGER_WARN("JobRegistry: job {} {}", job_id, to_string(terminal));
    }

    if (m_in_flight == job_id)
    {
        m_in_flight.reset();
        promote_locked();
    }
}

void JobRegistry::promote_locked()
{
    if (m_in_flight || m_queue.empty())
    {
        return;
    }
    const std::string next = m_queue.front();
    m_queue.pop_front();
    auto &job = m_jobs.at(next);
    job.state = JobState::InFlight;
    m_in_flight = next;
    LOGGER_DEBUG("JobRegistry: job {} is now in flight ({} queued)", next, m_queue.size());
}

void JobRegistry::remember_locked(const std::string &job_id, JobState terminal)
{
    m_history[job_id] = terminal;
    m_history_order.push_back(job_id);
    while (m_history_order.size() > m_history_size)
    {
        m_history.erase(m_history_order.front());
        m_history_order.pop_front();
    }
}

} // namespace testrelay::dispatch
