#pragma once
/**
 * @file job_registry.hpp
 * @brief Dispatcher-side job table: one in-flight slot, a FIFO queue, and the
 *        awaitable outcome of every admitted job.
 *
 * State machine:
 *
 *   Queued ──(slot free, FIFO)──> InFlight ──> Completed   (success result)
 *     │                              ├──────> Failed      (failure result)
 *     │                              ├──────> TimedOut    (deadline, no result)
 *     │                              └──────> Aborted     (deadline, worker lost and not back)
 *     └──(deadline while queued)──> TimedOut
 *
 * Every admitted job reaches exactly one terminal state; the promise behind its
 * JobTicket is fulfilled at that transition and never again. Terminal jobs leave the
 * table immediately; a bounded history of their ids lets late results be told apart
 * from results for ids that never existed.
 *
 * Thread-safe: every method takes the registry mutex. Submitting threads, the control
 * loop and the event stream thread all share one instance.
 */
#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "relay/outcome.hpp"
#include "testrelay_core_export.h"

namespace testrelay::dispatch
{

enum class JobState
{
    Queued,
    InFlight,
    Completed,
    Failed,
    TimedOut,
    Aborted,
};

TESTRELAY_CORE_EXPORT std::string_view to_string(JobState state) noexcept;

[[nodiscard]] inline bool is_terminal(JobState state) noexcept
{
    return state != JobState::Queued && state != JobState::InFlight;
}

/// Result of delivering a worker-reported outcome to the registry.
enum class ResolveStatus
{
    Accepted,        ///< The in-flight job was resolved with the outcome
    UnknownJob,      ///< No job with this id was ever seen (or it fell out of history)
    AlreadyTerminal, ///< The job already resolved (typically timed out); late result
    NotInFlight,     ///< The job is still queued and was never streamed
};

TESTRELAY_CORE_EXPORT std::string_view to_string(ResolveStatus status) noexcept;

/// Handle returned to a submitter: the job id and the future of its terminal outcome.
struct JobTicket
{
    std::string job_id;
    std::shared_future<relay::Outcome> outcome;
};

/// The in-flight job handed to the event stream.
struct StreamTask
{
    std::string job_id;
    std::shared_ptr<const std::vector<uint8_t>> payload;
    std::chrono::steady_clock::time_point deadline;
};

class TESTRELAY_CORE_EXPORT JobRegistry
{
  public:
    using Clock = std::chrono::steady_clock;

    /// @param history_size Number of terminal job ids remembered for late-result detection.
    explicit JobRegistry(std::size_t history_size = 256);

    JobRegistry(const JobRegistry &) = delete;
    JobRegistry &operator=(const JobRegistry &) = delete;

    /**
     * @brief Admits a job. It goes straight to InFlight when the slot is free,
     *        otherwise to the back of the queue.
     */
    JobTicket admit(std::shared_ptr<const std::vector<uint8_t>> payload, Clock::time_point deadline);

    /**
     * @brief Returns the in-flight job if it still needs streaming, and marks it as
     *        being streamed so it is handed out only once.
     */
    [[nodiscard]] std::optional<StreamTask> next_to_stream();

    /// Records that every event of @p job_id was sent. False if the job is no longer in flight.
    bool mark_streamed(const std::string &job_id);

    /// Records that streaming @p job_id stopped part way; the job is not streamed again.
    bool mark_stream_interrupted(const std::string &job_id);

    /**
     * @brief Resolves the in-flight job @p job_id with a worker-reported outcome.
     * Results for any other id are discarded without touching other jobs.
     */
    ResolveStatus resolve(const std::string &job_id, relay::Outcome outcome);

    /**
     * @brief Resolves every job whose deadline is at or before @p now.
     * @param worker_connected Whether a worker is subscribed right now; decides between
     *        TimedOut and Aborted for an in-flight job that lost its worker.
     * @return Number of jobs expired.
     */
    std::size_t expire(Clock::time_point now, bool worker_connected);

    /**
     * @brief Resolves @p job_id as expired regardless of its deadline, if it is not
     *        terminal yet. Used by a blocking submitter whose own wait ran out.
     * @return true if this call performed the transition.
     */
    bool expire_job(const std::string &job_id, bool worker_connected);

    /// Marks the in-flight job (if any) as having lost its worker connection.
    void note_worker_lost();

    /**
     * @brief Resolves every queued and in-flight job as Aborted with @p kind / @p message.
     * @return Number of jobs resolved.
     */
    std::size_t cancel_all(relay::FailureKind kind, const std::string &message);

    [[nodiscard]] std::optional<JobState> state(const std::string &job_id) const;
    [[nodiscard]] std::size_t queued_count() const;
    [[nodiscard]] std::size_t in_flight_count() const;
    [[nodiscard]] std::optional<std::string> in_flight_id() const;
    [[nodiscard]] bool idle() const;
    [[nodiscard]] uint64_t late_results() const;

  private:
    enum class StreamState
    {
        Pending,
        Streaming,
        Streamed,
        Interrupted,
    };

    struct Job
    {
        std::string id;
        std::shared_ptr<const std::vector<uint8_t>> payload;
        Clock::time_point submitted_at;
        Clock::time_point deadline;
        JobState state{JobState::Queued};
        StreamState stream{StreamState::Pending};
        bool worker_lost{false};
        std::promise<relay::Outcome> promise;
    };

    void finish_locked(const std::string &job_id, JobState terminal, relay::Outcome outcome);
    void expire_locked(Job &job, bool worker_connected);
    void promote_locked();
    void remember_locked(const std::string &job_id, JobState terminal);

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Job> m_jobs;
    std::deque<std::string> m_queue;
    std::optional<std::string> m_in_flight;

    std::size_t m_history_size;
    std::deque<std::string> m_history_order;
    std::unordered_map<std::string, JobState> m_history;
    uint64_t m_late_results{0};
};

} // namespace testrelay::dispatch
