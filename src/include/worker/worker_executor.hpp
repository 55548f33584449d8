#pragma once
/**
 * @file worker_executor.hpp
 * @brief Runs a reassembled bundle through the TestEngine and reports the outcome.
 */
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "relay/outcome.hpp"
#include "testrelay_core_export.h"
#include "worker/test_engine.hpp"

namespace testrelay::worker
{

/// Delivers a job outcome to the dispatcher (RESULT_REQ in production).
class TESTRELAY_CORE_EXPORT ResultReporter
{
  public:
    virtual ~ResultReporter() = default;

    /// @return true once the dispatcher acknowledged the result.
    virtual bool report(const std::string &job_id, const relay::Outcome &outcome) = 0;
};

/**
 * @brief Engine time for a job with @p remaining time left before the dispatcher's
 *        deadline. @p margin is kept back for reporting, but never more than half
 *        of @p remaining, so a short deadline still leaves the engine some time.
 */
[[nodiscard]] TESTRELAY_CORE_EXPORT std::chrono::milliseconds
engine_budget(std::chrono::milliseconds remaining, std::chrono::milliseconds margin) noexcept;

class TESTRELAY_CORE_EXPORT WorkerExecutor
{
  public:
    /**
     * @param engine_timeout Passed to the engine as ExecutionOptions::timeout; set it
     *        below the dispatcher's job deadline so a hung run is reported as a failure
     *        instead of a dispatcher-side timeout.
     */
    WorkerExecutor(TestEngine &engine, ResultReporter &reporter,
                   std::chrono::milliseconds engine_timeout);

    /**
     * @brief Runs @p bundle. Never throws: every engine exception becomes an
     *        Execution failure carrying the exception text.
     * @param job_timeout Per-job limit from the job's deadline; the engine gets the
     *        smaller of this and the configured engine timeout.
     */
    relay::Outcome execute(const std::string &job_id, std::span<const uint8_t> bundle,
                           std::optional<std::chrono::milliseconds> job_timeout = std::nullopt);

    /// Sends @p outcome. A failed delivery is logged and not retried.
    bool report(const std::string &job_id, const relay::Outcome &outcome);

    /// execute() then report(). @return the outcome that was reported.
    relay::Outcome run(const std::string &job_id, std::span<const uint8_t> bundle,
                       std::optional<std::chrono::milliseconds> job_timeout = std::nullopt);

    [[nodiscard]] uint64_t jobs_run() const noexcept { return m_jobs_run; }
    [[nodiscard]] uint64_t reports_failed() const noexcept { return m_reports_failed; }

  private:
    TestEngine &m_engine;
    ResultReporter &m_reporter;
    std::chrono::milliseconds m_engine_timeout;
    uint64_t m_jobs_run{0};
    uint64_t m_reports_failed{0};
};

} // namespace testrelay::worker
