#include "worker/worker_executor.hpp"

#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <exception>

namespace testrelay::worker
{

using relay::FailureKind;
using relay::Outcome;

std::chrono::milliseconds engine_budget(std::chrono::milliseconds remaining,
                                        std::chrono::milliseconds margin) noexcept
{
    if (remaining.count() <= 0)
    {
        return std::chrono::milliseconds{0};
    }
    return remaining - std::min(margin, remaining / 2);
}

WorkerExecutor::WorkerExecutor(TestEngine &engine, ResultReporter &reporter,
                               std::chrono::milliseconds engine_timeout)
    : m_engine(engine), m_reporter(reporter), m_engine_timeout(engine_timeout)
{
}

Outcome WorkerExecutor::execute(const std::string &job_id, std::span<const uint8_t> bundle,
                                std::optional<std::chrono::milliseconds> job_timeout)
{
    ++m_jobs_run;
    const auto timeout = job_timeout ? std::min(*job_timeout, m_engine_timeout) : m_engine_timeout;
    if (timeout.count() <= 0)
    {
        LOGGER_WARN("WorkerExecutor: job {} arrived after its deadline; not running it", job_id);
        return Outcome::failure(FailureKind::Execution,
                                "job deadline passed before the bundle could run");
    }
    LOGGER_INFO("WorkerExecutor: running job {} ({} bytes, {} ms limit)", job_id, bundle.size(),
                timeout.count());
    const auto started = std::chrono::steady_clock::now();

    try
    {
        nlohmann::json results = m_engine.execute(bundle, ExecutionOptions{job_id, timeout});
        LOGGER_INFO("WorkerExecutor: job {} finished in {} ms", job_id,
                    std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - started)
                        .count());
        return Outcome::success(std::move(results));
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("WorkerExecutor: job {} failed: {}", job_id,
                    format_tools::truncate_for_log(e.what()));
        return Outcome::failure(FailureKind::Execution, std::string("failed to run bundle: ") + e.what());
    }
    catch (...)
    {
        LOGGER_WARN("WorkerExecutor: job {} failed with a non-standard exception", job_id);
        return Outcome::failure(FailureKind::Execution, "failed to run bundle: unknown exception");
    }
}

bool WorkerExecutor::report(const std::string &job_id, const Outcome &outcome)
{
    bool delivered = false;
    try
    {
        delivered = m_reporter.report(job_id, outcome);
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("WorkerExecutor: reporting job {} threw: {}", job_id, e.what());
    }
    if (delivered)
    {
        LOGGER_INFO("WorkerExecutor: reported job {} ({})", job_id, outcome.submit_status());
    }
    else
    {
        ++m_reports_failed;
        LOGGER_WARN("WorkerExecutor: result of job {} was not delivered", job_id);
    }
    return delivered;
}

Outcome WorkerExecutor::run(const std::string &job_id, std::span<const uint8_t> bundle,
                            std::optional<std::chrono::milliseconds> job_timeout)
{
    Outcome outcome = execute(job_id, bundle, job_timeout);
    static_cast<void>(report(job_id, outcome));
    return outcome;
}

} // namespace testrelay::worker
