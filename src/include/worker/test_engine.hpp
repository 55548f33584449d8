#pragma once
/**
 * @file test_engine.hpp
 * @brief Boundary between the worker and whatever actually runs a test bundle.
 *
 * An engine turns the raw bundle into engine-native input, runs it, and returns the
 * engine's results as JSON. Any failure (unreadable bundle, crash, non-zero exit,
 * timeout) is reported by throwing; WorkerExecutor converts the exception into an
 * Execution failure.
 */
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

#include <nlohmann/json.hpp>

#include "testrelay_core_export.h"

namespace testrelay::worker
{

struct ExecutionOptions
{
    std::string job_id;
    /// The engine must give up after this long. Always shorter than the dispatcher deadline.
    std::chrono::milliseconds timeout{std::chrono::seconds(29)};
};

class TESTRELAY_CORE_EXPORT TestEngine
{
  public:
    virtual ~TestEngine() = default;

    /**
     * @brief Runs @p bundle and returns the engine's result document.
     * @throws std::exception (any subclass) when the bundle cannot be run or the run fails.
     */
    virtual nlohmann::json execute(std::span<const uint8_t> bundle, const ExecutionOptions &options) = 0;
};

/**
 * @brief Runs a shell command per bundle.
 *
 * The bundle is written to a temporary file and @c command is run with `/bin/sh -c`
 * after every `{bundle}` in it is replaced by that file's path. The child is killed
 * (SIGKILL) once the timeout elapses.
 *
 * Exit status 0: stdout is parsed as JSON; non-JSON output is returned as
 * `{"stdout": "<text>"}`. Any other status throws std::runtime_error carrying the
 * status and the tail of stderr.
 */
class TESTRELAY_CORE_EXPORT CommandEngine : public TestEngine
{
  public:
    explicit CommandEngine(std::string command,
                           std::filesystem::path work_dir = std::filesystem::temp_directory_path());

    nlohmann::json execute(std::span<const uint8_t> bundle, const ExecutionOptions &options) override;

    [[nodiscard]] const std::string &command() const noexcept { return m_command; }

  private:
    std::string m_command;
    std::filesystem::path m_work_dir;
};

} // namespace testrelay::worker
