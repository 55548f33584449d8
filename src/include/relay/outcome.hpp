#pragma once
/**
 * @file outcome.hpp
 * @brief Terminal result of a job, as delivered to the submitting caller.
 *
 * Wire form (RESULT_REQ "outcome" field and SUBMIT_ACK):
 *   success: {"success": true,  "results": <any JSON>}
 *   failure: {"success": false, "error": "<message>", "kind": "execution"}
 *
 * The results payload is opaque: whatever the test engine produced is handed back
 * verbatim.
 */
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "testrelay_core_export.h"

namespace testrelay::relay
{

enum class FailureKind
{
    Validation,       ///< Rejected before admission (empty, oversized, shutting down)
    Execution,        ///< The worker failed to deserialize or run the bundle
    Timeout,          ///< No result before the job deadline
    WorkerDisconnect, ///< The worker's event connection was lost and not restored in time
};

TESTRELAY_CORE_EXPORT std::string_view to_string(FailureKind kind) noexcept;
TESTRELAY_CORE_EXPORT std::optional<FailureKind> failure_kind_from_string(std::string_view s) noexcept;

class TESTRELAY_CORE_EXPORT Outcome
{
  public:
    [[nodiscard]] static Outcome success(nlohmann::json results);
    [[nodiscard]] static Outcome failure(FailureKind kind, std::string message);

    /**
     * @brief Parses the wire form.
     * @throws std::invalid_argument if @p j is not a well-formed outcome object.
     */
    [[nodiscard]] static Outcome from_json(const nlohmann::json &j);

    [[nodiscard]] bool is_success() const noexcept { return m_success; }

    /// @throws std::logic_error on a failure outcome.
    [[nodiscard]] const nlohmann::json &results() const;

    /// @throws std::logic_error on a success outcome.
    [[nodiscard]] FailureKind kind() const;

    /// Empty for a success outcome.
    [[nodiscard]] const std::string &error_message() const noexcept { return m_error; }

    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Status string reported to a network submitter in SUBMIT_ACK.
     * @return "completed", "failed", "timeout", "worker_disconnect" or "rejected".
     */
    [[nodiscard]] std::string_view submit_status() const noexcept;

    bool operator==(const Outcome &other) const;

  private:
    Outcome() = default;

    bool m_success{false};
    nlohmann::json m_results;
    FailureKind m_kind{FailureKind::Execution};
    std::string m_error;
};

} // namespace testrelay::relay
