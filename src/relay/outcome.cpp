#include "relay/outcome.hpp"

#include <stdexcept>

namespace testrelay::relay
{

std::string_view to_string(FailureKind kind) noexcept
{
    switch (kind)
    {
    case FailureKind::Validation:
        return "validation";
    case FailureKind::Execution:
        return "execution";
    case FailureKind::Timeout:
        return "timeout";
    case FailureKind::WorkerDisconnect:
        return "worker_disconnect";
    }
    return "execution";
}

std::optional<FailureKind> failure_kind_from_string(std::string_view s) noexcept
{
    if (s == "validation")
        return FailureKind::Validation;
    if (s == "execution")
        return FailureKind::Execution;
    if (s == "timeout")
        return FailureKind::Timeout;
    if (s == "worker_disconnect")
        return FailureKind::WorkerDisconnect;
    return std::nullopt;
}

Outcome Outcome::success(nlohmann::json results)
{
    Outcome o;
    o.m_success = true;
    o.m_results = std::move(results);
    return o;
}

Outcome Outcome::failure(FailureKind kind, std::string message)
{
    Outcome o;
    o.m_success = false;
    o.m_kind = kind;
    o.m_error = std::move(message);
    return o;
}

Outcome Outcome::from_json(const nlohmann::json &j)
{
    if (!j.is_object() || !j.contains("success") || !j["success"].is_boolean())
    {
        throw std::invalid_argument("outcome: missing boolean 'success'");
    }
    if (j["success"].get<bool>())
    {
        // A worker may legitimately report success with no results body.
        return success(j.value("results", nlohmann::json{}));
    }

    // Failures reported by a worker without a kind are execution failures.
    FailureKind kind = FailureKind::Execution;
    if (j.contains("kind"))
    {
        if (!j["kind"].is_string())
        {
            throw std::invalid_argument("outcome: 'kind' must be a string");
        }
        const auto parsed = failure_kind_from_string(j["kind"].get<std::string>());
        if (!parsed)
        {
            throw std::invalid_argument("outcome: unknown failure kind '" +
                                        j["kind"].get<std::string>() + "'");
        }
        kind = *parsed;
    }
    std::string message;
    if (j.contains("error"))
    {
        message = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
    }
    return failure(kind, std::move(message));
}

const nlohmann::json &Outcome::results() const
{
    if (!m_success)
    {
        throw std::logic_error("Outcome::results() called on a failure outcome");
    }
    return m_results;
}

FailureKind Outcome::kind() const
{
    if (m_success)
    {
        throw std::logic_error("Outcome::kind() called on a success outcome");
    }
    return m_kind;
}

nlohmann::json Outcome::to_json() const
{
    if (m_success)
    {
        return {{"success", true}, {"results", m_results}};
    }
    return {{"success", false}, {"error", m_error}, {"kind", std::string(to_string(m_kind))}};
}

std::string_view Outcome::submit_status() const noexcept
{
    if (m_success)
    {
        return "completed";
    }
    switch (m_kind)
    {
    case FailureKind::Validation:
        return "rejected";
    case FailureKind::Execution:
        return "failed";
    case FailureKind::Timeout:
        return "timeout";
    case FailureKind::WorkerDisconnect:
        return "worker_disconnect";
    }
    return "failed";
}

bool Outcome::operator==(const Outcome &other) const
{
    if (m_success != other.m_success)
    {
        return false;
    }
    if (m_success)
    {
        return m_results == other.m_results;
    }
    return m_kind == other.m_kind && m_error == other.m_error;
}

} // namespace testrelay::relay
