#include "dispatch/relay_client.hpp"

#include "relay/wire.hpp"
#include "utils/config_utils.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace testrelay::dispatch
{

namespace
{
namespace wire = relay::wire;
using relay::FailureKind;
using relay::Outcome;

// Used for the reply wait when the caller leaves the deadline to the dispatcher.
constexpr std::chrono::milliseconds kDefaultReplyWait{60000};
// No dispatcher accepts a deadline past this; it also keeps now() + wait representable.
constexpr std::chrono::milliseconds kMaxReplyWait{config::kMaxDurationMs};

Outcome outcome_from_ack(const nlohmann::json &ack)
{
    const std::string status = ack.value("status", std::string{});
    if (status == "completed")
    {
        return Outcome::success(ack.value("results", nlohmann::json::object()));
    }
    if (status == "rejected")
    {
        return Outcome::failure(FailureKind::Validation, ack.value("error", std::string{}));
    }
    const auto kind = relay::failure_kind_from_string(ack.value("kind", std::string{}));
    if (!kind)
    {
        throw std::runtime_error(fmt::format("RelayClient: SUBMIT_ACK with unknown status '{}'", status));
    }
    return Outcome::failure(*kind, ack.value("error", std::string{}));
}
} // namespace

RelayClient::RelayClient(std::string control_endpoint)
    : m_channel(std::move(control_endpoint), "submit")
{
}

SubmitReply RelayClient::submit(std::span<const uint8_t> payload, std::chrono::milliseconds deadline)
{
    nlohmann::json req = nlohmann::json::object();
    std::chrono::milliseconds wait = kDefaultReplyWait;
    if (deadline.count() > 0)
    {
        req["deadline_ms"] = static_cast<uint64_t>(deadline.count());
        wait = std::min(deadline, kMaxReplyWait) + kReplyGrace;
    }

    LOGGER_DEBUG("RelayClient: submitting {} bytes to {}", payload.size(), m_channel.endpoint());
    auto reply = m_channel.request(wire::msg::kSubmitReq, std::move(req), wire::msg::kSubmitAck, wait,
                                   payload, true);
    if (!reply)
    {
        throw std::runtime_error(fmt::format("RelayClient: no SUBMIT_ACK from {} within {} ms",
                                             m_channel.endpoint(), wait.count()));
    }
    if (reply->type == wire::msg::kError)
    {
        throw std::runtime_error(fmt::format("RelayClient: dispatcher error {}: {}",
                                             reply->body.value("error_code", std::string{}),
                                             reply->body.value("message", std::string{})));
    }
    try
    {
        return SubmitReply{reply->body.value("job_id", std::string{}), outcome_from_ack(reply->body)};
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(fmt::format("RelayClient: malformed SUBMIT_ACK: {}", e.what()));
    }
}

std::optional<nlohmann::json> RelayClient::health(std::chrono::milliseconds timeout)
{
    auto reply = m_channel.request(wire::msg::kHealthReq, nlohmann::json::object(),
                                   wire::msg::kHealthAck, timeout);
    if (!reply || reply->type != wire::msg::kHealthAck)
    {
        return std::nullopt;
    }
    return std::move(reply->body);
}

} // namespace testrelay::dispatch
