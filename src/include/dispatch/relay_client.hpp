#pragma once
/**
 * @file relay_client.hpp
 * @brief Remote caller of a Dispatcher's control endpoint (SUBMIT_REQ, HEALTH_REQ).
 */
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include <nlohmann/json.hpp>

#include "relay/outcome.hpp"
#include "relay/request_channel.hpp"
#include "testrelay_core_export.h"

namespace testrelay::dispatch
{

struct SubmitReply
{
    std::string job_id; ///< Empty when the dispatcher rejected the bundle
    relay::Outcome outcome;
};

class TESTRELAY_CORE_EXPORT RelayClient
{
  public:
    /// Extra time allowed for the SUBMIT_ACK beyond the job deadline.
    static constexpr std::chrono::milliseconds kReplyGrace{5000};

    explicit RelayClient(std::string control_endpoint);

    /**
     * @brief Submits @p payload and blocks until the dispatcher reports the terminal outcome.
     *
     * @param deadline Job deadline sent as deadline_ms; the dispatcher's job_timeout is
     *                 used when zero.
     * @throws std::runtime_error if no SUBMIT_ACK arrives within deadline + kReplyGrace
     *         (or 60 s when @p deadline is zero), or the dispatcher answers ERROR.
     */
    SubmitReply submit(std::span<const uint8_t> payload,
                       std::chrono::milliseconds deadline = std::chrono::milliseconds{0});

    /// HEALTH_ACK body, or nullopt if the dispatcher did not answer within @p timeout.
    std::optional<nlohmann::json> health(std::chrono::milliseconds timeout);

  private:
    relay::RequestChannel m_channel;
};

} // namespace testrelay::dispatch
