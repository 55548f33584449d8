#pragma once
/**
 * @file request_channel.hpp
 * @brief DEALER-side request/reply helper for the dispatcher's control endpoint.
 *
 * Every request carries a fresh "correlation_id". request() waits for a reply of the
 * expected type (or ERROR) whose correlation id matches; anything else is a stale
 * reply from an earlier, timed-out request and is dropped. After a timeout the socket
 * is closed and reopened on the next call, so a late reply can never be read as the
 * answer to a later request.
 *
 * Not thread-safe: each thread that talks to the dispatcher owns its own channel.
 */
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include "relay/wire.hpp"
#include "testrelay_core_export.h"

namespace testrelay::relay
{

class TESTRELAY_CORE_EXPORT RequestChannel
{
  public:
    /**
     * @param endpoint  Control endpoint, e.g. "tcp://127.0.0.1:8325".
     * @param name      Used as the correlation id prefix and in log lines.
     */
    RequestChannel(std::string endpoint, std::string name);
    ~RequestChannel();

    RequestChannel(const RequestChannel &) = delete;
    RequestChannel &operator=(const RequestChannel &) = delete;

    /**
     * @brief Sends @p type with @p body (plus @p payload as a binary frame when
     *        @p with_payload) and waits up to @p timeout for the reply.
     *
     * @return The reply (type @p expected_reply or ERROR), or nullopt on timeout.
     * @throws zmq::error_t on socket errors other than a timeout.
     */
    std::optional<wire::ControlMessage> request(std::string_view type, nlohmann::json body,
                                                std::string_view expected_reply,
                                                std::chrono::milliseconds timeout,
                                                std::span<const uint8_t> payload = {},
                                                bool with_payload = false);

    /**
     * @brief Sends a message that has no reply (HEARTBEAT_REQ).
     * @return false if the message could not be queued.
     */
    bool post(std::string_view type, const nlohmann::json &body);

    /// Closes the socket; the next call reconnects.
    void reset();

    [[nodiscard]] const std::string &endpoint() const noexcept { return m_endpoint; }

  private:
    zmq::socket_t &socket();
    std::string next_correlation_id();

    std::string m_endpoint;
    std::string m_name;
    std::optional<zmq::socket_t> m_socket;
    uint64_t m_seq{0};
};

} // namespace testrelay::relay
