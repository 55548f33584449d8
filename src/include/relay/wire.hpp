#pragma once
/**
 * @file wire.hpp
 * @brief ZeroMQ multipart framing shared by the dispatcher and the worker.
 *
 * Frame 0 of every message (after the ROUTER identity, when present) is a one-byte
 * frame type:
 *
 *   'C'  control:  ['C', msg_type, json_body]            (+ optional binary frame)
 *   'E'  event:    ['E', event_kind, json_header]        (+ binary frame for job_chunk)
 *
 * Control message types:
 *   SUBMIT_REQ / SUBMIT_ACK      caller  -> dispatcher, carries the bundle as a binary frame
 *   RESULT_REQ / RESULT_ACK      worker  -> dispatcher
 *   HEARTBEAT_REQ                worker  -> dispatcher (no reply)
 *   HEALTH_REQ / HEALTH_ACK      anyone  -> dispatcher
 *   SUBSCRIBE_REQ / SUBSCRIBE_ACK, UNSUBSCRIBE_REQ   worker -> dispatcher event endpoint
 *   ERROR                        dispatcher reply to an unknown or malformed request
 */
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <zmq.hpp>
#include <zmq_addon.hpp>

#include "relay/events.hpp"
#include "testrelay_core_export.h"
#include "utils/result.hpp"

namespace testrelay::relay::wire
{

inline constexpr char kFrameTypeControl = 'C';
inline constexpr char kFrameTypeEvent = 'E';

namespace msg
{
inline constexpr std::string_view kSubmitReq = "SUBMIT_REQ";
inline constexpr std::string_view kSubmitAck = "SUBMIT_ACK";
inline constexpr std::string_view kResultReq = "RESULT_REQ";
inline constexpr std::string_view kResultAck = "RESULT_ACK";
inline constexpr std::string_view kHeartbeatReq = "HEARTBEAT_REQ";
inline constexpr std::string_view kHealthReq = "HEALTH_REQ";
inline constexpr std::string_view kHealthAck = "HEALTH_ACK";
inline constexpr std::string_view kSubscribeReq = "SUBSCRIBE_REQ";
inline constexpr std::string_view kSubscribeAck = "SUBSCRIBE_ACK";
inline constexpr std::string_view kUnsubscribeReq = "UNSUBSCRIBE_REQ";
inline constexpr std::string_view kError = "ERROR";
} // namespace msg

/// A decoded control message. @c payload is set only when a binary frame followed the body.
struct ControlMessage
{
    std::string type;
    nlohmann::json body;
    std::optional<zmq::message_t> payload;
};

/**
 * @brief Sends a control message, prefixed by @p identity when replying from a ROUTER.
 * @return false if the socket would block (e.g. HWM reached on a DONTWAIT send).
 * @throws zmq::error_t on socket errors (EHOSTUNREACH for a vanished ROUTER peer).
 */
TESTRELAY_CORE_EXPORT bool send_control(zmq::socket_t &socket, const zmq::message_t *identity,
                                        std::string_view type, const nlohmann::json &body,
                                        std::span<const uint8_t> payload = {},
                                        bool with_payload = false);

/**
 * @brief Parses frames[offset..] as a control message.
 *
 * @p frames is consumed: the binary frame, if any, is moved into the result.
 */
[[nodiscard]] TESTRELAY_CORE_EXPORT utils::Result<ControlMessage, DecodeError>
decode_control(std::vector<zmq::message_t> &frames, std::size_t offset);

/**
 * @brief Sends @p ev to the ROUTER peer @p identity.
 * @throws zmq::error_t on socket errors (EHOSTUNREACH when the peer is gone).
 */
TESTRELAY_CORE_EXPORT bool send_event(zmq::socket_t &socket, const zmq::message_t &identity,
                                      const Event &ev);

/// Sends a job_chunk without copying @p data into an Event first.
TESTRELAY_CORE_EXPORT bool send_chunk(zmq::socket_t &socket, const zmq::message_t &identity,
                                      std::string_view job_id, std::span<const uint8_t> data);

/// Parses frames[offset..] (['E', kind, header] + optional data) into an Event.
[[nodiscard]] TESTRELAY_CORE_EXPORT utils::Result<Event, DecodeError>
decode_event_frames(const std::vector<zmq::message_t> &frames, std::size_t offset);

/**
 * @brief Reads @p key of a request body as a string.
 * @return "" when the key is absent, nullopt when it holds something other than a string.
 */
[[nodiscard]] TESTRELAY_CORE_EXPORT std::optional<std::string> string_field(const nlohmann::json &body,
                                                                           const char *key);

/// Builds the ERROR reply body.
[[nodiscard]] TESTRELAY_CORE_EXPORT nlohmann::json make_error(std::string_view correlation_id,
                                                              std::string_view error_code,
                                                              std::string_view message);

} // namespace testrelay::relay::wire
