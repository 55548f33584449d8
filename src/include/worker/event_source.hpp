#pragma once
/**
 * @file event_source.hpp
 * @brief Worker end of the event channel.
 *
 * EventSource is the seam between the ConnectionSupervisor and the transport: the
 * supervisor only sees sessions that open, deliver decoded events and close. Tests
 * drive the supervisor through a scripted source; production uses ZmqEventSource.
 */
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <zmq.hpp>

#include "relay/events.hpp"
#include "testrelay_core_export.h"

namespace testrelay::worker
{

struct ReceiveResult
{
    enum class Kind
    {
        Event,     ///< @c event holds the decoded event
        Timeout,   ///< nothing arrived within the timeout
        Closed,    ///< the session is gone; connect() again
        Malformed, ///< a message arrived but could not be decoded; see @c error
    };

    Kind kind{Kind::Timeout};
    std::optional<relay::Event> event;
    relay::DecodeError error{relay::DecodeError::Unknown};

    static ReceiveResult of(relay::Event ev) { return {Kind::Event, std::move(ev), {}}; }
    static ReceiveResult timeout() { return {Kind::Timeout, std::nullopt, {}}; }
    static ReceiveResult closed() { return {Kind::Closed, std::nullopt, {}}; }
    static ReceiveResult malformed(relay::DecodeError err) { return {Kind::Malformed, std::nullopt, err}; }
};

class TESTRELAY_CORE_EXPORT EventSource
{
  public:
    virtual ~EventSource() = default;

    /**
     * @brief Opens a new session, replacing any previous one.
     * @return true once the dispatcher acknowledged the subscription within @p timeout.
     */
    virtual bool connect(std::chrono::milliseconds timeout) = 0;

    /// Waits up to @p timeout for the next event of the current session.
    virtual ReceiveResult receive(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Ends the current session. @p deliberate announces the close to the
     *        dispatcher (UNSUBSCRIBE_REQ) instead of just dropping the connection.
     */
    virtual void close(bool deliberate) = 0;
};

/**
 * @brief DEALER subscriber of a dispatcher's event endpoint.
 *
 * Each session uses a fresh socket whose routing id is "<worker_uid>#<n>", so the
 * dispatcher never mistakes a new session for the previous one.
 */
class TESTRELAY_CORE_EXPORT ZmqEventSource : public EventSource
{
  public:
    ZmqEventSource(std::string endpoint, std::string worker_uid);
    ~ZmqEventSource() override;

    ZmqEventSource(const ZmqEventSource &) = delete;
    ZmqEventSource &operator=(const ZmqEventSource &) = delete;

    bool connect(std::chrono::milliseconds timeout) override;
    ReceiveResult receive(std::chrono::milliseconds timeout) override;
    void close(bool deliberate) override;

    [[nodiscard]] uint64_t sessions() const noexcept { return m_session; }

  private:
    std::string m_endpoint;
    std::string m_uid;
    std::optional<zmq::socket_t> m_socket;
    uint64_t m_session{0};
};

} // namespace testrelay::worker
