#include "worker/event_source.hpp"

#include "relay/wire.hpp"
#include "utils/logger.hpp"
#include "utils/zmq_context.hpp"

#include <algorithm>
#include <vector>

namespace testrelay::worker
{

namespace
{
namespace wire = relay::wire;
} // namespace

ZmqEventSource::ZmqEventSource(std::string endpoint, std::string worker_uid)
    : m_endpoint(std::move(endpoint)), m_uid(std::move(worker_uid))
{
}

ZmqEventSource::~ZmqEventSource()
{
    close(false);
}

bool ZmqEventSource::connect(std::chrono::milliseconds timeout)
{
    close(false);
    try
    {
        ++m_session;
        m_socket.emplace(utils::get_zmq_context(), zmq::socket_type::dealer);
        m_socket->set(zmq::sockopt::linger, 0);
        m_socket->set(zmq::sockopt::rcvhwm, 0);
        m_socket->set(zmq::sockopt::routing_id, fmt::format("{}#{}", m_uid, m_session));
        m_socket->connect(m_endpoint);

        static_cast<void>(
            wire::send_control(*m_socket, nullptr, wire::msg::kSubscribeReq, {{"worker_uid", m_uid}}));

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true)
        {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                break;
            }
            std::vector<zmq::pollitem_t> items = {{m_socket->handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, remaining);
            if ((items[0].revents & ZMQ_POLLIN) == 0)
            {
                continue;
            }
            std::vector<zmq::message_t> frames;
            static_cast<void>(zmq::recv_multipart(*m_socket, std::back_inserter(frames)));
            auto decoded = wire::decode_control(frames, 0);
            if (decoded.is_ok() && decoded.content().type == wire::msg::kSubscribeAck)
            {
                LOGGER_INFO("ZmqEventSource: subscribed to {} (session {})", m_endpoint, m_session);
                return true;
            }
            LOGGER_WARN("ZmqEventSource: unexpected reply while subscribing");
        }
        LOGGER_WARN("ZmqEventSource: no SUBSCRIBE_ACK from {} within {} ms", m_endpoint,
                    timeout.count());
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_WARN("ZmqEventSource: subscribe to {} failed: {}", m_endpoint, e.what());
    }
    close(false);
    return false;
}

ReceiveResult ZmqEventSource::receive(std::chrono::milliseconds timeout)
{
    if (!m_socket)
    {
        return ReceiveResult::closed();
    }
    try
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true)
        {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            std::vector<zmq::pollitem_t> items = {{m_socket->handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, std::max(remaining, std::chrono::milliseconds{0}));
            if ((items[0].revents & ZMQ_POLLIN) == 0)
            {
                return ReceiveResult::timeout();
            }

            std::vector<zmq::message_t> frames;
            static_cast<void>(zmq::recv_multipart(*m_socket, std::back_inserter(frames)));
            const auto &ft = frames.front();
            if (ft.size() == 1 && *static_cast<const char *>(ft.data()) == wire::kFrameTypeControl)
            {
                // A control reply on the event socket (late ACK or ERROR) carries no event.
                LOGGER_DEBUG("ZmqEventSource: ignoring control message on the event channel");
                continue;
            }

            auto decoded = wire::decode_event_frames(frames, 0);
            if (decoded.is_error())
            {
                return ReceiveResult::malformed(decoded.error());
            }
            return ReceiveResult::of(std::move(decoded).content());
        }
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_WARN("ZmqEventSource: receive failed: {}", e.what());
        close(false);
        return ReceiveResult::closed();
    }
}

void ZmqEventSource::close(bool deliberate)
{
    if (!m_socket)
    {
        return;
    }
    if (deliberate)
    {
        try
        {
            m_socket->set(zmq::sockopt::linger, 200);
            const std::string body = nlohmann::json{{"worker_uid", m_uid}}.dump();
            std::vector<zmq::const_buffer> msgs = {
                zmq::buffer(&wire::kFrameTypeControl, 1),
                zmq::buffer(wire::msg::kUnsubscribeReq.data(), wire::msg::kUnsubscribeReq.size()),
                zmq::buffer(body)};
            static_cast<void>(zmq::send_multipart(*m_socket, msgs, zmq::send_flags::dontwait));
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_DEBUG("ZmqEventSource: UNSUBSCRIBE_REQ not sent: {}", e.what());
        }
    }
    m_socket->close();
    m_socket.reset();
    LOGGER_DEBUG("ZmqEventSource: session {} closed{}", m_session, deliberate ? " (deliberate)" : "");
}

} // namespace testrelay::worker
