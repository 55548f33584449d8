#include "relay/request_channel.hpp"

#include "utils/logger.hpp"
#include "utils/uid_utils.hpp"
#include "utils/zmq_context.hpp"

#include <vector>

namespace testrelay::relay
{

namespace
{
constexpr std::chrono::milliseconds kSendTimeout{1000};
} // namespace

RequestChannel::RequestChannel(std::string endpoint, std::string name)
    : m_endpoint(std::move(endpoint)), m_name(std::move(name))
{
}

RequestChannel::~RequestChannel() = default;

zmq::socket_t &RequestChannel::socket()
{
    if (!m_socket)
    {
        m_socket.emplace(utils::get_zmq_context(), zmq::socket_type::dealer);
        m_socket->set(zmq::sockopt::linger, 0);
        // A dispatcher that is down must not block senders once the queue is full.
        m_socket->set(zmq::sockopt::sndtimeo, static_cast<int>(kSendTimeout.count()));
        m_socket->connect(m_endpoint);
        LOGGER_DEBUG("RequestChannel[{}]: connected to {}", m_name, m_endpoint);
    }
    return *m_socket;
}

void RequestChannel::reset()
{
    if (m_socket)
    {
        m_socket->close();
        m_socket.reset();
    }
}

std::string RequestChannel::next_correlation_id()
{
    return fmt::format("{}-{:08x}-{}", m_name, uid::detail::random_u32(), ++m_seq);
}

std::optional<wire::ControlMessage> RequestChannel::request(std::string_view type, nlohmann::json body,
                                                            std::string_view expected_reply,
                                                            std::chrono::milliseconds timeout,
                                                            std::span<const uint8_t> payload,
                                                            bool with_payload)
{
    const std::string correlation_id = next_correlation_id();
    body["correlation_id"] = correlation_id;

    zmq::socket_t &sock = socket();
    if (!wire::send_control(sock, nullptr, type, body, payload, with_payload))
    {
        LOGGER_WARN("RequestChannel[{}]: {} could not be queued", m_name, type);
        reset();
        return std::nullopt;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            break;
        }
        std::vector<zmq::pollitem_t> items = {{sock.handle(), 0, ZMQ_POLLIN, 0}};
        zmq::poll(items, remaining);
        if ((items[0].revents & ZMQ_POLLIN) == 0)
        {
            continue;
        }

        std::vector<zmq::message_t> frames;
        static_cast<void>(zmq::recv_multipart(sock, std::back_inserter(frames)));
        auto decoded = wire::decode_control(frames, 0);
        if (decoded.is_error())
        {
            LOGGER_WARN("RequestChannel[{}]: malformed reply: {}", m_name,
                        to_string(decoded.error()));
            continue;
        }
        wire::ControlMessage &reply = decoded.content();
        if (reply.type != expected_reply && reply.type != wire::msg::kError)
        {
            LOGGER_DEBUG("RequestChannel[{}]: ignoring unexpected {}", m_name, reply.type);
            continue;
        }
        const std::string reply_cid = reply.body.value("correlation_id", std::string{});
        if (!reply_cid.empty() && reply_cid != correlation_id)
        {
            LOGGER_DEBUG("RequestChannel[{}]: ignoring stale {} ({})", m_name, reply.type, reply_cid);
            continue;
        }
        return std::move(reply);
    }

    LOGGER_DEBUG("RequestChannel[{}]: no {} within {} ms", m_name, expected_reply, timeout.count());
    reset();
    return std::nullopt;
}

bool RequestChannel::post(std::string_view type, const nlohmann::json &body)
{
    return wire::send_control(socket(), nullptr, type, body);
}

} // namespace testrelay::relay
