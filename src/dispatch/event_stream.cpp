#include "event_stream.hpp"

#include "relay/chunk_codec.hpp"
#include "relay/wire.hpp"
#include "utils/logger.hpp"
#include "utils/zmq_context.hpp"

#include <algorithm>
#include <cstring>
#include <span>
#include <vector>

namespace testrelay::dispatch
{

namespace
{
// Short poll so a freshly admitted job starts streaming promptly.
constexpr std::chrono::milliseconds kPollTimeout{20};
// ZMTP heartbeats let the ROUTER drop a silently vanished peer.
constexpr int kZmtpHeartbeatIvlMs = 1000;
constexpr int kZmtpHeartbeatTimeoutMs = 3000;

namespace wire = relay::wire;
} // namespace

EventStream::EventStream(const DispatcherConfig &cfg, JobRegistry &registry)
    : m_cfg(cfg), m_registry(registry),
      m_router(utils::get_zmq_context(), zmq::socket_type::router)
{
}

EventStream::~EventStream()
{
    stop(false);
}

std::string EventStream::start()
{
    m_router.set(zmq::sockopt::linger, 0);
    m_router.set(zmq::sockopt::router_mandatory, 1);
    m_router.set(zmq::sockopt::sndhwm, 0);
    m_router.set(zmq::sockopt::heartbeat_ivl, kZmtpHeartbeatIvlMs);
    m_router.set(zmq::sockopt::heartbeat_timeout, kZmtpHeartbeatTimeoutMs);
    m_router.bind(m_cfg.event_endpoint);
    const std::string bound = m_router.get(zmq::sockopt::last_endpoint);

    m_thread = std::thread(&EventStream::run, this);
    LOGGER_INFO("EventStream: listening on {}", bound);
    return bound;
}

void EventStream::stop(bool notify_worker)
{
    m_notify_on_stop.store(notify_worker, std::memory_order_release);
    m_stop_requested.store(true, std::memory_order_release);
    if (m_thread.joinable())
    {
        m_thread.join();
    }
}

std::optional<std::string> EventStream::worker_uid() const
{
    if (!worker_connected())
    {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(m_uid_mutex);
    return m_worker_uid;
}

void EventStream::run()
{
    while (!m_stop_requested.load(std::memory_order_acquire))
    {
        try
        {
            std::vector<zmq::pollitem_t> items = {{m_router.handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, kPollTimeout);

            if ((items[0].revents & ZMQ_POLLIN) != 0)
            {
                std::vector<zmq::message_t> frames;
                static_cast<void>(zmq::recv_multipart(m_router, std::back_inserter(frames)));
                handle_request(frames);
            }

            if (!m_subscriber)
            {
                continue;
            }
            if (auto task = m_registry.next_to_stream())
            {
                stream_job(*task);
            }
            if (m_subscriber &&
                std::chrono::steady_clock::now() - m_last_send >= m_cfg.keepalive_interval)
            {
                static_cast<void>(send_or_drop(relay::KeepAlive{}));
            }
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_ERROR("EventStream: socket error: {}", e.what());
        }
    }

    if (m_subscriber && m_notify_on_stop.load(std::memory_order_acquire))
    {
        if (send_or_drop(relay::Shutdown{}))
        {
            LOGGER_INFO("EventStream: sent shutdown to the worker");
        }
    }
    m_subscriber.reset();
    m_connected.store(false, std::memory_order_release);
    m_router.close();
    LOGGER_INFO("EventStream: stopped.");
}

void EventStream::handle_request(std::vector<zmq::message_t> &frames)
{
    if (frames.size() < 2)
    {
        LOGGER_WARN("EventStream: malformed message ({} frames)", frames.size());
        return;
    }
    auto decoded = wire::decode_control(frames, 1);
    if (decoded.is_error())
    {
        LOGGER_WARN("EventStream: malformed request: {}", relay::to_string(decoded.error()));
        return;
    }
    const auto &msg = decoded.content();
    const zmq::message_t &identity = frames[0];

    if (msg.type == wire::msg::kSubscribeReq)
    {
        std::string uid = wire::string_field(msg.body, "worker_uid").value_or("");
        if (uid.empty())
        {
            uid = "unknown";
        }
        if (m_subscriber)
        {
            LOGGER_WARN("EventStream: worker {} replaces the current subscriber", uid);
            drop_session("replaced by a new subscriber");
        }
        m_subscriber.emplace(identity.data(), identity.size());
        {
            std::lock_guard<std::mutex> lock(m_uid_mutex);
            m_worker_uid = uid;
        }
        try
        {
            static_cast<void>(wire::send_control(m_router, &identity, wire::msg::kSubscribeAck,
                                                 {{"status", "success"}}));
            m_last_send = std::chrono::steady_clock::now();
            m_connected.store(true, std::memory_order_release);
            LOGGER_INFO("EventStream: worker {} subscribed", uid);
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_WARN("EventStream: worker {} vanished before SUBSCRIBE_ACK: {}", uid, e.what());
            m_subscriber.reset();
        }
        return;
    }

    if (msg.type == wire::msg::kUnsubscribeReq)
    {
        if (m_subscriber && m_subscriber->size() == identity.size() &&
            std::memcmp(m_subscriber->data(), identity.data(), identity.size()) == 0)
        {
            LOGGER_INFO("EventStream: worker unsubscribed");
            drop_session("worker unsubscribed");
        }
        return;
    }

    LOGGER_WARN("EventStream: unknown msg_type '{}'", msg.type);
    try
    {
        static_cast<void>(wire::send_control(
            m_router, &identity, wire::msg::kError,
            wire::make_error("", "UNKNOWN_MSG_TYPE", "Unknown message type: " + msg.type)));
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_WARN("EventStream: could not send ERROR reply: {}", e.what());
    }
}

void EventStream::stream_job(const StreamTask &task)
{
    const std::span<const uint8_t> payload(task.payload->data(), task.payload->size());
    const auto chunks = relay::split(payload, m_cfg.chunk_size);
    LOGGER_INFO("EventStream: streaming job {} ({} bytes in {} chunks)", task.job_id,
                payload.size(), chunks.size());

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        task.deadline - std::chrono::steady_clock::now());
    const auto deadline_ms = static_cast<uint64_t>(std::max<int64_t>(remaining.count(), 0));
    if (!send_or_drop(relay::JobStart{task.job_id, relay::total_size(payload), deadline_ms}))
    {
        m_registry.mark_stream_interrupted(task.job_id);
        return;
    }
    for (std::size_t i = 0; i < chunks.size(); ++i)
    {
        if (i > 0 && m_cfg.chunk_interval.count() > 0)
        {
            std::this_thread::sleep_for(m_cfg.chunk_interval);
        }
        bool sent = false;
        try
        {
            sent = wire::send_chunk(m_router, *m_subscriber, task.job_id, chunks[i]);
        }
        catch (const zmq::error_t &e)
        {
            drop_session(e.what());
        }
        if (!sent)
        {
            drop_session("chunk send failed");
            m_registry.mark_stream_interrupted(task.job_id);
            return;
        }
        m_last_send = std::chrono::steady_clock::now();
    }
    if (!send_or_drop(relay::JobEnd{task.job_id}))
    {
        m_registry.mark_stream_interrupted(task.job_id);
        return;
    }
    m_registry.mark_streamed(task.job_id);
    LOGGER_DEBUG("EventStream: job {} streamed", task.job_id);
}

bool EventStream::send_or_drop(const relay::Event &ev)
{
    if (!m_subscriber)
    {
        return false;
    }
    try
    {
        if (wire::send_event(m_router, *m_subscriber, ev))
        {
            m_last_send = std::chrono::steady_clock::now();
            return true;
        }
        drop_session("send would block");
    }
    catch (const zmq::error_t &e)
    {
        drop_session(e.what());
    }
    return false;
}

void EventStream::drop_session(const std::string &reason)
{
    if (!m_subscriber)
    {
        return;
    }
    m_subscriber.reset();
    m_connected.store(false, std::memory_order_release);
    LOGGER_WARN("EventStream: worker session closed ({})", reason);
    m_registry.note_worker_lost();
}

} // namespace testrelay::dispatch
