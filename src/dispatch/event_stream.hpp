#pragma once
/**
 * @file event_stream.hpp
 * @brief Dispatcher end of the event channel (internal to the dispatcher).
 *
 * Owns a ROUTER socket on the event endpoint and a thread that:
 *  - accepts SUBSCRIBE_REQ / UNSUBSCRIBE_REQ (a new subscriber replaces the old one),
 *  - streams the registry's in-flight job as job_start, job_chunk..., job_end,
 *    back to back, never interleaving two jobs,
 *  - sends keep_alive every keepalive_interval while a worker is subscribed,
 *  - sends shutdown to the worker when asked to stop with notification.
 *
 * A failed send (ROUTER_MANDATORY reports EHOSTUNREACH once the peer's connection is
 * gone) closes the session and tells the registry that the worker was lost. Nothing
 * is replayed to a later subscriber.
 */
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <zmq.hpp>

#include "dispatch/dispatcher_config.hpp"
#include "dispatch/job_registry.hpp"

namespace testrelay::dispatch
{

class EventStream
{
  public:
    EventStream(const DispatcherConfig &cfg, JobRegistry &registry);
    ~EventStream();

    EventStream(const EventStream &) = delete;
    EventStream &operator=(const EventStream &) = delete;

    /**
     * @brief Binds the event endpoint and starts the stream thread.
     * @return The bound endpoint.
     * @throws zmq::error_t if the endpoint cannot be bound.
     */
    std::string start();

    /**
     * @brief Stops the stream thread, optionally sending `shutdown` to the subscriber first.
     * Idempotent.
     */
    void stop(bool notify_worker);

    [[nodiscard]] bool worker_connected() const noexcept
    {
        return m_connected.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::optional<std::string> worker_uid() const;

  private:
    void run();
    void handle_request(std::vector<zmq::message_t> &frames);
    void stream_job(const StreamTask &task);
    bool send_or_drop(const relay::Event &ev);
    void drop_session(const std::string &reason);

    const DispatcherConfig &m_cfg;
    JobRegistry &m_registry;

    zmq::socket_t m_router;
    std::thread m_thread;

    // Owned by the stream thread once started.
    std::optional<zmq::message_t> m_subscriber;
    std::chrono::steady_clock::time_point m_last_send{};

    mutable std::mutex m_uid_mutex;
    std::string m_worker_uid;

    std::atomic<bool> m_connected{false};
    std::atomic<bool> m_stop_requested{false};
    std::atomic<bool> m_notify_on_stop{false};
};

} // namespace testrelay::dispatch
