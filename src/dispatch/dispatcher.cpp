#include "dispatch/dispatcher.hpp"

#include "event_stream.hpp"
#include "relay/wire.hpp"
#include "trl_platform.hpp"
#include "utils/logger.hpp"
#include "utils/zmq_context.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace testrelay::dispatch
{

namespace
{
// Control loop poll timeout (kept short so deadlines are enforced promptly)
constexpr std::chrono::milliseconds kPollTimeout{50};

namespace wire = relay::wire;
using relay::FailureKind;
using relay::Outcome;

JobTicket rejected_ticket(const std::string &reason)
{
    std::promise<Outcome> p;
    p.set_value(Outcome::failure(FailureKind::Validation, reason));
    return JobTicket{std::string{}, p.get_future().share()};
}
} // namespace

// ============================================================================
// DispatcherImpl: private state and logic
// ============================================================================

class DispatcherImpl
{
  public:
    explicit DispatcherImpl(DispatcherConfig c)
        : cfg(std::move(c)), stream((cfg.validate(), cfg), registry)
    {
    }

    DispatcherConfig cfg;
    JobRegistry registry;
    EventStream stream;

    std::atomic<bool> stop_requested{false};
    std::atomic<bool> accepting{true};
    std::atomic<uint64_t> last_heartbeat_ns{0}; ///< monotonic; 0 = never seen

    mutable std::mutex heartbeat_mu;
    std::string heartbeat_uid;

    /// A network submitter waiting for its SUBMIT_ACK (run() thread only).
    struct PendingSubmit
    {
        zmq::message_t identity;
        std::string correlation_id;
        JobTicket ticket;
    };
    std::vector<PendingSubmit> pending;

    JobTicket submit_async(std::vector<uint8_t> payload, std::chrono::milliseconds timeout);
    Outcome submit(std::vector<uint8_t> payload, std::chrono::milliseconds timeout);
    ResolveStatus ingest_result(const std::string &job_id, Outcome outcome);
    nlohmann::json health() const;

    void run();

    void process_message(zmq::socket_t &socket, const zmq::message_t &identity,
                         wire::ControlMessage &msg);
    void handle_submit_req(zmq::socket_t &socket, const zmq::message_t &identity,
                           wire::ControlMessage &msg, const std::string &correlation_id);
    nlohmann::json handle_result_req(const nlohmann::json &req, const std::string &correlation_id);
    void handle_heartbeat_req(const nlohmann::json &req);
    void flush_pending(zmq::socket_t &socket);

    static nlohmann::json make_submit_ack(const std::string &correlation_id,
                                          const std::string &job_id, const Outcome &outcome);
    static void send_reply(zmq::socket_t &socket, const zmq::message_t &identity,
                           std::string_view msg_type_ack, const nlohmann::json &body);
};

// ============================================================================
// Submission
// ============================================================================

JobTicket DispatcherImpl::submit_async(std::vector<uint8_t> payload,
                                       std::chrono::milliseconds timeout)
{
    if (stop_requested.load(std::memory_order_acquire) || !accepting.load(std::memory_order_acquire))
    {
        return rejected_ticket("dispatcher is shutting down");
    }
    if (payload.empty())
    {
        return rejected_ticket("payload must not be empty");
    }
    if (payload.size() > cfg.max_payload_size)
    {
        return rejected_ticket(fmt::format("payload of {} bytes exceeds the maximum of {} bytes",
                                           payload.size(), cfg.max_payload_size));
    }
    if (timeout.count() <= 0)
    {
        return rejected_ticket("timeout must be positive");
    }
    if (timeout > cfg.max_job_timeout)
    {
        return rejected_ticket(fmt::format("timeout of {} ms exceeds the maximum of {} ms",
                                           timeout.count(), cfg.max_job_timeout.count()));
    }

    const auto deadline = JobRegistry::Clock::now() + timeout;
    return registry.admit(std::make_shared<const std::vector<uint8_t>>(std::move(payload)),
                          deadline);
}

Outcome DispatcherImpl::submit(std::vector<uint8_t> payload, std::chrono::milliseconds timeout)
{
    const auto admitted = JobRegistry::Clock::now();
    JobTicket ticket = submit_async(std::move(payload), timeout);
    if (ticket.job_id.empty())
    {
        const Outcome &rejected = ticket.outcome.get();
        LOGGER_WARN("Dispatcher: submission rejected: {}", rejected.error_message());
        return rejected;
    }
    // submit_async bounded the timeout, so this cannot overflow.
    const auto deadline = admitted + timeout;
    if (ticket.outcome.wait_until(deadline) != std::future_status::ready)
    {
        // The control loop may win this race; the registry resolves the job only once.
        static_cast<void>(registry.expire_job(ticket.job_id, stream.worker_connected()));
    }
    return ticket.outcome.get();
}

ResolveStatus DispatcherImpl::ingest_result(const std::string &job_id, Outcome outcome)
{
    return registry.resolve(job_id, std::move(outcome));
}

nlohmann::json DispatcherImpl::health() const
{
    const bool connected = stream.worker_connected();
    const uint64_t hb = last_heartbeat_ns.load(std::memory_order_acquire);

    nlohmann::json j{{"status", accepting.load() && !stop_requested.load() ? "ok" : "shutting_down"},
                     {"worker_connected", connected},
                     {"queued", registry.queued_count()},
                     {"in_flight", registry.in_flight_count()},
                     {"accepting", accepting.load() && !stop_requested.load()},
                     {"late_results", registry.late_results()}};

    if (auto uid = stream.worker_uid())
    {
        j["worker_uid"] = *uid;
    }
    else
    {
        std::lock_guard<std::mutex> lock(heartbeat_mu);
        j["worker_uid"] = heartbeat_uid.empty() ? nlohmann::json(nullptr) : nlohmann::json(heartbeat_uid);
    }

    if (hb == 0)
    {
        j["last_heartbeat_age_ms"] = nullptr;
    }
    else
    {
        j["last_heartbeat_age_ms"] = platform::elapsed_time_ns(hb) / 1000000U;
    }
    return j;
}

// ============================================================================
// DispatcherImpl::run(): control loop
// ============================================================================

void DispatcherImpl::run()
{
    zmq::socket_t router(utils::get_zmq_context(), zmq::socket_type::router);
    router.set(zmq::sockopt::linger, 0);
    router.set(zmq::sockopt::router_mandatory, 1);
    router.bind(cfg.control_endpoint);
    const std::string bound_control = router.get(zmq::sockopt::last_endpoint);
    const std::string bound_event = stream.start();

    LOGGER_INFO("Dispatcher: control endpoint {}, event endpoint {}", bound_control, bound_event);
    if (cfg.on_ready)
    {
        cfg.on_ready(bound_control, bound_event);
    }

    std::optional<JobRegistry::Clock::time_point> drain_deadline;
    while (true)
    {
        try
        {
            std::vector<zmq::pollitem_t> items = {{router.handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, kPollTimeout);

            if ((items[0].revents & ZMQ_POLLIN) != 0)
            {
                std::vector<zmq::message_t> frames;
                static_cast<void>(zmq::recv_multipart(router, std::back_inserter(frames)));
                // Expected layout: [identity, 'C', msg_type, json_body, (payload)]
                if (frames.size() < 4)
                {
                    LOGGER_WARN("Dispatcher: malformed message (expected >=4 frames, got {})",
                                frames.size());
                }
                else
                {
                    auto decoded = wire::decode_control(frames, 1);
                    if (decoded.is_ok())
                    {
                        process_message(router, frames[0], decoded.content());
                    }
                    else
                    {
                        LOGGER_WARN("Dispatcher: malformed request: {}",
                                    relay::to_string(decoded.error()));
                    }
                }
            }
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_ERROR("Dispatcher: socket error: {}", e.what());
        }
        catch (const nlohmann::json::exception &e)
        {
            LOGGER_WARN("Dispatcher: ill-typed request field: {}", e.what());
        }

        const auto now = JobRegistry::Clock::now();
        static_cast<void>(registry.expire(now, stream.worker_connected()));
        flush_pending(router);

        if (stop_requested.load(std::memory_order_acquire))
        {
            if (!drain_deadline)
            {
                accepting.store(false, std::memory_order_release);
                drain_deadline = now + cfg.shutdown_timeout;
                LOGGER_INFO("Dispatcher: stopping; waiting up to {} ms for {} queued and {} in-flight job(s)",
                            cfg.shutdown_timeout.count(), registry.queued_count(),
                            registry.in_flight_count());
            }
            if (registry.idle() || now >= *drain_deadline)
            {
                break;
            }
        }
    }

    const std::size_t aborted =
        registry.cancel_all(FailureKind::WorkerDisconnect, "dispatcher shut down before the job finished");
    if (aborted > 0)
    {
        LOGGER_WARN("Dispatcher: aborted {} unfinished job(s) at shutdown", aborted);
    }
    flush_pending(router);

    stream.stop(cfg.notify_worker_on_shutdown);
    router.close();
    LOGGER_INFO("Dispatcher: stopped.");
}

// ============================================================================
// Message dispatch
// ============================================================================

void DispatcherImpl::process_message(zmq::socket_t &socket, const zmq::message_t &identity,
                                     wire::ControlMessage &msg)
{
    const std::optional<std::string> correlation_id = wire::string_field(msg.body, "correlation_id");
    if (!correlation_id)
    {
        LOGGER_WARN("Dispatcher: {} with a non-string correlation_id", msg.type);
        send_reply(socket, identity, wire::msg::kError,
                   wire::make_error("", "INVALID_REQUEST", "correlation_id must be a string"));
        return;
    }

    if (msg.type == wire::msg::kSubmitReq)
    {
        handle_submit_req(socket, identity, msg, *correlation_id);
    }
    else if (msg.type == wire::msg::kResultReq)
    {
        send_reply(socket, identity, wire::msg::kResultAck, handle_result_req(msg.body, *correlation_id));
    }
    else if (msg.type == wire::msg::kHeartbeatReq)
    {
        handle_heartbeat_req(msg.body);
    }
    else if (msg.type == wire::msg::kHealthReq)
    {
        nlohmann::json ack = health();
        ack["correlation_id"] = *correlation_id;
        send_reply(socket, identity, wire::msg::kHealthAck, ack);
    }
    else
    {
        LOGGER_WARN("Dispatcher: unknown msg_type '{}'", msg.type);
        send_reply(socket, identity, wire::msg::kError,
                   wire::make_error(*correlation_id, "UNKNOWN_MSG_TYPE", "Unknown message type: " + msg.type));
    }
}

void DispatcherImpl::handle_submit_req(zmq::socket_t &socket, const zmq::message_t &identity,
                                       wire::ControlMessage &msg, const std::string &correlation_id)
{
    std::chrono::milliseconds timeout = cfg.job_timeout;
    if (msg.body.contains("deadline_ms"))
    {
        const auto &d = msg.body["deadline_ms"];
        if (!d.is_number_unsigned() || d.get<uint64_t>() == 0)
        {
            send_reply(socket, identity, wire::msg::kError,
                       wire::make_error(correlation_id, "INVALID_REQUEST",
                                        "deadline_ms must be a positive integer"));
            return;
        }
        if (d.get<uint64_t>() > static_cast<uint64_t>(cfg.max_job_timeout.count()))
        {
            send_reply(socket, identity, wire::msg::kError,
                       wire::make_error(correlation_id, "INVALID_REQUEST",
                                        fmt::format("deadline_ms must not exceed {}",
                                                    cfg.max_job_timeout.count())));
            return;
        }
        timeout = std::chrono::milliseconds(d.get<uint64_t>());
    }

    std::vector<uint8_t> payload;
    if (msg.payload)
    {
        const auto *data = static_cast<const uint8_t *>(msg.payload->data());
        payload.assign(data, data + msg.payload->size());
    }
    LOGGER_DEBUG("Dispatcher: SUBMIT_REQ correlation_id='{}' ({} bytes, deadline {} ms)",
                 correlation_id, payload.size(), timeout.count());

    pending.push_back(PendingSubmit{zmq::message_t(identity.data(), identity.size()), correlation_id,
                                    submit_async(std::move(payload), timeout)});
}

nlohmann::json DispatcherImpl::handle_result_req(const nlohmann::json &req,
                                                 const std::string &correlation_id)
{
    if (!req.contains("job_id") || !req["job_id"].is_string() || !req.contains("outcome"))
    {
        return wire::make_error(correlation_id, "INVALID_REQUEST",
                                "RESULT_REQ requires job_id and outcome");
    }
    const std::string job_id = req["job_id"].get<std::string>();

    std::optional<Outcome> outcome;
    try
    {
        outcome.emplace(Outcome::from_json(req["outcome"]));
    }
    catch (const std::invalid_argument &e)
    {
        LOGGER_WARN("Dispatcher: RESULT_REQ for job {} has a malformed outcome: {}", job_id, e.what());
        return wire::make_error(correlation_id, "INVALID_REQUEST", e.what());
    }

    const ResolveStatus status = ingest_result(job_id, std::move(*outcome));
    nlohmann::json ack{{"correlation_id", correlation_id},
                       {"job_id", job_id},
                       {"status", status == ResolveStatus::Accepted ? "accepted" : "discarded"}};
    if (status != ResolveStatus::Accepted)
    {
        ack["reason"] = std::string(to_string(status));
    }
    return ack;
}

void DispatcherImpl::handle_heartbeat_req(const nlohmann::json &req)
{
    last_heartbeat_ns.store(platform::monotonic_time_ns(), std::memory_order_release);
    const std::string uid = wire::string_field(req, "worker_uid").value_or("");
    {
        std::lock_guard<std::mutex> lock(heartbeat_mu);
        heartbeat_uid = uid;
    }
    LOGGER_TRACE("Dispatcher: heartbeat from '{}'", uid);
}

void DispatcherImpl::flush_pending(zmq::socket_t &socket)
{
    for (auto it = pending.begin(); it != pending.end();)
    {
        if (it->ticket.outcome.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
        {
            ++it;
            continue;
        }
        send_reply(socket, it->identity, wire::msg::kSubmitAck,
                   make_submit_ack(it->correlation_id, it->ticket.job_id, it->ticket.outcome.get()));
        it = pending.erase(it);
    }
}

nlohmann::json DispatcherImpl::make_submit_ack(const std::string &correlation_id,
                                               const std::string &job_id, const Outcome &outcome)
{
    nlohmann::json ack{{"correlation_id", correlation_id},
                       {"job_id", job_id},
                       {"status", std::string(outcome.submit_status())}};
    if (outcome.is_success())
    {
        ack["results"] = outcome.results();
    }
    else
    {
        ack["error"] = outcome.error_message();
        ack["kind"] = std::string(relay::to_string(outcome.kind()));
    }
    return ack;
}

void DispatcherImpl::send_reply(zmq::socket_t &socket, const zmq::message_t &identity,
                                std::string_view msg_type_ack, const nlohmann::json &body)
{
    try
    {
        static_cast<void>(wire::send_control(socket, &identity, msg_type_ack, body));
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_WARN("Dispatcher: could not deliver {} ({})", msg_type_ack, e.what());
    }
}

// ============================================================================
// Dispatcher: public API forwarding to DispatcherImpl
// ============================================================================

Dispatcher::Dispatcher(DispatcherConfig cfg) : pImpl(std::make_unique<DispatcherImpl>(std::move(cfg)))
{
}

Dispatcher::~Dispatcher() = default;

relay::Outcome Dispatcher::submit(std::vector<uint8_t> payload)
{
    return pImpl->submit(std::move(payload), pImpl->cfg.job_timeout);
}

relay::Outcome Dispatcher::submit(std::vector<uint8_t> payload, std::chrono::milliseconds timeout)
{
    return pImpl->submit(std::move(payload), timeout);
}

JobTicket Dispatcher::submit_async(std::vector<uint8_t> payload, std::chrono::milliseconds timeout)
{
    return pImpl->submit_async(std::move(payload), timeout);
}

ResolveStatus Dispatcher::ingest_result(const std::string &job_id, relay::Outcome outcome)
{
    return pImpl->ingest_result(job_id, std::move(outcome));
}

void Dispatcher::run()
{
    pImpl->run();
}

void Dispatcher::stop()
{
    pImpl->stop_requested.store(true, std::memory_order_release);
}

bool Dispatcher::is_accepting() const noexcept
{
    return pImpl->accepting.load(std::memory_order_acquire) &&
           !pImpl->stop_requested.load(std::memory_order_acquire);
}

bool Dispatcher::worker_connected() const noexcept
{
    return pImpl->stream.worker_connected();
}

nlohmann::json Dispatcher::health() const
{
    return pImpl->health();
}

const JobRegistry &Dispatcher::registry() const noexcept
{
    return pImpl->registry;
}

} // namespace testrelay::dispatch
