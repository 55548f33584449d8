// tests/test_layer3_relay/test_dispatcher_e2e.cpp
/**
 * @file test_dispatcher_e2e.cpp
 * @brief Layer 3 end-to-end tests: a Dispatcher and a real worker stack talking
 *        over loopback TCP.
 *
 * Both endpoints bind "tcp://127.0.0.1:*"; the bound addresses are collected from
 * DispatcherConfig::on_ready before any client connects. The worker runs the
 * production ConnectionSupervisor, ZmqEventSource and ControlClient with an
 * in-process engine that echoes the bundle back.
 */
#include "test_entrypoint.h"

#include "dispatch/dispatcher.hpp"
#include "dispatch/relay_client.hpp"
#include "relay/request_channel.hpp"
#include "relay/wire.hpp"
#include "utils/uid_utils.hpp"
#include "utils/zmq_context.hpp"
#include "worker/connection_supervisor.hpp"
#include "worker/control_client.hpp"
#include "worker/event_source.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace testrelay;
using namespace std::chrono_literals;
using dispatch::Dispatcher;
using dispatch::DispatcherConfig;
using dispatch::ResolveStatus;
using relay::FailureKind;
using relay::Outcome;
using json = nlohmann::json;

namespace
{

std::vector<uint8_t> bytes_of(const std::string &s)
{
    return {s.begin(), s.end()};
}

/// Returns {"echo": <bundle as text>, "size": N}. Blocks on @c gate when one is set.
class EchoEngine : public worker::TestEngine
{
  public:
    json execute(std::span<const uint8_t> bundle, const worker::ExecutionOptions &options) override
    {
        std::shared_future<void> hold;
        {
            std::lock_guard<std::mutex> lock(mu);
            job_ids.push_back(options.job_id);
            timeouts.push_back(options.timeout);
            hold = gate;
        }
        if (hold.valid())
        {
            entered.store(true);
            hold.wait();
        }
        return {{"echo", std::string(bundle.begin(), bundle.end())}, {"size", bundle.size()}};
    }

    std::vector<std::string> seen()
    {
        std::lock_guard<std::mutex> lock(mu);
        return job_ids;
    }

    std::vector<std::chrono::milliseconds> seen_timeouts()
    {
        std::lock_guard<std::mutex> lock(mu);
        return timeouts;
    }

    void hold_jobs(std::shared_future<void> until)
    {
        std::lock_guard<std::mutex> lock(mu);
        gate = std::move(until);
    }

    std::mutex mu;
    std::vector<std::string> job_ids;
    std::vector<std::chrono::milliseconds> timeouts;
    std::shared_future<void> gate;
    std::atomic<bool> entered{false};
};

/// The full worker stack on its own thread.
class WorkerHarness
{
  public:
    WorkerHarness(const std::string &control, const std::string &event)
        : cfg(make_config(control, event)), uid(uid::generate_worker_uid("e2e")),
          control_client(control, uid, 2s),
          heartbeat_client(control, uid, 2s), executor(engine, control_client, 5s),
          source(event, uid), supervisor(cfg, source, executor, {},
                                         [this] { return heartbeat_client.send_heartbeat(); })
    {
        thread = std::thread([this] { exit_reason = supervisor.run(); });
    }

    ~WorkerHarness() { stop(); }

    void stop()
    {
        supervisor.stop();
        if (thread.joinable())
        {
            thread.join();
        }
    }

    static worker::WorkerConfig make_config(const std::string &control, const std::string &event)
    {
        worker::WorkerConfig cfg;
        cfg.control_endpoint = control;
        cfg.event_endpoint = event;
        cfg.await_dispatcher = false;
        cfg.max_reconnect_delay = 0s;
        cfg.max_reconnect_attempts = 50;
        cfg.connect_timeout = 500ms;
        cfg.idle_timeout = 3s;
        cfg.heartbeat_interval = 100ms;
        return cfg;
    }

    worker::WorkerConfig cfg;
    std::string uid;
    EchoEngine engine;
    worker::ControlClient control_client;
    worker::ControlClient heartbeat_client;
    worker::WorkerExecutor executor;
    worker::ZmqEventSource source;
    worker::ConnectionSupervisor supervisor;
    std::atomic<worker::ExitReason> exit_reason{worker::ExitReason::Stopped};
    std::thread thread;
};

} // namespace

class DispatcherE2ETest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        cfg_.control_endpoint = "tcp://127.0.0.1:*";
        cfg_.event_endpoint = "tcp://127.0.0.1:*";
        cfg_.job_timeout = 5s;
        cfg_.keepalive_interval = 200ms;
        cfg_.shutdown_timeout = 1s;
        cfg_.chunk_size = 1024;
    }

    void TearDown() override
    {
        worker_.reset();
        stop_dispatcher();
    }

    void start_dispatcher()
    {
        auto ready = std::make_shared<std::promise<std::pair<std::string, std::string>>>();
        auto ready_future = ready->get_future();
        cfg_.on_ready = [ready](const std::string &control, const std::string &event)
        { ready->set_value({control, event}); };
        dispatcher_ = std::make_unique<Dispatcher>(cfg_);
        run_thread_ = std::thread([this] { dispatcher_->run(); });
        ASSERT_EQ(ready_future.wait_for(5s), std::future_status::ready);
        std::tie(control_ep_, event_ep_) = ready_future.get();
    }

    void stop_dispatcher()
    {
        if (dispatcher_)
        {
            dispatcher_->stop();
        }
        if (run_thread_.joinable())
        {
            run_thread_.join();
        }
    }

    void start_worker()
    {
        worker_ = std::make_unique<WorkerHarness>(control_ep_, event_ep_);
        ASSERT_TRUE(tests::wait_until([this] { return dispatcher_->worker_connected(); }))
            << "worker never subscribed";
    }

    DispatcherConfig cfg_;
    std::unique_ptr<Dispatcher> dispatcher_;
    std::thread run_thread_;
    std::string control_ep_;
    std::string event_ep_;
    std::unique_ptr<WorkerHarness> worker_;
};

// ============================================================================
// Submission validation
// ============================================================================

TEST_F(DispatcherE2ETest, EmptyPayloadIsRejectedWithoutAJob)
{
    start_dispatcher();
    const Outcome o = dispatcher_->submit({}, 1s);
    ASSERT_FALSE(o.is_success());
    EXPECT_EQ(o.kind(), FailureKind::Validation);
    EXPECT_EQ(o.submit_status(), "rejected");
    EXPECT_TRUE(dispatcher_->registry().idle());

    auto ticket = dispatcher_->submit_async({}, 1s);
    EXPECT_TRUE(ticket.job_id.empty());
    EXPECT_EQ(ticket.outcome.wait_for(0s), std::future_status::ready);
}

TEST_F(DispatcherE2ETest, OversizedPayloadIsRejected)
{
    cfg_.max_payload_size = 16;
    start_dispatcher();
    const Outcome o = dispatcher_->submit(std::vector<uint8_t>(17, 1), 1s);
    ASSERT_FALSE(o.is_success());
    EXPECT_EQ(o.kind(), FailureKind::Validation);
    EXPECT_NE(o.error_message().find("exceeds"), std::string::npos);
    EXPECT_TRUE(dispatcher_->registry().idle());
}

TEST_F(DispatcherE2ETest, TimeoutAboveTheMaximumIsRejected)
{
    cfg_.max_job_timeout = 10s;
    start_dispatcher();

    const Outcome huge = dispatcher_->submit(bytes_of("x"), std::chrono::milliseconds::max());
    ASSERT_FALSE(huge.is_success());
    EXPECT_EQ(huge.kind(), FailureKind::Validation);
    EXPECT_NE(huge.error_message().find("maximum"), std::string::npos) << huge.error_message();

    const Outcome over = dispatcher_->submit(bytes_of("x"), 11s);
    EXPECT_EQ(over.kind(), FailureKind::Validation);
    EXPECT_TRUE(dispatcher_->registry().idle());

    dispatch::RelayClient client(control_ep_);
    const auto payload = bytes_of("remote");
    try
    {
        static_cast<void>(client.submit(payload, std::chrono::milliseconds(10000000000000000LL)));
        FAIL() << "an oversized deadline_ms was accepted";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_NE(std::string(e.what()).find("INVALID_REQUEST"), std::string::npos) << e.what();
    }
    EXPECT_TRUE(dispatcher_->registry().idle());
}

TEST_F(DispatcherE2ETest, NonStringCorrelationIdGetsInvalidRequest)
{
    start_dispatcher();
    zmq::socket_t raw(utils::get_zmq_context(), zmq::socket_type::dealer);
    raw.set(zmq::sockopt::linger, 0);
    raw.set(zmq::sockopt::rcvtimeo, 2000);
    raw.connect(control_ep_);
    ASSERT_TRUE(relay::wire::send_control(raw, nullptr, relay::wire::msg::kHealthReq,
                                          {{"correlation_id", 5}}));

    std::vector<zmq::message_t> frames;
    ASSERT_TRUE(zmq::recv_multipart(raw, std::back_inserter(frames)).has_value());
    auto reply = relay::wire::decode_control(frames, 0);
    ASSERT_TRUE(reply.is_ok());
    EXPECT_EQ(reply.content().type, relay::wire::msg::kError);
    EXPECT_EQ(reply.content().body["error_code"], "INVALID_REQUEST");

    // The run loop survives and keeps answering.
    dispatch::RelayClient client(control_ep_);
    EXPECT_TRUE(client.health(2s).has_value());
}

// ============================================================================
// Full round trips
// ============================================================================

TEST_F(DispatcherE2ETest, BundleRunsOnWorkerAndResultsComeBackVerbatim)
{
    start_dispatcher();
    start_worker();

    std::string text(5000, 'q');
    text += "-tail";
    const Outcome o = dispatcher_->submit(bytes_of(text), 5s);
    ASSERT_TRUE(o.is_success()) << o.error_message();
    EXPECT_EQ(o.results()["echo"], text);
    EXPECT_EQ(o.results()["size"], text.size());
    EXPECT_TRUE(dispatcher_->registry().idle());
}

TEST_F(DispatcherE2ETest, JobsRunOneAtATimeInSubmissionOrder)
{
    start_dispatcher();
    start_worker();

    std::vector<dispatch::JobTicket> tickets;
    for (int i = 0; i < 4; ++i)
    {
        tickets.push_back(dispatcher_->submit_async(bytes_of("bundle-" + std::to_string(i)), 5s));
    }
    EXPECT_LE(dispatcher_->registry().in_flight_count(), 1u);

    std::vector<std::string> expected;
    for (std::size_t i = 0; i < tickets.size(); ++i)
    {
        ASSERT_EQ(tickets[i].outcome.wait_for(10s), std::future_status::ready);
        const Outcome &o = tickets[i].outcome.get();
        ASSERT_TRUE(o.is_success()) << o.error_message();
        EXPECT_EQ(o.results()["echo"], "bundle-" + std::to_string(i));
        expected.push_back(tickets[i].job_id);
    }
    EXPECT_EQ(worker_->engine.seen(), expected);
}

TEST_F(DispatcherE2ETest, RelayClientSubmitsOverTheNetwork)
{
    start_dispatcher();
    start_worker();

    dispatch::RelayClient client(control_ep_);
    const auto payload = bytes_of("remote bundle");
    const dispatch::SubmitReply reply = client.submit(payload, 5s);
    EXPECT_TRUE(uid::is_job_id(reply.job_id)) << reply.job_id;
    ASSERT_TRUE(reply.outcome.is_success()) << reply.outcome.error_message();
    EXPECT_EQ(reply.outcome.results()["echo"], "remote bundle");

    const dispatch::SubmitReply rejected = client.submit(std::span<const uint8_t>{}, 5s);
    EXPECT_TRUE(rejected.job_id.empty());
    ASSERT_FALSE(rejected.outcome.is_success());
    EXPECT_EQ(rejected.outcome.kind(), FailureKind::Validation);
}

// ============================================================================
// Deadlines and late results
// ============================================================================

TEST_F(DispatcherE2ETest, TimesOutWithoutWorkerNoEarlierThanDeadline)
{
    start_dispatcher();
    const auto started = std::chrono::steady_clock::now();
    const Outcome o = dispatcher_->submit(bytes_of("nobody home"), 1s);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(o.is_success());
    EXPECT_EQ(o.kind(), FailureKind::Timeout);
    EXPECT_GE(elapsed, 1s);
    EXPECT_LT(elapsed, 4s);
    EXPECT_TRUE(dispatcher_->registry().idle());
}

TEST_F(DispatcherE2ETest, LateResultIsDiscardedAndCounted)
{
    start_dispatcher();
    auto ticket = dispatcher_->submit_async(bytes_of("slow"), 200ms);
    ASSERT_EQ(ticket.outcome.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(ticket.outcome.get().kind(), FailureKind::Timeout);

    EXPECT_EQ(dispatcher_->ingest_result(ticket.job_id, Outcome::success({{"late", true}})),
              ResolveStatus::AlreadyTerminal);
    EXPECT_EQ(dispatcher_->ingest_result("00000000-0000-4000-8000-000000000000", Outcome::success({})),
              ResolveStatus::UnknownJob);
    EXPECT_EQ(ticket.outcome.get().kind(), FailureKind::Timeout);
    EXPECT_EQ(dispatcher_->health()["late_results"], 1);
}

TEST_F(DispatcherE2ETest, LostWorkerAbortsInFlightJob)
{
    start_dispatcher();

    // A bare subscriber that takes the job and vanishes without reporting.
    zmq::socket_t ghost(utils::get_zmq_context(), zmq::socket_type::dealer);
    ghost.set(zmq::sockopt::linger, 0);
    ghost.set(zmq::sockopt::rcvtimeo, 3000);
    ghost.set(zmq::sockopt::routing_id, "WORKER-GHOST-00000000#1");
    ghost.connect(event_ep_);
    ASSERT_TRUE(relay::wire::send_control(ghost, nullptr, relay::wire::msg::kSubscribeReq,
                                          {{"worker_uid", "WORKER-GHOST-00000000"}}));
    ASSERT_TRUE(tests::wait_until([this] { return dispatcher_->worker_connected(); }));

    auto ticket = dispatcher_->submit_async(bytes_of("doomed"), 2s);
    bool saw_job_end = false;
    for (int i = 0; i < 50 && !saw_job_end; ++i)
    {
        std::vector<zmq::message_t> frames;
        if (!zmq::recv_multipart(ghost, std::back_inserter(frames)))
        {
            break;
        }
        auto ev = relay::wire::decode_event_frames(frames, 0);
        saw_job_end = ev.is_ok() && std::holds_alternative<relay::JobEnd>(ev.content());
    }
    ASSERT_TRUE(saw_job_end);
    ghost.close();

    ASSERT_EQ(ticket.outcome.wait_for(5s), std::future_status::ready);
    const Outcome &o = ticket.outcome.get();
    ASSERT_FALSE(o.is_success());
    EXPECT_EQ(o.kind(), FailureKind::WorkerDisconnect);
    EXPECT_EQ(dispatcher_->registry().state(ticket.job_id).value_or(dispatch::JobState::Queued),
              dispatch::JobState::Aborted);
}

TEST_F(DispatcherE2ETest, EngineTimeoutFollowsTheJobDeadline)
{
    start_dispatcher();
    start_worker();

    const Outcome o = dispatcher_->submit(bytes_of("bounded"), 3s);
    ASSERT_TRUE(o.is_success()) << o.error_message();
    const auto timeouts = worker_->engine.seen_timeouts();
    ASSERT_EQ(timeouts.size(), 1u);
    // The worker's own limit is 5 s; the job had less than 3 s left when it started.
    EXPECT_LT(timeouts[0], 3000ms);
    EXPECT_GT(timeouts[0], 0ms);
}

TEST_F(DispatcherE2ETest, JobSurvivesASessionDropAndCompletes)
{
    start_dispatcher();
    start_worker();

    std::promise<void> release;
    worker_->engine.hold_jobs(release.get_future().share());
    auto ticket = dispatcher_->submit_async(bytes_of("resilient"), 20s);
    ASSERT_TRUE(tests::wait_until([this] { return worker_->engine.entered.load(); }));

    // Another subscriber takes over the event session while the engine runs.
    {
        zmq::socket_t intruder(utils::get_zmq_context(), zmq::socket_type::dealer);
        intruder.set(zmq::sockopt::linger, 0);
        intruder.set(zmq::sockopt::rcvtimeo, 3000);
        intruder.connect(event_ep_);
        ASSERT_TRUE(relay::wire::send_control(intruder, nullptr, relay::wire::msg::kSubscribeReq,
                                              {{"worker_uid", "WORKER-INTRUDER-00000000"}}));
        std::vector<zmq::message_t> frames;
        ASSERT_TRUE(zmq::recv_multipart(intruder, std::back_inserter(frames)).has_value());
    }
    EXPECT_EQ(dispatcher_->registry().state(ticket.job_id).value_or(dispatch::JobState::Queued),
              dispatch::JobState::InFlight);

    release.set_value();
    ASSERT_EQ(ticket.outcome.wait_for(10s), std::future_status::ready);
    const Outcome &o = ticket.outcome.get();
    ASSERT_TRUE(o.is_success()) << o.error_message();
    EXPECT_EQ(o.results()["echo"], "resilient");
    EXPECT_EQ(dispatcher_->registry().state(ticket.job_id).value_or(dispatch::JobState::Queued),
              dispatch::JobState::Completed);

    // The worker notices the silent session and subscribes again.
    EXPECT_TRUE(tests::wait_until(
        [this] { return worker_->supervisor.connections() >= 2 && dispatcher_->worker_connected(); },
        15s));
    worker_->engine.hold_jobs({});
    const Outcome next = dispatcher_->submit(bytes_of("after"), 5s);
    EXPECT_TRUE(next.is_success()) << next.error_message();
}

// ============================================================================
// Health, heartbeats and shutdown
// ============================================================================

TEST_F(DispatcherE2ETest, HealthOverTheControlEndpoint)
{
    start_dispatcher();
    dispatch::RelayClient client(control_ep_);

    auto before = client.health(2s);
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ((*before)["status"], "ok");
    EXPECT_EQ((*before)["worker_connected"], false);
    EXPECT_TRUE((*before)["last_heartbeat_age_ms"].is_null());
    EXPECT_EQ((*before)["queued"], 0);

    start_worker();
    ASSERT_TRUE(tests::wait_until([this] { return !dispatcher_->health()["last_heartbeat_age_ms"].is_null(); }));
    auto after = client.health(2s);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ((*after)["worker_connected"], true);
    EXPECT_EQ((*after)["worker_uid"], worker_->uid);
    EXPECT_LT((*after)["last_heartbeat_age_ms"].get<uint64_t>(), 2000u);
}

TEST_F(DispatcherE2ETest, UnknownMessageTypeGetsError)
{
    start_dispatcher();
    relay::RequestChannel channel(control_ep_, "e2e-client");
    auto reply = channel.request("FROBNICATE_REQ", json::object(), relay::wire::msg::kError, 2s);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->type, "ERROR");
    EXPECT_EQ(reply->body["error_code"], "UNKNOWN_MSG_TYPE");
}

TEST_F(DispatcherE2ETest, StopNotifiesWorkerAndRejectsNewWork)
{
    start_dispatcher();
    start_worker();

    dispatcher_->stop();
    EXPECT_FALSE(dispatcher_->is_accepting());
    const Outcome rejected = dispatcher_->submit(bytes_of("too late"), 1s);
    EXPECT_EQ(rejected.kind(), FailureKind::Validation);

    stop_dispatcher();
    worker_->thread.join();
    EXPECT_EQ(worker_->exit_reason.load(), worker::ExitReason::ShutdownEvent);
}

TEST_F(DispatcherE2ETest, StopAbortsJobsThatOutliveTheDrain)
{
    cfg_.shutdown_timeout = 200ms;
    start_dispatcher();
    auto ticket = dispatcher_->submit_async(bytes_of("stranded"), 30s);
    ASSERT_FALSE(ticket.job_id.empty());

    stop_dispatcher();
    ASSERT_EQ(ticket.outcome.wait_for(0s), std::future_status::ready);
    const Outcome &o = ticket.outcome.get();
    EXPECT_EQ(o.kind(), FailureKind::WorkerDisconnect);
    EXPECT_EQ(o.error_message(), "dispatcher shut down before the job finished");
    EXPECT_TRUE(dispatcher_->registry().idle());
}
