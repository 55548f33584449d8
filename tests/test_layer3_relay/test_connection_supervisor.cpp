// tests/test_layer3_relay/test_connection_supervisor.cpp
/**
 * @file test_connection_supervisor.cpp
 * @brief Layer 3 tests for the worker's reconnect loop and job reassembly.
 *
 * The supervisor is driven by ScriptedEventSource: every connect() consumes the
 * next scripted session, which either fails to connect or delivers a fixed list of
 * events and then closes (or goes silent). max_reconnect_delay is 0 so backoff
 * never sleeps.
 */
#include "test_entrypoint.h"
#include "relay/chunk_codec.hpp"
#include "worker/connection_supervisor.hpp"

#include <atomic>
#include <csignal>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include <pthread.h>

using namespace testrelay::worker;
using namespace testrelay::relay;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace
{

struct ScriptedSession
{
    enum class Tail
    {
        Close,  ///< receive() reports Closed once the events run out
        Silent, ///< receive() keeps timing out
    };

    bool connects{true};
    std::deque<ReceiveResult> results;
    Tail tail{Tail::Close};

    static ScriptedSession refused() { return ScriptedSession{false, {}, Tail::Close}; }
};

ScriptedSession session_of(std::vector<Event> events, ScriptedSession::Tail tail = ScriptedSession::Tail::Close)
{
    ScriptedSession s;
    for (auto &ev : events)
    {
        s.results.push_back(ReceiveResult::of(std::move(ev)));
    }
    s.tail = tail;
    return s;
}

class ScriptedEventSource : public EventSource
{
  public:
    explicit ScriptedEventSource(std::vector<ScriptedSession> script) : m_script(script.begin(), script.end()) {}

    bool connect(std::chrono::milliseconds /*timeout*/) override
    {
        connects.fetch_add(1);
        if (m_script.empty())
        {
            m_current.reset();
            return false;
        }
        ScriptedSession next = std::move(m_script.front());
        m_script.pop_front();
        if (!next.connects)
        {
            m_current.reset();
            return false;
        }
        m_current = std::move(next);
        return true;
    }

    ReceiveResult receive(std::chrono::milliseconds timeout) override
    {
        if (!m_current)
        {
            return ReceiveResult::closed();
        }
        if (!m_current->results.empty())
        {
            ReceiveResult r = std::move(m_current->results.front());
            m_current->results.pop_front();
            return r;
        }
        if (m_current->tail == ScriptedSession::Tail::Close)
        {
            m_current.reset();
            return ReceiveResult::closed();
        }
        std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(timeout, 5ms));
        return ReceiveResult::timeout();
    }

    void close(bool deliberate) override
    {
        m_current.reset();
        (deliberate ? deliberate_closes : dropped_closes).fetch_add(1);
    }

    std::atomic<int> connects{0};
    std::atomic<int> deliberate_closes{0};
    std::atomic<int> dropped_closes{0};

  private:
    std::deque<ScriptedSession> m_script;
    std::optional<ScriptedSession> m_current;
};

class EchoSizeEngine : public TestEngine
{
  public:
    json execute(std::span<const uint8_t> bundle, const ExecutionOptions &options) override
    {
        std::lock_guard<std::mutex> lock(mu);
        bundles.emplace_back(bundle.begin(), bundle.end());
        timeouts.push_back(options.timeout);
        return {{"job_id", options.job_id}, {"size", bundle.size()}};
    }

    std::mutex mu;
    std::vector<std::vector<uint8_t>> bundles;
    std::vector<std::chrono::milliseconds> timeouts;
};

class RecordingReporter : public ResultReporter
{
  public:
    bool report(const std::string &job_id, const Outcome &outcome) override
    {
        std::lock_guard<std::mutex> lock(mu);
        reports.emplace_back(job_id, outcome);
        return true;
    }

    std::size_t count()
    {
        std::lock_guard<std::mutex> lock(mu);
        return reports.size();
    }

    std::mutex mu;
    std::vector<std::pair<std::string, Outcome>> reports;
};

std::vector<Event> stream_job(const std::string &job_id, const std::vector<uint8_t> &payload,
                              std::size_t chunk_size = 8192)
{
    std::vector<Event> events;
    events.emplace_back(JobStart{job_id, payload.size()});
    for (const auto &chunk : split(payload, chunk_size))
    {
        events.emplace_back(JobChunk{job_id, {chunk.begin(), chunk.end()}});
    }
    events.emplace_back(JobEnd{job_id});
    return events;
}

std::vector<uint8_t> make_payload(std::size_t n)
{
    std::vector<uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        v[i] = static_cast<uint8_t>((i * 13U) & 0xFFU);
    }
    return v;
}

std::atomic<ConnectionSupervisor *> g_signal_target{nullptr};

extern "C" void stop_supervisor_on_signal(int /*sig*/)
{
    if (auto *supervisor = g_signal_target.load(); supervisor != nullptr)
    {
        supervisor->signal_stop();
    }
}

} // namespace

class ConnectionSupervisorTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        cfg_.max_reconnect_delay = 0s;
        cfg_.max_reconnect_attempts = 3;
        cfg_.await_dispatcher = false;
        cfg_.idle_timeout = 10s;
        cfg_.connect_timeout = 100ms;
    }

    WorkerConfig cfg_;
    EchoSizeEngine engine_;
    RecordingReporter reporter_;
    WorkerExecutor executor_{engine_, reporter_, 1s};
};

TEST_F(ConnectionSupervisorTest, ShutdownEventEndsTheLoop)
{
    ScriptedEventSource source({session_of({KeepAlive{}, Shutdown{}})});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    EXPECT_EQ(supervisor.run(), ExitReason::ShutdownEvent);
    EXPECT_EQ(supervisor.state(), SupervisorState::Stopped);
    EXPECT_FALSE(supervisor.active());
    EXPECT_EQ(supervisor.connections(), 1u);
    EXPECT_EQ(source.deliberate_closes.load(), 1);
}

TEST_F(ConnectionSupervisorTest, SuccessfulConnectResetsTheAttemptCounter)
{
    // Two rounds of (closure, refused, refused) would exceed 3 attempts without a reset.
    ScriptedEventSource source({session_of({KeepAlive{}}), ScriptedSession::refused(),
                                ScriptedSession::refused(), session_of({KeepAlive{}}),
                                ScriptedSession::refused(), ScriptedSession::refused(),
                                session_of({Shutdown{}})});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    EXPECT_EQ(supervisor.run(), ExitReason::ShutdownEvent);
    EXPECT_EQ(supervisor.connections(), 3u);
    EXPECT_EQ(supervisor.attempts(), 0);
    EXPECT_EQ(source.connects.load(), 7);
    EXPECT_EQ(source.dropped_closes.load(), 2);
}

TEST_F(ConnectionSupervisorTest, GivesUpAfterMaxAttempts)
{
    cfg_.max_reconnect_attempts = 2;
    ScriptedEventSource source(std::vector<ScriptedSession>{});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    EXPECT_EQ(supervisor.run(), ExitReason::GaveUp);
    EXPECT_EQ(supervisor.state(), SupervisorState::GaveUp);
    // The initial connect plus two retries, then the third failure exceeds the limit.
    EXPECT_EQ(source.connects.load(), 3);
    EXPECT_EQ(supervisor.connections(), 0u);
}

TEST_F(ConnectionSupervisorTest, ReconnectDelayFollowsBackoff)
{
    cfg_.max_reconnect_delay = 30s;
    ScriptedEventSource source(std::vector<ScriptedSession>{});
    ConnectionSupervisor supervisor(cfg_, source, executor_);
    EXPECT_EQ(supervisor.reconnect_delay(1), 0s);
    EXPECT_EQ(supervisor.reconnect_delay(2), 2s);
    EXPECT_EQ(supervisor.reconnect_delay(3), 4s);
    EXPECT_EQ(supervisor.reconnect_delay(9), 30s);
}

TEST_F(ConnectionSupervisorTest, ReassemblesAndRunsStreamedJob)
{
    const auto payload = make_payload(20000);
    auto events = stream_job("job-1", payload);
    events.emplace_back(Shutdown{});
    ScriptedEventSource source({session_of(std::move(events))});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    EXPECT_EQ(supervisor.run(), ExitReason::ShutdownEvent);
    ASSERT_EQ(engine_.bundles.size(), 1u);
    EXPECT_EQ(engine_.bundles[0], payload);
    ASSERT_EQ(reporter_.reports.size(), 1u);
    EXPECT_EQ(reporter_.reports[0].first, "job-1");
    ASSERT_TRUE(reporter_.reports[0].second.is_success());
    EXPECT_EQ(reporter_.reports[0].second.results()["size"], 20000);
    EXPECT_EQ(supervisor.protocol_errors(), 0u);
}

TEST_F(ConnectionSupervisorTest, JobsRunInArrivalOrder)
{
    auto events = stream_job("a", make_payload(10));
    const auto second = stream_job("b", make_payload(30000));
    events.insert(events.end(), second.begin(), second.end());
    events.emplace_back(Shutdown{});
    ScriptedEventSource source({session_of(std::move(events))});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    EXPECT_EQ(supervisor.run(), ExitReason::ShutdownEvent);
    ASSERT_EQ(reporter_.reports.size(), 2u);
    EXPECT_EQ(reporter_.reports[0].first, "a");
    EXPECT_EQ(reporter_.reports[1].first, "b");
    EXPECT_EQ(executor_.jobs_run(), 2u);
}

TEST_F(ConnectionSupervisorTest, OverflowIsReportedOnceAndRestIgnored)
{
    std::vector<Event> events = {
        JobStart{"bad", 10},
        JobChunk{"bad", std::vector<uint8_t>(12, 1)},
        JobChunk{"bad", std::vector<uint8_t>(4, 1)},
        JobEnd{"bad"},
        Shutdown{},
    };
    ScriptedEventSource source({session_of(std::move(events))});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    EXPECT_EQ(supervisor.run(), ExitReason::ShutdownEvent);
    EXPECT_TRUE(engine_.bundles.empty());
    ASSERT_EQ(reporter_.reports.size(), 1u);
    EXPECT_EQ(reporter_.reports[0].first, "bad");
    const Outcome &o = reporter_.reports[0].second;
    ASSERT_FALSE(o.is_success());
    EXPECT_EQ(o.kind(), FailureKind::Execution);
    EXPECT_NE(o.error_message().find("protocol error"), std::string::npos) << o.error_message();
    EXPECT_EQ(supervisor.protocol_errors(), 1u);
}

TEST_F(ConnectionSupervisorTest, ShortPayloadIsLengthMismatch)
{
    std::vector<Event> events = {JobStart{"short", 10}, JobChunk{"short", std::vector<uint8_t>(4, 1)},
                                 JobEnd{"short"}, Shutdown{}};
    ScriptedEventSource source({session_of(std::move(events))});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    EXPECT_EQ(supervisor.run(), ExitReason::ShutdownEvent);
    ASSERT_EQ(reporter_.reports.size(), 1u);
    EXPECT_NE(reporter_.reports[0].second.error_message().find("length mismatch"), std::string::npos)
        << reporter_.reports[0].second.error_message();
}

TEST_F(ConnectionSupervisorTest, ChunkSizeMismatchFailsOpenJob)
{
    ScriptedSession s = session_of({JobStart{"j", 8}});
    s.results.push_back(ReceiveResult::malformed(DecodeError::ChunkSizeMismatch));
    s.results.push_back(ReceiveResult::of(JobChunk{"j", std::vector<uint8_t>(8, 2)}));
    s.results.push_back(ReceiveResult::of(JobEnd{"j"}));
    s.results.push_back(ReceiveResult::of(Shutdown{}));
    ScriptedEventSource source({std::move(s)});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    EXPECT_EQ(supervisor.run(), ExitReason::ShutdownEvent);
    ASSERT_EQ(reporter_.reports.size(), 1u);
    EXPECT_FALSE(reporter_.reports[0].second.is_success());
    EXPECT_TRUE(engine_.bundles.empty());
}

TEST_F(ConnectionSupervisorTest, SecondJobStartFailsThePartialJob)
{
    std::vector<Event> events = {JobStart{"first", 100}, JobChunk{"first", std::vector<uint8_t>(50, 1)}};
    const auto second = stream_job("second", make_payload(64));
    events.insert(events.end(), second.begin(), second.end());
    events.emplace_back(Shutdown{});
    ScriptedEventSource source({session_of(std::move(events))});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    EXPECT_EQ(supervisor.run(), ExitReason::ShutdownEvent);
    ASSERT_EQ(reporter_.reports.size(), 2u);
    EXPECT_EQ(reporter_.reports[0].first, "first");
    EXPECT_FALSE(reporter_.reports[0].second.is_success());
    EXPECT_EQ(reporter_.reports[1].first, "second");
    EXPECT_TRUE(reporter_.reports[1].second.is_success());
}

TEST_F(ConnectionSupervisorTest, PartialJobIsDroppedOnReconnect)
{
    std::vector<Event> events = {JobStart{"lost", 100}, JobChunk{"lost", std::vector<uint8_t>(10, 1)}};
    auto next = stream_job("fresh", make_payload(5));
    next.emplace_back(Shutdown{});
    ScriptedEventSource source({session_of(std::move(events)), session_of(std::move(next))});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    EXPECT_EQ(supervisor.run(), ExitReason::ShutdownEvent);
    ASSERT_EQ(reporter_.reports.size(), 1u);
    EXPECT_EQ(reporter_.reports[0].first, "fresh");
    EXPECT_TRUE(reporter_.reports[0].second.is_success());
}

TEST_F(ConnectionSupervisorTest, IdleTimeoutClosesTheSession)
{
    cfg_.idle_timeout = 50ms;
    ScriptedEventSource source({session_of({KeepAlive{}}, ScriptedSession::Tail::Silent),
                                session_of({Shutdown{}})});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    EXPECT_EQ(supervisor.run(), ExitReason::ShutdownEvent);
    EXPECT_EQ(supervisor.connections(), 2u);
    EXPECT_EQ(source.dropped_closes.load(), 1);
}

TEST_F(ConnectionSupervisorTest, StopInterruptsAnIdleSession)
{
    ScriptedEventSource source({session_of({}, ScriptedSession::Tail::Silent)});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    std::atomic<int> exit_reason{-1};
    std::thread runner([&] { exit_reason = static_cast<int>(supervisor.run()); });
    ASSERT_TRUE(testrelay::tests::wait_until(
        [&] { return supervisor.state() == SupervisorState::Connected; }));
    EXPECT_TRUE(supervisor.active());
    supervisor.stop();
    runner.join();

    EXPECT_EQ(exit_reason.load(), static_cast<int>(ExitReason::Stopped));
    EXPECT_EQ(source.deliberate_closes.load(), 1);
}

TEST_F(ConnectionSupervisorTest, WaitsForReadinessBeforeSubscribing)
{
    cfg_.await_dispatcher = true;
    std::atomic<int> checks{0};
    ScriptedEventSource source({session_of({Shutdown{}})});
    ConnectionSupervisor supervisor(cfg_, source, executor_,
                                    [&] { return checks.fetch_add(1) >= 1; });

    EXPECT_EQ(supervisor.run(), ExitReason::ShutdownEvent);
    EXPECT_EQ(checks.load(), 2);
    EXPECT_EQ(source.connects.load(), 1);
}

TEST_F(ConnectionSupervisorTest, StopWhileAwaitingReadiness)
{
    cfg_.await_dispatcher = true;
    ScriptedEventSource source(std::vector<ScriptedSession>{});
    ConnectionSupervisor supervisor(cfg_, source, executor_, [] { return false; });

    std::thread runner([&] { EXPECT_EQ(supervisor.run(), ExitReason::Stopped); });
    ASSERT_TRUE(testrelay::tests::wait_until(
        [&] { return supervisor.state() == SupervisorState::AwaitingDispatcher; }));
    supervisor.stop();
    runner.join();
    EXPECT_EQ(source.connects.load(), 0);
}

TEST_F(ConnectionSupervisorTest, HeartbeatsFlowWhileConnected)
{
    cfg_.heartbeat_interval = 10ms;
    std::atomic<int> beats{0};
    ScriptedEventSource source({session_of({}, ScriptedSession::Tail::Silent)});
    ConnectionSupervisor supervisor(cfg_, source, executor_, {},
                                    [&]
                                    {
                                        beats.fetch_add(1);
                                        return true;
                                    });

    std::thread runner([&] { static_cast<void>(supervisor.run()); });
    EXPECT_TRUE(testrelay::tests::wait_until([&] { return supervisor.heartbeats_sent() >= 3; }));
    supervisor.stop();
    runner.join();

    const int after_stop = beats.load();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(beats.load(), after_stop);
    EXPECT_GE(after_stop, 3);
}

TEST(SupervisorStateTest, Strings)
{
    EXPECT_EQ(to_string(SupervisorState::AwaitingDispatcher), "awaiting_dispatcher");
    EXPECT_EQ(to_string(SupervisorState::GaveUp), "gave_up");
    EXPECT_EQ(to_string(ExitReason::ShutdownEvent), "shutdown_event");
}

TEST_F(ConnectionSupervisorTest, SignalDeliveredToTheRunThreadStopsIt)
{
    cfg_.await_dispatcher = true;
    ScriptedEventSource source(std::vector<ScriptedSession>{});
    std::atomic<int> checks{0};
    ConnectionSupervisor supervisor(cfg_, source, executor_,
                                    [&]
                                    {
                                        checks.fetch_add(1);
                                        return false;
                                    });

    struct sigaction action{};
    struct sigaction previous{};
    action.sa_handler = stop_supervisor_on_signal;
    sigemptyset(&action.sa_mask);
    ASSERT_EQ(sigaction(SIGUSR1, &action, &previous), 0);
    g_signal_target.store(&supervisor);

    std::atomic<bool> done{false};
    std::atomic<int> exit_reason{-1};
    std::thread runner(
        [&]
        {
            exit_reason = static_cast<int>(supervisor.run());
            done = true;
        });
    ASSERT_TRUE(testrelay::tests::wait_until(
        [&] { return supervisor.state() == SupervisorState::AwaitingDispatcher && checks.load() >= 1; }));

    // The handler runs on the thread that sits in the readiness backoff wait.
    ASSERT_EQ(pthread_kill(runner.native_handle(), SIGUSR1), 0);
    EXPECT_TRUE(testrelay::tests::wait_until([&] { return done.load(); }, 2000ms));
    runner.join();
    g_signal_target.store(nullptr);
    sigaction(SIGUSR1, &previous, nullptr);

    EXPECT_EQ(exit_reason.load(), static_cast<int>(ExitReason::Stopped));
    EXPECT_EQ(source.connects.load(), 0);
}

TEST_F(ConnectionSupervisorTest, SignalStopEndsReconnectBackoff)
{
    cfg_.max_reconnect_delay = 30s;
    cfg_.max_reconnect_attempts = 5;
    // Attempt 2 waits 2 s; signal_stop() must cut it short without a notify.
    ScriptedEventSource source(std::vector<ScriptedSession>{});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    std::atomic<bool> done{false};
    std::thread runner(
        [&]
        {
            EXPECT_EQ(supervisor.run(), ExitReason::Stopped);
            done = true;
        });
    ASSERT_TRUE(testrelay::tests::wait_until([&] { return source.connects.load() >= 2; }));
    supervisor.signal_stop();
    EXPECT_TRUE(testrelay::tests::wait_until([&] { return done.load(); }, 1000ms));
    runner.join();
    EXPECT_EQ(source.connects.load(), 2);
}

TEST_F(ConnectionSupervisorTest, JobDeadlineBoundsEngineTime)
{
    cfg_.engine_timeout_margin = 1000ms;
    WorkerExecutor executor(engine_, reporter_, 30s);
    const auto payload = make_payload(64);

    std::vector<Event> events;
    events.emplace_back(JobStart{"bounded", payload.size(), 5000});
    events.emplace_back(JobChunk{"bounded", payload});
    events.emplace_back(JobEnd{"bounded"});
    const auto unbounded = stream_job("unbounded", payload);
    events.insert(events.end(), unbounded.begin(), unbounded.end());
    events.emplace_back(Shutdown{});
    ScriptedEventSource source({session_of(std::move(events))});
    ConnectionSupervisor supervisor(cfg_, source, executor);

    EXPECT_EQ(supervisor.run(), ExitReason::ShutdownEvent);
    ASSERT_EQ(engine_.timeouts.size(), 2u);
    // 5 s left at job_start, 1 s kept back for reporting.
    EXPECT_LE(engine_.timeouts[0], 4000ms);
    EXPECT_GT(engine_.timeouts[0], 3000ms);
    EXPECT_EQ(engine_.timeouts[1], 30s);
    ASSERT_EQ(reporter_.reports.size(), 2u);
    EXPECT_TRUE(reporter_.reports[0].second.is_success());
}

TEST_F(ConnectionSupervisorTest, JobPastItsDeadlineIsNotRun)
{
    const auto payload = make_payload(16);
    std::vector<Event> events;
    events.emplace_back(JobStart{"late", payload.size(), 0});
    events.emplace_back(JobChunk{"late", payload});
    events.emplace_back(JobEnd{"late"});
    events.emplace_back(Shutdown{});
    ScriptedEventSource source({session_of(std::move(events))});
    ConnectionSupervisor supervisor(cfg_, source, executor_);

    EXPECT_EQ(supervisor.run(), ExitReason::ShutdownEvent);
    EXPECT_TRUE(engine_.bundles.empty());
    ASSERT_EQ(reporter_.reports.size(), 1u);
    EXPECT_EQ(reporter_.reports[0].first, "late");
    ASSERT_FALSE(reporter_.reports[0].second.is_success());
    EXPECT_EQ(reporter_.reports[0].second.kind(), FailureKind::Execution);
    EXPECT_NE(reporter_.reports[0].second.error_message().find("deadline"), std::string::npos);
}
