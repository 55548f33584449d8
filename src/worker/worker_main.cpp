/**
 * @file worker_main.cpp
 * @brief testrelay-worker: subscribes to a dispatcher and runs bundles with CommandEngine.
 *
 *     testrelay-worker --config <path.json> [--validate]
 *
 * Exit status: 0 after stop or a dispatcher shutdown, 2 when reconnect attempts are
 * exhausted, 1 on configuration errors.
 */
#include "trl_service.hpp"

#include "worker/connection_supervisor.hpp"
#include "worker/control_client.hpp"
#include "worker/event_source.hpp"
#include "worker/test_engine.hpp"
#include "worker/worker_config.hpp"
#include "worker/worker_executor.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace
{
std::atomic<bool> g_shutdown{false};
std::atomic<testrelay::worker::ConnectionSupervisor *> g_supervisor{nullptr};

void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown.load(std::memory_order_relaxed))
    {
        std::_Exit(1);
    }
    g_shutdown.store(true, std::memory_order_relaxed);
    if (auto *supervisor = g_supervisor.load(std::memory_order_acquire); supervisor != nullptr)
    {
        supervisor->signal_stop();
    }
}

struct WorkerArgs
{
    std::string config_path;
    bool validate_only{false};
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog << " --config <path.json> [--validate]\n\n"
              << "Options:\n"
              << "  --config <path>   Worker JSON config (required; must set engine.command)\n"
              << "  --validate        Load and check the config, then exit 0/1\n"
              << "  --help            Show this message\n";
}

WorkerArgs parse_args(int argc, char *argv[])
{
    WorkerArgs args;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--config" && i + 1 < argc)
        {
            args.config_path = argv[++i];
        }
        else if (arg == "--validate")
        {
            args.validate_only = true;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    if (args.config_path.empty())
    {
        std::cerr << "Error: --config <path> is required\n\n";
        print_usage(argv[0]);
        std::exit(1);
    }
    return args;
}
} // namespace

int main(int argc, char *argv[])
{
    using namespace testrelay;

    const WorkerArgs args = parse_args(argc, argv);

    worker::WorkerConfig cfg;
    try
    {
        cfg = worker::WorkerConfig::from_json_file(args.config_path);
        if (cfg.engine_command.empty())
        {
            throw std::runtime_error("Worker config: engine.command is required");
        }
        config::apply_logging(cfg.log_level, cfg.log_file);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }
    if (args.validate_only)
    {
        std::cout << "Config OK: control " << cfg.control_endpoint << ", event " << cfg.event_endpoint
                  << ", engine '" << cfg.engine_command << "'\n";
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const std::string uid = uid::generate_worker_uid(cfg.name);
    LOGGER_INFO("testrelay-worker {} starting (pid {})", uid, platform::get_pid());

    int rc = 0;
    {
        worker::CommandEngine engine(cfg.engine_command);
        worker::ControlClient control(cfg.control_endpoint, uid, cfg.report_timeout);
        worker::ControlClient heartbeat_control(cfg.control_endpoint, uid, cfg.report_timeout);
        worker::WorkerExecutor executor(engine, control, cfg.engine_timeout());
        worker::ZmqEventSource source(cfg.event_endpoint, uid);

        worker::ConnectionSupervisor supervisor(
            cfg, source, executor,
            [&control, &cfg] { return control.health(cfg.connect_timeout).has_value(); },
            [&heartbeat_control] { return heartbeat_control.send_heartbeat(); });
        g_supervisor.store(&supervisor, std::memory_order_release);

        const worker::ExitReason reason = supervisor.run();
        g_supervisor.store(nullptr, std::memory_order_release);
        LOGGER_INFO("testrelay-worker {} exiting: {} ({} jobs run)", uid, worker::to_string(reason),
                    executor.jobs_run());
        rc = reason == worker::ExitReason::GaveUp ? 2 : 0;
    }

    utils::zmq_context_shutdown();
    utils::Logger::instance().shutdown();
    return rc;
}
