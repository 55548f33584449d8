/**
 * @file dispatcher_main.cpp
 * @brief testrelay-dispatcher: serves the control and event endpoints.
 *
 *     testrelay-dispatcher [--config <path.json>] [--validate]
 *
 * Without --config the built-in defaults are used. SIGINT/SIGTERM start a graceful
 * stop; a second signal exits immediately.
 */
#include "trl_service.hpp"

#include "dispatch/dispatcher.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace
{
std::atomic<bool> g_shutdown{false};
testrelay::dispatch::Dispatcher *g_dispatcher = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown.load(std::memory_order_relaxed))
    {
        std::_Exit(1);
    }
    g_shutdown.store(true, std::memory_order_relaxed);
    if (g_dispatcher != nullptr)
    {
        g_dispatcher->stop();
    }
}

struct DispatcherArgs
{
    std::string config_path;
    bool validate_only{false};
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog << " [--config <path.json>] [--validate]\n\n"
              << "Options:\n"
              << "  --config <path>   Dispatcher JSON config (defaults apply when omitted)\n"
              << "  --validate        Load and check the config, then exit 0/1\n"
              << "  --help            Show this message\n";
}

DispatcherArgs parse_args(int argc, char *argv[])
{
    DispatcherArgs args;
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
    return args;
}
} // namespace

int main(int argc, char *argv[])
{
    using namespace testrelay;

    const DispatcherArgs args = parse_args(argc, argv);

    dispatch::DispatcherConfig cfg;
    try
    {
        if (!args.config_path.empty())
        {
            cfg = dispatch::DispatcherConfig::from_json_file(args.config_path);
        }
        cfg.validate();
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
                  << "\n";
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int rc = 0;
    try
    {
        dispatch::Dispatcher dispatcher(cfg);
        g_dispatcher = &dispatcher;
        LOGGER_INFO("testrelay-dispatcher starting (pid {})", platform::get_pid());
        dispatcher.run();
        g_dispatcher = nullptr;
    }
    catch (const zmq::error_t &e)
    {
        g_dispatcher = nullptr;
        LOGGER_ERROR("testrelay-dispatcher: cannot serve: {}", e.what());
        rc = 1;
    }

    utils::zmq_context_shutdown();
    utils::Logger::instance().shutdown();
    return rc;
}
