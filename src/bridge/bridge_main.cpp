/**
 * @file bridge_main.cpp
 * @brief gwbridge-plugin: plugin-side gateway bridge process.
 *
 * Usage:
 *     gwbridge-plugin --config <path.json>                # run
 *     gwbridge-plugin --plugin-id mqtt                     # run with defaults
 *     gwbridge-plugin --config <path.json> --validate      # print effective config; exit 0/1
 *
 * SIGINT/SIGTERM ask the plugin to unload: pluginUnloaded is sent to the
 * gateway and the process exits once the channel is closed. A second signal
 * exits immediately.
 */
#include "gwb_bridge.hpp"
#include "gateway_bridge.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include <syslog.h>

// ---------------------------------------------------------------------------
// Signal handling
// ---------------------------------------------------------------------------

namespace
{
std::atomic<bool> g_shutdown{false};
std::atomic<gwbridge::bridge::GatewayBridge *> g_bridge{nullptr};

void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown.exchange(true, std::memory_order_relaxed))
        std::_Exit(1); // double signal: fast exit
    if (auto *bridge = g_bridge.load(std::memory_order_acquire); bridge != nullptr)
        bridge->request_unload();
}

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

struct BridgeArgs
{
    std::string config_path;
    std::string plugin_id;
    bool validate_only = false;
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog << " [--config <path.json>] [--plugin-id <id>] [--validate]\n\n"
              << "Options:\n"
              << "  --config <path>   Path to bridge JSON config\n"
              << "  --plugin-id <id>  Plugin id (overrides config and GWBRIDGE_PLUGIN_ID)\n"
              << "  --validate        Print the effective config; exit 0 if valid, 1 otherwise\n"
              << "  --help            Show this message\n\n"
              << "Environment:\n"
              << "  GWBRIDGE_PLUGIN_ID, GWBRIDGE_RENDEZVOUS, GWBRIDGE_BASE_URL\n";
}

BridgeArgs parse_args(int argc, char *argv[])
{
    BridgeArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--config" && i + 1 < argc)
        {
            args.config_path = argv[++i];
        }
        else if (arg == "--plugin-id" && i + 1 < argc)
        {
            args.plugin_id = argv[++i];
        }
        else if (arg == "--validate")
        {
            args.validate_only = true;
        }
        else
        {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    return args;
}

void configure_logger(const gwbridge::bridge::BridgeConfig &config)
{
    auto &logger = gwbridge::utils::Logger::instance();
    logger.set_level(config.log.level);
    if (config.log.syslog)
    {
        logger.set_syslog("gwbridge-" + config.plugin_id, LOG_PID, LOG_USER);
    }
    else if (!config.log.file.empty())
    {
        // Several plugin processes may share one file.
        logger.set_logfile(config.log.file, true);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const BridgeArgs args = parse_args(argc, argv);

    // ── Load config ───────────────────────────────────────────────────────────
    gwbridge::bridge::BridgeConfig config;
    try
    {
        if (!args.config_path.empty())
            config = gwbridge::bridge::BridgeConfig::from_json_file(args.config_path);
        config.apply_env_overrides();
        if (!args.plugin_id.empty())
            config.plugin_id = args.plugin_id;
        config.validate();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    if (args.validate_only)
    {
        std::cout << config.to_json().dump(2) << "\nValidation passed.\n";
        return 0;
    }

    // ── Logger and ZeroMQ context ─────────────────────────────────────────────
    configure_logger(config);
    auto logger_guard = gwbridge::basics::make_scope_guard(
        [] { gwbridge::utils::Logger::instance().shutdown(); });

    gwbridge::ipc::zmq_context_startup();
    auto context_guard =
        gwbridge::basics::make_scope_guard([] { gwbridge::ipc::zmq_context_shutdown(); });

    // ── Run ───────────────────────────────────────────────────────────────────
    int exit_code = 0;
    try
    {
        gwbridge::bridge::GatewayBridge bridge(gwbridge::ipc::get_zmq_context(), config);
        g_bridge.store(&bridge, std::memory_order_release);
        auto unpublish = gwbridge::basics::make_scope_guard(
            [] { g_bridge.store(nullptr, std::memory_order_release); });
        if (g_shutdown.load(std::memory_order_relaxed))
            bridge.request_unload(); // signal arrived before the bridge existed

        LOGGER_INFO("gwbridge-plugin '{}' starting", config.plugin_id);
        bridge.run();

        const auto relay_exit = bridge.relay_exit();
        if (relay_exit == gwbridge::ipc::RelayExit::ChannelLost)
        {
            LOGGER_ERROR("gwbridge-plugin '{}': connection to gateway lost", config.plugin_id);
            exit_code = 2;
        }
        else
        {
            LOGGER_INFO("gwbridge-plugin '{}' unloaded", config.plugin_id);
        }
    }
    catch (const gwbridge::ipc::HandshakeError &e)
    {
        LOGGER_ERROR("gwbridge-plugin '{}': registration failed: {}", config.plugin_id, e.what());
        exit_code = 1;
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("gwbridge-plugin '{}': fatal: {}", config.plugin_id, e.what());
        exit_code = 1;
    }

    return exit_code;
}
