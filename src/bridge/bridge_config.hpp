#pragma once
/**
 * @file bridge_config.hpp
 * @brief Plugin-process configuration loaded from JSON.
 *
 * JSON format (every key optional except "plugin.id", which may instead come
 * from --plugin-id or GWBRIDGE_PLUGIN_ID):
 * @code
 * {
 *   "plugin":     { "id": "mqtt" },
 *   "gateway":    { "rendezvous": "ipc:///tmp/gateway.addonManager",
 *                   "base_url":   "ipc:///tmp" },
 *   "handshake":  { "timeout_ms": 5000, "attempts": 3, "backoff_ms": 200 },
 *   "relay":      { "idle_wait_ms": 20 },
 *   "dispatcher": { "idle_wait_ms": 20 },
 *   "queue":      { "capacity": 1024,
 *                   "inbound_policy": "reject", "outbound_policy": "block" },
 *   "log":        { "level": "info", "file": "", "syslog": false },
 *   "adapters":   [ { "id": "virtual", "name": "Virtual things",
 *                     "devices": [ { "id": "lamp-1", "name": "Lamp", "type": "onOffLight",
 *                                    "properties": { "on": false }, "actions": {} } ] } ]
 * }
 * @endcode
 *
 * "adapters" declares static in-memory adapters (no driver behind them) that
 * the bridge registers at startup; useful for bring-up against a gateway.
 * Their announcements must fit in a bounded "queue.capacity".
 */
#include "ipc/handshake_client.hpp"
#include "ipc/relay_loop.hpp"
#include "plugin/device.hpp"
#include "plugin/dispatcher.hpp"
#include "utils/logger.hpp"
#include "utils/mailbox.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace gwbridge::bridge
{

struct StaticAdapterConfig
{
    std::string id;
    std::string name;
    std::vector<plugin::Device> devices;
};

struct BridgeConfig
{
    std::string plugin_id;

    struct Gateway
    {
        std::string rendezvous = ipc::kDefaultRendezvousEndpoint;
        std::string base_url = ipc::kDefaultBaseUrl;
    } gateway;

    struct Handshake
    {
        int timeout_ms = 5000;
        int attempts = 3;
        int backoff_ms = 200;
    } handshake;

    int relay_idle_wait_ms = 20;
    int dispatcher_idle_wait_ms = 20;

    struct Queue
    {
        std::size_t capacity = 1024; ///< 0 = unbounded
        utils::FullPolicy inbound_policy = utils::FullPolicy::Reject;
        utils::FullPolicy outbound_policy = utils::FullPolicy::Block;
    } queue;

    struct Log
    {
        utils::Logger::Level level = utils::Logger::Level::L_INFO;
        std::string file; ///< empty = console
        bool syslog = false;
    } log;

    std::vector<StaticAdapterConfig> adapters;

    /**
     * @brief Parses a config object.
     * @param origin Named in error messages (usually the file path).
     * @throws std::runtime_error naming the offending key.
     */
    static BridgeConfig from_json(const nlohmann::json &j, const std::string &origin = "<inline>");

    /** @throws std::runtime_error if the file cannot be read or parsed. */
    static BridgeConfig from_json_file(const std::string &path);

    /** @brief Applies GWBRIDGE_PLUGIN_ID, GWBRIDGE_RENDEZVOUS, GWBRIDGE_BASE_URL. */
    void apply_env_overrides();

    /** @brief Checks the fully merged config. @throws std::runtime_error */
    void validate() const;

    /** @brief Effective configuration, in the same layout from_json accepts. */
    [[nodiscard]] nlohmann::json to_json() const;

    [[nodiscard]] ipc::HandshakeClient::Config handshake_config() const;
    [[nodiscard]] ipc::RelayLoop::Config relay_config() const;
    [[nodiscard]] plugin::Dispatcher::Config dispatcher_config() const;
};

} // namespace gwbridge::bridge
