/**
 * @file test_bridge_config.cpp
 * @brief BridgeConfig parsing, validation, environment overrides and export.
 */
#include "bridge_config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace gwbridge;
using namespace gwbridge::bridge;
using json = nlohmann::json;

namespace
{

/// Expects from_json to throw std::runtime_error mentioning @p key.
void expect_rejected(const json &j, const std::string &key)
{
    try
    {
        static_cast<void>(BridgeConfig::from_json(j, "test.json"));
        ADD_FAILURE() << "expected rejection of " << j.dump();
    }
    catch (const std::runtime_error &e)
    {
        const std::string what = e.what();
        EXPECT_NE(what.find(key), std::string::npos) << what;
        EXPECT_NE(what.find("test.json"), std::string::npos) << what;
    }
}

class EnvOverrideTest : public ::testing::Test
{
  protected:
    void TearDown() override
    {
        ::unsetenv("GWBRIDGE_PLUGIN_ID");
        ::unsetenv("GWBRIDGE_RENDEZVOUS");
        ::unsetenv("GWBRIDGE_BASE_URL");
    }
};

} // namespace

// ============================================================================
// Defaults and full parse
// ============================================================================

TEST(BridgeConfigTest, EmptyObjectGivesDefaults)
{
    const auto cfg = BridgeConfig::from_json(json::object());
    EXPECT_TRUE(cfg.plugin_id.empty());
    EXPECT_EQ(cfg.gateway.rendezvous, "ipc:///tmp/gateway.addonManager");
    EXPECT_EQ(cfg.gateway.base_url, "ipc:///tmp");
    EXPECT_EQ(cfg.handshake.timeout_ms, 5000);
    EXPECT_EQ(cfg.handshake.attempts, 3);
    EXPECT_EQ(cfg.handshake.backoff_ms, 200);
    EXPECT_EQ(cfg.queue.capacity, 1024u);
    EXPECT_EQ(cfg.queue.inbound_policy, utils::FullPolicy::Reject);
    EXPECT_EQ(cfg.queue.outbound_policy, utils::FullPolicy::Block);
    EXPECT_EQ(cfg.log.level, utils::Logger::Level::L_INFO);
    EXPECT_TRUE(cfg.log.file.empty());
    EXPECT_FALSE(cfg.log.syslog);
    EXPECT_TRUE(cfg.adapters.empty());
}

TEST(BridgeConfigTest, ParsesEverySection)
{
    const json j = json::parse(R"({
        "plugin":     { "id": "mqtt" },
        "gateway":    { "rendezvous": "ipc:///run/gw.addonManager", "base_url": "ipc:///run" },
        "handshake":  { "timeout_ms": 750, "attempts": 5, "backoff_ms": 0 },
        "relay":      { "idle_wait_ms": 7 },
        "dispatcher": { "idle_wait_ms": 9 },
        "queue":      { "capacity": 0, "inbound_policy": "drop_oldest", "outbound_policy": "reject" },
        "log":        { "level": "debug", "file": "/tmp/gwbridge.log" },
        "adapters":   [ { "id": "virtual", "name": "Virtual",
                          "devices": [ { "id": "lamp", "name": "Lamp", "type": "onOffLight",
                                         "properties": { "on": false },
                                         "actions": { "blink": {} } } ] } ]
    })");

    const auto cfg = BridgeConfig::from_json(j, "full.json");
    EXPECT_EQ(cfg.plugin_id, "mqtt");
    EXPECT_EQ(cfg.gateway.rendezvous, "ipc:///run/gw.addonManager");
    EXPECT_EQ(cfg.gateway.base_url, "ipc:///run");
    EXPECT_EQ(cfg.handshake.timeout_ms, 750);
    EXPECT_EQ(cfg.handshake.attempts, 5);
    EXPECT_EQ(cfg.handshake.backoff_ms, 0);
    EXPECT_EQ(cfg.relay_idle_wait_ms, 7);
    EXPECT_EQ(cfg.dispatcher_idle_wait_ms, 9);
    EXPECT_EQ(cfg.queue.capacity, 0u);
    EXPECT_EQ(cfg.queue.inbound_policy, utils::FullPolicy::DropOldest);
    EXPECT_EQ(cfg.queue.outbound_policy, utils::FullPolicy::Reject);
    EXPECT_EQ(cfg.log.level, utils::Logger::Level::L_DEBUG);
    EXPECT_EQ(cfg.log.file, "/tmp/gwbridge.log");

    ASSERT_EQ(cfg.adapters.size(), 1u);
    const auto &adapter = cfg.adapters[0];
    EXPECT_EQ(adapter.id, "virtual");
    EXPECT_EQ(adapter.name, "Virtual");
    ASSERT_EQ(adapter.devices.size(), 1u);
    EXPECT_EQ(adapter.devices[0].id, "lamp");
    EXPECT_EQ(adapter.devices[0].type, "onOffLight");
    EXPECT_EQ(adapter.devices[0].properties.at("on"), false);
    EXPECT_EQ(adapter.devices[0].actions.count("blink"), 1u);

    const auto hc = cfg.handshake_config();
    EXPECT_EQ(hc.rendezvous_endpoint, "ipc:///run/gw.addonManager");
    EXPECT_EQ(hc.reply_timeout.count(), 750);
    EXPECT_EQ(hc.attempts, 5);
    EXPECT_EQ(cfg.relay_config().idle_wait.count(), 7);
    EXPECT_EQ(cfg.dispatcher_config().idle_wait.count(), 9);
}

TEST(BridgeConfigTest, AdapterNameAndDeviceNameDefaultToId)
{
    const auto cfg = BridgeConfig::from_json(
        json::parse(R"({"adapters":[{"id":"a","devices":[{"id":"d"}]}]})"));
    ASSERT_EQ(cfg.adapters.size(), 1u);
    EXPECT_EQ(cfg.adapters[0].name, "a");
    EXPECT_EQ(cfg.adapters[0].devices[0].name, "d");
}

// ============================================================================
// Rejections
// ============================================================================

TEST(BridgeConfigTest, RejectsInvalidValuesNamingTheKey)
{
    expect_rejected(json::array(), "top level");
    expect_rejected({{"gateway", "ipc:///tmp"}}, "'gateway'");
    expect_rejected({{"gateway", {{"rendezvous", 5}}}}, "gateway.rendezvous");
    expect_rejected({{"handshake", {{"timeout_ms", 0}}}}, "handshake.timeout_ms");
    expect_rejected({{"handshake", {{"attempts", -1}}}}, "handshake.attempts");
    expect_rejected({{"handshake", {{"backoff_ms", -5}}}}, "handshake.backoff_ms");
    expect_rejected({{"handshake", {{"timeout_ms", "soon"}}}}, "handshake.timeout_ms");
    expect_rejected({{"relay", {{"idle_wait_ms", 0}}}}, "relay.idle_wait_ms");
    expect_rejected({{"queue", {{"capacity", -1}}}}, "queue.capacity");
    expect_rejected({{"queue", {{"inbound_policy", "drop_newest"}}}}, "queue.inbound_policy");
    expect_rejected({{"queue", {{"outbound_policy", "wait"}}}}, "queue.outbound_policy");
    expect_rejected({{"log", {{"level", "verbose"}}}}, "log.level");
    expect_rejected({{"log", {{"syslog", "yes"}}}}, "log.syslog");
    expect_rejected({{"log", {{"syslog", true}, {"file", "/tmp/x.log"}}}}, "mutually exclusive");
}

TEST(BridgeConfigTest, RejectsBadAdapters)
{
    expect_rejected(json::parse(R"({"adapters":{}})"), "'adapters'");
    expect_rejected(json::parse(R"({"adapters":[{"name":"x"}]})"), "adapters[0].id");
    expect_rejected(json::parse(R"({"adapters":[{"id":"a"},{"id":"a"}]})"), "duplicate adapter id 'a'");
    expect_rejected(json::parse(R"({"adapters":[{"id":"a","devices":[{"id":"d"},{"id":"d"}]}]})"),
                    "duplicate device id 'd'");
    expect_rejected(json::parse(R"({"adapters":[{"id":"a","devices":[{"id":"d","properties":[]}]}]})"),
                    "adapters[0].devices[0].properties");
}

TEST(BridgeConfigTest, ValidateRequiresPluginId)
{
    BridgeConfig cfg;
    EXPECT_THROW(cfg.validate(), std::runtime_error);
    cfg.plugin_id = "mqtt";
    EXPECT_NO_THROW(cfg.validate());
    cfg.gateway.base_url.clear();
    EXPECT_THROW(cfg.validate(), std::runtime_error);
}

TEST(BridgeConfigTest, ValidateRejectsStaticAdaptersThatOverflowQueue)
{
    BridgeConfig cfg;
    cfg.plugin_id = "mqtt";
    cfg.queue.capacity = 3;
    cfg.adapters.push_back(StaticAdapterConfig{
        "a", "A", {plugin::Device{"d1", "D1", "light", {}, {}}, plugin::Device{"d2", "D2", "light", {}, {}}}});
    EXPECT_NO_THROW(cfg.validate());

    cfg.adapters.push_back(StaticAdapterConfig{"b", "B", {}});
    try
    {
        cfg.validate();
        FAIL() << "expected std::runtime_error";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_NE(std::string(e.what()).find("queue.capacity"), std::string::npos) << e.what();
    }

    cfg.queue.capacity = 0; // unbounded
    EXPECT_NO_THROW(cfg.validate());
}

// ============================================================================
// Files, environment, export
// ============================================================================

TEST(BridgeConfigTest, FromJsonFile)
{
    const auto path = std::filesystem::temp_directory_path() /
                      ("gwbridge_config_test_" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"plugin":{"id":"zigbee"},"handshake":{"attempts":1}})";
    }
    const auto cfg = BridgeConfig::from_json_file(path.string());
    EXPECT_EQ(cfg.plugin_id, "zigbee");
    EXPECT_EQ(cfg.handshake.attempts, 1);

    {
        std::ofstream out(path);
        out << "{ broken";
    }
    EXPECT_THROW(static_cast<void>(BridgeConfig::from_json_file(path.string())), std::runtime_error);
    std::filesystem::remove(path);

    EXPECT_THROW(static_cast<void>(BridgeConfig::from_json_file(path.string())), std::runtime_error);
}

TEST_F(EnvOverrideTest, EnvironmentOverridesFileValues)
{
    auto cfg = BridgeConfig::from_json(json::parse(R"({"plugin":{"id":"from-file"}})"));
    ::setenv("GWBRIDGE_PLUGIN_ID", "from-env", 1);
    ::setenv("GWBRIDGE_RENDEZVOUS", "inproc://rendezvous", 1);
    cfg.apply_env_overrides();
    EXPECT_EQ(cfg.plugin_id, "from-env");
    EXPECT_EQ(cfg.gateway.rendezvous, "inproc://rendezvous");
    EXPECT_EQ(cfg.gateway.base_url, "ipc:///tmp");
}

TEST_F(EnvOverrideTest, EmptyVariablesAreIgnored)
{
    auto cfg = BridgeConfig::from_json(json::parse(R"({"plugin":{"id":"from-file"}})"));
    ::setenv("GWBRIDGE_PLUGIN_ID", "", 1);
    cfg.apply_env_overrides();
    EXPECT_EQ(cfg.plugin_id, "from-file");
}

TEST(BridgeConfigTest, ToJsonRoundTrips)
{
    BridgeConfig cfg;
    cfg.plugin_id = "mqtt";
    cfg.handshake.backoff_ms = 0;
    cfg.queue.inbound_policy = utils::FullPolicy::DropOldest;
    cfg.log.level = utils::Logger::Level::L_WARNING;
    cfg.log.syslog = true;
    cfg.adapters.push_back(StaticAdapterConfig{"v", "Virtual", {plugin::Device{"d", "D", "thing", {{"on", true}}, {}}}});

    const json exported = cfg.to_json();
    EXPECT_EQ(exported["log"]["level"], "warn");
    EXPECT_EQ(exported["queue"]["inbound_policy"], "drop_oldest");

    const auto reparsed = BridgeConfig::from_json(exported);
    EXPECT_EQ(reparsed.plugin_id, "mqtt");
    EXPECT_EQ(reparsed.handshake.backoff_ms, 0);
    EXPECT_EQ(reparsed.queue.inbound_policy, utils::FullPolicy::DropOldest);
    EXPECT_EQ(reparsed.log.level, utils::Logger::Level::L_WARNING);
    EXPECT_TRUE(reparsed.log.syslog);
    ASSERT_EQ(reparsed.adapters.size(), 1u);
    EXPECT_EQ(reparsed.adapters[0].devices[0].properties.at("on"), true);
    EXPECT_EQ(reparsed.to_json(), exported);
}
