/**
 * @file bridge_config.cpp
 * @brief BridgeConfig JSON parsing, environment overrides and validation.
 */
#include "bridge_config.hpp"

#include "gwb_service.hpp"

#include <cstdlib>
#include <fstream>
#include <map>
#include <set>
#include <stdexcept>

namespace gwbridge::bridge
{

// ============================================================================
// Parsing helpers (anonymous namespace)
// ============================================================================

namespace
{

[[noreturn]] void config_error(const std::string &origin, const std::string &message)
{
    throw std::runtime_error("Bridge config '" + origin + "': " + message);
}

const nlohmann::json *section(const nlohmann::json &j, const char *key, const std::string &origin)
{
    if (!j.contains(key))
        return nullptr;
    const auto &s = j[key];
    if (!s.is_object())
        config_error(origin, std::string("'") + key + "' must be an object");
    return &s;
}

std::string get_string(const nlohmann::json &s, const char *key, const std::string &full_key,
                       const std::string &fallback, const std::string &origin)
{
    if (!s.contains(key))
        return fallback;
    if (!s[key].is_string())
        config_error(origin, "'" + full_key + "' must be a string");
    return s[key].get<std::string>();
}

int get_positive_int(const nlohmann::json &s, const char *key, const std::string &full_key,
                     int fallback, const std::string &origin, bool allow_zero = false)
{
    if (!s.contains(key))
        return fallback;
    const auto &v = s[key];
    if (!v.is_number_integer())
        config_error(origin, "'" + full_key + "' must be an integer");
    const auto value = v.get<long long>();
    if (value < 0 || (value == 0 && !allow_zero) || value > 3600 * 1000)
        config_error(origin, "'" + full_key + "' = " + std::to_string(value) +
                                 (allow_zero ? " (must be >= 0)" : " (must be > 0)"));
    return static_cast<int>(value);
}

utils::FullPolicy parse_policy(const std::string &s, const std::string &full_key,
                               const std::string &origin)
{
    if (s == "block")       return utils::FullPolicy::Block;
    if (s == "drop_oldest") return utils::FullPolicy::DropOldest;
    if (s == "reject")      return utils::FullPolicy::Reject;
    config_error(origin, "invalid '" + full_key + "' = '" + s +
                             "' (must be 'block', 'drop_oldest', or 'reject')");
}

utils::Logger::Level parse_log_level(const std::string &s, const std::string &origin)
{
    const auto level = utils::Logger::parse_level(s);
    if (!level)
        config_error(origin, "invalid 'log.level' = '" + s +
                                 "' (must be trace, debug, info, warn, error or system)");
    return *level;
}

const char *log_level_key(utils::Logger::Level level)
{
    switch (level)
    {
    case utils::Logger::Level::L_TRACE: return "trace";
    case utils::Logger::Level::L_DEBUG: return "debug";
    case utils::Logger::Level::L_INFO: return "info";
    case utils::Logger::Level::L_WARNING: return "warn";
    case utils::Logger::Level::L_ERROR: return "error";
    case utils::Logger::Level::L_SYSTEM: return "system";
    }
    return "info";
}

std::map<std::string, nlohmann::json> get_map(const nlohmann::json &s, const char *key,
                                              const std::string &full_key, const std::string &origin)
{
    if (!s.contains(key))
        return {};
    if (!s[key].is_object())
        config_error(origin, "'" + full_key + "' must be an object");
    return s[key].get<std::map<std::string, nlohmann::json>>();
}

StaticAdapterConfig parse_adapter(const nlohmann::json &a, std::size_t index,
                                  const std::string &origin)
{
    const std::string prefix = "adapters[" + std::to_string(index) + "]";
    if (!a.is_object())
        config_error(origin, "'" + prefix + "' must be an object");

    StaticAdapterConfig sa;
    sa.id = get_string(a, "id", prefix + ".id", {}, origin);
    if (sa.id.empty())
        config_error(origin, "missing required field '" + prefix + ".id'");
    sa.name = get_string(a, "name", prefix + ".name", sa.id, origin);

    if (a.contains("devices"))
    {
        if (!a["devices"].is_array())
            config_error(origin, "'" + prefix + ".devices' must be an array");
        std::set<std::string> seen;
        std::size_t n = 0;
        for (const auto &d : a["devices"])
        {
            const std::string dprefix = prefix + ".devices[" + std::to_string(n++) + "]";
            if (!d.is_object())
                config_error(origin, "'" + dprefix + "' must be an object");
            plugin::Device dev;
            dev.id = get_string(d, "id", dprefix + ".id", {}, origin);
            if (dev.id.empty())
                config_error(origin, "missing required field '" + dprefix + ".id'");
            if (!seen.insert(dev.id).second)
                config_error(origin, "duplicate device id '" + dev.id + "' in " + prefix);
            dev.name = get_string(d, "name", dprefix + ".name", dev.id, origin);
            dev.type = get_string(d, "type", dprefix + ".type", {}, origin);
            dev.properties = get_map(d, "properties", dprefix + ".properties", origin);
            dev.actions = get_map(d, "actions", dprefix + ".actions", origin);
            sa.devices.push_back(std::move(dev));
        }
    }
    return sa;
}

} // anonymous namespace

// ============================================================================
// BridgeConfig
// ============================================================================

BridgeConfig BridgeConfig::from_json(const nlohmann::json &j, const std::string &origin)
{
    if (!j.is_object())
        config_error(origin, "top level must be an object");

    BridgeConfig cfg;

    if (const auto *p = section(j, "plugin", origin))
        cfg.plugin_id = get_string(*p, "id", "plugin.id", {}, origin);

    if (const auto *g = section(j, "gateway", origin))
    {
        cfg.gateway.rendezvous =
            get_string(*g, "rendezvous", "gateway.rendezvous", cfg.gateway.rendezvous, origin);
        cfg.gateway.base_url =
            get_string(*g, "base_url", "gateway.base_url", cfg.gateway.base_url, origin);
    }

    if (const auto *h = section(j, "handshake", origin))
    {
        cfg.handshake.timeout_ms =
            get_positive_int(*h, "timeout_ms", "handshake.timeout_ms", cfg.handshake.timeout_ms, origin);
        cfg.handshake.attempts =
            get_positive_int(*h, "attempts", "handshake.attempts", cfg.handshake.attempts, origin);
        cfg.handshake.backoff_ms = get_positive_int(*h, "backoff_ms", "handshake.backoff_ms",
                                                    cfg.handshake.backoff_ms, origin, true);
    }

    if (const auto *r = section(j, "relay", origin))
        cfg.relay_idle_wait_ms = get_positive_int(*r, "idle_wait_ms", "relay.idle_wait_ms",
                                                  cfg.relay_idle_wait_ms, origin);

    if (const auto *d = section(j, "dispatcher", origin))
        cfg.dispatcher_idle_wait_ms = get_positive_int(
            *d, "idle_wait_ms", "dispatcher.idle_wait_ms", cfg.dispatcher_idle_wait_ms, origin);

    if (const auto *q = section(j, "queue", origin))
    {
        if (q->contains("capacity"))
        {
            const auto &c = (*q)["capacity"];
            if (!c.is_number_unsigned() && !(c.is_number_integer() && c.get<long long>() >= 0))
                config_error(origin, "'queue.capacity' must be a non-negative integer");
            cfg.queue.capacity = c.get<std::size_t>();
        }
        cfg.queue.inbound_policy = parse_policy(
            get_string(*q, "inbound_policy", "queue.inbound_policy", "reject", origin),
            "queue.inbound_policy", origin);
        cfg.queue.outbound_policy = parse_policy(
            get_string(*q, "outbound_policy", "queue.outbound_policy", "block", origin),
            "queue.outbound_policy", origin);
    }

    if (const auto *l = section(j, "log", origin))
    {
        cfg.log.level = parse_log_level(get_string(*l, "level", "log.level", "info", origin), origin);
        cfg.log.file = get_string(*l, "file", "log.file", {}, origin);
        if (l->contains("syslog"))
        {
            if (!(*l)["syslog"].is_boolean())
                config_error(origin, "'log.syslog' must be true or false");
            cfg.log.syslog = (*l)["syslog"].get<bool>();
        }
        if (cfg.log.syslog && !cfg.log.file.empty())
            config_error(origin, "'log.file' and 'log.syslog' are mutually exclusive");
    }

    if (j.contains("adapters"))
    {
        if (!j["adapters"].is_array())
            config_error(origin, "'adapters' must be an array");
        std::set<std::string> seen;
        std::size_t index = 0;
        for (const auto &a : j["adapters"])
        {
            StaticAdapterConfig sa = parse_adapter(a, index++, origin);
            if (!seen.insert(sa.id).second)
                config_error(origin, "duplicate adapter id '" + sa.id + "'");
            cfg.adapters.push_back(std::move(sa));
        }
    }

    return cfg;
}

BridgeConfig BridgeConfig::from_json_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Bridge config: cannot open file: " + path);

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("Bridge config: JSON parse error in '" + path + "': " + e.what());
    }
    return from_json(j, path);
}

void BridgeConfig::apply_env_overrides()
{
    if (const char *v = std::getenv("GWBRIDGE_PLUGIN_ID"); v != nullptr && *v != '\0')
        plugin_id = v;
    if (const char *v = std::getenv("GWBRIDGE_RENDEZVOUS"); v != nullptr && *v != '\0')
        gateway.rendezvous = v;
    if (const char *v = std::getenv("GWBRIDGE_BASE_URL"); v != nullptr && *v != '\0')
        gateway.base_url = v;
}

void BridgeConfig::validate() const
{
    if (plugin_id.empty())
        throw std::runtime_error(
            "Bridge config: 'plugin.id' is required (config file, --plugin-id or GWBRIDGE_PLUGIN_ID)");
    if (gateway.rendezvous.empty())
        throw std::runtime_error("Bridge config: 'gateway.rendezvous' must not be empty");
    if (gateway.base_url.empty())
        throw std::runtime_error("Bridge config: 'gateway.base_url' must not be empty");

    // Static adapters are announced before the relay drains anything.
    if (queue.capacity != 0)
    {
        std::size_t announcements = 0;
        for (const auto &sa : adapters)
            announcements += 1 + sa.devices.size();
        if (announcements > queue.capacity)
            throw std::runtime_error(fmt::format(
                "Bridge config: 'adapters' announce {} events but 'queue.capacity' is {}",
                announcements, queue.capacity));
    }
}

nlohmann::json BridgeConfig::to_json() const
{
    nlohmann::json adapters_json = nlohmann::json::array();
    for (const auto &sa : adapters)
    {
        nlohmann::json devices = nlohmann::json::array();
        for (const auto &d : sa.devices)
        {
            devices.push_back({{"id", d.id},
                               {"name", d.name},
                               {"type", d.type},
                               {"properties", d.properties},
                               {"actions", d.actions}});
        }
        adapters_json.push_back({{"id", sa.id}, {"name", sa.name}, {"devices", devices}});
    }

    return nlohmann::json{
        {"plugin", {{"id", plugin_id}}},
        {"gateway", {{"rendezvous", gateway.rendezvous}, {"base_url", gateway.base_url}}},
        {"handshake",
         {{"timeout_ms", handshake.timeout_ms},
          {"attempts", handshake.attempts},
          {"backoff_ms", handshake.backoff_ms}}},
        {"relay", {{"idle_wait_ms", relay_idle_wait_ms}}},
        {"dispatcher", {{"idle_wait_ms", dispatcher_idle_wait_ms}}},
        {"queue",
         {{"capacity", queue.capacity},
          {"inbound_policy", utils::to_string(queue.inbound_policy)},
          {"outbound_policy", utils::to_string(queue.outbound_policy)}}},
        {"log",
         {{"level", log_level_key(log.level)},
          {"file", log.file},
          {"syslog", log.syslog}}},
        {"adapters", adapters_json}};
}

ipc::HandshakeClient::Config BridgeConfig::handshake_config() const
{
    ipc::HandshakeClient::Config hc;
    hc.rendezvous_endpoint = gateway.rendezvous;
    hc.base_url = gateway.base_url;
    hc.reply_timeout = std::chrono::milliseconds(handshake.timeout_ms);
    hc.attempts = handshake.attempts;
    hc.backoff_base = std::chrono::milliseconds(handshake.backoff_ms);
    return hc;
}

ipc::RelayLoop::Config BridgeConfig::relay_config() const
{
    return ipc::RelayLoop::Config{std::chrono::milliseconds(relay_idle_wait_ms)};
}

plugin::Dispatcher::Config BridgeConfig::dispatcher_config() const
{
    return plugin::Dispatcher::Config{std::chrono::milliseconds(dispatcher_idle_wait_ms)};
}

} // namespace gwbridge::bridge
