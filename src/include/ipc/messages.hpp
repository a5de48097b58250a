#pragma once
/**
 * @file messages.hpp
 * @brief Wire message types exchanged between the gateway and a plugin.
 *
 * Every frame is a JSON envelope `{"messageType": <tag>, "data": {...}}`.
 * Each message kind is a plain struct carrying its tag in `kMessageType`;
 * the three families are `std::variant`s over those structs:
 *
 * | Family           | Direction          | Used by                        |
 * |------------------|--------------------|--------------------------------|
 * | HandshakeMessage | both, once         | HandshakeClient                |
 * | GatewayMessage   | gateway -> plugin  | RelayLoop (decode), Dispatcher |
 * | PluginMessage    | plugin -> gateway  | EventSink, RelayLoop (encode)  |
 *
 * Field names on the wire are camelCase (`pluginId`, `adapterId`, ...).
 * Encoding and decoding of whole envelopes lives in message_codec.hpp; this
 * header only provides the per-struct nlohmann/json conversions.
 */
#include "gwbridge_core_export.h"

#include <map>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace gwbridge::ipc
{

using json = nlohmann::json;

/// Named property value. The value is opaque to the bridge.
struct Property
{
    std::string name;
    json value;

    bool operator==(const Property &) const = default;
};

// ============================================================================
// Handshake
// ============================================================================

struct RegisterPlugin
{
    static constexpr std::string_view kMessageType = "registerPlugin";
    std::string plugin_id;

    bool operator==(const RegisterPlugin &) const = default;
};

struct RegisterPluginReply
{
    static constexpr std::string_view kMessageType = "registerPluginReply";
    std::string plugin_id;
    std::string ipc_base_addr;

    bool operator==(const RegisterPluginReply &) const = default;
};

// ============================================================================
// Gateway -> Plugin commands
// ============================================================================

struct UnloadPlugin
{
    static constexpr std::string_view kMessageType = "unloadPlugin";
    std::string plugin_id;

    bool operator==(const UnloadPlugin &) const = default;
};

struct UnloadAdapter
{
    static constexpr std::string_view kMessageType = "unloadAdapter";
    std::string plugin_id;
    std::string adapter_id;

    bool operator==(const UnloadAdapter &) const = default;
};

struct SetProperty
{
    static constexpr std::string_view kMessageType = "setProperty";
    std::string plugin_id;
    std::string adapter_id;
    std::string device_id;
    Property property;

    bool operator==(const SetProperty &) const = default;
};

struct StartPairing
{
    static constexpr std::string_view kMessageType = "startPairing";
    std::string plugin_id;
    std::string adapter_id;
    double timeout = 0.0; ///< seconds, advisory

    bool operator==(const StartPairing &) const = default;
};

struct CancelPairing
{
    static constexpr std::string_view kMessageType = "cancelPairing";
    std::string plugin_id;
    std::string adapter_id;

    bool operator==(const CancelPairing &) const = default;
};

struct RemoveThing
{
    static constexpr std::string_view kMessageType = "removeThing";
    std::string plugin_id;
    std::string adapter_id;
    std::string device_id;

    bool operator==(const RemoveThing &) const = default;
};

struct CancelRemoveThing
{
    static constexpr std::string_view kMessageType = "cancelRemoveThing";
    std::string plugin_id;
    std::string adapter_id;
    std::string device_id;

    bool operator==(const CancelRemoveThing &) const = default;
};

// ============================================================================
// Plugin -> Gateway events
// ============================================================================

struct PluginUnloaded
{
    static constexpr std::string_view kMessageType = "pluginUnloaded";
    std::string plugin_id;

    bool operator==(const PluginUnloaded &) const = default;
};

struct AdapterUnloaded
{
    static constexpr std::string_view kMessageType = "adapterUnloaded";
    std::string plugin_id;
    std::string adapter_id;

    bool operator==(const AdapterUnloaded &) const = default;
};

struct AddAdapter
{
    static constexpr std::string_view kMessageType = "addAdapter";
    std::string plugin_id;
    std::string adapter_id;
    std::string name;

    bool operator==(const AddAdapter &) const = default;
};

struct HandleDeviceAdded
{
    static constexpr std::string_view kMessageType = "handleDeviceAdded";
    std::string plugin_id;
    std::string adapter_id;
    std::string id;
    std::string name;
    std::string type;
    std::map<std::string, json> properties;
    std::map<std::string, json> actions;

    bool operator==(const HandleDeviceAdded &) const = default;
};

struct HandleDeviceRemoved
{
    static constexpr std::string_view kMessageType = "handleDeviceRemoved";
    std::string plugin_id;
    std::string adapter_id;
    std::string id;

    bool operator==(const HandleDeviceRemoved &) const = default;
};

struct PropertyChanged
{
    static constexpr std::string_view kMessageType = "propertyChanged";
    std::string plugin_id;
    std::string adapter_id;
    std::string device_id;
    Property property;

    bool operator==(const PropertyChanged &) const = default;
};

using HandshakeMessage = std::variant<RegisterPlugin, RegisterPluginReply>;

using GatewayMessage = std::variant<UnloadPlugin, UnloadAdapter, SetProperty, StartPairing,
                                    CancelPairing, RemoveThing, CancelRemoveThing>;

using PluginMessage = std::variant<PluginUnloaded, AdapterUnloaded, AddAdapter, HandleDeviceAdded,
                                   HandleDeviceRemoved, PropertyChanged>;

/// Wire tag of the alternative currently held by @p msg.
template <typename... Ts>
[[nodiscard]] std::string_view message_type(const std::variant<Ts...> &msg) noexcept
{
    return std::visit([](const auto &m) { return std::decay_t<decltype(m)>::kMessageType; }, msg);
}

/// Every message of every family carries the plugin id.
template <typename... Ts>
[[nodiscard]] const std::string &plugin_id_of(const std::variant<Ts...> &msg) noexcept
{
    return std::visit([](const auto &m) -> const std::string & { return m.plugin_id; }, msg);
}

// --- nlohmann/json conversions (data object only, without the envelope) ---
// from_json throws nlohmann::json::exception on missing or mistyped fields
// (std::invalid_argument for a non-numeric startPairing timeout).

GWBRIDGE_CORE_EXPORT void to_json(json &j, const Property &p);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, Property &p);

GWBRIDGE_CORE_EXPORT void to_json(json &j, const RegisterPlugin &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, RegisterPlugin &m);
GWBRIDGE_CORE_EXPORT void to_json(json &j, const RegisterPluginReply &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, RegisterPluginReply &m);

GWBRIDGE_CORE_EXPORT void to_json(json &j, const UnloadPlugin &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, UnloadPlugin &m);
GWBRIDGE_CORE_EXPORT void to_json(json &j, const UnloadAdapter &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, UnloadAdapter &m);
GWBRIDGE_CORE_EXPORT void to_json(json &j, const SetProperty &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, SetProperty &m);
GWBRIDGE_CORE_EXPORT void to_json(json &j, const StartPairing &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, StartPairing &m);
GWBRIDGE_CORE_EXPORT void to_json(json &j, const CancelPairing &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, CancelPairing &m);
GWBRIDGE_CORE_EXPORT void to_json(json &j, const RemoveThing &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, RemoveThing &m);
GWBRIDGE_CORE_EXPORT void to_json(json &j, const CancelRemoveThing &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, CancelRemoveThing &m);

GWBRIDGE_CORE_EXPORT void to_json(json &j, const PluginUnloaded &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, PluginUnloaded &m);
GWBRIDGE_CORE_EXPORT void to_json(json &j, const AdapterUnloaded &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, AdapterUnloaded &m);
GWBRIDGE_CORE_EXPORT void to_json(json &j, const AddAdapter &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, AddAdapter &m);
GWBRIDGE_CORE_EXPORT void to_json(json &j, const HandleDeviceAdded &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, HandleDeviceAdded &m);
GWBRIDGE_CORE_EXPORT void to_json(json &j, const HandleDeviceRemoved &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, HandleDeviceRemoved &m);
GWBRIDGE_CORE_EXPORT void to_json(json &j, const PropertyChanged &m);
GWBRIDGE_CORE_EXPORT void from_json(const json &j, PropertyChanged &m);

} // namespace gwbridge::ipc
