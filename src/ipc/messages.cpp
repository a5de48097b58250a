#include "ipc/messages.hpp"

#include <stdexcept>

namespace gwbridge::ipc
{

void to_json(json &j, const Property &p)
{
    j = json{{"name", p.name}, {"value", p.value}};
}

void from_json(const json &j, Property &p)
{
    j.at("name").get_to(p.name);
    // A property without a value is legal; it reads as JSON null.
    p.value = j.value("value", json());
}

// --- Handshake ---

void to_json(json &j, const RegisterPlugin &m)
{
    j = json{{"pluginId", m.plugin_id}};
}

void from_json(const json &j, RegisterPlugin &m)
{
    j.at("pluginId").get_to(m.plugin_id);
}

void to_json(json &j, const RegisterPluginReply &m)
{
    j = json{{"pluginId", m.plugin_id}, {"ipcBaseAddr", m.ipc_base_addr}};
}

void from_json(const json &j, RegisterPluginReply &m)
{
    j.at("pluginId").get_to(m.plugin_id);
    j.at("ipcBaseAddr").get_to(m.ipc_base_addr);
}

// --- Gateway -> Plugin ---

void to_json(json &j, const UnloadPlugin &m)
{
    j = json{{"pluginId", m.plugin_id}};
}

void from_json(const json &j, UnloadPlugin &m)
{
    j.at("pluginId").get_to(m.plugin_id);
}

void to_json(json &j, const UnloadAdapter &m)
{
    j = json{{"pluginId", m.plugin_id}, {"adapterId", m.adapter_id}};
}

void from_json(const json &j, UnloadAdapter &m)
{
    j.at("pluginId").get_to(m.plugin_id);
    j.at("adapterId").get_to(m.adapter_id);
}

void to_json(json &j, const SetProperty &m)
{
    j = json{{"pluginId", m.plugin_id},
             {"adapterId", m.adapter_id},
             {"deviceId", m.device_id},
             {"property", m.property}};
}

void from_json(const json &j, SetProperty &m)
{
    j.at("pluginId").get_to(m.plugin_id);
    j.at("adapterId").get_to(m.adapter_id);
    j.at("deviceId").get_to(m.device_id);
    j.at("property").get_to(m.property);
}

void to_json(json &j, const StartPairing &m)
{
    j = json{{"pluginId", m.plugin_id}, {"adapterId", m.adapter_id}, {"timeout", m.timeout}};
}

void from_json(const json &j, StartPairing &m)
{
    j.at("pluginId").get_to(m.plugin_id);
    j.at("adapterId").get_to(m.adapter_id);
    const json &timeout = j.at("timeout");
    if (!timeout.is_number())
    {
        // get<double>() would silently accept booleans.
        throw std::invalid_argument("startPairing.timeout must be a number");
    }
    m.timeout = timeout.get<double>();
}

void to_json(json &j, const CancelPairing &m)
{
    j = json{{"pluginId", m.plugin_id}, {"adapterId", m.adapter_id}};
}

void from_json(const json &j, CancelPairing &m)
{
    j.at("pluginId").get_to(m.plugin_id);
    j.at("adapterId").get_to(m.adapter_id);
}

void to_json(json &j, const RemoveThing &m)
{
    j = json{{"pluginId", m.plugin_id}, {"adapterId", m.adapter_id}, {"deviceId", m.device_id}};
}

void from_json(const json &j, RemoveThing &m)
{
    j.at("pluginId").get_to(m.plugin_id);
    j.at("adapterId").get_to(m.adapter_id);
    j.at("deviceId").get_to(m.device_id);
}

void to_json(json &j, const CancelRemoveThing &m)
{
    j = json{{"pluginId", m.plugin_id}, {"adapterId", m.adapter_id}, {"deviceId", m.device_id}};
}

void from_json(const json &j, CancelRemoveThing &m)
{
    j.at("pluginId").get_to(m.plugin_id);
    j.at("adapterId").get_to(m.adapter_id);
    j.at("deviceId").get_to(m.device_id);
}

// --- Plugin -> Gateway ---

void to_json(json &j, const PluginUnloaded &m)
{
    j = json{{"pluginId", m.plugin_id}};
}

void from_json(const json &j, PluginUnloaded &m)
{
    j.at("pluginId").get_to(m.plugin_id);
}

void to_json(json &j, const AdapterUnloaded &m)
{
    j = json{{"pluginId", m.plugin_id}, {"adapterId", m.adapter_id}};
}

void from_json(const json &j, AdapterUnloaded &m)
{
    j.at("pluginId").get_to(m.plugin_id);
    j.at("adapterId").get_to(m.adapter_id);
}

void to_json(json &j, const AddAdapter &m)
{
    j = json{{"pluginId", m.plugin_id}, {"adapterId", m.adapter_id}, {"name", m.name}};
}

void from_json(const json &j, AddAdapter &m)
{
    j.at("pluginId").get_to(m.plugin_id);
    j.at("adapterId").get_to(m.adapter_id);
    j.at("name").get_to(m.name);
}

void to_json(json &j, const HandleDeviceAdded &m)
{
    j = json{{"pluginId", m.plugin_id},
             {"adapterId", m.adapter_id},
             {"id", m.id},
             {"name", m.name},
             {"type", m.type},
             {"properties", m.properties},
             {"actions", m.actions}};
}

void from_json(const json &j, HandleDeviceAdded &m)
{
    j.at("pluginId").get_to(m.plugin_id);
    j.at("adapterId").get_to(m.adapter_id);
    j.at("id").get_to(m.id);
    j.at("name").get_to(m.name);
    j.at("type").get_to(m.type);
    m.properties = j.value("properties", std::map<std::string, json>{});
    m.actions = j.value("actions", std::map<std::string, json>{});
}

void to_json(json &j, const HandleDeviceRemoved &m)
{
    j = json{{"pluginId", m.plugin_id}, {"adapterId", m.adapter_id}, {"id", m.id}};
}

void from_json(const json &j, HandleDeviceRemoved &m)
{
    j.at("pluginId").get_to(m.plugin_id);
    j.at("adapterId").get_to(m.adapter_id);
    j.at("id").get_to(m.id);
}

void to_json(json &j, const PropertyChanged &m)
{
    j = json{{"pluginId", m.plugin_id},
             {"adapterId", m.adapter_id},
             {"deviceId", m.device_id},
             {"property", m.property}};
}

void from_json(const json &j, PropertyChanged &m)
{
    j.at("pluginId").get_to(m.plugin_id);
    j.at("adapterId").get_to(m.adapter_id);
    j.at("deviceId").get_to(m.device_id);
    j.at("property").get_to(m.property);
}

} // namespace gwbridge::ipc
