#include "plugin/adapter.hpp"
#include "gwb_service.hpp"

namespace gwbridge::plugin
{

const char *to_string(AdapterError err) noexcept
{
    switch (err)
    {
    case AdapterError::NotFound: return "not found";
    case AdapterError::InvalidValue: return "invalid value";
    case AdapterError::Unsupported: return "unsupported";
    case AdapterError::Failed: return "failed";
    }
    return "unknown";
}

// ============================================================================
// EventSink
// ============================================================================

EventSink::EventSink(std::string plugin_id, std::shared_ptr<ipc::OutboundQueue> outbound)
    : m_plugin_id(std::move(plugin_id)), m_outbound(std::move(outbound))
{
}

utils::SendStatus EventSink::emit(ipc::PluginMessage event) const
{
    if (!m_outbound)
    {
        LOGGER_TRACE("EventSink: detached; {} discarded", ipc::message_type(event));
        return utils::SendStatus::Closed;
    }
    const std::string type(ipc::message_type(event));
    const auto status = m_outbound->send(std::move(event));
    if (status == utils::SendStatus::Closed)
    {
        LOGGER_DEBUG("EventSink: outbound queue closed; {} discarded", type);
    }
    else if (status != utils::SendStatus::Sent)
    {
        LOGGER_WARN("EventSink: outbound queue full; {} {}", type, utils::to_string(status));
    }
    return status;
}

// ============================================================================
// Adapter
// ============================================================================

Adapter::Adapter(std::string id, std::string name) : m_id(std::move(id)), m_name(std::move(name))
{
}

Adapter::~Adapter() = default;

void Adapter::attach(EventSink sink)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events = std::move(sink);
}

EventSink Adapter::events() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events;
}

bool Adapter::add_device(Device device)
{
    ipc::HandleDeviceAdded event;
    EventSink sink;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_devices.count(device.id) != 0)
        {
            LOGGER_WARN("Adapter '{}': device '{}' already registered", m_id, device.id);
            return false;
        }
        event = ipc::HandleDeviceAdded{m_events.plugin_id(), m_id,          device.id,
                                       device.name,          device.type,   device.properties,
                                       device.actions};
        m_devices.emplace(device.id, std::move(device));
        sink = m_events;
    }
    // Emit outside the lock: a Block-policy queue may wait for the relay.
    sink.emit(std::move(event));
    return true;
}

Outcome Adapter::remove_device(const std::string &device_id)
{
    EventSink sink;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_devices.erase(device_id) == 0)
        {
            return failure(AdapterError::NotFound);
        }
        sink = m_events;
    }
    sink.emit(ipc::HandleDeviceRemoved{sink.plugin_id(), m_id, device_id});
    return success();
}

Outcome Adapter::notify_property_changed(const std::string &device_id,
                                         const ipc::Property &property)
{
    EventSink sink;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(device_id);
        if (it == m_devices.end())
        {
            return failure(AdapterError::NotFound);
        }
        it->second.properties[property.name] = property.value;
        sink = m_events;
    }
    sink.emit(ipc::PropertyChanged{sink.plugin_id(), m_id, device_id, property});
    return success();
}

std::optional<Device> Adapter::find_device(const std::string &device_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(device_id);
    if (it == m_devices.end())
    {
        return std::nullopt;
    }
    return it->second;
}

bool Adapter::has_device(const std::string &device_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_devices.count(device_id) != 0;
}

std::vector<std::string> Adapter::device_ids() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    ids.reserve(m_devices.size());
    for (const auto &[id, device] : m_devices)
    {
        ids.push_back(id);
    }
    return ids;
}

std::size_t Adapter::device_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_devices.size();
}

Outcome Adapter::set_property(const std::string &device_id, const ipc::Property &property)
{
    return notify_property_changed(device_id, property);
}

Outcome Adapter::start_pairing(double timeout_seconds)
{
    LOGGER_DEBUG("Adapter '{}': pairing ({}s) not supported", m_id, timeout_seconds);
    return failure(AdapterError::Unsupported);
}

Outcome Adapter::cancel_pairing()
{
    return failure(AdapterError::Unsupported);
}

void Adapter::unload()
{
    LOGGER_DEBUG("Adapter '{}': unloaded with {} device(s)", m_id, device_count());
}

Outcome Adapter::remove_thing(const std::string &device_id)
{
    return remove_device(device_id);
}

Outcome Adapter::cancel_remove_thing(const std::string & /*device_id*/)
{
    return success();
}

} // namespace gwbridge::plugin
