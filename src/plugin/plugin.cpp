#include "plugin/plugin.hpp"
#include "gwb_service.hpp"

#include <stdexcept>

namespace gwbridge::plugin
{

Plugin::Plugin(std::string id, std::shared_ptr<ipc::OutboundQueue> outbound)
    : m_id(std::move(id)), m_events(m_id, std::move(outbound))
{
}

Plugin::~Plugin() = default;

Adapter &Plugin::add_adapter(std::unique_ptr<Adapter> adapter)
{
    if (!adapter)
    {
        throw std::invalid_argument("Plugin::add_adapter: null adapter");
    }
    const std::string adapter_id = adapter->id();
    if (m_adapters.count(adapter_id) != 0)
    {
        throw std::invalid_argument(
            fmt::format("Plugin '{}': adapter '{}' already registered", m_id, adapter_id));
    }

    adapter->attach(m_events);
    Adapter &ref = *adapter;
    m_adapters.emplace(adapter_id, std::move(adapter));
    LOGGER_INFO("Plugin '{}': adapter '{}' ({}) added", m_id, adapter_id, ref.name());

    m_events.emit(ipc::AddAdapter{m_id, adapter_id, ref.name()});
    return ref;
}

Adapter *Plugin::find_adapter(const std::string &adapter_id) noexcept
{
    auto it = m_adapters.find(adapter_id);
    return it == m_adapters.end() ? nullptr : it->second.get();
}

const Adapter *Plugin::find_adapter(const std::string &adapter_id) const noexcept
{
    auto it = m_adapters.find(adapter_id);
    return it == m_adapters.end() ? nullptr : it->second.get();
}

std::unique_ptr<Adapter> Plugin::remove_adapter(const std::string &adapter_id)
{
    auto it = m_adapters.find(adapter_id);
    if (it == m_adapters.end())
    {
        return nullptr;
    }
    std::unique_ptr<Adapter> adapter = std::move(it->second);
    m_adapters.erase(it);
    adapter->attach(EventSink{});
    return adapter;
}

std::vector<std::string> Plugin::adapter_ids() const
{
    std::vector<std::string> ids;
    ids.reserve(m_adapters.size());
    for (const auto &[id, adapter] : m_adapters)
    {
        ids.push_back(id);
    }
    return ids;
}

} // namespace gwbridge::plugin
