#pragma once
/**
 * @file plugin.hpp
 * @brief The plugin's adapter registry.
 *
 * A Plugin is created once per process, has a fixed id and owns its adapters.
 * Adapter ids are unique within a plugin. The registry itself is used from
 * the thread that runs the Dispatcher (adapters are normally added before
 * `GatewayBridge::run()` or from adapter hooks on that thread).
 */
#include "gwbridge_core_export.h"
#include "ipc/local_channel_pair.hpp"
#include "plugin/adapter.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gwbridge::plugin
{

class GWBRIDGE_CORE_EXPORT Plugin
{
  public:
    Plugin(std::string id, std::shared_ptr<ipc::OutboundQueue> outbound);
    ~Plugin();

    Plugin(const Plugin &) = delete;
    Plugin &operator=(const Plugin &) = delete;

    [[nodiscard]] const std::string &id() const noexcept { return m_id; }

    /**
     * @brief Takes ownership of @p adapter, attaches it to the outbound
     *        queue and announces it with addAdapter.
     * @return The registered adapter.
     * @throws std::invalid_argument if @p adapter is null or its id is taken.
     */
    Adapter &add_adapter(std::unique_ptr<Adapter> adapter);

    /** @return nullptr if no adapter has this id. */
    [[nodiscard]] Adapter *find_adapter(const std::string &adapter_id) noexcept;
    [[nodiscard]] const Adapter *find_adapter(const std::string &adapter_id) const noexcept;

    /** @brief Detaches and returns the adapter; nullptr if absent. No event is emitted. */
    std::unique_ptr<Adapter> remove_adapter(const std::string &adapter_id);

    [[nodiscard]] std::size_t adapter_count() const noexcept { return m_adapters.size(); }
    [[nodiscard]] std::vector<std::string> adapter_ids() const;

    template <typename Fn> void for_each_adapter(Fn &&fn)
    {
        for (auto &[id, adapter] : m_adapters)
        {
            fn(*adapter);
        }
    }

    [[nodiscard]] const EventSink &event_sink() const noexcept { return m_events; }

  private:
    std::string m_id;
    EventSink m_events;
    std::map<std::string, std::unique_ptr<Adapter>> m_adapters;
};

} // namespace gwbridge::plugin
