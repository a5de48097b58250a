#pragma once
/**
 * @file adapter.hpp
 * @brief Base class for adapters (drivers) hosted by a plugin.
 *
 * An Adapter owns a set of Devices and is the target of routed gateway
 * commands. Concrete drivers derive from it and override the command hooks
 * they support; the defaults below give a working in-memory adapter.
 *
 * Outbound events go through the EventSink the adapter receives when it is
 * added to a Plugin. Until then, emitted events are discarded.
 *
 * Thread safety: the device table is guarded by a mutex, so drivers may add
 * and remove devices or report property changes from their own threads
 * while the dispatcher routes commands. Command hooks are only ever invoked
 * from the dispatcher thread.
 */
#include "gwbridge_core_export.h"
#include "ipc/local_channel_pair.hpp"
#include "ipc/messages.hpp"
#include "plugin/device.hpp"
#include "utils/mailbox.hpp"
#include "utils/result.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gwbridge::plugin
{

enum class AdapterError
{
    NotFound,     ///< unknown adapter or device id
    InvalidValue, ///< value rejected by the adapter
    Unsupported,  ///< adapter does not implement the command
    Failed,       ///< the adapter tried and failed
};

[[nodiscard]] GWBRIDGE_CORE_EXPORT const char *to_string(AdapterError err) noexcept;

/// Per-command result: success, or an AdapterError.
using Outcome = utils::Result<std::monostate, AdapterError>;

[[nodiscard]] inline Outcome success()
{
    return Outcome::ok(std::monostate{});
}

[[nodiscard]] inline Outcome failure(AdapterError err)
{
    return Outcome::error(err);
}

/**
 * @class EventSink
 * @brief Adapter-facing handle onto the outbound queue.
 *
 * Carries the plugin id so adapters can fill in `pluginId` on the events
 * they build.
 * Cheap to copy. A default-constructed sink is detached and drops everything.
 */
class GWBRIDGE_CORE_EXPORT EventSink
{
  public:
    EventSink() = default;
    EventSink(std::string plugin_id, std::shared_ptr<ipc::OutboundQueue> outbound);

    [[nodiscard]] const std::string &plugin_id() const noexcept { return m_plugin_id; }
    [[nodiscard]] bool attached() const noexcept { return m_outbound != nullptr; }

    /**
     * @brief Enqueues @p event for the gateway.
     * A closed queue (session over) is reported, never thrown.
     */
    utils::SendStatus emit(ipc::PluginMessage event) const;

  private:
    std::string m_plugin_id;
    std::shared_ptr<ipc::OutboundQueue> m_outbound;
};

class Plugin;

class GWBRIDGE_CORE_EXPORT Adapter
{
  public:
    Adapter(std::string id, std::string name);
    virtual ~Adapter();

    Adapter(const Adapter &) = delete;
    Adapter &operator=(const Adapter &) = delete;

    [[nodiscard]] const std::string &id() const noexcept { return m_id; }
    [[nodiscard]] const std::string &name() const noexcept { return m_name; }

    // --- Device registry (callable from driver threads) ---

    /**
     * @brief Registers @p device and announces it with handleDeviceAdded.
     * @return false (and nothing is emitted) if the id is already present.
     */
    bool add_device(Device device);

    /** @brief Forgets a device and announces handleDeviceRemoved. */
    Outcome remove_device(const std::string &device_id);

    /**
     * @brief Records a new property value reported by the device and
     *        announces propertyChanged.
     */
    Outcome notify_property_changed(const std::string &device_id, const ipc::Property &property);

    [[nodiscard]] std::optional<Device> find_device(const std::string &device_id) const;
    [[nodiscard]] bool has_device(const std::string &device_id) const;
    [[nodiscard]] std::vector<std::string> device_ids() const;
    [[nodiscard]] std::size_t device_count() const;

    // --- Command hooks (dispatcher thread) ---

    /** @brief Default: store the value and echo it back as propertyChanged. */
    virtual Outcome set_property(const std::string &device_id, const ipc::Property &property);

    /** @param timeout_seconds advisory pairing window. Default: Unsupported. */
    virtual Outcome start_pairing(double timeout_seconds);

    /** @brief Default: Unsupported. */
    virtual Outcome cancel_pairing();

    /** @brief Called before the adapter is dropped (unloadAdapter / unloadPlugin). */
    virtual void unload();

    /** @brief Default: remove_device(). */
    virtual Outcome remove_thing(const std::string &device_id);

    /** @brief Default: nothing to cancel, succeeds. */
    virtual Outcome cancel_remove_thing(const std::string &device_id);

  protected:
    [[nodiscard]] EventSink events() const;

  private:
    friend class Plugin;
    void attach(EventSink sink);

    const std::string m_id;
    const std::string m_name;

    mutable std::mutex m_mutex;
    std::map<std::string, Device> m_devices;
    EventSink m_events;
};

} // namespace gwbridge::plugin
