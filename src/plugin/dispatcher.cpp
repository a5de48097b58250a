#include "plugin/dispatcher.hpp"
#include "gwb_service.hpp"

#include <exception>

namespace gwbridge::plugin
{

namespace
{
/// Runs an adapter hook; an exception from driver code becomes a Failed outcome.
template <typename Hook>
Outcome guarded(const std::string &adapter_id, std::string_view what, Hook &&hook)
{
    try
    {
        return hook();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Dispatcher: adapter '{}' threw from {}: {}", adapter_id, what, e.what());
        return failure(AdapterError::Failed);
    }
}
} // namespace

const char *to_string(DispatcherExit exit) noexcept
{
    switch (exit)
    {
    case DispatcherExit::Unloaded: return "unloaded";
    case DispatcherExit::QueueClosed: return "inbound queue closed";
    }
    return "unknown";
}

Dispatcher::Dispatcher(Plugin &plugin, ipc::InboundQueue &inbound, ipc::OutboundQueue &outbound)
    : Dispatcher(plugin, inbound, outbound, Config{})
{
}

Dispatcher::Dispatcher(Plugin &plugin, ipc::InboundQueue &inbound, ipc::OutboundQueue &outbound,
                       Config config)
    : m_plugin(plugin), m_inbound(inbound), m_outbound(outbound), m_config(config)
{
}

void Dispatcher::request_unload() noexcept
{
    m_unload_requested.store(true, std::memory_order_release);
}

bool Dispatcher::unloaded() const noexcept
{
    return m_unloaded.load(std::memory_order_acquire);
}

DispatcherExit Dispatcher::run()
{
    LOGGER_INFO("Dispatcher: running for plugin '{}' with {} adapter(s)", m_plugin.id(),
                m_plugin.adapter_count());
    while (true)
    {
        if (m_unload_requested.load(std::memory_order_acquire))
        {
            LOGGER_INFO("Dispatcher: unload requested locally");
            unload_plugin();
        }
        if (unloaded())
        {
            return DispatcherExit::Unloaded;
        }

        std::optional<ipc::GatewayMessage> msg = m_inbound.receive_for(m_config.idle_wait);
        if (!msg.has_value())
        {
            if (m_inbound.is_drained())
            {
                LOGGER_INFO("Dispatcher: inbound queue closed; stopping");
                return DispatcherExit::QueueClosed;
            }
            continue;
        }

        Outcome outcome = dispatch(*msg);
        if (outcome.is_error())
        {
            const AdapterError err = outcome.error();
            if (err == AdapterError::NotFound)
            {
                LOGGER_WARN("Dispatcher: {} not applied: {}", ipc::message_type(*msg),
                            to_string(err));
            }
            else
            {
                LOGGER_INFO("Dispatcher: {} not applied: {}", ipc::message_type(*msg),
                            to_string(err));
            }
        }
    }
}

Outcome Dispatcher::dispatch(const ipc::GatewayMessage &msg)
{
    const std::string &target = ipc::plugin_id_of(msg);
    if (target != m_plugin.id())
    {
        LOGGER_TRACE("Dispatcher: ignoring {} for plugin '{}'", ipc::message_type(msg), target);
        return success();
    }
    LOGGER_DEBUG("Dispatcher: {}", ipc::message_type(msg));
    return std::visit([this](const auto &cmd) { return handle(cmd); }, msg);
}

Adapter *Dispatcher::lookup(const std::string &adapter_id, std::string_view command)
{
    Adapter *adapter = m_plugin.find_adapter(adapter_id);
    if (adapter == nullptr)
    {
        LOGGER_WARN("Dispatcher: {} for unknown adapter '{}'", command, adapter_id);
    }
    return adapter;
}

void Dispatcher::unload_plugin()
{
    if (unloaded())
    {
        return;
    }
    m_plugin.for_each_adapter([](Adapter &adapter) {
        try
        {
            adapter.unload();
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("Dispatcher: adapter '{}' threw from unload: {}", adapter.id(), e.what());
        }
    });

    // Bypasses the full-queue policy: the relay ends the session only on this notice.
    const auto status = m_outbound.force_send(ipc::PluginUnloaded{m_plugin.id()});
    if (status == utils::SendStatus::Sent)
    {
        LOGGER_INFO("Dispatcher: plugin '{}' unloaded; notice queued", m_plugin.id());
    }
    else
    {
        LOGGER_WARN("Dispatcher: plugin '{}' unloaded; notice not queued ({})", m_plugin.id(),
                    utils::to_string(status));
    }
    m_unloaded.store(true, std::memory_order_release);
}

// ============================================================================
// Command handlers
// ============================================================================

Outcome Dispatcher::handle(const ipc::UnloadPlugin & /*cmd*/)
{
    unload_plugin();
    return success();
}

Outcome Dispatcher::handle(const ipc::UnloadAdapter &cmd)
{
    Adapter *adapter = lookup(cmd.adapter_id, ipc::UnloadAdapter::kMessageType);
    if (adapter == nullptr)
    {
        return failure(AdapterError::NotFound);
    }
    Outcome outcome = guarded(cmd.adapter_id, "unload", [adapter] {
        adapter->unload();
        return success();
    });
    // Dropped even if unload() threw; the gateway has already let go of it.
    m_plugin.remove_adapter(cmd.adapter_id);
    LOGGER_INFO("Dispatcher: adapter '{}' unloaded", cmd.adapter_id);
    m_plugin.event_sink().emit(ipc::AdapterUnloaded{m_plugin.id(), cmd.adapter_id});
    return outcome;
}

Outcome Dispatcher::handle(const ipc::SetProperty &cmd)
{
    Adapter *adapter = lookup(cmd.adapter_id, ipc::SetProperty::kMessageType);
    if (adapter == nullptr)
    {
        return failure(AdapterError::NotFound);
    }
    return guarded(cmd.adapter_id, "set_property",
                   [&] { return adapter->set_property(cmd.device_id, cmd.property); });
}

Outcome Dispatcher::handle(const ipc::StartPairing &cmd)
{
    Adapter *adapter = lookup(cmd.adapter_id, ipc::StartPairing::kMessageType);
    if (adapter == nullptr)
    {
        return failure(AdapterError::NotFound);
    }
    return guarded(cmd.adapter_id, "start_pairing",
                   [&] { return adapter->start_pairing(cmd.timeout); });
}

Outcome Dispatcher::handle(const ipc::CancelPairing &cmd)
{
    Adapter *adapter = lookup(cmd.adapter_id, ipc::CancelPairing::kMessageType);
    if (adapter == nullptr)
    {
        return failure(AdapterError::NotFound);
    }
    return guarded(cmd.adapter_id, "cancel_pairing", [&] { return adapter->cancel_pairing(); });
}

Outcome Dispatcher::handle(const ipc::RemoveThing &cmd)
{
    Adapter *adapter = lookup(cmd.adapter_id, ipc::RemoveThing::kMessageType);
    if (adapter == nullptr)
    {
        return failure(AdapterError::NotFound);
    }
    return guarded(cmd.adapter_id, "remove_thing",
                   [&] { return adapter->remove_thing(cmd.device_id); });
}

Outcome Dispatcher::handle(const ipc::CancelRemoveThing &cmd)
{
    Adapter *adapter = lookup(cmd.adapter_id, ipc::CancelRemoveThing::kMessageType);
    if (adapter == nullptr)
    {
        return failure(AdapterError::NotFound);
    }
    return guarded(cmd.adapter_id, "cancel_remove_thing",
                   [&] { return adapter->cancel_remove_thing(cmd.device_id); });
}

} // namespace gwbridge::plugin
