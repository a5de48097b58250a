#include "gateway_bridge.hpp"

#include "gwb_bridge.hpp"

#include <exception>
#include <stdexcept>
#include <thread>

namespace gwbridge::bridge
{

const char *to_string(BridgeState state) noexcept
{
    switch (state)
    {
    case BridgeState::Unregistered: return "Unregistered";
    case BridgeState::Registering: return "Registering";
    case BridgeState::Relaying: return "Relaying";
    case BridgeState::ShuttingDown: return "ShuttingDown";
    case BridgeState::Terminated: return "Terminated";
    }
    return "Unknown";
}

namespace
{
const BridgeConfig &validated(const BridgeConfig &config)
{
    config.validate();
    return config;
}
} // namespace

GatewayBridge::GatewayBridge(zmq::context_t &context, BridgeConfig config)
    : m_context(context), m_config(validated(config)),
      m_queues(ipc::make_local_channel_pair(m_config.queue.capacity, m_config.queue.inbound_policy,
                                            m_config.queue.outbound_policy)),
      m_plugin(m_config.plugin_id, m_queues.outbound),
      m_dispatcher(m_plugin, *m_queues.inbound, *m_queues.outbound, m_config.dispatcher_config())
{
    for (const auto &sa : m_config.adapters)
    {
        auto &adapter = m_plugin.add_adapter(std::make_unique<plugin::Adapter>(sa.id, sa.name));
        for (const auto &device : sa.devices)
        {
            adapter.add_device(device);
        }
    }
}

GatewayBridge::~GatewayBridge() = default;

BridgeState GatewayBridge::state() const noexcept
{
    return m_state.load(std::memory_order_acquire);
}

std::optional<ipc::RelayExit> GatewayBridge::relay_exit() const noexcept
{
    const int v = m_relay_exit.load(std::memory_order_acquire);
    if (v < 0)
        return std::nullopt;
    return static_cast<ipc::RelayExit>(v);
}

void GatewayBridge::request_unload() noexcept
{
    m_dispatcher.request_unload();
}

void GatewayBridge::advance(BridgeState next) noexcept
{
    BridgeState current = m_state.load(std::memory_order_acquire);
    while (static_cast<int>(current) < static_cast<int>(next))
    {
        if (m_state.compare_exchange_weak(current, next, std::memory_order_acq_rel))
        {
            LOGGER_INFO("Bridge: {} -> {}", to_string(current), to_string(next));
            return;
        }
    }
}

void GatewayBridge::relay_thread_main()
{
    try
    {
        ipc::HandshakeClient client(m_context, m_config.handshake_config());
        const auto registration = client.register_plugin(m_config.plugin_id);

        ipc::ZmqPairChannel channel(m_context, registration.channel_endpoint);
        advance(BridgeState::Relaying);

        ipc::RelayLoop relay(channel, *m_queues.inbound, *m_queues.outbound,
                             m_config.relay_config());
        const ipc::RelayExit exit = relay.run();
        m_relay_exit.store(static_cast<int>(exit), std::memory_order_release);
        advance(BridgeState::ShuttingDown);
        return;
    }
    catch (const ipc::HandshakeError &e)
    {
        LOGGER_ERROR("Bridge: {}", e.what());
        m_startup_error = std::current_exception();
    }
    catch (const ipc::TransportError &e)
    {
        LOGGER_ERROR("Bridge: cannot open persistent channel: {}", e.what());
        m_startup_error = std::make_exception_ptr(
            ipc::HandshakeError(std::string("Bridge: cannot open persistent channel: ") + e.what()));
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Bridge: relay thread failed: {}", e.what());
        m_startup_error = std::current_exception();
    }
    // Startup failed: release the dispatcher.
    m_queues.inbound->close();
    m_queues.outbound->close();
    advance(BridgeState::ShuttingDown);
}

void GatewayBridge::run()
{
    BridgeState expected = BridgeState::Unregistered;
    if (!m_state.compare_exchange_strong(expected, BridgeState::Registering))
    {
        throw std::logic_error("GatewayBridge::run() called more than once");
    }
    LOGGER_INFO("Bridge: Unregistered -> Registering (plugin '{}', gateway {})",
                m_config.plugin_id, m_config.gateway.rendezvous);

    std::thread relay_thread([this] { relay_thread_main(); });

    plugin::DispatcherExit dispatcher_exit = plugin::DispatcherExit::QueueClosed;
    try
    {
        dispatcher_exit = m_dispatcher.run();
    }
    catch (...)
    {
        // Unblock and join the relay thread before the exception leaves run().
        m_queues.inbound->close();
        m_queues.outbound->close();
        relay_thread.join();
        advance(BridgeState::Terminated);
        throw;
    }
    if (dispatcher_exit == plugin::DispatcherExit::Unloaded)
    {
        advance(BridgeState::ShuttingDown);
    }
    // Nobody consumes inbound commands any more; a blocking relay must not wait on it.
    m_queues.inbound->close();
    LOGGER_INFO("Bridge: dispatcher stopped ({})", plugin::to_string(dispatcher_exit));

    relay_thread.join();
    advance(BridgeState::Terminated);

    if (m_startup_error)
    {
        std::rethrow_exception(m_startup_error);
    }
}

} // namespace gwbridge::bridge
