#pragma once
/**
 * @file gateway_bridge.hpp
 * @brief Composes handshake, relay loop and dispatcher into one plugin session.
 *
 * Threads:
 *  - a relay thread performs the handshake, connects the persistent channel
 *    and runs the RelayLoop;
 *  - the thread calling run() runs the Dispatcher.
 * They share only the inbound/outbound queues.
 *
 * State machine (monotonic):
 *   Unregistered -> Registering -> Relaying -> ShuttingDown -> Terminated
 *
 * @code
 * GatewayBridge bridge(gwbridge::ipc::get_zmq_context(), config);
 * bridge.plugin().add_adapter(std::make_unique<MyAdapter>());
 * bridge.run();   // returns after unload; throws ipc::HandshakeError on startup failure
 * @endcode
 */
#include "bridge_config.hpp"

#include "ipc/local_channel_pair.hpp"
#include "ipc/relay_loop.hpp"
#include "plugin/dispatcher.hpp"
#include "plugin/plugin.hpp"

#include <atomic>
#include <exception>
#include <optional>

#include <zmq.hpp>

namespace gwbridge::bridge
{

enum class BridgeState : int
{
    Unregistered = 0,
    Registering,
    Relaying,
    ShuttingDown,
    Terminated,
};

[[nodiscard]] const char *to_string(BridgeState state) noexcept;

class GatewayBridge
{
  public:
    /**
     * @brief Creates the queues, the plugin registry (including adapters
     *        declared in the config) and the dispatcher. No I/O happens here.
     * @throws std::runtime_error if @p config does not validate.
     */
    GatewayBridge(zmq::context_t &context, BridgeConfig config);
    ~GatewayBridge();

    GatewayBridge(const GatewayBridge &) = delete;
    GatewayBridge &operator=(const GatewayBridge &) = delete;

    [[nodiscard]] plugin::Plugin &plugin() noexcept { return m_plugin; }
    [[nodiscard]] const BridgeConfig &config() const noexcept { return m_config; }
    [[nodiscard]] BridgeState state() const noexcept;

    /**
     * @brief Runs the session to completion. Call once.
     * @throws ipc::HandshakeError if registration or channel setup failed.
     * @throws std::logic_error if called twice.
     */
    void run();

    /** @brief Triggers a graceful unload. Async-signal-safe. */
    void request_unload() noexcept;

    /** @brief How the relay loop ended; empty until it has. */
    [[nodiscard]] std::optional<ipc::RelayExit> relay_exit() const noexcept;

  private:
    void advance(BridgeState next) noexcept;
    void relay_thread_main();

    zmq::context_t &m_context;
    BridgeConfig m_config;
    ipc::LocalChannelPair m_queues;
    plugin::Plugin m_plugin;
    plugin::Dispatcher m_dispatcher;

    std::atomic<BridgeState> m_state{BridgeState::Unregistered};
    std::atomic<int> m_relay_exit{-1};
    std::exception_ptr m_startup_error;
};

} // namespace gwbridge::bridge
