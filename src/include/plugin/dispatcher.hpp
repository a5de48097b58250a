#pragma once
/**
 * @file dispatcher.hpp
 * @brief Routes inbound gateway commands to the plugin's adapters.
 *
 * The Dispatcher is the only consumer of the inbound queue. Commands for
 * another plugin id are ignored. Unknown adapter or device ids produce a
 * NotFound outcome that is logged; they never stop the loop.
 *
 * The loop ends when
 *  - an `unloadPlugin` command for this plugin arrives,
 *  - request_unload() was called (e.g. from a signal handler), or
 *  - the inbound queue has been closed and drained (relay loop stopped).
 * In the first two cases every adapter's `unload()` hook runs and
 * `pluginUnloaded` is queued for the gateway before run() returns.
 */
#include "gwbridge_core_export.h"
#include "ipc/local_channel_pair.hpp"
#include "plugin/adapter.hpp"
#include "plugin/plugin.hpp"

#include <atomic>
#include <chrono>

namespace gwbridge::plugin
{

enum class DispatcherExit
{
    Unloaded,
    QueueClosed,
};

[[nodiscard]] GWBRIDGE_CORE_EXPORT const char *to_string(DispatcherExit exit) noexcept;

class GWBRIDGE_CORE_EXPORT Dispatcher
{
  public:
    struct Config
    {
        std::chrono::milliseconds idle_wait{20};
    };

    Dispatcher(Plugin &plugin, ipc::InboundQueue &inbound, ipc::OutboundQueue &outbound,
               Config config);
    Dispatcher(Plugin &plugin, ipc::InboundQueue &inbound, ipc::OutboundQueue &outbound);

    Dispatcher(const Dispatcher &) = delete;
    Dispatcher &operator=(const Dispatcher &) = delete;

    /** @brief Runs the dispatch loop on the calling thread. */
    [[nodiscard]] DispatcherExit run();

    /**
     * @brief Routes one command.
     * Commands addressed to another plugin succeed without effect.
     */
    Outcome dispatch(const ipc::GatewayMessage &msg);

    /** @brief Asks run() to unload the plugin. Async-signal-safe. */
    void request_unload() noexcept;

    /** @brief True once the unload sequence has run. */
    [[nodiscard]] bool unloaded() const noexcept;

  private:
    Outcome handle(const ipc::UnloadPlugin &cmd);
    Outcome handle(const ipc::UnloadAdapter &cmd);
    Outcome handle(const ipc::SetProperty &cmd);
    Outcome handle(const ipc::StartPairing &cmd);
    Outcome handle(const ipc::CancelPairing &cmd);
    Outcome handle(const ipc::RemoveThing &cmd);
    Outcome handle(const ipc::CancelRemoveThing &cmd);

    Adapter *lookup(const std::string &adapter_id, std::string_view command);
    void unload_plugin();

    Plugin &m_plugin;
    ipc::InboundQueue &m_inbound;
    ipc::OutboundQueue &m_outbound;
    Config m_config;

    std::atomic<bool> m_unload_requested{false};
    std::atomic<bool> m_unloaded{false};

    static_assert(std::atomic<bool>::is_always_lock_free,
                  "request_unload() must be callable from a signal handler");
};

} // namespace gwbridge::plugin
