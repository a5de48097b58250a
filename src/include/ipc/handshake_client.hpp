#pragma once
/**
 * @file handshake_client.hpp
 * @brief One-shot plugin registration with the gateway.
 *
 * The client connects a REQ socket to the gateway's rendezvous endpoint,
 * sends `registerPlugin{pluginId}` and waits for exactly one
 * `registerPluginReply{pluginId, ipcBaseAddr}`. The persistent channel the
 * relay loop connects to is `<base_url>/<ipcBaseAddr>`.
 *
 * Reply timeouts are retried (bounded, with exponential backoff); a REQ
 * socket that timed out is in a stuck state and is discarded before the next
 * attempt. Any other failure ends the handshake at once with HandshakeError.
 */
#include "gwbridge_core_export.h"

#include <chrono>
#include <stdexcept>
#include <string>

#include <zmq.hpp>

namespace gwbridge::ipc
{

inline constexpr const char *kDefaultRendezvousEndpoint = "ipc:///tmp/gateway.addonManager";
inline constexpr const char *kDefaultBaseUrl = "ipc:///tmp";

class GWBRIDGE_CORE_EXPORT HandshakeError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Joins @p base_url and @p ipc_base_addr with a single '/'.
 * "ipc:///tmp" + "gateway.plugin.mqtt" -> "ipc:///tmp/gateway.plugin.mqtt"
 */
[[nodiscard]] GWBRIDGE_CORE_EXPORT std::string derive_channel_endpoint(const std::string &base_url,
                                                                       const std::string &ipc_base_addr);

class GWBRIDGE_CORE_EXPORT HandshakeClient
{
  public:
    struct Config
    {
        std::string rendezvous_endpoint = kDefaultRendezvousEndpoint;
        std::string base_url = kDefaultBaseUrl;
        std::chrono::milliseconds reply_timeout{5000};
        int attempts = 3;
        std::chrono::milliseconds backoff_base{200};
    };

    struct Registration
    {
        std::string plugin_id;        ///< as echoed by the gateway
        std::string ipc_base_addr;
        std::string channel_endpoint; ///< derived: base_url + "/" + ipc_base_addr
    };

    HandshakeClient(zmq::context_t &context, Config config);

    /**
     * @brief Performs the registration exchange.
     * @throws HandshakeError on connect, send, receive or parse failure, or
     *         when every attempt timed out.
     */
    [[nodiscard]] Registration register_plugin(const std::string &plugin_id);

    [[nodiscard]] const Config &config() const noexcept { return m_config; }

  private:
    zmq::context_t &m_context;
    Config m_config;
};

} // namespace gwbridge::ipc
