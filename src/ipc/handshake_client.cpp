#include "ipc/handshake_client.hpp"
#include "ipc/message_codec.hpp"
#include "gwb_service.hpp"

#include <optional>
#include <vector>

namespace gwbridge::ipc
{

std::string derive_channel_endpoint(const std::string &base_url, const std::string &ipc_base_addr)
{
    std::string base = base_url;
    while (!base.empty() && base.back() == '/')
    {
        base.pop_back();
    }
    return fmt::format("{}/{}", base, ipc_base_addr);
}

HandshakeClient::HandshakeClient(zmq::context_t &context, Config config)
    : m_context(context), m_config(std::move(config))
{
    if (m_config.attempts < 1)
    {
        m_config.attempts = 1;
    }
}

namespace
{

/// One request/reply exchange. Returns the raw reply, or nullopt on timeout.
std::optional<std::string> exchange_once(zmq::context_t &context,
                                         const HandshakeClient::Config &cfg,
                                         const std::string &request)
{
    zmq::socket_t socket(context, zmq::socket_type::req);
    socket.set(zmq::sockopt::linger, 0);
    socket.set(zmq::sockopt::sndtimeo, static_cast<int>(cfg.reply_timeout.count()));
    socket.connect(cfg.rendezvous_endpoint);

    const auto sent = socket.send(zmq::buffer(request), zmq::send_flags::none);
    if (!sent)
    {
        return std::nullopt;
    }

    std::vector<zmq::pollitem_t> items = {{socket.handle(), 0, ZMQ_POLLIN, 0}};
    zmq::poll(items, cfg.reply_timeout);
    if ((items[0].revents & ZMQ_POLLIN) == 0)
    {
        return std::nullopt;
    }

    zmq::message_t reply;
    const auto received = socket.recv(reply, zmq::recv_flags::dontwait);
    if (!received)
    {
        return std::nullopt;
    }
    return reply.to_string();
}

} // namespace

HandshakeClient::Registration HandshakeClient::register_plugin(const std::string &plugin_id)
{
    const std::string request = encode(HandshakeMessage{RegisterPlugin{plugin_id}});
    const utils::ExponentialBackoff backoff{m_config.backoff_base, std::chrono::seconds(5)};

    for (int attempt = 0; attempt < m_config.attempts; ++attempt)
    {
        LOGGER_INFO("Handshake: registering plugin '{}' at {} (attempt {}/{})", plugin_id,
                    m_config.rendezvous_endpoint, attempt + 1, m_config.attempts);

        std::optional<std::string> raw;
        try
        {
            raw = exchange_once(m_context, m_config, request);
        }
        catch (const zmq::error_t &e)
        {
            throw HandshakeError(fmt::format("Handshake: transport error talking to {}: {} ({})",
                                             m_config.rendezvous_endpoint, e.what(), e.num()));
        }

        if (!raw.has_value())
        {
            LOGGER_WARN("Handshake: no reply from {} within {} ms", m_config.rendezvous_endpoint,
                        m_config.reply_timeout.count());
            if (attempt + 1 < m_config.attempts)
            {
                backoff(attempt);
            }
            continue;
        }

        auto decoded = decode_handshake_message(*raw);
        if (decoded.is_error())
        {
            throw HandshakeError(fmt::format("Handshake: unparseable reply ({}): {}",
                                             to_string(decoded.error()),
                                             format_tools::clip_for_log(*raw)));
        }
        const auto *reply = std::get_if<RegisterPluginReply>(&decoded.content());
        if (reply == nullptr)
        {
            throw HandshakeError(fmt::format("Handshake: expected registerPluginReply, got {}",
                                             message_type(decoded.content())));
        }
        if (reply->ipc_base_addr.empty())
        {
            throw HandshakeError("Handshake: registerPluginReply carries an empty ipcBaseAddr");
        }
        if (reply->plugin_id != plugin_id)
        {
            LOGGER_WARN("Handshake: gateway replied for plugin '{}' (requested '{}'); continuing",
                        reply->plugin_id, plugin_id);
        }

        Registration registration{reply->plugin_id, reply->ipc_base_addr,
                                  derive_channel_endpoint(m_config.base_url, reply->ipc_base_addr)};
        LOGGER_INFO("Handshake: registered; persistent channel is {}",
                    registration.channel_endpoint);
        return registration;
    }

    throw HandshakeError(fmt::format("Handshake: gateway at {} did not reply after {} attempt(s)",
                                     m_config.rendezvous_endpoint, m_config.attempts));
}

} // namespace gwbridge::ipc
