#include "ipc/relay_loop.hpp"
#include "ipc/message_codec.hpp"
#include "gwb_service.hpp"

#include <string>

namespace gwbridge::ipc
{

const char *to_string(RelayExit exit) noexcept
{
    switch (exit)
    {
    case RelayExit::Unloaded: return "unloaded";
    case RelayExit::ChannelLost: return "channel lost";
    }
    return "unknown";
}

RelayLoop::RelayLoop(DuplexChannel &channel, InboundQueue &inbound, OutboundQueue &outbound)
    : RelayLoop(channel, inbound, outbound, Config{})
{
}

RelayLoop::RelayLoop(DuplexChannel &channel, InboundQueue &inbound, OutboundQueue &outbound,
                     Config config)
    : m_channel(channel), m_inbound(inbound), m_outbound(outbound), m_config(config)
{
}

RelayStats RelayLoop::stats() const noexcept
{
    return RelayStats{m_frames_in.load(std::memory_order_relaxed),
                      m_frames_dropped.load(std::memory_order_relaxed),
                      m_frames_out.load(std::memory_order_relaxed),
                      m_write_failures.load(std::memory_order_relaxed)};
}

// Returns true if a frame was read (whether or not it was usable).
bool RelayLoop::pump_inbound()
{
    // Scoped to this call: nothing from a previous frame can leak into the next.
    std::optional<std::string> frame = m_channel.try_read();
    if (!frame.has_value())
    {
        return false;
    }

    auto decoded = decode_gateway_message(*frame);
    if (decoded.is_error())
    {
        m_frames_dropped.fetch_add(1, std::memory_order_relaxed);
        LOGGER_DEBUG("Relay: dropped inbound frame ({}): {}", to_string(decoded.error()),
                     format_tools::clip_for_log(*frame));
        return true;
    }

    const std::string type(message_type(decoded.content()));
    const auto status = m_inbound.send(std::move(decoded).content());
    switch (status)
    {
    case utils::SendStatus::Sent:
        m_frames_in.fetch_add(1, std::memory_order_relaxed);
        LOGGER_TRACE("Relay: queued inbound {}", type);
        break;
    case utils::SendStatus::DroppedOldest:
        m_frames_in.fetch_add(1, std::memory_order_relaxed);
        m_frames_dropped.fetch_add(1, std::memory_order_relaxed);
        LOGGER_WARN("Relay: inbound queue full; oldest command discarded for {}", type);
        break;
    case utils::SendStatus::Rejected:
        m_frames_dropped.fetch_add(1, std::memory_order_relaxed);
        LOGGER_WARN("Relay: inbound queue full; {} dropped", type);
        break;
    case utils::SendStatus::Closed:
        m_frames_dropped.fetch_add(1, std::memory_order_relaxed);
        LOGGER_DEBUG("Relay: inbound queue closed; {} dropped", type);
        break;
    }
    return true;
}

// Returns true if an outbound message was taken off the queue.
bool RelayLoop::pump_outbound(bool &unloaded)
{
    std::optional<PluginMessage> msg = m_outbound.try_receive();
    if (!msg.has_value())
    {
        return false;
    }

    const bool is_unload = std::holds_alternative<PluginUnloaded>(*msg);
    std::string frame;
    try
    {
        frame = encode(*msg);
    }
    catch (const nlohmann::json::exception &e)
    {
        // e.g. a property string that is not valid UTF-8
        m_write_failures.fetch_add(1, std::memory_order_relaxed);
        LOGGER_WARN("Relay: cannot encode outbound {}; dropped: {}", message_type(*msg), e.what());
        unloaded = is_unload;
        return true;
    }

    try
    {
        m_channel.write(frame);
        m_frames_out.fetch_add(1, std::memory_order_relaxed);
        LOGGER_TRACE("Relay: sent {}", message_type(*msg));
    }
    catch (const TransportError &e)
    {
        m_write_failures.fetch_add(1, std::memory_order_relaxed);
        if (!e.recoverable())
        {
            throw;
        }
        if (is_unload)
        {
            // The session ends either way; the gateway learns of it from the closed socket.
            LOGGER_ERROR("Relay: could not deliver pluginUnloaded: {}; closing anyway", e.what());
            unloaded = true;
            return true;
        }
        LOGGER_WARN("Relay: dropped outbound {}: {}", message_type(*msg), e.what());
        return true;
    }
    unloaded = is_unload;
    return true;
}

RelayExit RelayLoop::finish(RelayExit reason)
{
    m_channel.close();
    m_inbound.close();
    m_outbound.close();
    const RelayStats s = stats();
    LOGGER_INFO("Relay: stopped ({}); in={} dropped={} out={} write_failures={}",
                to_string(reason), s.frames_in, s.frames_dropped, s.frames_out,
                s.write_failures);
    return reason;
}

RelayExit RelayLoop::run()
{
    LOGGER_INFO("Relay: running on {}", m_channel.description());
    while (true)
    {
        try
        {
            bool unloaded = false;
            const bool got_inbound = pump_inbound();
            const bool got_outbound = pump_outbound(unloaded);
            if (unloaded)
            {
                return finish(RelayExit::Unloaded);
            }
            if (!got_inbound && !got_outbound)
            {
                // Outbound latency is bounded by idle_wait.
                static_cast<void>(m_channel.wait_readable(m_config.idle_wait));
            }
        }
        catch (const TransportError &e)
        {
            if (e.recoverable())
            {
                LOGGER_WARN("Relay: transient transport error: {}", e.what());
                continue;
            }
            LOGGER_ERROR("Relay: channel lost: {}", e.what());
            return finish(RelayExit::ChannelLost);
        }
    }
}

} // namespace gwbridge::ipc
