#include "ipc/duplex_channel.hpp"
#include "gwb_service.hpp"

#include <cerrno>
#include <vector>

namespace gwbridge::ipc
{

bool is_recoverable_zmq_error(int error_number) noexcept
{
    return error_number == EAGAIN || error_number == EINTR;
}

namespace
{
[[noreturn]] void throw_transport(const std::string &operation, const zmq::error_t &e)
{
    throw TransportError(fmt::format("{}: {} ({})", operation, e.what(), e.num()),
                         is_recoverable_zmq_error(e.num()), e.num());
}
} // namespace

ZmqPairChannel::ZmqPairChannel(zmq::context_t &context, std::string endpoint)
    : ZmqPairChannel(context, std::move(endpoint), Config{})
{
}

ZmqPairChannel::ZmqPairChannel(zmq::context_t &context, std::string endpoint, Config config)
    : m_endpoint(std::move(endpoint)), m_config(config)
{
    try
    {
        m_socket = zmq::socket_t(context, zmq::socket_type::pair);
        m_socket.set(zmq::sockopt::sndtimeo, static_cast<int>(m_config.send_timeout.count()));
        m_socket.set(zmq::sockopt::linger, static_cast<int>(m_config.linger.count()));
        m_socket.connect(m_endpoint);
    }
    catch (const zmq::error_t &e)
    {
        // Socket errors at construction are never transient.
        throw TransportError(
            fmt::format("ZmqPairChannel: connect to '{}' failed: {} ({})", m_endpoint, e.what(),
                        e.num()),
            false, e.num());
    }
    m_open = true;
    LOGGER_DEBUG("Relay: PAIR socket connected to {}", m_endpoint);
}

ZmqPairChannel::~ZmqPairChannel()
{
    close();
}

std::optional<std::string> ZmqPairChannel::try_read()
{
    if (!m_open)
    {
        throw TransportError("ZmqPairChannel: read on closed channel", false, ENOTSOCK);
    }
    // Fresh message per call: no frame data survives between reads.
    zmq::message_t msg;
    try
    {
        const auto received = m_socket.recv(msg, zmq::recv_flags::dontwait);
        if (!received)
        {
            return std::nullopt;
        }
    }
    catch (const zmq::error_t &e)
    {
        throw_transport("ZmqPairChannel: recv", e);
    }
    return msg.to_string();
}

void ZmqPairChannel::write(std::string_view frame)
{
    if (!m_open)
    {
        throw TransportError("ZmqPairChannel: write on closed channel", false, ENOTSOCK);
    }
    try
    {
        const auto sent = m_socket.send(zmq::buffer(frame.data(), frame.size()),
                                        zmq::send_flags::none);
        if (!sent)
        {
            // sndtimeo expired: the peer is not draining.
            throw TransportError(fmt::format("ZmqPairChannel: send timed out after {} ms",
                                             m_config.send_timeout.count()),
                                 true, EAGAIN);
        }
    }
    catch (const zmq::error_t &e)
    {
        throw_transport("ZmqPairChannel: send", e);
    }
}

bool ZmqPairChannel::wait_readable(std::chrono::milliseconds timeout)
{
    if (!m_open)
    {
        throw TransportError("ZmqPairChannel: poll on closed channel", false, ENOTSOCK);
    }
    try
    {
        std::vector<zmq::pollitem_t> items = {{m_socket.handle(), 0, ZMQ_POLLIN, 0}};
        zmq::poll(items, timeout);
        return (items[0].revents & ZMQ_POLLIN) != 0;
    }
    catch (const zmq::error_t &e)
    {
        if (e.num() == EINTR)
        {
            return false;
        }
        throw_transport("ZmqPairChannel: poll", e);
    }
}

void ZmqPairChannel::close() noexcept
{
    if (!m_open)
    {
        return;
    }
    m_open = false;
    try
    {
        m_socket.close();
        LOGGER_DEBUG("Relay: PAIR socket to {} closed", m_endpoint);
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_ERROR("Relay: error closing PAIR socket to {}: {}", m_endpoint, e.what());
    }
}

bool ZmqPairChannel::is_open() const noexcept
{
    return m_open;
}

std::string ZmqPairChannel::description() const
{
    return fmt::format("zmq-pair:{}", m_endpoint);
}

} // namespace gwbridge::ipc
