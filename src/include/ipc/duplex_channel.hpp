#pragma once
/**
 * @file duplex_channel.hpp
 * @brief Framed, bidirectional channel between the plugin and the gateway.
 *
 * `DuplexChannel` is the seam the relay loop is written against. The
 * production implementation is `ZmqPairChannel` (a connected ZMQ PAIR
 * socket); tests substitute an in-memory channel.
 *
 * A channel is owned and used by exactly one thread (the relay thread).
 */
#include "gwbridge_core_export.h"

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <zmq.hpp>

namespace gwbridge::ipc
{

/**
 * @brief Transport failure on a channel or socket.
 *
 * `recoverable()` is true for transient conditions (send timeout, EAGAIN,
 * EINTR) after which the same channel can be used again. Unrecoverable
 * errors (channel closed, context terminated) end the relay loop.
 */
class GWBRIDGE_CORE_EXPORT TransportError : public std::runtime_error
{
  public:
    TransportError(const std::string &what, bool recoverable, int error_code = 0)
        : std::runtime_error(what), m_recoverable(recoverable), m_error_code(error_code)
    {
    }

    [[nodiscard]] bool recoverable() const noexcept { return m_recoverable; }
    [[nodiscard]] int error_code() const noexcept { return m_error_code; }

  private:
    bool m_recoverable;
    int m_error_code;
};

class GWBRIDGE_CORE_EXPORT DuplexChannel
{
  public:
    virtual ~DuplexChannel() = default;

    DuplexChannel() = default;
    DuplexChannel(const DuplexChannel &) = delete;
    DuplexChannel &operator=(const DuplexChannel &) = delete;

    /**
     * @brief Non-blocking read of one complete frame.
     * @return The frame, or nullopt when nothing is pending.
     * @throws TransportError
     */
    [[nodiscard]] virtual std::optional<std::string> try_read() = 0;

    /**
     * @brief Writes one complete frame.
     * @throws TransportError
     */
    virtual void write(std::string_view frame) = 0;

    /**
     * @brief Waits up to @p timeout for a frame to become readable.
     * @return true if try_read() would now return a frame.
     * @throws TransportError
     */
    [[nodiscard]] virtual bool wait_readable(std::chrono::milliseconds timeout) = 0;

    /** @brief Closes the channel. Idempotent. */
    virtual void close() noexcept = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;

    /** @brief Human-readable endpoint, for log lines. */
    [[nodiscard]] virtual std::string description() const = 0;
};

/**
 * @class ZmqPairChannel
 * @brief DuplexChannel over a ZMQ PAIR socket connected to the gateway.
 */
class GWBRIDGE_CORE_EXPORT ZmqPairChannel : public DuplexChannel
{
  public:
    struct Config
    {
        /// Upper bound for a blocked send before it fails recoverably.
        std::chrono::milliseconds send_timeout{1000};
        /// How long unsent frames survive close(); 0 discards them.
        std::chrono::milliseconds linger{500};
    };

    /**
     * @brief Creates the PAIR socket and connects it to @p endpoint.
     * @throws TransportError (unrecoverable) if the socket cannot be created
     *         or the endpoint is invalid.
     */
    ZmqPairChannel(zmq::context_t &context, std::string endpoint, Config config);
    ZmqPairChannel(zmq::context_t &context, std::string endpoint);
    ~ZmqPairChannel() override;

    [[nodiscard]] std::optional<std::string> try_read() override;
    void write(std::string_view frame) override;
    [[nodiscard]] bool wait_readable(std::chrono::milliseconds timeout) override;
    void close() noexcept override;
    [[nodiscard]] bool is_open() const noexcept override;
    [[nodiscard]] std::string description() const override;

  private:
    std::string m_endpoint;
    Config m_config;
    zmq::socket_t m_socket;
    bool m_open{false};
};

/// True for zmq errno values after which a socket is still usable.
[[nodiscard]] GWBRIDGE_CORE_EXPORT bool is_recoverable_zmq_error(int error_number) noexcept;

} // namespace gwbridge::ipc
