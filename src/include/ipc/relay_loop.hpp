#pragma once
/**
 * @file relay_loop.hpp
 * @brief Moves frames between the persistent gateway channel and the local queues.
 *
 * Each iteration:
 *  1. reads at most one frame from the channel; a frame that decodes as a
 *     GatewayMessage goes onto the inbound queue, anything else is dropped;
 *  2. takes at most one message off the outbound queue and writes it; after
 *     writing `pluginUnloaded` the channel is closed and run() returns. A
 *     message that cannot be encoded is counted as a write failure and dropped;
 *  3. when neither step found work, waits for the channel to become readable
 *     for at most `idle_wait`.
 *
 * On every exit path both queues are closed, so the dispatcher observes the
 * end of the session and later sends onto the outbound queue are refused.
 */
#include "gwbridge_core_export.h"
#include "ipc/duplex_channel.hpp"
#include "ipc/local_channel_pair.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace gwbridge::ipc
{

enum class RelayExit
{
    Unloaded,    ///< pluginUnloaded was written and the channel closed.
    ChannelLost, ///< unrecoverable transport error.
};

[[nodiscard]] GWBRIDGE_CORE_EXPORT const char *to_string(RelayExit exit) noexcept;

struct RelayStats
{
    uint64_t frames_in = 0;      ///< decoded and queued for the dispatcher
    uint64_t frames_dropped = 0; ///< malformed, unknown, or rejected by a full queue
    uint64_t frames_out = 0;
    uint64_t write_failures = 0;
};

class GWBRIDGE_CORE_EXPORT RelayLoop
{
  public:
    struct Config
    {
        std::chrono::milliseconds idle_wait{20};
    };

    RelayLoop(DuplexChannel &channel, InboundQueue &inbound, OutboundQueue &outbound, Config config);
    RelayLoop(DuplexChannel &channel, InboundQueue &inbound, OutboundQueue &outbound);

    RelayLoop(const RelayLoop &) = delete;
    RelayLoop &operator=(const RelayLoop &) = delete;

    /** @brief Runs until unload or channel loss. Call once. */
    [[nodiscard]] RelayExit run();

    /** @brief Snapshot of the counters; safe to call from any thread. */
    [[nodiscard]] RelayStats stats() const noexcept;

  private:
    bool pump_inbound();
    bool pump_outbound(bool &unloaded);
    RelayExit finish(RelayExit reason);

    DuplexChannel &m_channel;
    InboundQueue &m_inbound;
    OutboundQueue &m_outbound;
    Config m_config;

    std::atomic<uint64_t> m_frames_in{0};
    std::atomic<uint64_t> m_frames_dropped{0};
    std::atomic<uint64_t> m_frames_out{0};
    std::atomic<uint64_t> m_write_failures{0};
};

} // namespace gwbridge::ipc
