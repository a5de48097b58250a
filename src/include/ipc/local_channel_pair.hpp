#pragma once
/**
 * @file local_channel_pair.hpp
 * @brief The two in-process queues shared by the relay and dispatcher threads.
 *
 * inbound  : gateway -> plugin commands, produced by RelayLoop, consumed by Dispatcher.
 * outbound : plugin -> gateway events, produced by Dispatcher and adapters
 *            (through EventSink), consumed by RelayLoop.
 *
 * These are the only state the two threads share.
 */
#include "ipc/messages.hpp"
#include "utils/mailbox.hpp"

#include <cstddef>
#include <memory>

namespace gwbridge::ipc
{

using InboundQueue = utils::Mailbox<GatewayMessage>;
using OutboundQueue = utils::Mailbox<PluginMessage>;

struct LocalChannelPair
{
    std::shared_ptr<InboundQueue> inbound;
    std::shared_ptr<OutboundQueue> outbound;
};

inline LocalChannelPair make_local_channel_pair(std::size_t capacity = 1024,
                                                utils::FullPolicy inbound_policy = utils::FullPolicy::Reject,
                                                utils::FullPolicy outbound_policy = utils::FullPolicy::Block)
{
    return LocalChannelPair{std::make_shared<InboundQueue>(capacity, inbound_policy),
                            std::make_shared<OutboundQueue>(capacity, outbound_policy)};
}

} // namespace gwbridge::ipc
