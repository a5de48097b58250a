#pragma once
/**
 * @file gwb_bridge.hpp
 * @brief Layer 3: gateway IPC and the plugin-side registry.
 *
 * Wire messages and codec, the duplex channel abstraction, handshake client,
 * relay loop, and the Plugin / Adapter / Dispatcher registry.
 */
#include "gwb_service.hpp"

#include "utils/zmq_context.hpp"

#include "ipc/messages.hpp"
#include "ipc/message_codec.hpp"
#include "ipc/duplex_channel.hpp"
#include "ipc/local_channel_pair.hpp"
#include "ipc/handshake_client.hpp"
#include "ipc/relay_loop.hpp"

#include "plugin/device.hpp"
#include "plugin/adapter.hpp"
#include "plugin/plugin.hpp"
#include "plugin/dispatcher.hpp"
