#pragma once
/**
 * @file zmq_context.hpp
 * @brief Process-wide ZeroMQ context.
 *
 * One `zmq::context_t` per plugin process. The handshake REQ socket and the
 * relay PAIR socket are both created from it, which is also what makes
 * `inproc://` endpoints usable between a test-side gateway and the bridge.
 *
 * Usage:
 *   gwbridge::ipc::zmq_context_startup();
 *   auto guard = gwbridge::basics::make_scope_guard([] { gwbridge::ipc::zmq_context_shutdown(); });
 *   zmq::socket_t s(gwbridge::ipc::get_zmq_context(), zmq::socket_type::pair);
 */
#include "gwbridge_core_export.h"

#include <zmq.hpp>

namespace gwbridge::ipc
{

/**
 * @brief Returns the global ZeroMQ context.
 * @throws std::logic_error if zmq_context_startup() has not been called.
 */
[[nodiscard]] GWBRIDGE_CORE_EXPORT zmq::context_t &get_zmq_context();

/**
 * @brief Creates the global ZeroMQ context. Idempotent.
 */
GWBRIDGE_CORE_EXPORT void zmq_context_startup();

/**
 * @brief Destroys the global ZeroMQ context. Idempotent.
 * Blocks until every socket created from the context has been closed.
 */
GWBRIDGE_CORE_EXPORT void zmq_context_shutdown();

} // namespace gwbridge::ipc
