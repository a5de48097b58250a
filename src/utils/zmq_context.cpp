#include "utils/zmq_context.hpp"
#include "gwb_service.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>

namespace gwbridge::ipc
{

namespace
{
std::mutex g_context_mutex;
std::unique_ptr<zmq::context_t> g_context;
} // namespace

zmq::context_t &get_zmq_context()
{
    std::lock_guard<std::mutex> lock(g_context_mutex);
    if (!g_context)
    {
        throw std::logic_error("ZmqContext: zmq_context_startup() has not been called");
    }
    return *g_context;
}

void zmq_context_startup()
{
    std::lock_guard<std::mutex> lock(g_context_mutex);
    if (g_context)
        return;
    g_context = std::make_unique<zmq::context_t>(1);
    LOGGER_DEBUG("ZmqContext: created (1 io thread)");
}

void zmq_context_shutdown()
{
    std::unique_ptr<zmq::context_t> released;
    {
        std::lock_guard<std::mutex> lock(g_context_mutex);
        released.swap(g_context);
    }
    if (!released)
        return;
    // Terminating blocks until every socket is closed, so not under the lock.
    released.reset();
    LOGGER_DEBUG("ZmqContext: terminated");
}

} // namespace gwbridge::ipc
