#include "utils/zmq_context.hpp"
#include "utils/logger.hpp"

#include <memory>
#include <mutex>

namespace testrelay::utils
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
        g_context = std::make_unique<zmq::context_t>(1);
        LOGGER_DEBUG("ZMQContext: ZeroMQ context created.");
    }
    return *g_context;
}

void zmq_context_shutdown()
{
    std::unique_ptr<zmq::context_t> ctx;
    {
        std::lock_guard<std::mutex> lock(g_context_mutex);
        ctx = std::move(g_context);
    }
    if (!ctx)
    {
        return;
    }
    ctx.reset();
    LOGGER_DEBUG("ZMQContext: ZeroMQ context destroyed.");
}

} // namespace testrelay::utils
