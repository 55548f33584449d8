#pragma once
/**
 * @file zmq_context.hpp
 * @brief Process-wide ZeroMQ context.
 *
 * All sockets in the process are created from this context. It is created on first
 * use; executables call zmq_context_shutdown() once every component owning a socket
 * has stopped. Tests never shut it down.
 */
#include <zmq.hpp>

#include "testrelay_core_export.h"

namespace testrelay::utils
{

/**
 * @brief Returns the process-wide ZeroMQ context, creating it on first call.
 */
[[nodiscard]] TESTRELAY_CORE_EXPORT zmq::context_t &get_zmq_context();

/**
 * @brief Destroys the process-wide context. Idempotent.
 * @pre Every socket created from the context has been closed.
 */
TESTRELAY_CORE_EXPORT void zmq_context_shutdown();

} // namespace testrelay::utils
