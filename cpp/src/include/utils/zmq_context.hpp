#pragma once
/**
 * @file zmq_context.hpp
 * @brief Shared ZeroMQ context as a named static lifecycle module.
 *
 * Provides a single `zmq::context_t` instance owned by the lifecycle manager. The store
 * service and every `ZmqMessageStore` create their sockets from this context.
 *
 * Usage:
 *   Include GetZMQContextModule() in your LifecycleGuard module list, then call
 *   get_zmq_context() to obtain the shared context.
 */
#include "relayhub_utils_export.h"

#include <zmq.hpp>

#include "utils/module_def.hpp"

namespace relayhub::store
{

/**
 * @brief Returns the global ZeroMQ context.
 * @pre The "ZMQContext" lifecycle module has been started. Calling this earlier is fatal.
 */
[[nodiscard]] RELAYHUB_UTILS_EXPORT zmq::context_t &get_zmq_context();

/// Lifecycle module "ZMQContext", depending on the Logger.
RELAYHUB_UTILS_EXPORT relayhub::utils::ModuleDef GetZMQContextModule();

} // namespace relayhub::store
