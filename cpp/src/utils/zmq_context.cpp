#include "utils/zmq_context.hpp"
#include "rlh_service.hpp"

#include <memory>

namespace relayhub::store
{

namespace
{
constexpr std::chrono::milliseconds kContextTermTimeout{2000};

std::unique_ptr<zmq::context_t> &context_slot()
{
    static std::unique_ptr<zmq::context_t> slot;
    return slot;
}

void start_context(const char * /*arg*/)
{
    auto &slot = context_slot();
    if (!slot)
    {
        slot = std::make_unique<zmq::context_t>(1);
        LOGGER_INFO("ZMQContext: context created");
    }
}

// Terminating the context waits for every socket to be closed. Relayhub sockets use a
// short linger, so this returns once their owners have let go of them.
void stop_context(const char * /*arg*/)
{
    auto &slot = context_slot();
    if (slot)
    {
        slot.reset();
        LOGGER_INFO("ZMQContext: context terminated");
    }
}
} // namespace

zmq::context_t &get_zmq_context()
{
    auto &slot = context_slot();
    if (!slot)
        RLH_PANIC("get_zmq_context() called before the ZMQContext module was started");
    return *slot;
}

relayhub::utils::ModuleDef GetZMQContextModule()
{
    relayhub::utils::ModuleDef module("ZMQContext");
    module.add_dependency("relayhub::utils::Logger");
    module.set_startup(&start_context);
    module.set_shutdown(&stop_context, kContextTermTimeout);
    return module;
}

} // namespace relayhub::store
