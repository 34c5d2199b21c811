// relayhub-store: runs the message store service until SIGINT/SIGTERM.
//
// Usage: relayhub-store [--config <file>] [endpoint]
//
// The endpoint defaults to store.endpoint from the relayhub configuration.
#include "rlh_relay.hpp"

#include <csignal>
#include <cstring>

namespace
{
relayhub::store::StoreService *g_store = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void signal_handler(int /*sig*/)
{
    if (g_store != nullptr)
    {
        g_store->stop();
    }
}
} // namespace

int main(int argc, char *argv[])
{
    std::string endpoint_arg;
    for (int i = 1; i < argc; ++i)
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        const char *arg = argv[i];
        if (std::strcmp(arg, "--config") == 0 && i + 1 < argc)
        {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            relayhub::RelayConfig::set_config_path(argv[++i]);
        }
        else
        {
            endpoint_arg = arg;
        }
    }

    relayhub::utils::LifecycleGuard lifecycle(relayhub::utils::MakeModDefList(
        relayhub::utils::Logger::GetLifecycleModule(), relayhub::RelayConfig::GetLifecycleModule(),
        relayhub::store::GetZMQContextModule()));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    relayhub::store::StoreService::Config cfg;
    cfg.endpoint = endpoint_arg.empty() ? relayhub::RelayConfig::get_instance().store_endpoint()
                                        : endpoint_arg;

    relayhub::store::StoreService service(cfg);
    g_store = &service;

    LOGGER_INFO("relayhub-store {} starting on {}", relayhub::platform::get_version_string(),
                cfg.endpoint);
    try
    {
        service.run();
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_ERROR("relayhub-store: cannot serve on {}: {}", cfg.endpoint, e.what());
        g_store = nullptr;
        return 1;
    }
    g_store = nullptr;
    return 0;
}
