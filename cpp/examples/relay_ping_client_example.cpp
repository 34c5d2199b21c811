/**
 * @file relay_ping_client_example.cpp
 * @brief Example: client for relay_ping_server_example.
 *
 * Joins channel 1 as member 2, prints each value member 1 sends and answers with "ack".
 *
 * Usage: relay_ping_client_example [N]   (default N = 100)
 */
#include "rlh_relay.hpp"

#include <cstdlib>
#include <iostream>

using namespace relayhub;
using namespace relayhub::utils;
using namespace std::chrono_literals;

int main(int argc, char *argv[])
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    const int count = argc >= 2 ? std::atoi(argv[1]) : 100;

    LifecycleGuard lifecycle(MakeModDefList(Logger::GetLifecycleModule(),
                                            RelayConfig::GetLifecycleModule(),
                                            store::GetZMQContextModule()));

    const auto &config = RelayConfig::get_instance();
    auto connector = store::make_zmq_connector(config.store_endpoint(), config.request_timeout());

    try
    {
        auto channel = relay::Channel::open(connector, 1);
        channel.join(2);

        for (int i = 0; i < count; ++i)
        {
            auto msg = channel.recv_from(1, true, 10000ms);
            if (!msg.is_ok())
            {
                std::cerr << "client: server went quiet\n";
                return 1;
            }
            std::cout << "client: got " << msg.content().message.dump() << "\n";
            channel.send_to(1, "ack");
        }

        channel.leave();
    }
    catch (const relay::ChannelError &e)
    {
        std::cerr << "client: channel error: " << e.what() << "\n";
        return 1;
    }
    catch (const store::StoreError &e)
    {
        std::cerr << "client: store unreachable: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
