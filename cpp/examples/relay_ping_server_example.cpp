/**
 * @file relay_ping_server_example.cpp
 * @brief Example: counting server on relay channel 1.
 *
 * Joins channel 1 as member 1 (flushing the store), waits for member 2, then broadcasts the
 * values 1..N with send_to_all and waits for an acknowledgement after each one.
 *
 * Run relayhub-store first, then this program, then relay_ping_client_example.
 *
 * Usage: relay_ping_server_example [N]   (default N = 100)
 */
#include "rlh_relay.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

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
        auto channel = relay::Channel::open(connector, 1, /*flush=*/true);
        channel.join(1);
        std::cout << "server: joined channel 1 as 1, waiting for client 2\n";

        // ─── Wait for the client ──────────────────────────────────────────
        while (channel.members().count(2) == 0)
        {
            std::this_thread::sleep_for(100ms);
        }

        // ─── Count ────────────────────────────────────────────────────────
        for (int value = 1; value <= count; ++value)
        {
            channel.send_to_all(value);
            auto ack = channel.recv_from_any(true, 5000ms);
            if (!ack.is_ok())
            {
                std::cerr << "server: no ack for " << value << "\n";
                return 1;
            }
            std::cout << "server: " << value << " acked by " << ack.content().sender << "\n";
        }

        channel.leave();
    }
    catch (const relay::ChannelError &e)
    {
        std::cerr << "server: channel error: " << e.what() << "\n";
        return 1;
    }
    catch (const store::StoreError &e)
    {
        std::cerr << "server: store unreachable: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
