/**
 * @file test_relay_multiprocess.cpp
 * @brief Relay channels between separate OS processes.
 *
 * Every test spawns a "relay.store_server" worker hosting the store, then the participating
 * members, and finally a "relay.shutdown_store" worker that releases the server.
 */
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <optional>

using namespace relayhub::tests;
using namespace relayhub::tests::helper;

class RelayMultiProcessTest : public IsolatedProcessTest
{
  protected:
    void StartStore(const std::string &name)
    {
        endpoint_ = unique_store_endpoint(name);
        server_.emplace(g_self_exe_path, "relay.store_server",
                        std::vector<std::string>{endpoint_});
        ASSERT_TRUE(server_->valid());
    }

    void StopStore()
    {
        auto stopper = SpawnWorker("relay.shutdown_store", {endpoint_});
        ExpectWorkerOk(stopper);
        ExpectWorkerOk(server_.value());
    }

    std::string endpoint_;
    std::optional<WorkerProcess> server_;
};

TEST_F(RelayMultiProcessTest, CountingExchangeWithAck)
{
    const std::string count = std::to_string(scaled_value(100, 20));
    StartStore("counting");

    auto members = SpawnWorkers({{"relay.counting_sender", {endpoint_, count}},
                                 {"relay.counting_receiver", {endpoint_, count}}});
    for (auto &w : members)
        w.wait_for_exit();
    StopStore();

    auto it = members.begin();
    expect_worker_ok(*it, {"[SENDER] done after " + count + " messages"});
    ++it;
    expect_worker_ok(*it, {"[RECEIVER] got " + count + " messages in order"});
}

TEST_F(RelayMultiProcessTest, BlockedReceiverSeesLateJoiningSender)
{
    StartStore("late_joiner");

    auto receiver = SpawnWorker("relay.late_joiner_receiver", {endpoint_});
    auto sender = SpawnWorker("relay.late_joiner_sender", {endpoint_});
    receiver.wait_for_exit();
    sender.wait_for_exit();
    StopStore();

    expect_worker_ok(receiver, {"[RECEIVER] woken by late joiner"});
    expect_worker_ok(sender);
}

TEST_F(RelayMultiProcessTest, ConcurrentJoinOnOneIdHasOneWinner)
{
    constexpr int kContenders = 4;
    StartStore("contended_join");

    std::vector<std::pair<std::string, std::vector<std::string>>> scenarios;
    for (int i = 0; i < kContenders; ++i)
        scenarios.push_back({"relay.id_contender", {endpoint_, std::to_string(i)}});
    auto contenders = SpawnWorkers(scenarios);
    for (auto &w : contenders)
        w.wait_for_exit();
    StopStore();

    int winners = 0;
    for (auto &w : contenders)
    {
        expect_worker_ok(w);
        if (w.get_stderr().find("] WON") != std::string::npos)
            ++winners;
    }
    EXPECT_EQ(winners, 1);
}
