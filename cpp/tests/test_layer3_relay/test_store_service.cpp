/**
 * @file test_store_service.cpp
 * @brief StoreService integration tests.
 *
 * Each test runs one worker that hosts the service on a background thread and talks to it
 * through ZmqMessageStore (or a raw DEALER for wire-level checks).
 */
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

using namespace relayhub::tests;
using relayhub::tests::helper::unique_store_endpoint;

class StoreServiceTest : public IsolatedProcessTest
{
  protected:
    void Run(const std::string &scenario,
             std::vector<std::string> expected_stderr_substrings = {})
    {
        auto proc = SpawnWorker("store." + scenario, {unique_store_endpoint(scenario)});
        ExpectWorkerOk(proc, std::move(expected_stderr_substrings));
    }
};

TEST_F(StoreServiceTest, OpsRoundTrip)
{
    Run("ops_roundtrip", {"StoreService: listening on"});
}

TEST_F(StoreServiceTest, ParkedBlpopIsServed)
{
    Run("parked_blpop_is_served");
}

TEST_F(StoreServiceTest, BlpopTimesOut)
{
    Run("blpop_times_out");
}

TEST_F(StoreServiceTest, StopReleasesWaiters)
{
    Run("stop_releases_waiters", {"releasing 1 parked BLPOP waiters"});
}

TEST_F(StoreServiceTest, VanishedWaiterItemIsRequeued)
{
    Run("vanished_waiter_item_is_requeued", {"BLPOP waiter unreachable"});
}

TEST_F(StoreServiceTest, StalledWaiterItemIsRequeued)
{
    Run("stalled_waiter_item_is_requeued", {"BLPOP waiter unreachable", "requeueing item on 'q'"});
}

TEST_F(StoreServiceTest, BadRequestsGetErrorReplies)
{
    // The service logs these at WARN; no ERROR-level line is expected.
    Run("bad_requests_get_error_replies", {"unknown msg_type", "malformed JSON"});
}

TEST_F(StoreServiceTest, UnreachableStoreTimesOut)
{
    Run("unreachable_store_times_out");
}
