/**
 * @file test_channel_messaging.cpp
 * @brief Channel send and selective receive over the in-memory store.
 */
#include "rlh_relay.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <thread>

using namespace relayhub::relay;
using namespace relayhub::store;
using namespace std::chrono_literals;
using nlohmann::json;

namespace
{
struct Reading
{
    int seq{0};
    std::string label;
    std::vector<double> samples;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Reading, seq, label, samples)

template <typename Fn> ChannelErrc error_code_of(Fn &&fn)
{
    try
    {
        fn();
    }
    catch (const ChannelError &e)
    {
        return e.code();
    }
    ADD_FAILURE() << "expected a ChannelError";
    return ChannelErrc::UnknownProcess;
}
} // namespace

class ChannelMessagingTest : public relayhub::tests::PureApiTest
{
  protected:
    void SetUp() override
    {
        base_ = Channel::open(connect_, 1);
    }

    /// A member with identity "p<id>" joined as `id`.
    Channel Member(int id)
    {
        auto ch = base_->with_process_identity("p" + std::to_string(id));
        ch.join(id);
        return ch;
    }

    static void ExpectMessage(const RecvResult &r, int sender, const json &message)
    {
        ASSERT_TRUE(r.is_ok());
        EXPECT_EQ(r.content().sender, sender);
        EXPECT_EQ(r.content().message, message);
    }

    static void ExpectNothing(const RecvResult &r)
    {
        ASSERT_TRUE(r.is_error());
        EXPECT_EQ(r.error(), RecvError::NoMessage);
    }

    std::shared_ptr<InMemoryStoreState> state_ = std::make_shared<InMemoryStoreState>();
    StoreConnector connect_ = make_in_memory_connector(state_);
    std::optional<Channel> base_;
};

TEST_F(ChannelMessagingTest, PointToPoint)
{
    auto a = Member(1);
    auto b = Member(2);

    a.send_to(2, "hi");
    ExpectMessage(b.recv_from(1, true, 1s), 1, "hi");
    ExpectNothing(b.recv_from(1, false));
}

TEST_F(ChannelMessagingTest, SendQueuesPayloadThenWakeup)
{
    auto a = Member(1);
    Member(2);
    a.send_to(2, json{{"k", 1}});

    auto store = connect_();
    auto payload = store->blpop({encode_pair_key(1, 1, 2)}, 10ms);
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(json::parse(payload->value), (json{{"k", 1}}));
    auto marker = store->blpop({wakeup_key(1, 2)}, 10ms);
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(marker->value, kWakeupMarker);
}

TEST_F(ChannelMessagingTest, PerPairOrderIsPreserved)
{
    auto a = Member(1);
    auto b = Member(2);
    for (int i = 1; i <= 50; ++i)
        a.send_to(2, i);
    for (int i = 1; i <= 50; ++i)
        ExpectMessage(b.recv_from(1, false), 1, i);
    ExpectNothing(b.recv_from_any(false));
}

TEST_F(ChannelMessagingTest, OnlyTheAddresseeReceives)
{
    auto a = Member(1);
    auto b = Member(2);
    auto c = Member(3);

    a.send_to(2, "for b");
    ExpectNothing(c.recv_from_any(false));
    ExpectNothing(c.recv_from(1, false));
    ExpectMessage(b.recv_from_any(false), 1, "for b");
}

TEST_F(ChannelMessagingTest, SendToSeveralDestinations)
{
    auto a = Member(1);
    auto b = Member(2);
    auto c = Member(3);

    a.send_to(std::set<int>{2, 3}, "both");
    ExpectMessage(b.recv_from(1, false), 1, "both");
    ExpectMessage(c.recv_from(1, false), 1, "both");
    ExpectNothing(a.recv_from(1, false));
}

TEST_F(ChannelMessagingTest, SendToAllIncludesTheSender)
{
    auto a = Member(1);
    auto b = Member(2);

    a.send_to_all("everyone");
    ExpectMessage(b.recv_from(1, false), 1, "everyone");
    // recv_from_any skips the caller's own queue; an explicit recv_from(self) reads it.
    ExpectNothing(a.recv_from_any(false));
    ExpectMessage(a.recv_from(1, false), 1, "everyone");
}

TEST_F(ChannelMessagingTest, UnknownDestinationQueuesNothing)
{
    auto a = Member(1);
    auto b = Member(2);

    EXPECT_EQ(error_code_of([&] { a.send_to(std::set<int>{2, 7}, "x"); }),
              ChannelErrc::DestinationNotMember);
    EXPECT_EQ(error_code_of([&] { a.send_to(kSentinelId, "x"); }),
              ChannelErrc::DestinationNotMember);
    EXPECT_EQ(error_code_of([&] { a.send_to(-4, "x"); }), ChannelErrc::DestinationNotMember);
    ExpectNothing(b.recv_from_any(false));
    EXPECT_EQ(connect_()->exists({wakeup_key(1, 2)}), 0u);
}

TEST_F(ChannelMessagingTest, NonMembersCannotSendOrReceive)
{
    Member(2);
    auto outsider = base_->with_process_identity("outsider");

    EXPECT_EQ(error_code_of([&] { outsider.send_to(2, "x"); }), ChannelErrc::UnknownProcess);
    EXPECT_EQ(error_code_of([&] { (void)outsider.recv_from_any(false); }),
              ChannelErrc::UnknownProcess);
}

TEST_F(ChannelMessagingTest, ReceiveFromNonMemberIsUnknownSender)
{
    auto a = Member(1);
    EXPECT_EQ(error_code_of([&] { (void)a.recv_from(7, false); }), ChannelErrc::UnknownSender);
    EXPECT_EQ(error_code_of([&] { (void)a.recv_from(kSentinelId, false); }),
              ChannelErrc::UnknownSender);
}

TEST_F(ChannelMessagingTest, ReceiveFromASubsetOfSenders)
{
    auto a = Member(1);
    auto b = Member(2);
    auto c = Member(3);
    auto d = Member(4);

    b.send_to(1, "from b");
    c.send_to(1, "from c");
    d.send_to(1, "from d");

    std::set<int> seen;
    for (int i = 0; i < 2; ++i)
    {
        auto r = a.recv_from(std::set<int>{3, 4}, false);
        ASSERT_TRUE(r.is_ok());
        seen.insert(r.content().sender);
    }
    EXPECT_EQ(seen, (std::set<int>{3, 4}));
    ExpectNothing(a.recv_from(std::set<int>{3, 4}, false));
    ExpectMessage(a.recv_from_any(false), 2, "from b");
}

TEST_F(ChannelMessagingTest, LowestSenderIdIsServedFirst)
{
    auto a = Member(1);
    auto b = Member(2);
    auto c = Member(3);

    c.send_to(1, "c");
    b.send_to(1, "b");
    ExpectMessage(a.recv_from_any(false), 2, "b");
    ExpectMessage(a.recv_from_any(false), 3, "c");
}

TEST_F(ChannelMessagingTest, StructuredPayloadsRoundTrip)
{
    auto a = Member(1);
    auto b = Member(2);

    const Reading sent{7, "sensor", {0.5, -1.25}};
    a.send_to(2, sent);

    auto r = b.recv_from(1, false);
    ASSERT_TRUE(r.is_ok());
    const auto got = r.content().message.get<Reading>();
    EXPECT_EQ(got.seq, 7);
    EXPECT_EQ(got.label, "sensor");
    EXPECT_EQ(got.samples, sent.samples);

    a.send_to(2, nullptr);
    ExpectMessage(b.recv_from(1, false), 1, nullptr);
}

TEST_F(ChannelMessagingTest, MalformedPayloadRaisesParseError)
{
    Member(1);
    auto b = Member(2);
    connect_()->rpush(encode_pair_key(1, 1, 2), "{not json");
    EXPECT_THROW((void)b.recv_from(1, false), json::parse_error);
}

TEST_F(ChannelMessagingTest, BlockingReceiveTimesOut)
{
    auto a = Member(1);
    Member(2);

    const auto t0 = std::chrono::steady_clock::now();
    auto r = a.recv_from_any(true, 100ms);
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), RecvError::Timeout);
    EXPECT_GE(elapsed, 100ms);
    EXPECT_LT(elapsed, 3s);
}

TEST_F(ChannelMessagingTest, StaleWakeupsAreSkipped)
{
    auto a = Member(1);
    auto b = Member(2);

    a.send_to(2, "one");
    ExpectMessage(b.recv_from(1, false), 1, "one");
    // The wakeup marker of the consumed message is still queued.
    EXPECT_EQ(connect_()->exists({wakeup_key(1, 2)}), 1u);
    ExpectNothing(b.recv_from_any(false));
    EXPECT_EQ(connect_()->exists({wakeup_key(1, 2)}), 0u);
}

TEST_F(ChannelMessagingTest, BlockedReceiverSeesSenderThatJoinsLater)
{
    auto b = Member(2);
    auto pending = std::async(std::launch::async, [&]() { return b.recv_from_any(true, 5s); });

    // b is now waiting on its wakeup queue alone; the sender does not exist yet.
    std::this_thread::sleep_for(100ms);
    auto a = Member(1);
    a.send_to(2, "late joiner");

    ASSERT_EQ(pending.wait_for(5s), std::future_status::ready);
    ExpectMessage(pending.get(), 1, "late joiner");
}

TEST_F(ChannelMessagingTest, ReceiverLeavingWhileBlockedIsUnknownProcess)
{
    Member(1);
    auto b = Member(2);
    auto pending = std::async(std::launch::async, [&]() { return b.recv_from_any(true, 5s); });

    std::this_thread::sleep_for(100ms);
    b.leave();
    // A wakeup forces b to re-check its membership.
    connect_()->rpush(wakeup_key(1, 2), kWakeupMarker);

    ASSERT_EQ(pending.wait_for(5s), std::future_status::ready);
    try
    {
        (void)pending.get();
        ADD_FAILURE() << "expected UnknownProcess";
    }
    catch (const ChannelError &e)
    {
        EXPECT_EQ(e.code(), ChannelErrc::UnknownProcess);
    }
}

// The sender check is repeated on every pass: a sender that leaves during the wait is
// reported once the receiver is woken.
TEST_F(ChannelMessagingTest, SenderLeavingWhileBlockedIsUnknownSender)
{
    auto a = Member(1);
    auto b = Member(2);
    auto pending = std::async(std::launch::async, [&]() { return b.recv_from(1, true, 5s); });

    std::this_thread::sleep_for(100ms);
    a.leave();
    connect_()->rpush(wakeup_key(1, 2), kWakeupMarker);

    ASSERT_EQ(pending.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(error_code_of([&] { (void)pending.get(); }), ChannelErrc::UnknownSender);
}

// A wakeup with nothing behind it starts a fresh wait of the full timeout.
TEST_F(ChannelMessagingTest, WakeupRestartsTheTimeoutWindow)
{
    auto a = Member(1);
    Member(2);

    const auto t0 = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async, [&]() { return a.recv_from_any(true, 300ms); });

    std::this_thread::sleep_for(200ms);
    connect_()->rpush(wakeup_key(1, 1), kWakeupMarker);

    ASSERT_EQ(pending.wait_for(5s), std::future_status::ready);
    auto r = pending.get();
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), RecvError::Timeout);
    EXPECT_GE(elapsed, 450ms);
    EXPECT_LT(elapsed, 3s);
}
