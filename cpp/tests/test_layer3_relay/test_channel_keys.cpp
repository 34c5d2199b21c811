/**
 * @file test_channel_keys.cpp
 * @brief Store key layout of relay channels.
 */
#include "rlh_relay.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace relayhub::relay;

class ChannelKeysTest : public relayhub::tests::PureApiTest
{
};

TEST_F(ChannelKeysTest, FixedKeysOfAChannel)
{
    EXPECT_EQ(channel_prefix(1), "C0001");
    EXPECT_EQ(channel_prefix(9999), "C9999");
    EXPECT_EQ(members_key(1), "C0001MID");
    EXPECT_EQ(os_members_key(42), "C0042OID");
    EXPECT_EQ(wakeup_key(1, 3), "C0001WOS0003");
    EXPECT_STREQ(kChannelSetKey, "channelSet");
}

TEST_F(ChannelKeysTest, PairKeyConcatenatesSenderThenReceiver)
{
    EXPECT_EQ(encode_pair_key(1, 2, 3), "C000100020003");
    EXPECT_EQ(encode_pair_key(1, 3, 2), "C000100030002");
    EXPECT_EQ(encode_pair_key(0, 0, 0), "C000000000000");
    EXPECT_EQ(encode_pair_key(1, 2, 3), encode_pair_key(1, 2, 3));
}

TEST_F(ChannelKeysTest, DecodeInvertsEncode)
{
    for (int c : {0, 1, 77, 9999})
    {
        for (int s : {0, 5, 9998})
        {
            for (int r : {0, 12, 9999})
            {
                const auto decoded = decode_pair_key(encode_pair_key(c, s, r));
                ASSERT_TRUE(decoded.has_value());
                EXPECT_EQ(*decoded, (PairKey{c, s, r}));
            }
        }
    }
}

TEST_F(ChannelKeysTest, DecodeRejectsMalformedKeys)
{
    EXPECT_FALSE(decode_pair_key("").has_value());
    EXPECT_FALSE(decode_pair_key("C00010002000").has_value());   // too short
    EXPECT_FALSE(decode_pair_key("C0001000200030").has_value()); // too long
    EXPECT_FALSE(decode_pair_key("X000100020003").has_value());  // wrong tag
    EXPECT_FALSE(decode_pair_key("C00010002000a").has_value());  // non-digit
    EXPECT_FALSE(decode_pair_key("C0001MID").has_value());
}

TEST_F(ChannelKeysTest, WakeupKeyNeverDecodesAsPairKey)
{
    EXPECT_FALSE(decode_pair_key(wakeup_key(1, 2)).has_value());
    EXPECT_NE(wakeup_key(1, 2), encode_pair_key(1, 0, 2));
}

TEST_F(ChannelKeysTest, IdsThatDoNotFitAreRejected)
{
    EXPECT_THROW((void)channel_prefix(10000), std::out_of_range);
    EXPECT_THROW((void)channel_prefix(-1), std::out_of_range);
    EXPECT_THROW((void)encode_pair_key(1, -3, 2), std::out_of_range);
}
