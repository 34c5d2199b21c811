/**
 * @file test_result.cpp
 * @brief Layer 1 tests for relayhub::Result.
 */
#include "rlh_base.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

using relayhub::Result;

namespace
{
enum class Outcome
{
    Busy,
    Gone,
};
} // namespace

TEST(ResultTest, OkCarriesContent)
{
    auto r = Result<std::string, Outcome>::ok("payload");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_error());
    EXPECT_EQ(r.content(), "payload");
    EXPECT_EQ(r.value_or("fallback"), "payload");
    EXPECT_THROW((void)r.error(), std::logic_error);
}

TEST(ResultTest, ErrorCarriesReason)
{
    auto r = Result<std::string, Outcome>::error(Outcome::Gone);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), Outcome::Gone);
    EXPECT_EQ(r.value_or("fallback"), "fallback");
    EXPECT_THROW((void)r.content(), std::logic_error);
}

TEST(ResultTest, MoveOnlyContentCanBeTakenOut)
{
    auto r = Result<std::unique_ptr<int>, Outcome>::ok(std::make_unique<int>(7));
    std::unique_ptr<int> p = std::move(r).content();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 7);
}

TEST(ResultTest, ValueAndErrorMayShareAType)
{
    auto ok = Result<int, int>::ok(3);
    auto err = Result<int, int>::error(3);
    EXPECT_TRUE(ok.is_ok());
    EXPECT_TRUE(err.is_error());
    EXPECT_EQ(err.value_or(-1), -1);
}
