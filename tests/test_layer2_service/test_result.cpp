/**
 * @file test_result.cpp
 * @brief Layer 2 tests for Result<T, E>.
 */
#include "gwb_base.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

using gwbridge::utils::Result;

namespace
{
enum class ParseError
{
    Empty,
    BadDigit
};

Result<int, ParseError> parse_digit(const std::string &s)
{
    if (s.empty())
        return Result<int, ParseError>::error(ParseError::Empty);
    if (s.size() != 1 || s[0] < '0' || s[0] > '9')
        return Result<int, ParseError>::error(ParseError::BadDigit);
    return Result<int, ParseError>::ok(s[0] - '0');
}
} // namespace

TEST(ResultTest, OkHoldsValue)
{
    auto r = parse_digit("7");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_error());
    EXPECT_EQ(r.content(), 7);
    EXPECT_EQ(r.value_or(-1), 7);
}

TEST(ResultTest, ErrorHoldsEnum)
{
    auto r = parse_digit("42");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), ParseError::BadDigit);
    EXPECT_EQ(r.value_or(-1), -1);
    EXPECT_EQ(parse_digit("").error(), ParseError::Empty);
}

TEST(ResultTest, WrongAccessorThrowsLogicError)
{
    auto ok = parse_digit("1");
    auto err = parse_digit("");
    EXPECT_THROW(static_cast<void>(ok.error()), std::logic_error);
    EXPECT_THROW(static_cast<void>(err.content()), std::logic_error);
}

TEST(ResultTest, SameTypeForValueAndError)
{
    auto ok = Result<int, int>::ok(3);
    auto err = Result<int, int>::error(3);
    EXPECT_TRUE(ok.is_ok());
    EXPECT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), 3);
}

TEST(ResultTest, MoveOnlyPayloadCanBeMovedOut)
{
    auto r = Result<std::unique_ptr<int>, ParseError>::ok(std::make_unique<int>(5));
    std::unique_ptr<int> p = std::move(r).content();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 5);
}
