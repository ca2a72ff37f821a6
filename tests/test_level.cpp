/**
 * @file test_level.cpp
 * @brief Unit tests for Level enumeration
 * @brief Level 枚举的单元测试
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include <gtest/gtest.h>
#ifdef KVLOG_HAS_RAPIDCHECK
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>
#endif

#include <iterator>
#include <stdexcept>

#include <kvlog/common.hpp>

namespace kvlog {
namespace test {

// ==============================================================================
// Unit Tests / 单元测试
// ==============================================================================

/**
 * @brief Test Level enum values
 * @brief 测试 Level 枚举值
 */
TEST(LevelTest, EnumValues) {
    EXPECT_EQ(static_cast<uint8_t>(Level::Trace), 0);
    EXPECT_EQ(static_cast<uint8_t>(Level::Debug), 1);
    EXPECT_EQ(static_cast<uint8_t>(Level::Info), 2);
    EXPECT_EQ(static_cast<uint8_t>(Level::Warn), 3);
    EXPECT_EQ(static_cast<uint8_t>(Level::Error), 4);
    EXPECT_EQ(static_cast<uint8_t>(Level::Fatal), 5);
    EXPECT_EQ(static_cast<uint8_t>(Level::Disabled), 6);
}

/**
 * @brief Test LevelToString
 * @brief 测试 LevelToString
 */
TEST(LevelTest, LevelToString) {
    EXPECT_EQ(LevelToString(Level::Trace), "trace");
    EXPECT_EQ(LevelToString(Level::Debug), "debug");
    EXPECT_EQ(LevelToString(Level::Info), "info");
    EXPECT_EQ(LevelToString(Level::Warn), "warn");
    EXPECT_EQ(LevelToString(Level::Error), "error");
    EXPECT_EQ(LevelToString(Level::Fatal), "fatal");
    EXPECT_EQ(LevelToString(Level::Disabled), "disabled");
    EXPECT_EQ(LevelToString(Level::NoLevel), "");
}

/**
 * @brief Test LevelToShortString
 * @brief 测试 LevelToShortString
 */
TEST(LevelTest, LevelToShortString) {
    EXPECT_EQ(LevelToShortString(Level::Trace), "TRC");
    EXPECT_EQ(LevelToShortString(Level::Info), "INF");
    EXPECT_EQ(LevelToShortString(Level::Fatal), "FTL");
    EXPECT_EQ(LevelToShortString(Level::NoLevel), "???");
}

TEST(LevelTest, LevelListIsOrdered) {
    ASSERT_EQ(std::size(kLevels), kLevelCountWithOff);
    for (size_t i = 0; i < kLevelCountWithOff; ++i) {
        auto level = TryParseLevel(kLevels[i]);
        ASSERT_TRUE(level.has_value());
        EXPECT_EQ(static_cast<size_t>(*level), i);
    }
}

/**
 * @brief Test parsing unknown names
 * @brief 测试解析未知名称
 */
TEST(LevelTest, ParseUnknownLevel) {
    EXPECT_FALSE(TryParseLevel("verbose").has_value());
    EXPECT_FALSE(TryParseLevel("INFO").has_value());
    EXPECT_FALSE(TryParseLevel("").has_value());

    try {
        ParseLevel("verbose");
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "cannot parse level=verbose");
    }
}

/**
 * @brief Test ShouldLog filtering
 * @brief 测试 ShouldLog 过滤
 */
TEST(LevelTest, ShouldLog) {
    EXPECT_TRUE(ShouldLog(Level::Warn, Level::Warn));
    EXPECT_TRUE(ShouldLog(Level::Error, Level::Warn));
    EXPECT_FALSE(ShouldLog(Level::Debug, Level::Warn));
    EXPECT_TRUE(ShouldLog(Level::Trace, Level::Trace));

    // Disabled drops everything, NoLevel included
    EXPECT_FALSE(ShouldLog(Level::Fatal, Level::Disabled));
    EXPECT_FALSE(ShouldLog(Level::NoLevel, Level::Disabled));

    EXPECT_TRUE(ShouldLog(Level::NoLevel, Level::Fatal));
}

// ==============================================================================
// Property-Based Tests / 基于属性的测试
// ==============================================================================

#ifdef KVLOG_HAS_RAPIDCHECK

/**
 * @brief Property: level names parse back to the same level
 * @brief 属性：级别名称解析回相同级别
 */
RC_GTEST_PROP(LevelPropertyTest, StringLevelRoundTrip, ()) {
    const auto levelValue = *rc::gen::inRange<uint8_t>(0, 7);
    const auto level = static_cast<Level>(levelValue);

    const auto parsed = TryParseLevel(LevelToString(level));
    RC_ASSERT(parsed.has_value());
    RC_ASSERT(*parsed == level);
}

/**
 * @brief Property: filtering follows severity order below Disabled
 * @brief 属性：Disabled 以下的过滤遵循严重程度顺序
 */
RC_GTEST_PROP(LevelPropertyTest, LevelFilteringCorrectness, ()) {
    const auto recordValue = *rc::gen::inRange<uint8_t>(0, 6);
    const auto thresholdValue = *rc::gen::inRange<uint8_t>(0, 6);

    const bool expected = recordValue >= thresholdValue;
    RC_ASSERT(ShouldLog(static_cast<Level>(recordValue), static_cast<Level>(thresholdValue)) ==
              expected);
}

#endif  // KVLOG_HAS_RAPIDCHECK

}  // namespace test
}  // namespace kvlog
