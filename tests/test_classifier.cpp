/**
 * @file test_classifier.cpp
 * @brief Unit tests for the argument classifier
 * @brief 参数分类器的单元测试
 *
 * @copyright Copyright (c) 2024 kvlog
 */

#include <gtest/gtest.h>
#ifdef KVLOG_HAS_RAPIDCHECK
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>
#endif

#include <string>
#include <vector>

#include <kvlog/classifier.hpp>

namespace kvlog {
namespace test {

// ==============================================================================
// Placeholder Counting / 占位符计数
// ==============================================================================

TEST(ClassifierTest, CountPlaceholders) {
    EXPECT_EQ(CountPlaceholders(""), 0u);
    EXPECT_EQ(CountPlaceholders("no markers"), 0u);
    EXPECT_EQ(CountPlaceholders("value %d"), 1u);
    EXPECT_EQ(CountPlaceholders("%s=%v (%d%%)"), 5u);
}

// ==============================================================================
// Splitting / 拆分
// ==============================================================================

TEST(ClassifierTest, SplitFirstNAreFormatArgs) {
    FormatSplit split = SplitFormatArgs("value %d", MakeValues(42, "k", "v"));
    ASSERT_EQ(split.formatArgs.size(), 1u);
    EXPECT_EQ(split.formatArgs[0].AsInt(), 42);
    ASSERT_EQ(split.fieldArgs.size(), 2u);
    EXPECT_EQ(split.fieldArgs[0].AsString(), "k");
    EXPECT_EQ(split.fieldArgs[1].AsString(), "v");
}

TEST(ClassifierTest, SplitNoPlaceholdersAllFields) {
    FormatSplit split = SplitFormatArgs("plain", MakeValues("k", 1));
    EXPECT_TRUE(split.formatArgs.empty());
    EXPECT_EQ(split.fieldArgs.size(), 2u);
}

TEST(ClassifierTest, SplitMorePlaceholdersThanArgs) {
    FormatSplit split = SplitFormatArgs("%s %s %s", MakeValues("a", "b"));
    EXPECT_EQ(split.formatArgs.size(), 2u);
    EXPECT_TRUE(split.fieldArgs.empty());
}

TEST(ClassifierTest, SplitExactCount) {
    FormatSplit split = SplitFormatArgs("%s-%d", MakeValues("a", 1));
    EXPECT_EQ(split.formatArgs.size(), 2u);
    EXPECT_TRUE(split.fieldArgs.empty());
}

TEST(ClassifierTest, SplitEmptyArgs) {
    FormatSplit split = SplitFormatArgs("value %d", {});
    EXPECT_TRUE(split.formatArgs.empty());
    EXPECT_TRUE(split.fieldArgs.empty());
}

// ==============================================================================
// Rendering / 渲染
// ==============================================================================

TEST(ClassifierTest, RenderPrintf) {
    EXPECT_EQ(RenderMessage("value %d", MakeValues(42)), "value 42");
    EXPECT_EQ(RenderMessage("%s has %d items", MakeValues("cart", 3)), "cart has 3 items");
    EXPECT_EQ(RenderMessage("%.2f", MakeValues(3.14159)), "3.14");
    EXPECT_EQ(RenderMessage("%s", MakeValues(Error("disk full"))), "disk full");
}

TEST(ClassifierTest, RenderWithoutArgsKeepsMessage) {
    EXPECT_EQ(RenderMessage("100% sure", {}), "100% sure");
}

TEST(ClassifierTest, RenderMalformedKeepsMessage) {
    // Missing argument for the second placeholder
    EXPECT_EQ(RenderMessage("%d and %d", MakeValues(1)), "%d and %d");
}

// ==============================================================================
// Error Extraction / 错误提取
// ==============================================================================

TEST(ClassifierTest, ExtractErrorFromValueSlot) {
    Error errX("x failed");
    ValueList fields = MakeValues("k1", "v1", "error", errX, "k2", "v2");

    auto found = ExtractError(fields);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, errX);

    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0].AsString(), "k1");
    EXPECT_EQ(fields[1].AsString(), "v1");
    EXPECT_EQ(fields[2].AsString(), "k2");
    EXPECT_EQ(fields[3].AsString(), "v2");
}

TEST(ClassifierTest, ExtractErrorFromKeySlot) {
    Error err("bare");
    ValueList fields = MakeValues(err, "k", "v");

    auto found = ExtractError(fields);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->Message(), "bare");
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[0].AsString(), "k");
}

TEST(ClassifierTest, ExtractOnlyFirstError) {
    ValueList fields = MakeValues("a", Error("first"), "b", Error("second"));

    auto found = ExtractError(fields);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->Message(), "first");
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_TRUE(fields[1].IsError());
    EXPECT_EQ(fields[1].AsError().Message(), "second");
}

TEST(ClassifierTest, ExtractNoError) {
    ValueList fields = MakeValues("k", 1);
    EXPECT_FALSE(ExtractError(fields).has_value());
    EXPECT_EQ(fields.size(), 2u);
}

// ==============================================================================
// Field Building / 字段构建
// ==============================================================================

TEST(ClassifierTest, BuildFieldsPairs) {
    FieldList fields = BuildFields(MakeValues("id", 42, "name", "bob"));
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[0].key, "id");
    EXPECT_EQ(fields[0].value.AsInt(), 42);
    EXPECT_EQ(fields[1].key, "name");
    EXPECT_EQ(fields[1].value.AsString(), "bob");
}

TEST(ClassifierTest, BuildFieldsOddTrailingKeyIsNull) {
    FieldList fields = BuildFields(MakeValues("k", "v", "dangling"));
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[1].key, "dangling");
    EXPECT_TRUE(fields[1].value.IsNull());
}

TEST(ClassifierTest, BuildFieldsNonStringKey) {
    FieldList fields = BuildFields(MakeValues(7, true));
    ASSERT_EQ(fields.size(), 1u);
    EXPECT_EQ(fields[0].key, "7");
}

// ==============================================================================
// Print Helpers / 打印辅助
// ==============================================================================

TEST(ClassifierTest, Sprint) {
    EXPECT_EQ(Sprint(MakeValues("a", "b")), "ab");
    EXPECT_EQ(Sprint(MakeValues(1, 2)), "1 2");
    EXPECT_EQ(Sprint(MakeValues("n=", 1, 2, "!")), "n=1 2!");
    EXPECT_EQ(Sprint(MakeValues(nullptr)), "<nil>");
    EXPECT_EQ(Sprint({}), "");
}

TEST(ClassifierTest, Sprintln) {
    EXPECT_EQ(Sprintln(MakeValues("a", "b", 3)), "a b 3\n");
    EXPECT_EQ(Sprintln({}), "\n");
}

// ==============================================================================
// Property-Based Tests / 基于属性的测试
// ==============================================================================

#ifdef KVLOG_HAS_RAPIDCHECK

/**
 * @brief Property: with N markers and at least N args, exactly N are substituted
 * @brief 属性：N 个占位符且至少 N 个参数时，恰好 N 个用于替换
 */
RC_GTEST_PROP(ClassifierPropertyTest, FirstNArgsAreFormatArgs, ()) {
    const auto markers = *rc::gen::inRange<size_t>(1, 6);
    const auto extra = *rc::gen::inRange<size_t>(0, 6);

    std::string message;
    for (size_t i = 0; i < markers; ++i) {
        message += "%d ";
    }
    ValueList args;
    for (size_t i = 0; i < markers + extra; ++i) {
        args.emplace_back(static_cast<int64_t>(i));
    }

    FormatSplit split = SplitFormatArgs(message, args);
    RC_ASSERT(split.formatArgs.size() == markers);
    RC_ASSERT(split.fieldArgs.size() == extra);
    for (size_t i = 0; i < extra; ++i) {
        RC_ASSERT(split.fieldArgs[i].AsInt() == static_cast<int64_t>(markers + i));
    }
}

/**
 * @brief Property: without markers every argument is a field
 * @brief 属性：没有占位符时所有参数均为字段
 */
RC_GTEST_PROP(ClassifierPropertyTest, NoMarkersAllFields, (const std::vector<int>& raw)) {
    ValueList args(raw.begin(), raw.end());
    FormatSplit split = SplitFormatArgs("plain message", args);
    RC_ASSERT(split.formatArgs.empty());
    RC_ASSERT(split.fieldArgs.size() == raw.size());
    RC_ASSERT(RenderMessage("plain message", split.formatArgs) == "plain message");
}

#endif  // KVLOG_HAS_RAPIDCHECK

}  // namespace test
}  // namespace kvlog
