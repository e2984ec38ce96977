/**
 * @file TextMatchTest.cpp
 * @brief Unit tests for pattern extraction and numeric conversion
 */

#include "util/TextMatch.hpp"

#include <gtest/gtest.h>

#include <regex>

// ========== match_first Tests ==========

TEST(TextMatchTest, MatchFirst_ReturnsFirstCaptureGroup) {
    auto value = util::match_first(R"(Serial Number:\s*(.+?)\n)", "Serial Number:   ABC123\n");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "ABC123");
}

TEST(TextMatchTest, MatchFirst_MultipleMatches_ReturnsFirst) {
    auto value = util::match_first(R"(Value:\s*(\d+))", "Value: 1\nValue: 2\n");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "1");
}

TEST(TextMatchTest, MatchFirst_NoMatch_ReturnsNullopt) {
    EXPECT_FALSE(util::match_first(R"(Device Model:\s*(.+?)\n)", "nothing here\n").has_value());
}

TEST(TextMatchTest, MatchFirst_EmptyBuffer_ReturnsNullopt) {
    EXPECT_FALSE(util::match_first(R"(Health:\s*(.+?)%)", "").has_value());
}

TEST(TextMatchTest, MatchFirst_LabelWithoutTrailingNewline_ReturnsNullopt) {
    EXPECT_FALSE(util::match_first(R"(Device Model:\s*(.+?)\n)", "Device Model: X").has_value());
}

TEST(TextMatchTest, MatchFirst_MalformedPattern_Throws) {
    EXPECT_THROW((void)util::match_first("Health:(", "Health: 1"), std::regex_error);
}

// ========== trim / first_token Tests ==========

TEST(TextMatchTest, Trim_StripsBothEnds) {
    EXPECT_EQ(util::trim("  41 \t\r\n"), "41");
    EXPECT_EQ(util::trim("   "), "");
}

TEST(TextMatchTest, FirstToken_ReturnsFirstWord) {
    EXPECT_EQ(util::first_token("InnoDisk Corp. - mSATA 3ME4"), "InnoDisk");
    EXPECT_EQ(util::first_token("  M.2 (S42) 3ME4"), "M.2");
    EXPECT_EQ(util::first_token("Virtium"), "Virtium");
    EXPECT_EQ(util::first_token(""), "");
}

// ========== Numeric conversion Tests ==========

TEST(TextMatchTest, ToInt64_ParsesPaddedValue) {
    auto value = util::to_int64("  5178 ");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 5178);
}

TEST(TextMatchTest, ToInt64_RejectsPartialAndEmpty) {
    EXPECT_FALSE(util::to_int64("12abc").has_value());
    EXPECT_FALSE(util::to_int64("N/A").has_value());
    EXPECT_FALSE(util::to_int64("").has_value());
    EXPECT_FALSE(util::to_int64("1.5").has_value());
}

TEST(TextMatchTest, ToInt64_OutOfRange_ReturnsNullopt) {
    EXPECT_FALSE(util::to_int64("99999999999999999999999").has_value());
}

TEST(TextMatchTest, ToDouble_ParsesIntegerAndFraction) {
    EXPECT_DOUBLE_EQ(util::to_double("83").value(), 83.0);
    EXPECT_DOUBLE_EQ(util::to_double(" 40.1 ").value(), 40.1);
}

TEST(TextMatchTest, ToDouble_RejectsGarbageAndNonFinite) {
    EXPECT_FALSE(util::to_double("abc").has_value());
    EXPECT_FALSE(util::to_double("83 %").has_value());
    EXPECT_FALSE(util::to_double("inf").has_value());
    EXPECT_FALSE(util::to_double("nan").has_value());
}
