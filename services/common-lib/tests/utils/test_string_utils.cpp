/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string utility functions
 */

#include <gtest/gtest.h>
#include <everify/utils/string_utils.h>

using namespace everify::utils;

class StringUtilsTest : public ::testing::Test {
protected:
};

// toLowerCase tests
TEST_F(StringUtilsTest, ToLowerCase_Mixed) {
    EXPECT_EQ(toLowerCase("John.Doe@Example.COM"), "john.doe@example.com");
}

TEST_F(StringUtilsTest, ToLowerCase_Empty) {
    EXPECT_EQ(toLowerCase(""), "");
}

TEST_F(StringUtilsTest, ToLowerCase_NonAsciiBytesUnchanged) {
    std::string s = "\xC3\x84" "BC";
    EXPECT_EQ(toLowerCase(s), "\xC3\x84" "bc");
}

// trim tests
TEST_F(StringUtilsTest, Trim_BothEnds) {
    EXPECT_EQ(trim("  \t user@example.com \r\n"), "user@example.com");
}

TEST_F(StringUtilsTest, Trim_OnlyWhitespace) {
    EXPECT_EQ(trim(" \t\n "), "");
}

TEST_F(StringUtilsTest, Trim_NoWhitespace) {
    EXPECT_EQ(trim("abc"), "abc");
}

// split / join tests
TEST_F(StringUtilsTest, Split_KeepsEmptyParts) {
    auto parts = split("a,,b,", ',');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
    EXPECT_EQ(parts[3], "");
}

TEST_F(StringUtilsTest, Split_NoDelimiter) {
    auto parts = split("example.com", ',');
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], "example.com");
}

TEST_F(StringUtilsTest, Join_Basic) {
    EXPECT_EQ(join({"mx1", "mx2", "mx3"}, ", "), "mx1, mx2, mx3");
}

TEST_F(StringUtilsTest, Join_Empty) {
    EXPECT_EQ(join({}, ","), "");
}

// prefix / suffix tests
TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(startsWith("--premium", "--"));
    EXPECT_FALSE(startsWith("-", "--"));
}

TEST_F(StringUtilsTest, EndsWith) {
    EXPECT_TRUE(endsWith("list.csv", ".csv"));
    EXPECT_FALSE(endsWith("list.CSV", ".csv"));
}

TEST_F(StringUtilsTest, EndsWithIgnoreCase) {
    EXPECT_TRUE(endsWithIgnoreCase("list.CSV", ".csv"));
    EXPECT_TRUE(endsWithIgnoreCase("notes.Text", ".text"));
    EXPECT_FALSE(endsWithIgnoreCase("image.png", ".txt"));
}

// toHex tests
TEST_F(StringUtilsTest, ToHex) {
    const unsigned char data[] = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(toHex(data, sizeof(data)), "000fabff");
}

TEST_F(StringUtilsTest, ToHex_Empty) {
    EXPECT_EQ(toHex(nullptr, 0), "");
}

// parseBool tests
TEST_F(StringUtilsTest, ParseBool_Accepted) {
    bool v = false;
    EXPECT_TRUE(parseBool("TRUE", v));
    EXPECT_TRUE(v);
    EXPECT_TRUE(parseBool(" off ", v));
    EXPECT_FALSE(v);
    EXPECT_TRUE(parseBool("1", v));
    EXPECT_TRUE(v);
}

TEST_F(StringUtilsTest, ParseBool_RejectedLeavesValue) {
    bool v = true;
    EXPECT_FALSE(parseBool("maybe", v));
    EXPECT_TRUE(v);
}
