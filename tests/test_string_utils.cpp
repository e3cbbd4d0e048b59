#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "utils/StringUtils.hpp"

using namespace HiveVerify::Utils;

TEST(StringUtils, TrimAndBlank) {
    EXPECT_EQ(trim("  \tvalue \r\n"), "value");
    EXPECT_TRUE(isBlank(" \t\r\n"));
    EXPECT_FALSE(isBlank(" x "));
}

TEST(StringUtils, CaseInsensitiveHelpers) {
    EXPECT_TRUE(iequals("Warning", "WARNING"));
    EXPECT_FALSE(iequals("warn", "warning"));
    EXPECT_TRUE(icontains("Calling PLANNER tool", "planner"));
    EXPECT_TRUE(contains("anything", ""));
}

TEST(StringUtils, SplitAndTrimDropsEmptyItems) {
    auto parts = splitAndTrim(" planner , ,command,", ',');
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "planner");
    EXPECT_EQ(parts[1], "command");
}

TEST(StringUtils, ParseIntegerRequiresWholeValue) {
    EXPECT_EQ(parseInteger<int>(" 42 "), 42);
    EXPECT_EQ(parseInteger<std::int64_t>("-7"), -7);
    EXPECT_FALSE(parseInteger<int>("12abc").has_value());
    EXPECT_FALSE(parseInteger<int>("").has_value());
    EXPECT_FALSE(parseInteger<int>("99999999999").has_value());
}

TEST(StringUtils, ReplaceAll) {
    EXPECT_EQ(replaceAll("a_b_c", "_", " "), "a b c");
    EXPECT_EQ(replaceAll("abc", "", "x"), "abc");
}

TEST(StringUtils, EscapeJsonControlCharacters) {
    EXPECT_EQ(escapeJson(std::string("a\x01" "b", 3)), "a\\u0001b");
    EXPECT_EQ(escapeJson("line\nbreak"), "line\\nbreak");
    EXPECT_EQ(escapeJson("say \"hi\""), "say \\\"hi\\\"");
}
