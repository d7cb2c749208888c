#include <gtest/gtest.h>
#include "csa/utils/string_utils.hpp"

#include <string>
#include <vector>

using namespace csa::string_utils;

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(trim("  hello \t\n"), "hello");
    EXPECT_EQ(trim_left("  a "), "a ");
    EXPECT_EQ(trim_right("  a "), "  a");
    EXPECT_EQ(trim("   "), "");
}

TEST(StringUtilsTest, SplitKeepsEmptyFields) {
    const auto parts = split("os.path.join", '.');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "os");
    EXPECT_EQ(parts[2], "join");

    EXPECT_EQ(split("", ',').size(), 1u);
    EXPECT_EQ(split("a,", ',').size(), 2u);
}

TEST(StringUtilsTest, SplitLinesHandlesAllTerminators) {
    EXPECT_TRUE(split_lines("").empty());
    EXPECT_EQ(split_lines("a\nb\n").size(), 2u);
    EXPECT_EQ(split_lines("a\r\nb\rc").size(), 3u);
    EXPECT_EQ(split_lines("\n\n").size(), 2u);
}

TEST(StringUtilsTest, Join) {
    const std::vector<std::string> parts = {"a", "b", "c"};
    EXPECT_EQ(join(parts, ", "), "a, b, c");
    EXPECT_EQ(join(std::vector<std::string>{}, ","), "");
}

TEST(StringUtilsTest, PrefixSuffixAndCase) {
    EXPECT_TRUE(starts_with("# comment", "#"));
    EXPECT_FALSE(starts_with("x", "xy"));
    EXPECT_TRUE(ends_with("pkg.", "."));
    EXPECT_EQ(to_lower("PyThOn"), "python");
}

TEST(StringUtilsTest, ExpandTabs) {
    EXPECT_EQ(expand_tabs("\tx", 4), "    x");
    EXPECT_EQ(expand_tabs("ab\tx", 4), "ab  x");
    EXPECT_EQ(expand_tabs("a\n\tb", 2), "a\n  b");
}
