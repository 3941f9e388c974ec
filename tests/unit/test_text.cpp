#include <gtest/gtest.h>
#include "../../src/utils/text/string_utils.hpp"

using namespace Vortex::Utils::Text;

TEST(TextTest, TrimAndCase) {
    EXPECT_EQ(trim("  \t hello world \r\n"), "hello world");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(to_lower("Content-Type"), "content-type");
    EXPECT_EQ(to_lower("Café"), "café");
}

TEST(TextTest, PrefixSuffix) {
    EXPECT_TRUE(starts_with("https://example.com", "https://"));
    EXPECT_FALSE(starts_with("http", "https://"));
    EXPECT_TRUE(ends_with("index.json", ".json"));
    EXPECT_FALSE(ends_with("json", ".json"));
    EXPECT_TRUE(ends_with("anything", ""));
}

TEST(TextTest, SplitKeepsEmptyParts) {
    auto parts = split("a&&b&", '&');
    ASSERT_EQ(parts.size(), 4);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
    EXPECT_EQ(parts[3], "");
    EXPECT_TRUE(split("", ',').empty());
    EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(join({}, ","), "");
}

TEST(TextTest, CollapseWhitespace) {
    EXPECT_EQ(collapse_whitespace("  Main \n\n  Title\t "), "Main Title");
    EXPECT_EQ(collapse_whitespace("\n\t "), "");
    EXPECT_EQ(collapse_whitespace("你好  世界"), "你好 世界");
}

TEST(TextTest, Truncate) {
    EXPECT_EQ(Vortex::Utils::Text::truncate("short", 10), "short");
    EXPECT_EQ(Vortex::Utils::Text::truncate("0123456789abc", 10), "0123456789...");
}

TEST(TextTest, Utf8Validation) {
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("Café 你好 🚀"));
    EXPECT_FALSE(is_valid_utf8("\xC3"));            // truncated sequence
    EXPECT_FALSE(is_valid_utf8("abc\xFF\xFE"));     // invalid lead bytes
    EXPECT_FALSE(is_valid_utf8("\xE4\xBD\x41"));    // bad continuation
    EXPECT_TRUE(is_valid_utf8(""));
}
