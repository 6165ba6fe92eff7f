#include <gtest/gtest.h>
#include "folio/core/string.hpp"

using namespace folio;

// ============================================================================
// UTF-8 decoding
// ============================================================================

TEST(Utf8Test, DecodeAscii) {
    auto cps = unicode::decode("Hi!");
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[0], U'H');
    EXPECT_EQ(cps[2], U'!');
}

TEST(Utf8Test, DecodeMultiByte) {
    // é, 中, 😀
    auto cps = unicode::decode("\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80");
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[0], 0xE9u);
    EXPECT_EQ(cps[1], 0x4E2Du);
    EXPECT_EQ(cps[2], 0x1F600u);
}

TEST(Utf8Test, MalformedInputIsReplaced) {
    auto cps = unicode::decode("a\xFF" "b");
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[1], unicode::REPLACEMENT_CHARACTER);
    EXPECT_EQ(cps[2], U'b');
}

TEST(Utf8Test, TruncatedSequenceConsumesInput) {
    auto cps = unicode::decode("\xE4\xB8");
    ASSERT_FALSE(cps.empty());
    EXPECT_EQ(cps[0], unicode::REPLACEMENT_CHARACTER);
}

// ============================================================================
// Character classes
// ============================================================================

TEST(UnicodeTest, WideCharacters) {
    EXPECT_TRUE(unicode::is_wide(0x4E2D));   // CJK ideograph
    EXPECT_TRUE(unicode::is_wide(0x3042));   // Hiragana
    EXPECT_TRUE(unicode::is_wide(0xAC00));   // Hangul
    EXPECT_FALSE(unicode::is_wide(U'A'));
    EXPECT_FALSE(unicode::is_wide(0xE9));
}

TEST(UnicodeTest, ContainsWide) {
    EXPECT_TRUE(unicode::contains_wide("Tea \xE4\xB8\xAD"));
    EXPECT_FALSE(unicode::contains_wide("Caf\xC3\xA9"));
    EXPECT_FALSE(unicode::contains_wide(""));
}

TEST(UnicodeTest, Whitespace) {
    EXPECT_TRUE(unicode::is_whitespace(U' '));
    EXPECT_TRUE(unicode::is_whitespace(U'\t'));
    EXPECT_TRUE(unicode::is_whitespace(0x3000));
    EXPECT_FALSE(unicode::is_whitespace(U'x'));
}

// ============================================================================
// Text helpers
// ============================================================================

TEST(TextHelpersTest, SplitWhitespace) {
    auto words = split_whitespace("  The Courage\tto  be\nDisliked ");
    std::vector<std::string> expected{"The", "Courage", "to", "be", "Disliked"};
    EXPECT_EQ(words, expected);
}

TEST(TextHelpersTest, SplitIdeographicSpace) {
    auto words = split_whitespace("\xE4\xB8\xAD\xE3\x80\x80\xE6\x96\x87");
    ASSERT_EQ(words.size(), 2u);
    EXPECT_EQ(words[0], "\xE4\xB8\xAD");
    EXPECT_EQ(words[1], "\xE6\x96\x87");
}

TEST(TextHelpersTest, SplitEmpty) {
    EXPECT_TRUE(split_whitespace("").empty());
    EXPECT_TRUE(split_whitespace("   ").empty());
}

TEST(TextHelpersTest, Join) {
    EXPECT_EQ(join({"a", "b", "c"}, " "), "a b c");
    EXPECT_EQ(join({}, " "), "");
    EXPECT_EQ(join({"solo"}, ", "), "solo");
}

TEST(TextHelpersTest, Lowercase) {
    EXPECT_EQ(to_ascii_lowercase("The DARK Tower"), "the dark tower");
}
