#include <gtest/gtest.h>
#include "folio/text/word_wrap.hpp"
#include "folio/core/string.hpp"

using namespace folio;
using namespace folio::text;

namespace {

class WordWrapTest : public ::testing::Test {
protected:
    // 8px built-in font: every character advances 6px
    std::shared_ptr<Font> font = create_builtin_font(8.0f);
};

} // anonymous namespace

TEST_F(WordWrapTest, ShortTextStaysOnOneLine) {
    WordWrapper wrapper(*font);
    auto lines = wrapper.wrap("short title", 1000.0f);

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "short title");
}

TEST_F(WordWrapTest, GreedyFirstFit) {
    WordWrapper wrapper(*font);
    // "aaa bbb" = 42px fits; "aaa bbb ccc" = 66px does not
    auto lines = wrapper.wrap("aaa bbb ccc dd", 60.0f);

    std::vector<std::string> expected{"aaa bbb", "ccc dd"};
    EXPECT_EQ(lines, expected);
}

TEST_F(WordWrapTest, OverlongWordGetsItsOwnLine) {
    WordWrapper wrapper(*font);
    auto lines = wrapper.wrap("a incomprehensibilities b", 30.0f);

    std::vector<std::string> expected{"a", "incomprehensibilities", "b"};
    EXPECT_EQ(lines, expected);
}

TEST_F(WordWrapTest, CollapsesWhitespace) {
    WordWrapper wrapper(*font);
    auto lines = wrapper.wrap("  spaced\t\tout \n words ", 1000.0f);

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "spaced out words");
}

TEST_F(WordWrapTest, EmptyInput) {
    WordWrapper wrapper(*font);
    EXPECT_TRUE(wrapper.wrap("", 100.0f).empty());
    EXPECT_TRUE(wrapper.wrap("   ", 100.0f).empty());
}

TEST_F(WordWrapTest, LinesRespectWidthAndPreserveWords) {
    WordWrapper wrapper(*font);
    const std::string text =
        "the quick brown fox jumps over the lazy dog while an extraordinarily "
        "long word tries to break everything";

    for (f32 width : {20.0f, 60.0f, 100.0f, 150.0f, 400.0f}) {
        auto lines = wrapper.wrap(text, width);

        for (const auto& line : lines) {
            if (split_whitespace(line).size() > 1) {
                EXPECT_LE(font->measure_text(line), width) << line;
            }
        }
        EXPECT_EQ(split_whitespace(join(lines, " ")), split_whitespace(text));
    }
}

TEST_F(WordWrapTest, OneWordPerLineIsStable) {
    WordWrapper wrapper(*font);
    auto lines = wrapper.wrap("alpha beta gamma", 36.0f);

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(wrapper.wrap_words(lines, 36.0f), lines);
}

TEST_F(WordWrapTest, CourageTitleAtReferenceSize) {
    auto title_font = create_builtin_font(120.0f);
    WordWrapper wrapper(*title_font);
    auto lines = wrapper.wrap("The Courage to be Disliked", 1280.0f);

    std::vector<std::string> expected{"The Courage to", "be Disliked"};
    EXPECT_EQ(lines, expected);
}
