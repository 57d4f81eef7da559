#include "toastkit/ui/MonospaceFont.hh"

#include <gtest/gtest.h>

using namespace toastkit;

namespace {

MonospaceFont makeFont() {
    return MonospaceFont(10.0f, 20.0f, 14.0f);
}

} // namespace

TEST(MonospaceFontTest, DebugTextMetrics) {
    auto font = MonospaceFont::debugText();
    EXPECT_FLOAT_EQ(font.glyphWidth(), 8.0f);
    EXPECT_FLOAT_EQ(font.lineHeight(), 16.0f);
    EXPECT_FLOAT_EQ(font.capHeight(), 16.0f);
}

TEST(MonospaceFontTest, EmptyTextIsOneEmptyLine) {
    auto font = makeFont();
    auto layout = font.layout("");
    ASSERT_EQ(layout.lines.size(), 1u);
    EXPECT_TRUE(layout.lines[0].text.empty());
    EXPECT_FLOAT_EQ(layout.width, 0.0f);
    EXPECT_FLOAT_EQ(layout.height, 14.0f); // cap height

    auto wrapped = font.layout("", 100.0f, TextAlign::Center);
    ASSERT_EQ(wrapped.lines.size(), 1u);
    EXPECT_FLOAT_EQ(wrapped.height, 14.0f);
    EXPECT_FLOAT_EQ(wrapped.lines[0].x, 50.0f);
}

TEST(MonospaceFontTest, SingleLineMetrics) {
    auto font = makeFont();
    auto layout = font.layout("hello");
    ASSERT_EQ(layout.lines.size(), 1u);
    EXPECT_EQ(layout.lines[0].text, "hello");
    EXPECT_FLOAT_EQ(layout.width, 50.0f);
    EXPECT_FLOAT_EQ(layout.height, 14.0f);
}

TEST(MonospaceFontTest, UnwrappedLayoutBreaksOnlyAtNewlines) {
    auto font = makeFont();
    auto layout = font.layout("ab\nlonger line");
    ASSERT_EQ(layout.lines.size(), 2u);
    EXPECT_EQ(layout.lines[1].text, "longer line");
    EXPECT_FLOAT_EQ(layout.width, 110.0f);
    EXPECT_FLOAT_EQ(layout.height, 14.0f + 20.0f);
    EXPECT_FLOAT_EQ(layout.lines[0].x, 0.0f);
}

TEST(MonospaceFontTest, WrapsAtSpaces) {
    auto font = makeFont();
    // 10 glyphs per line
    auto layout = font.layout("aaaa bbbb cccc dd", 100.0f, TextAlign::Left);
    ASSERT_EQ(layout.lines.size(), 2u);
    EXPECT_EQ(layout.lines[0].text, "aaaa bbbb");
    EXPECT_EQ(layout.lines[1].text, "cccc dd");
    EXPECT_FLOAT_EQ(layout.width, 90.0f);
    EXPECT_FLOAT_EQ(layout.height, 34.0f);
}

TEST(MonospaceFontTest, LineFillingTargetExactlyStaysOnOneLine) {
    auto font = makeFont();
    auto layout = font.layout("aaaa bbbbb", 100.0f, TextAlign::Left);
    ASSERT_EQ(layout.lines.size(), 1u);
    EXPECT_FLOAT_EQ(layout.width, 100.0f);
}

TEST(MonospaceFontTest, LongWordIsBrokenAtGlyphs) {
    auto font = makeFont();
    auto layout = font.layout("abcdefghijklmnopqrstuvwxy", 100.0f, TextAlign::Left);
    ASSERT_EQ(layout.lines.size(), 3u);
    EXPECT_EQ(layout.lines[0].text, "abcdefghij");
    EXPECT_EQ(layout.lines[1].text, "klmnopqrst");
    EXPECT_EQ(layout.lines[2].text, "uvwxy");
}

TEST(MonospaceFontTest, NoWrappedLineExceedsTarget) {
    auto font = makeFont();
    auto layout = font.layout("The quick brown fox jumps over the extraordinarily lazy dog", 73.0f,
                              TextAlign::Center);
    for (const auto& line : layout.lines) {
        EXPECT_LE(line.width, 73.0f) << line.text;
    }
    EXPECT_LE(layout.width, 73.0f);
}

TEST(MonospaceFontTest, TargetNarrowerThanGlyphKeepsOneGlyphPerLine) {
    auto font = makeFont();
    auto layout = font.layout("abc", 4.0f, TextAlign::Left);
    ASSERT_EQ(layout.lines.size(), 3u);
    EXPECT_FLOAT_EQ(layout.width, 10.0f);
}

TEST(MonospaceFontTest, CenterAlignmentOffsets) {
    auto font = makeFont();
    auto layout = font.layout("aaaa bbbb cc", 100.0f, TextAlign::Center);
    ASSERT_EQ(layout.lines.size(), 2u);
    EXPECT_FLOAT_EQ(layout.lines[0].x, 5.0f);
    EXPECT_FLOAT_EQ(layout.lines[1].x, 40.0f);
}

TEST(MonospaceFontTest, RightAlignmentOffsets) {
    auto font = makeFont();
    auto layout = font.layout("abc", 100.0f, TextAlign::Right);
    ASSERT_EQ(layout.lines.size(), 1u);
    EXPECT_FLOAT_EQ(layout.lines[0].x, 70.0f);
}

TEST(MonospaceFontTest, ExplicitNewlineAlwaysBreaks) {
    auto font = makeFont();
    auto layout = font.layout("ab\ncd", 100.0f, TextAlign::Left);
    ASSERT_EQ(layout.lines.size(), 2u);
    EXPECT_EQ(layout.lines[0].text, "ab");
    EXPECT_EQ(layout.lines[1].text, "cd");
}

TEST(MonospaceFontTest, SpacesCollapseAtBreaks) {
    auto font = makeFont();
    auto layout = font.layout("aaaa   bbbb    cccccc", 100.0f, TextAlign::Left);
    ASSERT_EQ(layout.lines.size(), 2u);
    EXPECT_EQ(layout.lines[0].text, "aaaa bbbb");
    EXPECT_EQ(layout.lines[1].text, "cccccc");
}
