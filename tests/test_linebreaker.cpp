#include <gtest/gtest.h>
#include "cellpress/linebreaker.h"
#include "cellpress/markup.h"

using namespace cellpress;
using namespace cellpress::linebreaker;

namespace {

std::vector<std::string> lineTexts(const WrappedLines& wrapped) {
    std::vector<std::string> out;
    for (const auto& line : wrapped.lines) {
        out.push_back(line.text());
    }
    return out;
}

StyledLine wordsLine(const std::vector<std::string>& words) {
    StyledLine line;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) line.segments.push_back(Segment::plain(" "));
        line.segments.push_back(Segment::plain(words[i]));
    }
    return line;
}

} // namespace

// ---------------------------------------------------------------------------
// Tokenizer
// ---------------------------------------------------------------------------

TEST(Tokenizer, CollapsesWhitespace) {
    auto tokens = tokenize(markup::decode("a   b\t c"));
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].type, TokenType::Word);
    EXPECT_EQ(tokens[1].type, TokenType::Space);
    EXPECT_EQ(tokens[2].type, TokenType::Word);
    EXPECT_EQ(tokens[3].type, TokenType::Space);
    EXPECT_EQ(tokens[4].type, TokenType::Word);
}

TEST(Tokenizer, NewlinesNeverCollapse) {
    auto tokens = tokenize(markup::decode("a\n\nb"));
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1].type, TokenType::Newline);
    EXPECT_EQ(tokens[2].type, TokenType::Newline);
}

TEST(Tokenizer, WordSpansStyles) {
    // "he" plain + "llo" bold is one word with two segments
    auto tokens = tokenize(markup::decode("he" + markup::bold("llo")));
    ASSERT_EQ(tokens.size(), 1u);
    const Word& word = tokens[0].word;
    EXPECT_EQ(word.width, 5);
    ASSERT_EQ(word.segments.size(), 2u);
    EXPECT_EQ(word.segments[0].text, "he");
    EXPECT_EQ(word.segments[1].text, "llo");
    EXPECT_TRUE(word.segments[1].style.bold);
}

TEST(Tokenizer, GraphemeClustersCountAsOneCell) {
    // "e" + combining acute accent is one cluster
    auto tokens = tokenize(markup::decode("e\xcc\x81t\xc3\xa9"));
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].word.width, 3);
}

TEST(Tokenizer, AnchorsAreStandaloneTokens) {
    auto tokens = tokenize(markup::decode("ab" + markup::anchor("n1") + "cd"));
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::Word);
    EXPECT_EQ(tokens[1].type, TokenType::Anchor);
    EXPECT_EQ(tokens[1].anchor, "n1");
    EXPECT_EQ(tokens[2].type, TokenType::Word);
}

// ---------------------------------------------------------------------------
// Greedy wrap
// ---------------------------------------------------------------------------

TEST(WordWrap, QuickBrownFox) {
    auto wrapped = wrapStyledText("The quick brown fox jumps.", 10);
    std::vector<std::string> expected = {"The quick", "brown fox", "jumps."};
    EXPECT_EQ(lineTexts(wrapped), expected);
    EXPECT_EQ(wrapped.anchors.size(), wrapped.lines.size());
}

TEST(WordWrap, WidthBound) {
    std::string text = "Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do "
                       "eiusmod tempor incididunt ut labore et dolore magna aliqua.";
    for (int width : {5, 8, 13, 21, 40}) {
        auto wrapped = wrapStyledText(text, width);
        for (const auto& line : wrapped.lines) {
            EXPECT_LE(lineWidth(line), width) << "width=" << width << " line='" << line.text() << "'";
        }
    }
}

TEST(WordWrap, OverlongWordIsForceSplit) {
    // "ij" + " xy" would be 5 cells, so "xy" moves down
    auto wrapped = wrapStyledText("abcdefghij xy", 4);
    std::vector<std::string> expected = {"abcd", "efgh", "ij", "xy"};
    EXPECT_EQ(lineTexts(wrapped), expected);
}

TEST(WordWrap, SplitChunkSeedsNextLine) {
    // "efg" + " h" would be 5 cells
    auto wrapped = wrapStyledText("abcdefg h", 4);
    std::vector<std::string> expected = {"abcd", "efg", "h"};
    EXPECT_EQ(lineTexts(wrapped), expected);

    wrapped = wrapStyledText("abcdef g", 4);
    expected = {"abcd", "ef g"};
    EXPECT_EQ(lineTexts(wrapped), expected);
}

TEST(WordWrap, SplitPreservesStylePerGrapheme) {
    auto wrapped = wrapStyledText("ab" + markup::bold("cdef"), 3);
    ASSERT_EQ(wrapped.lines.size(), 2u);
    const auto& first = wrapped.lines[0].segments;
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].text, "ab");
    EXPECT_FALSE(first[0].style.bold);
    EXPECT_EQ(first[1].text, "c");
    EXPECT_TRUE(first[1].style.bold);
    const auto& second = wrapped.lines[1].segments;
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].text, "def");
    EXPECT_TRUE(second[0].style.bold);
}

TEST(WordWrap, ZeroWidthClampedToOne) {
    auto wrapped = wrapStyledText("ab", 0);
    std::vector<std::string> expected = {"a", "b"};
    EXPECT_EQ(lineTexts(wrapped), expected);
}

TEST(WordWrap, EmptyTextYieldsOneEmptyLine) {
    auto wrapped = wrapStyledText("", 10);
    ASSERT_EQ(wrapped.lines.size(), 1u);
    EXPECT_TRUE(wrapped.lines[0].segments.empty());
}

TEST(WordWrap, NewlineFlushesEvenEmptyLines) {
    auto wrapped = wrapStyledText("one\n\ntwo", 20);
    std::vector<std::string> expected = {"one", "", "two"};
    EXPECT_EQ(lineTexts(wrapped), expected);
}

TEST(WordWrap, AnchorsAttachToTheirLine) {
    auto wrapped = wrapStyledText("aaa bbb ccc" + markup::anchor("mid") + " ddd", 7);
    ASSERT_EQ(wrapped.lines.size(), 2u);
    EXPECT_TRUE(wrapped.anchors[0].empty());
    ASSERT_EQ(wrapped.anchors[1].size(), 1u);
    EXPECT_EQ(wrapped.anchors[1][0], "mid");
}

TEST(WordWrap, AnchorBeforeSplitWordGoesToFirstChunk) {
    auto wrapped = wrapStyledText(markup::anchor("a") + "abcdefgh", 4);
    ASSERT_EQ(wrapped.lines.size(), 2u);
    ASSERT_EQ(wrapped.anchors[0].size(), 1u);
    EXPECT_EQ(wrapped.anchors[0][0], "a");
    EXPECT_TRUE(wrapped.anchors[1].empty());
}

TEST(WordWrap, TrailingAnchorIsNotLost) {
    auto wrapped = wrapStyledText("text\n" + markup::anchor("end"), 10);
    ASSERT_EQ(wrapped.lines.size(), 2u);
    ASSERT_EQ(wrapped.anchors[1].size(), 1u);
    EXPECT_EQ(wrapped.anchors[1][0], "end");
}

TEST(WordWrap, LinkedSpaceKeepsLink) {
    auto wrapped = wrapStyledText(markup::linked("t.html", "two words"), 20);
    ASSERT_EQ(wrapped.lines.size(), 1u);
    for (const auto& seg : wrapped.lines[0].segments) {
        ASSERT_TRUE(seg.link.has_value());
        EXPECT_EQ(*seg.link, "t.html");
    }
}

TEST(WordWrap, RoundTripStripping) {
    std::string source = "The " + markup::bold("quick") + " brown " +
                         markup::linked("f.html", "fox") + " jumps over the lazy dog.";
    auto wrapped = wrapStyledText(source, 9);
    std::string joined;
    for (const auto& line : wrapped.lines) {
        if (!joined.empty()) joined += ' ';
        joined += line.text();
    }
    EXPECT_EQ(joined, markup::strip(source));
}

// ---------------------------------------------------------------------------
// Justification
// ---------------------------------------------------------------------------

TEST(Justify, FillsWidthExactly) {
    StyledLine line = wordsLine({"a", "b", "c", "d", "e"});  // 9 cells, 4 gaps
    StyledLine out = justifyLine(line, 10);
    EXPECT_EQ(lineWidth(out), 10);
    EXPECT_EQ(out.text(), "a  b c d e");
}

TEST(Justify, EarlierGapsGetTheRemainder) {
    StyledLine line = wordsLine({"aaaa", "bb", "cc", "dd"});  // 13 cells, 3 gaps
    StyledLine out = justifyLine(line, 18);                    // extra 5: 2,2,1
    EXPECT_EQ(out.text(), "aaaa   bb   cc  dd");
    EXPECT_EQ(lineWidth(out), 18);
}

TEST(Justify, SkipsFullLine) {
    StyledLine line = wordsLine({"a", "b", "c", "d", "e"});
    EXPECT_EQ(justifyLine(line, 9).text(), "a b c d e");
}

TEST(Justify, SkipsUnderfilledLine) {
    StyledLine line = wordsLine({"a", "b", "c", "d"});  // 7 of 11 cells: 63%
    EXPECT_EQ(justifyLine(line, 11).text(), "a b c d");
}

TEST(Justify, SkipsTooFewGaps) {
    StyledLine line = wordsLine({"aaaa", "bbbb", "cc"});  // 12 cells, 2 gaps
    EXPECT_EQ(justifyLine(line, 14).text(), "aaaa bbbb cc");
}

TEST(Justify, ThresholdsComeFromSettings) {
    LayoutSettings settings;
    settings.justifyMinGaps = 2;
    StyledLine line = wordsLine({"aaaa", "bbbb", "cc"});
    EXPECT_EQ(lineWidth(justifyLine(line, 14, settings)), 14);
}

// ---------------------------------------------------------------------------
// Clipping and helpers
// ---------------------------------------------------------------------------

TEST(Clip, ShortLineUnchanged) {
    StyledLine out = clipSegments({Segment::plain("abc")}, 5);
    EXPECT_EQ(out.text(), "abc");
}

TEST(Clip, LongLineEndsWithEllipsis) {
    Segment colored = Segment::plain("abcdefgh");
    colored.fg = RgbColor{255, 0, 0};
    StyledLine out = clipSegments({Segment::plain("12"), colored}, 6);
    EXPECT_EQ(lineWidth(out), 6);
    EXPECT_EQ(out.text(), "12abc\xe2\x80\xa6");
    ASSERT_EQ(out.segments.size(), 3u);
    ASSERT_TRUE(out.segments[2].fg.has_value());
    EXPECT_EQ(*out.segments[2].fg, (RgbColor{255, 0, 0}));
}

TEST(Clip, SegmentsWithAnchors) {
    std::vector<Segment> segments;
    std::vector<std::string> anchors;
    segmentsWithAnchors("a " + markup::anchor("x") + "b" + markup::bold("c"), segments, anchors);
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].text, "a b");
    EXPECT_EQ(segments[1].text, "c");
    ASSERT_EQ(anchors.size(), 1u);
    EXPECT_EQ(anchors[0], "x");
}

TEST(Clip, UppercaseLeavesNonAsciiAlone) {
    std::vector<Segment> segments = {Segment::plain("caf\xc3\xa9 ok")};
    uppercaseSegments(segments);
    EXPECT_EQ(segments[0].text, "CAF\xc3\xa9 OK");
}
