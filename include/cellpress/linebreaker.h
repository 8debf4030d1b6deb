#pragma once

#include "cellpress/markup.h"
#include "cellpress/page.h"
#include "cellpress/style.h"
#include <optional>
#include <string>
#include <vector>

namespace cellpress {

namespace linebreaker {

/// A run of non-whitespace graphemes, possibly spanning several styles
struct Word {
    std::vector<Segment> segments;
    int width = 0;  // Grapheme count
};

enum class TokenType {
    Word,
    Space,     // One collapsed whitespace run
    Newline,   // Explicit line break; never collapses
    Anchor,
};

struct Token {
    TokenType type = TokenType::Word;
    Word word;                         // Word
    TextStyle style;                   // Space
    std::optional<std::string> link;   // Space
    std::string anchor;                // Anchor
};

/// Wrapped output: lines plus, per line, the anchors reached on it
struct WrappedLines {
    std::vector<StyledLine> lines;
    std::vector<std::vector<std::string>> anchors;
};

/// Grapheme-by-grapheme conversion of decoded pieces into wrap tokens
std::vector<Token> tokenize(const std::vector<markup::InlinePiece>& pieces);

/// Force-split a word into `width`-wide chunks; the last chunk may be shorter
std::vector<Word> splitWord(const std::vector<Segment>& segments, int width);

/// Greedy fill of tokens into lines of at most `width` cells (clamped to >= 1).
/// Always yields at least one line.
WrappedLines wrapTokens(const std::vector<Token>& tokens, int width);

/// decode + tokenize + wrapTokens
WrappedLines wrapStyledText(const std::string& text, int width);

/// Decode one line without wrapping: merged segments and its anchors
void segmentsWithAnchors(const std::string& text,
                         std::vector<Segment>& segments,
                         std::vector<std::string>& anchors);

/// Sum of grapheme widths
int segmentsWidth(const std::vector<Segment>& segments);
int lineWidth(const StyledLine& line);

/// Pad the gap segments of `line` so that it fills `width` exactly.
/// Lines that are already full, filled below the threshold, or that have too
/// few gaps are returned unchanged.
StyledLine justifyLine(const StyledLine& line, int width,
                       const LayoutSettings& settings = LayoutSettings{});

/// Cut segments to `width` cells; a cut line ends with "…" in the last cell
StyledLine clipSegments(const std::vector<Segment>& segments, int width);

/// Uppercase ASCII letters in every segment
void uppercaseSegments(std::vector<Segment>& segments);

} // namespace linebreaker

} // namespace cellpress
