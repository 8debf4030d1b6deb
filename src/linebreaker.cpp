#include "cellpress/linebreaker.h"
#include "cellpress/unicode.h"
#include "cellpress/log.h"
#include <algorithm>

namespace cellpress {

namespace linebreaker {

namespace {

const char* const kEllipsis = "\xe2\x80\xa6";  // "…"

/// Append one grapheme carrying the attributes of `like`,
/// extending the last segment when all attributes match
void appendGrapheme(std::vector<Segment>& segments, const std::string& g, const Segment& like) {
    if (!segments.empty()) {
        Segment& last = segments.back();
        if (last.style == like.style && last.link == like.link &&
            last.fg == like.fg && last.bg == like.bg) {
            last.text += g;
            return;
        }
    }
    Segment seg = like;
    seg.text = g;
    segments.push_back(std::move(seg));
}

Segment spaceSegment(const TextStyle& style, const std::optional<std::string>& link) {
    Segment seg;
    seg.text = " ";
    seg.style = style;
    seg.link = link;
    return seg;
}

/// A gap is a segment made only of spaces
bool isGapSegment(const Segment& seg) {
    return !seg.text.empty() &&
           std::all_of(seg.text.begin(), seg.text.end(), [](char c) { return c == ' '; });
}

} // anonymous namespace

// ── Tokenizer ────────────────────────────────────────────────────────

std::vector<Token> tokenize(const std::vector<markup::InlinePiece>& pieces) {
    std::vector<Token> tokens;
    Word word;

    auto flushWord = [&]() {
        if (word.segments.empty()) return;
        Token t;
        t.type = TokenType::Word;
        t.word = std::move(word);
        tokens.push_back(std::move(t));
        word = Word{};
    };

    for (const auto& piece : pieces) {
        Segment like;
        like.style = piece.style;
        like.link = piece.link;

        if (piece.type == markup::PieceType::Anchor) {
            flushWord();
            Token t;
            t.type = TokenType::Anchor;
            t.anchor = piece.text;
            tokens.push_back(std::move(t));
            continue;
        }

        for (const auto& g : unicode::graphemes(piece.text)) {
            if (unicode::isLineBreak(g)) {
                flushWord();
                Token t;
                t.type = TokenType::Newline;
                tokens.push_back(std::move(t));
                continue;
            }
            if (unicode::isWhitespace(g)) {
                flushWord();
                // Consecutive whitespace collapses; a space right after a newline is dropped
                if (tokens.empty() ||
                    (tokens.back().type != TokenType::Space &&
                     tokens.back().type != TokenType::Newline)) {
                    Token t;
                    t.type = TokenType::Space;
                    t.style = piece.style;
                    t.link = piece.link;
                    tokens.push_back(std::move(t));
                }
                continue;
            }
            appendGrapheme(word.segments, g, like);
            ++word.width;
        }
    }
    flushWord();
    return tokens;
}

// ── Forced splitting ─────────────────────────────────────────────────

std::vector<Word> splitWord(const std::vector<Segment>& segments, int width) {
    width = std::max(width, 1);
    std::vector<Word> parts;
    Word current;

    for (const auto& seg : segments) {
        for (const auto& g : unicode::graphemes(seg.text)) {
            appendGrapheme(current.segments, g, seg);
            ++current.width;
            if (current.width == width) {
                parts.push_back(std::move(current));
                current = Word{};
            }
        }
    }
    if (!current.segments.empty()) {
        parts.push_back(std::move(current));
    }
    if (parts.empty()) {
        parts.push_back(Word{});
    }
    return parts;
}

// ── Greedy wrap ──────────────────────────────────────────────────────

WrappedLines wrapTokens(const std::vector<Token>& tokens, int width) {
    width = std::max(width, 1);
    WrappedLines out;
    std::vector<Segment> current;
    std::vector<std::string> currentAnchors;
    int used = 0;
    const Token* pendingSpace = nullptr;

    auto pushCurrent = [&]() {
        StyledLine line;
        line.segments = std::move(current);
        out.lines.push_back(std::move(line));
        out.anchors.push_back(std::move(currentAnchors));
        current.clear();
        currentAnchors.clear();
        used = 0;
    };

    for (const auto& token : tokens) {
        switch (token.type) {
            case TokenType::Space:
                pendingSpace = &token;
                break;

            case TokenType::Anchor:
                if (!token.anchor.empty()) {
                    currentAnchors.push_back(token.anchor);
                }
                break;

            case TokenType::Newline:
                pendingSpace = nullptr;
                pushCurrent();
                break;

            case TokenType::Word: {
                const Word& word = token.word;
                int spaceWidth = (pendingSpace != nullptr && !current.empty()) ? 1 : 0;

                if (used + spaceWidth + word.width <= width) {
                    if (spaceWidth > 0) {
                        current.push_back(spaceSegment(pendingSpace->style, pendingSpace->link));
                        used += 1;
                    }
                    current.insert(current.end(), word.segments.begin(), word.segments.end());
                    used += word.width;
                } else {
                    if (!current.empty()) {
                        pushCurrent();
                    }
                    if (word.width > width) {
                        auto parts = splitWord(word.segments, width);
                        for (size_t i = 0; i + 1 < parts.size(); ++i) {
                            StyledLine line;
                            line.segments = std::move(parts[i].segments);
                            out.lines.push_back(std::move(line));
                            out.anchors.push_back(std::move(currentAnchors));
                            currentAnchors.clear();
                        }
                        current = std::move(parts.back().segments);
                        used = parts.back().width;
                    } else {
                        current = word.segments;
                        used = word.width;
                    }
                }
                pendingSpace = nullptr;
                break;
            }
        }
    }

    if (!current.empty() || out.lines.empty() || !currentAnchors.empty()) {
        pushCurrent();
    }
    return out;
}

WrappedLines wrapStyledText(const std::string& text, int width) {
    return wrapTokens(tokenize(markup::decode(text)), width);
}

void segmentsWithAnchors(const std::string& text,
                         std::vector<Segment>& segments,
                         std::vector<std::string>& anchors) {
    for (const auto& piece : markup::decode(text)) {
        if (piece.type == markup::PieceType::Anchor) {
            anchors.push_back(piece.text);
            continue;
        }
        if (piece.text.empty()) continue;
        if (!segments.empty() && segments.back().canMerge(piece.style, piece.link)) {
            segments.back().text += piece.text;
            continue;
        }
        Segment seg;
        seg.text = piece.text;
        seg.style = piece.style;
        seg.link = piece.link;
        segments.push_back(std::move(seg));
    }
}

// ── Measurement ──────────────────────────────────────────────────────

int segmentsWidth(const std::vector<Segment>& segments) {
    int total = 0;
    for (const auto& seg : segments) {
        total += static_cast<int>(unicode::graphemeCount(seg.text));
    }
    return total;
}

int lineWidth(const StyledLine& line) {
    return segmentsWidth(line.segments);
}

// ── Justification ────────────────────────────────────────────────────

StyledLine justifyLine(const StyledLine& line, int width, const LayoutSettings& settings) {
    int current = lineWidth(line);
    if (current >= width) return line;
    if (current * 100 < width * settings.justifyMinFillPercent) return line;

    std::vector<size_t> gaps;
    for (size_t i = 0; i < line.segments.size(); ++i) {
        if (isGapSegment(line.segments[i])) gaps.push_back(i);
    }
    if (gaps.empty() || static_cast<int>(gaps.size()) < settings.justifyMinGaps) return line;

    int extra = width - current;
    int gapCount = static_cast<int>(gaps.size());
    int base = extra / gapCount;
    int remainder = extra % gapCount;

    StyledLine out = line;
    for (size_t idx : gaps) {
        int add = base;
        if (remainder > 0) {
            ++add;
            --remainder;
        }
        if (add > 0) {
            out.segments[idx].text.append(static_cast<size_t>(add), ' ');
        }
    }
    return out;
}

// ── Clipping ─────────────────────────────────────────────────────────

StyledLine clipSegments(const std::vector<Segment>& segments, int width) {
    width = std::max(width, 1);
    StyledLine out;
    if (segmentsWidth(segments) <= width) {
        for (const auto& seg : segments) {
            if (!seg.text.empty()) out.segments.push_back(seg);
        }
        return out;
    }

    // Keep width - 1 cells, the last cell shows the ellipsis
    int budget = width - 1;
    int used = 0;
    for (const auto& seg : segments) {
        Segment piece = seg;
        piece.text.clear();
        bool cut = false;
        for (const auto& g : unicode::graphemes(seg.text)) {
            if (used >= budget) {
                cut = true;
                break;
            }
            piece.text += g;
            ++used;
        }
        if (!piece.text.empty()) {
            out.segments.push_back(piece);
        }
        if (cut || used >= budget) {
            Segment mark = seg;
            mark.text = kEllipsis;
            out.segments.push_back(std::move(mark));
            break;
        }
    }
    CP_LOGD("clipSegments: clipped line to %d cells", width);
    return out;
}

void uppercaseSegments(std::vector<Segment>& segments) {
    for (auto& seg : segments) {
        seg.text = unicode::asciiUppercase(seg.text);
    }
}

} // namespace linebreaker

} // namespace cellpress
