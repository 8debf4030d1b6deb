#pragma once

#include "cellpress/style.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cellpress {

/// In-band inline markup.
///
/// Block text carries formatting as private control characters instead of a tree:
///   STYLE_START <code> ... STYLE_END <code>   style span (codes: b i u c x s)
///   LINK_START <target> LINK_END              opens a link; an empty target closes it
///   ANCHOR_START <name> ANCHOR_END            zero-width named position
/// All markers are single ASCII control bytes, so scanning is byte-safe on UTF-8.
namespace markup {

constexpr char STYLE_START  = '\x1E';
constexpr char STYLE_END    = '\x1F';
constexpr char LINK_START   = '\x1C';
constexpr char LINK_END     = '\x1D';
constexpr char ANCHOR_START = '\x18';
constexpr char ANCHOR_END   = '\x17';

/// One-letter style codes that follow STYLE_START / STYLE_END
enum class StyleCode : char {
    Bold      = 'b',
    Italic    = 'i',
    Underline = 'u',
    Code      = 'c',   // Rendered dim + reverse
    Strike    = 'x',
    SmallCaps = 's',
};

bool isStyleCode(char c);

/// Per-style open counters. A style is active while its count is non-zero;
/// closes saturate at zero.
struct StyleCounts {
    uint16_t bold = 0;
    uint16_t italic = 0;
    uint16_t underline = 0;
    uint16_t code = 0;
    uint16_t strike = 0;
    uint16_t smallCaps = 0;

    /// Apply an open or close for `code`. Returns false for unknown codes.
    bool apply(char code, bool open);

    TextStyle resolve() const;
};

enum class PieceType {
    Span,
    Anchor,
};

/// Decoded unit: a styled text span or an anchor event (name in `text`)
struct InlinePiece {
    PieceType type = PieceType::Span;
    std::string text;
    TextStyle style;
    std::optional<std::string> link;

    static InlinePiece span(const std::string& t, const TextStyle& s,
                            const std::optional<std::string>& l) {
        return {PieceType::Span, t, s, l};
    }
    static InlinePiece anchor(const std::string& name) {
        return {PieceType::Anchor, name, TextStyle{}, std::nullopt};
    }
};

/// True if `text` contains any marker byte
bool hasMarkers(const std::string& text);

/// Single linear scan into spans and anchors, in document order.
/// Malformed openers are kept verbatim as plain text.
std::vector<InlinePiece> decode(const std::string& text);

/// Visible text only: markers removed, malformed markers kept as decode() keeps them
std::string strip(const std::string& text);

// -- Encoding helpers ------------------------------------------------------

std::string styleStart(StyleCode code);
std::string styleEnd(StyleCode code);
std::string styled(StyleCode code, const std::string& text);

/// Empty or blank targets produce no opener
std::string linkStart(const std::string& target);
std::string linkEnd();
std::string linked(const std::string& target, const std::string& text);

/// Leading '#' and surrounding whitespace are kept as given; decode() trims
std::string anchor(const std::string& name);

inline std::string bold(const std::string& t)   { return styled(StyleCode::Bold, t); }
inline std::string italic(const std::string& t) { return styled(StyleCode::Italic, t); }
inline std::string code(const std::string& t)   { return styled(StyleCode::Code, t); }

} // namespace markup

} // namespace cellpress
