#pragma once

#include <cstdint>
#include <string>

namespace cellpress {

/// 24-bit terminal colour
struct RgbColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const RgbColor& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const RgbColor& o) const { return !(*this == o); }
};

/// Character attributes of a run of text. Flags are independent and combine freely.
struct TextStyle {
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool dim = false;
    bool reverse = false;
    bool strikethrough = false;
    bool smallCaps = false;

    bool operator==(const TextStyle& o) const {
        return bold == o.bold && italic == o.italic && underline == o.underline &&
               dim == o.dim && reverse == o.reverse &&
               strikethrough == o.strikethrough && smallCaps == o.smallCaps;
    }
    bool operator!=(const TextStyle& o) const { return !(*this == o); }

    bool isPlain() const { return *this == TextStyle{}; }
};

/// Tunables for a pagination pass.
/// Maps to the reader settings screen; every field has a usable default.
struct LayoutSettings {
    // Justification
    bool justify = false;
    int justifyMinFillPercent = 70;   // Lines filled below this are left ragged
    int justifyMinGaps = 3;           // Lines with fewer gaps are left ragged

    // Block decorations
    int quoteRuleMinWidth = 16;       // "│ " rule for quotes at/above this width
    int codeRuleMinWidth = 12;        // "│ " rule for code at/above this width
    std::string listBullet = "\xe2\x80\xa2 ";  // "• "
    bool uppercaseHeadings = true;

    // Images
    int defaultImageRows = 6;         // Used when the aspect ratio is unknown
    int minImageRows = 3;
    int imageRowMargin = 2;           // Rows kept free below a full-height image
};

} // namespace cellpress
