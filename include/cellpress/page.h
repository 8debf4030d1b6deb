#pragma once

#include "cellpress/style.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cellpress {

/// A run of grapheme clusters sharing style, colour and link target.
/// The renderer paints each segment with its own attributes.
struct Segment {
    std::string text;
    std::optional<RgbColor> fg;
    std::optional<RgbColor> bg;
    TextStyle style;
    std::optional<std::string> link;  // Link target (href or anchor name)

    static Segment plain(const std::string& t) {
        Segment s;
        s.text = t;
        return s;
    }

    /// True when `other` could be appended to this segment without losing attributes
    bool canMerge(const TextStyle& otherStyle, const std::optional<std::string>& otherLink) const {
        return style == otherStyle && !fg && !bg && link == otherLink;
    }
};

/// Where a raster image is painted, relative to the line that carries it
struct ImagePlacement {
    std::string id;
    int columns = 0;
    int rows = 0;
};

/// One rendered row of character cells
struct StyledLine {
    std::vector<Segment> segments;
    std::optional<ImagePlacement> image;  // Set on the top row of an image only

    static StyledLine plain(const std::string& t) {
        StyledLine line;
        line.segments.push_back(Segment::plain(t));
        return line;
    }

    /// Concatenated segment text
    std::string text() const {
        std::string out;
        for (const auto& seg : segments) {
            out += seg.text;
        }
        return out;
    }
};

/// A line together with the anchors reached on it
struct AnchoredLine {
    StyledLine line;
    std::vector<std::string> anchors;
};

/// A height-bounded list of lines
struct Page {
    std::vector<StyledLine> lines;
};

/// Result of paginating a block list
struct Pagination {
    std::vector<Page> pages;
    std::vector<int> chapterStarts;       // Strictly increasing, [0] == 0 when non-empty
    std::map<std::string, int> anchors;   // Anchor name -> page of first occurrence
};

} // namespace cellpress
