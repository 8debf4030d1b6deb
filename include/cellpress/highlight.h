#pragma once

#include "cellpress/style.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cellpress {

/// A coloured run of code text
struct HighlightSpan {
    std::string text;
    std::optional<RgbColor> fg;
    std::optional<RgbColor> bg;
};

/// One source line of highlighted code
struct HighlightLine {
    std::vector<HighlightSpan> spans;
};

/// Abstract interface for syntax highlighting of code blocks.
/// Desktop: implement with a grammar-based highlighter
/// Tests: mock with fixed colours
///
/// Implementations must be synchronous and must return at least one line,
/// possibly empty, even for empty input. They may throw std::exception; the
/// paginator then renders the block as plain text.
class SyntaxHighlighter {
public:
    virtual ~SyntaxHighlighter() = default;

    /// Highlight `code` written in `lang` (a language token such as "rust" or "py")
    virtual std::vector<HighlightLine> highlight(const std::optional<std::string>& lang,
                                                 const std::string& code) const = 0;
};

/// Splits code into lines without colour
class PlainTextHighlighter : public SyntaxHighlighter {
public:
    std::vector<HighlightLine> highlight(const std::optional<std::string>& lang,
                                         const std::string& code) const override;
};

/// Process-wide highlighter, built on first use and immutable afterwards
std::shared_ptr<const SyntaxHighlighter> defaultHighlighter();

/// Split on '\n' (a trailing '\r' is dropped), one uncoloured span per line.
/// A trailing newline does not start an extra line; empty input gives one empty line.
std::vector<HighlightLine> plainLines(const std::string& code);

} // namespace cellpress
