#pragma once

#include "cellpress/document.h"
#include "cellpress/highlight.h"
#include "cellpress/page.h"
#include "cellpress/style.h"
#include <memory>
#include <vector>

namespace cellpress {

/// Viewport dimensions in character cells
struct PageSize {
    int width = 80;
    int height = 24;
};

/// The pagination engine: takes blocks + viewport size + settings,
/// produces fixed-height pages of styled lines with chapter and anchor indexes.
///
/// Pagination is a pure function of its arguments; nothing is carried between calls.
class LayoutEngine {
public:
    explicit LayoutEngine(std::shared_ptr<const SyntaxHighlighter> highlighter = defaultHighlighter());
    ~LayoutEngine();

    LayoutEngine(LayoutEngine&&) noexcept;
    LayoutEngine& operator=(LayoutEngine&&) noexcept;

    /// Lay out all blocks into pages. Each chapter after the first starts on a
    /// new page; the preceding page is flushed short.
    Pagination paginate(const std::vector<Block>& blocks,
                        const PageSize& size,
                        const LayoutSettings& settings) const;

    /// Lay out a single block without the trailing blank line
    std::vector<AnchoredLine> layoutBlock(const Block& block,
                                          const PageSize& size,
                                          const LayoutSettings& settings) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Paginate with the default highlighter and default settings plus `justify`.
/// Every chapter after the first begins on a fresh page, so the page before a
/// chapter start may be shorter than `size.height`.
Pagination paginate(const std::vector<Block>& blocks, const PageSize& size, bool justify);

/// Visible text of a chapter separator paragraph
inline constexpr char kSeparatorGlyphs[] = "\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80";  // "───"

/// A paragraph whose visible text is exactly kSeparatorGlyphs, with an empty paragraph on each side
bool isChapterSeparator(const std::vector<Block>& blocks, size_t idx);

/// A paragraph with no visible text
bool isEmptyParagraph(const Block& block);

} // namespace cellpress
