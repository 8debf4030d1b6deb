#include "cellpress/layout.h"
#include "cellpress/linebreaker.h"
#include "cellpress/markup.h"
#include "cellpress/table.h"
#include "cellpress/unicode.h"
#include "cellpress/log.h"
#include <algorithm>
#include <cmath>
#include <exception>

namespace cellpress {

namespace {

const char* const kRulePrefix = "\xe2\x94\x82 ";                              // "│ "

std::string visibleText(const std::string& text) {
    return unicode::trim(markup::strip(text));
}

/// Pages under construction plus the two indexes.
/// Every output line goes through pushLine().
struct PageAccumulator {
    int height = 1;
    Pagination result;
    Page current;
    int pageIndex = 0;

    void pushLine(StyledLine line, const std::vector<std::string>& anchors) {
        for (const auto& name : anchors) {
            result.anchors.emplace(name, pageIndex);  // First occurrence wins
        }
        current.lines.push_back(std::move(line));
        if (static_cast<int>(current.lines.size()) >= height) {
            flushPage();
        }
    }

    void pushBlank() {
        pushLine(StyledLine{}, {});
    }

    void flushPage() {
        result.pages.push_back(std::move(current));
        current = Page{};
        ++pageIndex;
        CP_LOGD("paginate: newPage pageIndex=%d", pageIndex);
    }

    /// Start a fresh page unless the current one is still empty
    void breakPage() {
        if (!current.lines.empty()) flushPage();
    }

    void markChapterStart() {
        if (result.chapterStarts.empty() || pageIndex > result.chapterStarts.back()) {
            result.chapterStarts.push_back(pageIndex);
        }
    }

    Pagination finish() {
        if (!current.lines.empty()) flushPage();
        return std::move(result);
    }
};

std::string imageFallbackText(const ImageBlock& image) {
    if (image.alt) {
        std::string alt = visibleText(*image.alt);
        if (!alt.empty()) return "Image: " + alt;
    }
    if (image.width && image.height) {
        return "Image (" + std::to_string(*image.width) + "x" + std::to_string(*image.height) + ")";
    }
    return "Image";
}

int imageRows(const ImageBlock& image, int columns, int viewportHeight,
              const LayoutSettings& settings) {
    int rows = settings.defaultImageRows;
    if (image.width && image.height && *image.width > 0) {
        double ratio = static_cast<double>(*image.height) / static_cast<double>(*image.width);
        double scaled = std::ceil(ratio * static_cast<double>(columns));
        rows = scaled > 100000.0 ? 100000 : static_cast<int>(scaled);
    }
    int minRows = std::max(settings.minImageRows, 1);
    int maxRows = std::max(minRows, viewportHeight - settings.imageRowMargin);
    return std::min(std::max(rows, minRows), maxRows);
}

void appendWrapped(std::vector<AnchoredLine>& out, linebreaker::WrappedLines wrapped) {
    for (size_t i = 0; i < wrapped.lines.size(); ++i) {
        out.push_back(AnchoredLine{std::move(wrapped.lines[i]), std::move(wrapped.anchors[i])});
    }
}

} // anonymous namespace

bool isEmptyParagraph(const Block& block) {
    return block.type == BlockType::Paragraph && visibleText(block.text).empty();
}

bool isChapterSeparator(const std::vector<Block>& blocks, size_t idx) {
    if (idx >= blocks.size()) return false;
    const Block& block = blocks[idx];
    if (block.type != BlockType::Paragraph || visibleText(block.text) != kSeparatorGlyphs) {
        return false;
    }
    bool prevEmpty = idx > 0 && isEmptyParagraph(blocks[idx - 1]);
    bool nextEmpty = idx + 1 < blocks.size() && isEmptyParagraph(blocks[idx + 1]);
    return prevEmpty && nextEmpty;
}

class LayoutEngine::Impl {
public:
    explicit Impl(std::shared_ptr<const SyntaxHighlighter> highlighter)
        : highlighter_(std::move(highlighter)) {
        if (!highlighter_) highlighter_ = defaultHighlighter();
    }

    Pagination paginate(const std::vector<Block>& blocks,
                        const PageSize& pageSize,
                        const LayoutSettings& settings) const {
        PageSize size = clampSize(pageSize);
        PageAccumulator acc;
        acc.height = size.height;

        bool firstBlock = true;
        bool awaitingChapter = false;
        size_t textImages = 0;

        for (size_t idx = 0; idx < blocks.size(); ++idx) {
            const Block& block = blocks[idx];
            bool separator = isChapterSeparator(blocks, idx);

            if (firstBlock) {
                acc.markChapterStart();  // Chapter 0 starts with the first content
                firstBlock = false;
            } else if (awaitingChapter && !separator && !isEmptyParagraph(block)) {
                acc.breakPage();
                acc.markChapterStart();
                awaitingChapter = false;
                CP_LOGD("paginate: chapter %zu starts at page %d",
                        acc.result.chapterStarts.size() - 1, acc.pageIndex);
            }
            if (separator) {
                awaitingChapter = true;
            }
            if (block.type == BlockType::Image && !block.image.data) {
                ++textImages;
            }

            for (auto& al : layoutBlock(block, size, settings)) {
                acc.pushLine(std::move(al.line), al.anchors);
            }

            if (!isChapterSeparator(blocks, idx + 1)) {
                acc.pushBlank();
            }
        }

        Pagination result = acc.finish();
        CP_LOGI("paginate: blocks=%zu size=%dx%d justify=%d pages=%zu chapters=%zu anchors=%zu",
                blocks.size(), size.width, size.height, settings.justify ? 1 : 0,
                result.pages.size(), result.chapterStarts.size(), result.anchors.size());
        if (textImages > 0) {
            CP_LOGW("paginate: %zu image(s) without data shown as text", textImages);
        }
        return result;
    }

    std::vector<AnchoredLine> layoutBlock(const Block& block,
                                          const PageSize& pageSize,
                                          const LayoutSettings& settings) const {
        PageSize size = clampSize(pageSize);
        std::vector<AnchoredLine> out;

        switch (block.type) {
            case BlockType::Paragraph:
                appendJustified(out, linebreaker::wrapStyledText(block.text, size.width),
                                size.width, settings);
                break;

            case BlockType::Heading: {
                auto wrapped = linebreaker::wrapStyledText(block.text, size.width);
                if (settings.uppercaseHeadings) {
                    for (auto& line : wrapped.lines) {
                        linebreaker::uppercaseSegments(line.segments);
                    }
                }
                appendWrapped(out, std::move(wrapped));
                break;
            }

            case BlockType::List:
                for (const auto& item : block.items) {
                    appendJustified(out,
                                    linebreaker::wrapStyledText(settings.listBullet + item, size.width),
                                    size.width, settings);
                }
                break;

            case BlockType::Quote:
                layoutQuote(out, block, size, settings);
                break;

            case BlockType::Code:
                layoutCode(out, block, size, settings);
                break;

            case BlockType::Table:
                for (auto& tl : renderTable(block.table, size.width)) {
                    out.push_back(std::move(tl));
                }
                break;

            case BlockType::Image:
                layoutImage(out, block.image, size, settings);
                break;
        }
        return out;
    }

private:
    std::shared_ptr<const SyntaxHighlighter> highlighter_;

    static PageSize clampSize(const PageSize& size) {
        return PageSize{std::max(size.width, 1), std::max(size.height, 1)};
    }

    /// Rule prefix when wide enough, two spaces otherwise, nothing when it would not fit
    static std::string blockPrefix(int width, int ruleMinWidth) {
        if (width <= 2) return "";
        return width >= ruleMinWidth ? kRulePrefix : "  ";
    }

    // ---------------------------------------------------------------
    // Paragraphs and list items: justify every line but the last
    // ---------------------------------------------------------------
    static void appendJustified(std::vector<AnchoredLine>& out,
                                linebreaker::WrappedLines wrapped,
                                int width,
                                const LayoutSettings& settings) {
        size_t count = wrapped.lines.size();
        for (size_t i = 0; i < count; ++i) {
            StyledLine line = std::move(wrapped.lines[i]);
            if (settings.justify && i + 1 < count) {
                line = linebreaker::justifyLine(line, width, settings);
            }
            out.push_back(AnchoredLine{std::move(line), std::move(wrapped.anchors[i])});
        }
    }

    // ---------------------------------------------------------------
    // Quotes: wrapped inside a left rule, explicit line breaks kept
    // ---------------------------------------------------------------
    static void layoutQuote(std::vector<AnchoredLine>& out,
                            const Block& block,
                            const PageSize& size,
                            const LayoutSettings& settings) {
        std::string prefix = blockPrefix(size.width, settings.quoteRuleMinWidth);
        int prefixWidth = static_cast<int>(unicode::graphemeCount(prefix));
        int inner = std::max(size.width - prefixWidth, 1);

        auto wrapped = linebreaker::wrapStyledText(block.text, inner);
        for (size_t i = 0; i < wrapped.lines.size(); ++i) {
            StyledLine line;
            if (!prefix.empty()) {
                line.segments.push_back(Segment::plain(prefix));
            }
            auto& segs = wrapped.lines[i].segments;
            line.segments.insert(line.segments.end(), segs.begin(), segs.end());
            out.push_back(AnchoredLine{std::move(line), std::move(wrapped.anchors[i])});
        }
    }

    // ---------------------------------------------------------------
    // Code: highlighter output, clipped to the width
    // ---------------------------------------------------------------
    void layoutCode(std::vector<AnchoredLine>& out,
                    const Block& block,
                    const PageSize& size,
                    const LayoutSettings& settings) const {
        std::vector<HighlightLine> highlighted;
        try {
            highlighted = highlighter_->highlight(block.lang, block.text);
        } catch (const std::exception& e) {
            CP_LOGW("paginate: highlighter failed for lang='%s': %s, using plain text",
                    block.lang ? block.lang->c_str() : "", e.what());
            highlighted.clear();
        }
        if (highlighted.empty()) {
            highlighted = plainLines(block.text);
        }

        std::string prefix = blockPrefix(size.width, settings.codeRuleMinWidth);
        for (const auto& hl : highlighted) {
            std::vector<Segment> segs;
            if (!prefix.empty()) {
                segs.push_back(Segment::plain(prefix));
            }
            for (const auto& span : hl.spans) {
                Segment seg;
                seg.text = span.text;
                seg.fg = span.fg;
                seg.bg = span.bg;
                segs.push_back(std::move(seg));
            }
            out.push_back(AnchoredLine{linebreaker::clipSegments(segs, size.width), {}});
        }
    }

    // ---------------------------------------------------------------
    // Images: blank rows reserved for the raster, then the caption
    // ---------------------------------------------------------------
    static void layoutImage(std::vector<AnchoredLine>& out,
                            const ImageBlock& image,
                            const PageSize& size,
                            const LayoutSettings& settings) {
        std::optional<std::string> caption = image.caption ? image.caption : image.alt;

        if (image.data) {
            int columns = size.width;
            int rows = imageRows(image, columns, size.height, settings);
            CP_LOGD("paginate: image id='%s' dims=%ux%u rows=%d",
                    image.id.c_str(), image.width.value_or(0), image.height.value_or(0), rows);
            std::string blank(static_cast<size_t>(columns), ' ');
            for (int row = 0; row < rows; ++row) {
                StyledLine line = StyledLine::plain(blank);
                if (row == 0) {
                    line.image = ImagePlacement{image.id, columns, rows};
                }
                out.push_back(AnchoredLine{std::move(line), {}});
            }
        } else {
            CP_LOGD("paginate: image id='%s' has no data, using text fallback", image.id.c_str());
            appendWrapped(out, linebreaker::wrapStyledText(imageFallbackText(image), size.width));
            caption = image.caption;  // Alt text is already part of the fallback
        }

        if (caption && !visibleText(*caption).empty()) {
            appendWrapped(out, linebreaker::wrapStyledText(*caption, size.width));
        }
    }
};

LayoutEngine::LayoutEngine(std::shared_ptr<const SyntaxHighlighter> highlighter)
    : impl_(std::make_unique<Impl>(std::move(highlighter))) {}

LayoutEngine::~LayoutEngine() = default;

LayoutEngine::LayoutEngine(LayoutEngine&&) noexcept = default;
LayoutEngine& LayoutEngine::operator=(LayoutEngine&&) noexcept = default;

Pagination LayoutEngine::paginate(const std::vector<Block>& blocks,
                                  const PageSize& size,
                                  const LayoutSettings& settings) const {
    return impl_->paginate(blocks, size, settings);
}

std::vector<AnchoredLine> LayoutEngine::layoutBlock(const Block& block,
                                                    const PageSize& size,
                                                    const LayoutSettings& settings) const {
    return impl_->layoutBlock(block, size, settings);
}

Pagination paginate(const std::vector<Block>& blocks, const PageSize& size, bool justify) {
    LayoutSettings settings;
    settings.justify = justify;
    return LayoutEngine().paginate(blocks, size, settings);
}

} // namespace cellpress
