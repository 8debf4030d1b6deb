#pragma once

#include "cellpress/document.h"
#include "cellpress/style.h"
#include "cellpress/highlight.h"
#include "cellpress/layout.h"
#include "cellpress/page.h"
#include "cellpress/interaction.h"
#include "cellpress/words.h"
#include <memory>

namespace cellpress {

/// Main entry point for the reader core.
/// Keeps the block list and last settings so that resizes and streamed
/// chapters can be re-paginated without the caller re-supplying them.
class Engine {
public:
    explicit Engine(std::shared_ptr<const SyntaxHighlighter> highlighter = defaultHighlighter());
    ~Engine();

    /// Lay out a fresh block list into pages
    Pagination layoutBlocks(const std::vector<Block>& blocks,
                            const PageSize& pageSize,
                            const LayoutSettings& settings);

    /// Append streamed blocks and re-paginate the whole list
    Pagination appendBlocks(const std::vector<Block>& blocks);

    /// Re-layout the current blocks (e.g. viewport resized, justify toggled)
    Pagination relayout(const PageSize& pageSize,
                        const LayoutSettings& settings);

    /// Clamp a scroll position to the current page count
    int clampPage(int pageIndex) const;

    /// Words of the current block list for word-at-a-time playback
    std::vector<WordToken> words() const;

    const std::vector<Block>& blocks() const { return lastBlocks_; }
    const Pagination& pagination() const { return interactionMgr_.pagination(); }
    const PageSize& pageSize() const { return lastPageSize_; }
    const LayoutSettings& settings() const { return lastSettings_; }

    /// Chapter metadata for link resolution and page info
    void setChapterHrefs(const std::vector<std::string>& hrefs);
    void setChapterTitles(const std::vector<std::string>& titles);

    // -- Interaction queries (delegate to InteractionManager) ----------------

    std::optional<std::string> linkAt(int pageIndex, int lineIndex, int column) const;
    std::optional<std::string> segmentTextAt(int pageIndex, int lineIndex, int column) const;
    std::optional<size_t> chapterIndexForPage(int pageIndex) const;
    std::optional<int> chapterPercent(size_t chapterIndex, int pageIndex) const;
    std::optional<int> resolveTarget(const std::string& target, int currentPage) const;
    std::optional<int> searchForward(const std::string& query, int startPage) const;
    std::string pageText(int pageIndex) const;
    PageInfo getPageInfo(int pageIndex) const;

private:
    std::unique_ptr<LayoutEngine> layoutEngine_;
    std::vector<Block> lastBlocks_;
    PageSize lastPageSize_;
    LayoutSettings lastSettings_;
    InteractionManager interactionMgr_;

    Pagination paginateAndCache();
};

} // namespace cellpress
