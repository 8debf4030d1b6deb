#pragma once

#include "cellpress/page.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cellpress {

/// Page metadata for header/footer rendering
struct PageInfo {
    std::string chapterLabel;
    int chapterIndex = -1;   // -1 when the document has no chapters
    int chapterCount = 0;
    int chapterPercent = 0;  // 1..100 within the chapter, 0 if unknown
    int currentPage = 0;     // 1-based page number
    int totalPages = 0;
    float progress = 0;      // 0.0 ~ 1.0
};

// ---------------------------------------------------------------------------
// InteractionManager — read-only query layer over a cached Pagination
// ---------------------------------------------------------------------------

class InteractionManager {
public:
    InteractionManager() = default;

    /// Update the cached pagination for subsequent queries
    void setPagination(const Pagination& pagination);

    /// Chapter hrefs ("text/ch01.xhtml"), indexed like chapterStarts
    void setChapterHrefs(const std::vector<std::string>& hrefs);

    /// Display titles, indexed like chapterStarts
    void setChapterTitles(const std::vector<std::string>& titles);

    const Pagination& pagination() const { return pagination_; }

    /// Link target of the segment covering a cell
    std::optional<std::string> linkAt(int pageIndex, int lineIndex, int column) const;

    /// Text of the segment covering a cell
    std::optional<std::string> segmentTextAt(int pageIndex, int lineIndex, int column) const;

    /// Last chapter whose start page is <= pageIndex
    std::optional<size_t> chapterIndexForPage(int pageIndex) const;

    /// [start, end) page range of a chapter
    std::optional<std::pair<int, int>> chapterPageRange(size_t chapterIndex) const;

    /// Position of pageIndex inside the chapter, 1..100
    std::optional<int> chapterPercent(size_t chapterIndex, int pageIndex) const;

    /// Anchor name, "#fragment" or chapter href → page index
    std::optional<int> resolveTarget(const std::string& target, int currentPage) const;

    /// First page at or after startPage containing query (ASCII case-insensitive),
    /// wrapping around to the beginning
    std::optional<int> searchForward(const std::string& query, int startPage) const;

    /// Plain text of a page, one row per line
    std::string pageText(int pageIndex) const;

    /// Cleaned-up chapter title, or "Chapter N"
    std::string chapterLabel(size_t chapterIndex) const;

    /// Page metadata (chapter label, progress, etc.)
    PageInfo getPageInfo(int pageIndex) const;

private:
    Pagination pagination_;
    std::vector<std::string> chapterHrefs_;
    std::vector<std::string> chapterTitles_;

    const Page* getPage(int pageIndex) const;
    const Segment* segmentAt(int pageIndex, int lineIndex, int column) const;
};

/// Trim whitespace and a leading "./" from an in-document href
std::string normalizeAnchorTarget(const std::string& href);

/// Strip markers and file-name noise from a navigation title
std::string sanitizeChapterTitle(const std::string& raw);

} // namespace cellpress
