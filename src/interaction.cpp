#include "cellpress/interaction.h"
#include "cellpress/markup.h"
#include "cellpress/unicode.h"
#include "cellpress/log.h"
#include <algorithm>
#include <cmath>

namespace cellpress {
namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool looksLikeFileName(const std::string& text) {
    std::string lower = unicode::asciiLowercase(text);
    return endsWith(lower, ".xhtml") || endsWith(lower, ".html") || endsWith(lower, ".htm");
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Free helpers
// ---------------------------------------------------------------------------

std::string normalizeAnchorTarget(const std::string& href) {
    std::string target = unicode::trim(href);
    while (target.compare(0, 2, "./") == 0) {
        target.erase(0, 2);
    }
    return target;
}

std::string sanitizeChapterTitle(const std::string& raw) {
    std::string stripped = unicode::trim(markup::strip(unicode::trim(raw)));
    if (stripped.empty()) { return {}; }

    bool hasPath = stripped.find('/') != std::string::npos ||
                   stripped.find('\\') != std::string::npos;
    if (!looksLikeFileName(stripped) && !hasPath) {
        return stripped;
    }

    // "text/chapter_01.xhtml#top" → "chapter 01"
    std::string s = stripped;
    size_t cut = s.find_first_of("#?");
    if (cut != std::string::npos) { s.erase(cut); }
    size_t slash = s.find_last_of("/\\");
    if (slash != std::string::npos) { s.erase(0, slash + 1); }

    std::string lower = unicode::asciiLowercase(s);
    for (const char* ext : {".xhtml", ".html", ".htm"}) {
        std::string e(ext);
        if (endsWith(lower, e) && s.size() > e.size()) {
            s.erase(s.size() - e.size());
            break;
        }
    }
    std::replace_if(s.begin(), s.end(),
                    [](char c) { return c == '_' || c == '-' || c == '.'; }, ' ');

    std::string cleaned = unicode::collapseWhitespace(s);
    return cleaned.empty() ? stripped : cleaned;
}

// ---------------------------------------------------------------------------
// InteractionManager
// ---------------------------------------------------------------------------

void InteractionManager::setPagination(const Pagination& pagination) {
    pagination_ = pagination;

    CP_LOGD("InteractionManager: cached %zu pages, %zu chapters, %zu anchors",
            pagination_.pages.size(), pagination_.chapterStarts.size(),
            pagination_.anchors.size());
}

void InteractionManager::setChapterHrefs(const std::vector<std::string>& hrefs) {
    chapterHrefs_.clear();
    chapterHrefs_.reserve(hrefs.size());
    for (const auto& href : hrefs) {
        chapterHrefs_.push_back(normalizeAnchorTarget(href));
    }
}

void InteractionManager::setChapterTitles(const std::vector<std::string>& titles) {
    chapterTitles_ = titles;
}

const Page* InteractionManager::getPage(int pageIndex) const {
    if (pageIndex < 0 || pageIndex >= static_cast<int>(pagination_.pages.size())) {
        return nullptr;
    }
    return &pagination_.pages[pageIndex];
}

const Segment* InteractionManager::segmentAt(int pageIndex, int lineIndex, int column) const {
    const Page* page = getPage(pageIndex);
    if (page == nullptr || column < 0) { return nullptr; }
    if (lineIndex < 0 || lineIndex >= static_cast<int>(page->lines.size())) { return nullptr; }

    size_t offset = 0;
    for (const auto& seg : page->lines[lineIndex].segments) {
        size_t len = unicode::graphemeCount(seg.text);
        if (static_cast<size_t>(column) < offset + len) {
            return &seg;
        }
        offset += len;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Cell queries
// ---------------------------------------------------------------------------

std::optional<std::string> InteractionManager::linkAt(int pageIndex, int lineIndex,
                                                      int column) const {
    const Segment* seg = segmentAt(pageIndex, lineIndex, column);
    if (seg == nullptr) { return std::nullopt; }
    return seg->link;
}

std::optional<std::string> InteractionManager::segmentTextAt(int pageIndex, int lineIndex,
                                                             int column) const {
    const Segment* seg = segmentAt(pageIndex, lineIndex, column);
    if (seg == nullptr) { return std::nullopt; }
    return seg->text;
}

// ---------------------------------------------------------------------------
// Chapters
// ---------------------------------------------------------------------------

std::optional<size_t> InteractionManager::chapterIndexForPage(int pageIndex) const {
    const auto& starts = pagination_.chapterStarts;
    if (starts.empty()) { return std::nullopt; }

    size_t idx = 0;
    for (size_t i = 0; i < starts.size(); ++i) {
        if (starts[i] <= pageIndex) {
            idx = i;
        } else {
            break;
        }
    }
    return idx;
}

std::optional<std::pair<int, int>> InteractionManager::chapterPageRange(size_t chapterIndex) const {
    const auto& starts = pagination_.chapterStarts;
    if (chapterIndex >= starts.size()) { return std::nullopt; }

    int start = starts[chapterIndex];
    int end = chapterIndex + 1 < starts.size()
                  ? starts[chapterIndex + 1]
                  : static_cast<int>(pagination_.pages.size());
    if (end <= start) { return std::nullopt; }
    return std::make_pair(start, end);
}

std::optional<int> InteractionManager::chapterPercent(size_t chapterIndex, int pageIndex) const {
    auto range = chapterPageRange(chapterIndex);
    if (!range) { return std::nullopt; }

    int length = range->second - range->first;
    int pos = std::min(std::max(pageIndex - range->first, 0), length - 1);
    int pct = static_cast<int>(std::lround(
        static_cast<double>(pos + 1) / static_cast<double>(length) * 100.0));
    return std::min(std::max(pct, 1), 100);
}

std::string InteractionManager::chapterLabel(size_t chapterIndex) const {
    std::string title;
    if (chapterIndex < chapterTitles_.size()) {
        title = sanitizeChapterTitle(chapterTitles_[chapterIndex]);
    }
    if (title.empty()) {
        return "Chapter " + std::to_string(chapterIndex + 1);
    }
    return title;
}

// ---------------------------------------------------------------------------
// resolveTarget — anchor, then fragment within the current chapter, then chapter href
// ---------------------------------------------------------------------------

std::optional<int> InteractionManager::resolveTarget(const std::string& target,
                                                     int currentPage) const {
    std::string key = normalizeAnchorTarget(target);
    if (key.empty()) { return std::nullopt; }

    auto it = pagination_.anchors.find(key);
    if (it != pagination_.anchors.end()) {
        return it->second;
    }

    if (key[0] == '#') {
        auto chapter = chapterIndexForPage(currentPage);
        if (chapter && *chapter < chapterHrefs_.size()) {
            auto full = pagination_.anchors.find(chapterHrefs_[*chapter] + key);
            if (full != pagination_.anchors.end()) {
                return full->second;
            }
        }
    }

    std::string path = key.substr(0, key.find('#'));
    auto href = std::find(chapterHrefs_.begin(), chapterHrefs_.end(), path);
    if (!path.empty() && href != chapterHrefs_.end()) {
        size_t idx = static_cast<size_t>(href - chapterHrefs_.begin());
        if (idx < pagination_.chapterStarts.size()) {
            return pagination_.chapterStarts[idx];
        }
    }

    CP_LOGD("resolveTarget: no page for '%s'", key.c_str());
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Search and text
// ---------------------------------------------------------------------------

std::optional<int> InteractionManager::searchForward(const std::string& query,
                                                     int startPage) const {
    std::string needle = unicode::foldCase(unicode::trim(query));
    int total = static_cast<int>(pagination_.pages.size());
    if (needle.empty() || total == 0) { return std::nullopt; }

    int start = ((startPage % total) + total) % total;
    for (int offset = 0; offset < total; ++offset) {
        int idx = (start + offset) % total;
        std::string haystack;
        const auto& lines = pagination_.pages[idx].lines;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) { haystack += ' '; }
            haystack += lines[i].text();
        }
        if (unicode::foldCase(haystack).find(needle) != std::string::npos) {
            return idx;
        }
    }
    return std::nullopt;
}

std::string InteractionManager::pageText(int pageIndex) const {
    const Page* page = getPage(pageIndex);
    if (page == nullptr) { return {}; }

    std::string out;
    for (size_t i = 0; i < page->lines.size(); ++i) {
        if (i > 0) { out += '\n'; }
        out += page->lines[i].text();
    }
    return out;
}

// ---------------------------------------------------------------------------
// getPageInfo — page metadata
// ---------------------------------------------------------------------------

PageInfo InteractionManager::getPageInfo(int pageIndex) const {
    PageInfo info;
    int total = static_cast<int>(pagination_.pages.size());
    info.totalPages = total;
    if (total == 0) { return info; }

    int clamped = std::min(std::max(pageIndex, 0), total - 1);
    info.currentPage = clamped + 1;
    info.progress = static_cast<float>(clamped + 1) / static_cast<float>(total);

    info.chapterCount = static_cast<int>(pagination_.chapterStarts.size());
    if (auto chapter = chapterIndexForPage(clamped)) {
        info.chapterIndex = static_cast<int>(*chapter);
        info.chapterLabel = chapterLabel(*chapter);
        info.chapterPercent = chapterPercent(*chapter, clamped).value_or(0);
    }
    return info;
}

} // namespace cellpress
