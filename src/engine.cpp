#include "cellpress/engine.h"
#include "cellpress/log.h"
#include <algorithm>

namespace cellpress {

Engine::Engine(std::shared_ptr<const SyntaxHighlighter> highlighter)
    : layoutEngine_(std::make_unique<LayoutEngine>(std::move(highlighter))) {}

Engine::~Engine() = default;

Pagination Engine::layoutBlocks(const std::vector<Block>& blocks,
                                const PageSize& pageSize,
                                const LayoutSettings& settings) {
    CP_LOGI("layoutBlocks: blocks=%zu page=%dx%d justify=%d",
            blocks.size(), pageSize.width, pageSize.height, settings.justify ? 1 : 0);

    lastBlocks_ = blocks;
    lastPageSize_ = pageSize;
    lastSettings_ = settings;

    if (lastBlocks_.empty()) {
        CP_LOGW("layoutBlocks: empty content");
    }
    return paginateAndCache();
}

Pagination Engine::appendBlocks(const std::vector<Block>& blocks) {
    CP_LOGI("appendBlocks: +%zu blocks (total %zu)",
            blocks.size(), lastBlocks_.size() + blocks.size());

    lastBlocks_.insert(lastBlocks_.end(), blocks.begin(), blocks.end());
    return paginateAndCache();
}

Pagination Engine::relayout(const PageSize& pageSize,
                            const LayoutSettings& settings) {
    CP_LOGI("relayout: blocks=%zu page=%dx%d justify=%d",
            lastBlocks_.size(), pageSize.width, pageSize.height, settings.justify ? 1 : 0);

    lastPageSize_ = pageSize;
    lastSettings_ = settings;
    return paginateAndCache();
}

int Engine::clampPage(int pageIndex) const {
    int total = static_cast<int>(pagination().pages.size());
    if (total == 0) { return 0; }
    return std::min(std::max(pageIndex, 0), total - 1);
}

std::vector<WordToken> Engine::words() const {
    return extractWords(lastBlocks_);
}

void Engine::setChapterHrefs(const std::vector<std::string>& hrefs) {
    interactionMgr_.setChapterHrefs(hrefs);
}

void Engine::setChapterTitles(const std::vector<std::string>& titles) {
    interactionMgr_.setChapterTitles(titles);
}

// ---------------------------------------------------------------------------
// Interaction query delegates
// ---------------------------------------------------------------------------

std::optional<std::string> Engine::linkAt(int pageIndex, int lineIndex, int column) const {
    return interactionMgr_.linkAt(pageIndex, lineIndex, column);
}

std::optional<std::string> Engine::segmentTextAt(int pageIndex, int lineIndex, int column) const {
    return interactionMgr_.segmentTextAt(pageIndex, lineIndex, column);
}

std::optional<size_t> Engine::chapterIndexForPage(int pageIndex) const {
    return interactionMgr_.chapterIndexForPage(pageIndex);
}

std::optional<int> Engine::chapterPercent(size_t chapterIndex, int pageIndex) const {
    return interactionMgr_.chapterPercent(chapterIndex, pageIndex);
}

std::optional<int> Engine::resolveTarget(const std::string& target, int currentPage) const {
    return interactionMgr_.resolveTarget(target, currentPage);
}

std::optional<int> Engine::searchForward(const std::string& query, int startPage) const {
    return interactionMgr_.searchForward(query, startPage);
}

std::string Engine::pageText(int pageIndex) const {
    return interactionMgr_.pageText(pageIndex);
}

PageInfo Engine::getPageInfo(int pageIndex) const {
    return interactionMgr_.getPageInfo(pageIndex);
}

// ---------------------------------------------------------------------------
// Internal
// ---------------------------------------------------------------------------

Pagination Engine::paginateAndCache() {
    auto result = layoutEngine_->paginate(lastBlocks_, lastPageSize_, lastSettings_);
    interactionMgr_.setPagination(result);
    return result;
}

} // namespace cellpress
