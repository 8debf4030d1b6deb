#include "cellpress/highlight.h"
#include "cellpress/log.h"

namespace cellpress {

std::vector<HighlightLine> plainLines(const std::string& code) {
    std::vector<HighlightLine> out;
    size_t start = 0;
    while (start < code.size()) {
        size_t nl = code.find('\n', start);
        size_t end = (nl == std::string::npos) ? code.size() : nl;
        std::string line = code.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();

        HighlightLine hl;
        if (!line.empty()) {
            hl.spans.push_back(HighlightSpan{line, std::nullopt, std::nullopt});
        }
        out.push_back(std::move(hl));

        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    if (out.empty()) {
        out.push_back(HighlightLine{});
    }
    return out;
}

std::vector<HighlightLine> PlainTextHighlighter::highlight(const std::optional<std::string>& lang,
                                                           const std::string& code) const {
    CP_LOGD("highlight: plain text for lang='%s' bytes=%zu",
            lang ? lang->c_str() : "", code.size());
    return plainLines(code);
}

std::shared_ptr<const SyntaxHighlighter> defaultHighlighter() {
    static const std::shared_ptr<const SyntaxHighlighter> instance =
        std::make_shared<PlainTextHighlighter>();
    return instance;
}

} // namespace cellpress
