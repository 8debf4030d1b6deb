#include "cellpress/words.h"
#include "cellpress/layout.h"
#include "cellpress/markup.h"
#include "cellpress/unicode.h"
#include "cellpress/log.h"

namespace cellpress {
namespace {

const char* const kImagePlaceholder = "[image]";

std::string trimClosers(const std::string& word) {
    size_t end = word.find_last_not_of(")]\"'");
    return end == std::string::npos ? std::string() : word.substr(0, end + 1);
}

void appendWords(std::vector<WordToken>& out, const std::string& text,
                 std::optional<size_t> chapter) {
    for (auto& word : unicode::splitWhitespace(markup::strip(text))) {
        WordToken token;
        token.isSentenceEnd = isSentenceEnd(word);
        token.isComma = isCommaPause(word);
        token.chapterIndex = chapter;
        token.text = std::move(word);
        out.push_back(std::move(token));
    }
}

} // anonymous namespace

bool isSentenceEnd(const std::string& word) {
    std::string trimmed = trimClosers(word);
    if (trimmed.empty()) return false;
    char last = trimmed.back();
    return last == '.' || last == '!' || last == '?' || last == ':' || last == ';';
}

bool isCommaPause(const std::string& word) {
    if (word.empty()) return false;
    if (word.back() == ')') return true;
    std::string trimmed = trimClosers(word);
    if (trimmed.empty()) return false;
    return trimmed.back() == ',' || trimmed.back() == '-';
}

std::vector<WordToken> extractWords(const std::vector<Block>& blocks) {
    std::vector<WordToken> words;
    std::optional<size_t> chapter;
    size_t chapterCounter = 0;

    for (size_t idx = 0; idx < blocks.size(); ++idx) {
        const Block& block = blocks[idx];
        switch (block.type) {
            case BlockType::Code:
                break;

            case BlockType::Paragraph: {
                std::string visible = unicode::trim(markup::strip(block.text));
                if (visible == kSeparatorGlyphs) {
                    if (isChapterSeparator(blocks, idx)) {
                        chapter = ++chapterCounter;
                    }
                    break;
                }
                if (visible == kImagePlaceholder) break;
                appendWords(words, block.text, chapter);
                break;
            }

            case BlockType::Heading:
            case BlockType::Quote:
                appendWords(words, block.text, chapter);
                break;

            case BlockType::List:
                for (const auto& item : block.items) {
                    appendWords(words, item, chapter);
                }
                break;

            case BlockType::Image: {
                const auto& label = block.image.caption ? block.image.caption : block.image.alt;
                if (label) appendWords(words, *label, chapter);
                break;
            }

            case BlockType::Table:
                for (const auto& row : block.table.rows) {
                    for (const auto& cell : row) {
                        appendWords(words, cell.text, chapter);
                    }
                }
                break;
        }
    }

    CP_LOGD("extractWords: %zu blocks -> %zu words, %zu chapters",
            blocks.size(), words.size(), chapterCounter);
    return words;
}

} // namespace cellpress
