#include "cellpress/unicode.h"
#include "cellpress/log.h"

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utext.h>
#include <unicode/utf8.h>

#include <cctype>
#include <cstdint>
#include <memory>

namespace cellpress {

namespace unicode {

namespace {

/// Character (grapheme) break iterator, one per thread.
/// Null when ICU cannot build one; callers fall back to code points.
icu::BreakIterator* graphemeIterator() {
    thread_local std::unique_ptr<icu::BreakIterator> iter = [] {
        UErrorCode err = U_ZERO_ERROR;
        std::unique_ptr<icu::BreakIterator> it(
            icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), err));
        if (U_FAILURE(err)) {
            CP_LOGW("unicode: grapheme iterator unavailable (%s), using code points",
                    u_errorName(err));
            it.reset();
        }
        return it;
    }();
    return iter.get();
}

void codePointSplit(const std::string& text, std::vector<std::string>& out) {
    size_t i = 0;
    while (i < text.size()) {
        size_t len = utf8CharLen(static_cast<unsigned char>(text[i]));
        if (i + len > text.size()) len = text.size() - i;
        out.push_back(text.substr(i, len));
        i += len;
    }
}

/// Decode the code point at `pos` and advance it. Ill-formed bytes yield U+FFFD.
UChar32 nextCodePoint(const std::string& text, size_t& pos) {
    int32_t i = static_cast<int32_t>(pos);
    int32_t length = static_cast<int32_t>(text.size());
    UChar32 c = 0;
    U8_NEXT(reinterpret_cast<const uint8_t*>(text.data()), i, length, c);
    pos = static_cast<size_t>(i);
    return c < 0 ? 0xFFFD : c;
}

bool isSpaceCodePoint(UChar32 c) {
    return u_isUWhiteSpace(c) != 0;
}

} // anonymous namespace

size_t utf8CharLen(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1; // invalid byte, advance by 1
}

std::vector<std::string> graphemes(const std::string& text) {
    std::vector<std::string> out;
    if (text.empty()) return out;

    icu::BreakIterator* iter = graphemeIterator();
    if (iter != nullptr) {
        UErrorCode err = U_ZERO_ERROR;
        UText* ut = utext_openUTF8(nullptr, text.data(),
                                   static_cast<int64_t>(text.size()), &err);
        if (U_SUCCESS(err)) {
            // With a UTF-8 UText the iterator reports byte offsets
            iter->setText(ut, err);
            if (U_SUCCESS(err)) {
                int32_t start = iter->first();
                for (int32_t end = iter->next(); end != icu::BreakIterator::DONE;
                     start = end, end = iter->next()) {
                    out.push_back(text.substr(static_cast<size_t>(start),
                                              static_cast<size_t>(end - start)));
                }
            }
        }
        utext_close(ut);
        if (U_SUCCESS(err)) return out;
        CP_LOGW("unicode: grapheme segmentation failed (%s), using code points",
                u_errorName(err));
        out.clear();
    }

    codePointSplit(text, out);
    return out;
}

size_t graphemeCount(const std::string& text) {
    if (text.empty()) return 0;
    bool ascii = true;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc >= 0x80 || uc == '\r') {
            ascii = false;
            break;
        }
    }
    // Plain ASCII without CR: one cluster per byte
    if (ascii) return text.size();
    return graphemes(text).size();
}

bool isWhitespace(const std::string& g) {
    if (g.empty()) return false;
    size_t pos = 0;
    while (pos < g.size()) {
        if (!isSpaceCodePoint(nextCodePoint(g, pos))) return false;
    }
    return true;
}

bool isLineBreak(const std::string& g) {
    return g == "\n" || g == "\r\n";
}

std::string trim(const std::string& text) {
    size_t begin = text.size();
    size_t end = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t at = pos;
        UChar32 c = nextCodePoint(text, pos);
        if (!isSpaceCodePoint(c)) {
            if (begin == text.size()) begin = at;
            end = pos;
        }
    }
    if (begin >= end) return "";
    return text.substr(begin, end - begin);
}

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::vector<std::string> out;
    std::string current;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t at = pos;
        UChar32 c = nextCodePoint(text, pos);
        if (isSpaceCodePoint(c)) {
            if (!current.empty()) {
                out.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.append(text, at, pos - at);
        }
    }
    if (!current.empty()) out.push_back(std::move(current));
    return out;
}

std::string collapseWhitespace(const std::string& text) {
    std::string out;
    for (const auto& word : splitWhitespace(text)) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

std::string asciiUppercase(const std::string& text) {
    std::string out = text;
    for (auto& c : out) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80) c = static_cast<char>(std::toupper(uc));
    }
    return out;
}

std::string asciiLowercase(const std::string& text) {
    std::string out = text;
    for (auto& c : out) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80) c = static_cast<char>(std::tolower(uc));
    }
    return out;
}

std::string foldCase(const std::string& text) {
    std::string out;
    icu::UnicodeString::fromUTF8(text).foldCase().toUTF8String(out);
    return out;
}

} // namespace unicode

} // namespace cellpress
