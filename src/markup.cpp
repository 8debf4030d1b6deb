#include "cellpress/markup.h"
#include "cellpress/unicode.h"
#include "cellpress/log.h"

namespace cellpress {

namespace markup {

namespace {

bool isMarker(char c) {
    return c == STYLE_START || c == STYLE_END || c == LINK_START ||
           c == LINK_END || c == ANCHOR_START || c == ANCHOR_END;
}

/// Collects spans while tracking the active style and link
struct Decoder {
    std::vector<InlinePiece> pieces;
    std::string current;
    StyleCounts counts;
    std::optional<std::string> link;

    void flush() {
        if (current.empty()) return;
        pieces.push_back(InlinePiece::span(current, counts.resolve(), link));
        current.clear();
    }
};

/// Read bytes after an opener up to `closer`. Returns false if input ends first.
bool readUntil(const std::string& text, size_t& pos, char closer, std::string& out) {
    while (pos < text.size()) {
        char c = text[pos++];
        if (c == closer) return true;
        out += c;
    }
    return false;
}

} // anonymous namespace

bool isStyleCode(char c) {
    return c == 'b' || c == 'i' || c == 'u' || c == 'c' || c == 'x' || c == 's';
}

bool StyleCounts::apply(char code, bool open) {
    uint16_t* target = nullptr;
    switch (code) {
        case 'b': target = &bold; break;
        case 'i': target = &italic; break;
        case 'u': target = &underline; break;
        case 'c': target = &this->code; break;
        case 'x': target = &strike; break;
        case 's': target = &smallCaps; break;
        default: return false;
    }
    if (open) {
        if (*target < UINT16_MAX) ++*target;
    } else if (*target > 0) {
        --*target;
    }
    return true;
}

TextStyle StyleCounts::resolve() const {
    TextStyle s;
    s.bold = bold > 0;
    s.italic = italic > 0;
    s.underline = underline > 0;
    s.dim = code > 0;
    s.reverse = code > 0;
    s.strikethrough = strike > 0;
    s.smallCaps = smallCaps > 0;
    return s;
}

bool hasMarkers(const std::string& text) {
    for (char c : text) {
        if (isMarker(c)) return true;
    }
    return false;
}

std::vector<InlinePiece> decode(const std::string& text) {
    Decoder d;
    size_t pos = 0;
    while (pos < text.size()) {
        char ch = text[pos++];

        if (ch == STYLE_START || ch == STYLE_END) {
            if (pos >= text.size()) {
                CP_LOGD("markup: dangling style marker at end of input");
                d.current += ch;
                break;
            }
            char codeChar = text[pos];
            if (isStyleCode(codeChar)) {
                ++pos;
                d.flush();
                d.counts.apply(codeChar, ch == STYLE_START);
                continue;
            }
            // Unknown code: keep the marker and the following character as text
            size_t len = unicode::utf8CharLen(static_cast<unsigned char>(codeChar));
            if (pos + len > text.size()) len = text.size() - pos;
            d.current += ch;
            d.current.append(text, pos, len);
            pos += len;
            continue;
        }

        if (ch == LINK_START) {
            std::string target;
            if (!readUntil(text, pos, LINK_END, target)) {
                CP_LOGD("markup: unterminated link marker");
                d.current += ch;
                d.current += target;
                break;
            }
            d.flush();
            if (target.empty()) {
                d.link.reset();
            } else {
                d.link = target;
            }
            continue;
        }

        if (ch == ANCHOR_START) {
            std::string name;
            if (!readUntil(text, pos, ANCHOR_END, name)) {
                CP_LOGD("markup: unterminated anchor marker");
                d.current += ch;
                d.current += name;
                break;
            }
            d.flush();
            name = unicode::trim(name);
            if (!name.empty()) {
                d.pieces.push_back(InlinePiece::anchor(name));
            }
            continue;
        }

        d.current += ch;
    }
    d.flush();
    return d.pieces;
}

std::string strip(const std::string& text) {
    if (!hasMarkers(text)) return text;
    std::string out;
    out.reserve(text.size());
    for (const auto& piece : decode(text)) {
        if (piece.type == PieceType::Span) {
            out += piece.text;
        }
    }
    return out;
}

std::string styleStart(StyleCode code) {
    return std::string{STYLE_START, static_cast<char>(code)};
}

std::string styleEnd(StyleCode code) {
    return std::string{STYLE_END, static_cast<char>(code)};
}

std::string styled(StyleCode code, const std::string& text) {
    return styleStart(code) + text + styleEnd(code);
}

std::string linkStart(const std::string& target) {
    std::string t = unicode::trim(target);
    if (t.empty()) return "";
    return std::string(1, LINK_START) + t + LINK_END;
}

std::string linkEnd() {
    return std::string{LINK_START, LINK_END};
}

std::string linked(const std::string& target, const std::string& text) {
    std::string open = linkStart(target);
    if (open.empty()) return text;
    return open + text + linkEnd();
}

std::string anchor(const std::string& name) {
    return std::string(1, ANCHOR_START) + name + ANCHOR_END;
}

} // namespace markup

} // namespace cellpress
