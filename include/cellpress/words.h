#pragma once

#include "cellpress/document.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cellpress {

/// One word for word-at-a-time playback
struct WordToken {
    std::string text;
    bool isSentenceEnd = false;
    bool isComma = false;
    std::optional<size_t> chapterIndex;  // nullopt before the first chapter separator
};

/// Flatten blocks into words, markup stripped. Code blocks are skipped.
std::vector<WordToken> extractWords(const std::vector<Block>& blocks);

/// Ends in . ! ? : or ; once trailing ) ] " ' are ignored
bool isSentenceEnd(const std::string& word);

/// Ends in a comma, a dash or a closing parenthesis
bool isCommaPause(const std::string& word);

} // namespace cellpress
