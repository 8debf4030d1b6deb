#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace cellpress {

/// Text helpers over UTF-8. Every grapheme cluster occupies one cell.
namespace unicode {

/// Byte length of the UTF-8 sequence introduced by `lead`.
/// Returns 1 for invalid lead bytes so scanning always advances.
size_t utf8CharLen(unsigned char lead);

/// Split into extended grapheme clusters
std::vector<std::string> graphemes(const std::string& text);

/// Number of grapheme clusters, i.e. display width in cells
size_t graphemeCount(const std::string& text);

/// True if every code point of `g` is Unicode White_Space
bool isWhitespace(const std::string& g);

/// True for an explicit line break cluster ("\n" or "\r\n")
bool isLineBreak(const std::string& g);

/// Strip leading and trailing Unicode whitespace
std::string trim(const std::string& text);

/// Split on runs of Unicode whitespace; no empty pieces
std::vector<std::string> splitWhitespace(const std::string& text);

/// Join whitespace-separated pieces with single spaces
std::string collapseWhitespace(const std::string& text);

/// Uppercase ASCII letters, leave everything else untouched
std::string asciiUppercase(const std::string& text);

/// Lowercase ASCII letters, leave everything else untouched
std::string asciiLowercase(const std::string& text);

/// Full Unicode case folding, for caseless comparison
std::string foldCase(const std::string& text);

} // namespace unicode

} // namespace cellpress
