#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace bagindex::utf8 {

constexpr char32_t kReplacement = 0xFFFD;

// Decodes the character starting at text[pos] into cp and returns its byte
// length. A malformed sequence counts as one byte and decodes to kReplacement.
std::size_t next(std::string_view text, std::size_t pos, char32_t& cp);

// Strict decode; false when text is not well-formed UTF-8.
bool decode(std::string_view text, std::vector<char32_t>& out);

void append(std::string& out, char32_t cp);

// Byte offset of every character start, plus text.size() as the last entry.
std::vector<std::size_t> boundaries(std::string_view text);

std::size_t length(std::string_view text);

// Simple case folding for ASCII, Latin-1, Greek and Cyrillic capitals.
char32_t toLower(char32_t cp);

bool isSpace(char32_t cp);

} // namespace bagindex::utf8
