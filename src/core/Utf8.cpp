#include "bagindex/Utf8.hpp"

namespace bagindex::utf8 {

namespace {

bool isContinuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

} // namespace

std::size_t next(std::string_view text, std::size_t pos, char32_t& cp) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) {
        cp = lead;
        return 1;
    }

    std::size_t len = 0;
    char32_t value = 0;
    char32_t min = 0;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2; value = lead & 0x1F; min = 0x80;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3; value = lead & 0x0F; min = 0x800;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4; value = lead & 0x07; min = 0x10000;
    } else {
        cp = kReplacement;
        return 1;
    }
    if (text.size() - pos < len) {
        cp = kReplacement;
        return 1;
    }
    for (std::size_t i = 1; i < len; ++i) {
        const auto b = static_cast<unsigned char>(text[pos + i]);
        if (!isContinuation(b)) {
            cp = kReplacement;
            return 1;
        }
        value = (value << 6) | (b & 0x3F);
    }
    // overlong forms, surrogates and values past U+10FFFF
    if (value < min || (value >= 0xD800 && value <= 0xDFFF) || value > 0x10FFFF) {
        cp = kReplacement;
        return 1;
    }
    cp = value;
    return len;
}

bool decode(std::string_view text, std::vector<char32_t>& out) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        const std::size_t len = next(text, pos, cp);
        if (cp == kReplacement && len == 1) {
            return false;
        }
        out.push_back(cp);
        pos += len;
    }
    return true;
}

void append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::vector<std::size_t> boundaries(std::string_view text) {
    std::vector<std::size_t> out;
    out.reserve(text.size() + 1);
    std::size_t pos = 0;
    while (pos < text.size()) {
        out.push_back(pos);
        char32_t cp = 0;
        pos += next(text, pos, cp);
    }
    out.push_back(text.size());
    return out;
}

std::size_t length(std::string_view text) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        pos += next(text, pos, cp);
        ++count;
    }
    return count;
}

char32_t toLower(char32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
    if (cp < 0xC0) return cp;
    if (cp <= 0xDE && cp != 0xD7) return cp + 0x20;        // Latin-1 capitals
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) return cp + 0x20; // Greek
    if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;      // Cyrillic
    if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
    return cp;
}

bool isSpace(char32_t cp) {
    switch (cp) {
    case ' ': case '\t': case '\n': case '\v': case '\f': case '\r':
    case 0x1C: case 0x1D: case 0x1E: case 0x1F:
    case 0x85: case 0xA0: case 0x1680: case 0x2028: case 0x2029:
    case 0x202F: case 0x205F: case 0x3000:
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

} // namespace bagindex::utf8
