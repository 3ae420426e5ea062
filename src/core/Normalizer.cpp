#include "bagindex/Normalizer.hpp"

#include "bagindex/Errors.hpp"
#include "bagindex/Utf8.hpp"

namespace bagindex {

Normalizer::Normalizer(const TrigramConfig& config)
    : characterSet_(canonicalCharacterSet(config.characterSet)),
      ngramSize_(config.ngramSize),
      normalize_(config.normalize) {
    std::vector<char32_t> chars;
    if (!utf8::decode(characterSet_, chars)) {
        throw ConfigError("character_set is not valid UTF-8");
    }
    members_.insert(chars.begin(), chars.end());
}

std::string Normalizer::normalize(std::string_view text) const {
    if (!normalize_) {
        return std::string(text);
    }

    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        pos += utf8::next(text, pos, cp);
        cp = utf8::toLower(cp);
        if (cp != utf8::kReplacement && members_.count(cp)) {
            if (pendingSpace && !out.empty()) {
                out.push_back(' ');
            }
            pendingSpace = false;
            utf8::append(out, cp);
        } else {
            pendingSpace = true;
        }
    }
    // A trailing folded run is dropped above; in-set whitespace is trimmed here.
    const auto bounds = utf8::boundaries(out);
    auto spaceAt = [&](size_t i) {
        char32_t c = 0;
        utf8::next(out, bounds[i], c);
        return utf8::isSpace(c);
    };
    size_t first = 0;
    size_t last = bounds.size() - 1;
    while (first < last && spaceAt(first)) ++first;
    while (last > first && spaceAt(last - 1)) --last;
    return out.substr(bounds[first], bounds[last] - bounds[first]);
}

std::vector<NGram> Normalizer::ngrams(std::string_view text) const {
    std::vector<NGram> grams;
    const auto bounds = utf8::boundaries(text);
    const size_t chars = bounds.size() - 1;
    const size_t n = static_cast<size_t>(ngramSize_);
    if (chars < n) {
        return grams;
    }
    grams.reserve(chars - n + 1);
    for (size_t i = 0; i + n <= chars; ++i) {
        grams.push_back({text.substr(bounds[i], bounds[i + n] - bounds[i]), static_cast<int64_t>(i)});
    }
    return grams;
}

std::string Normalizer::effectiveCharacterSet() const {
    if (normalize_ && !members_.count(U' ')) {
        return characterSet_ + " ";
    }
    return characterSet_;
}

} // namespace bagindex
