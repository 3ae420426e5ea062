#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "bagindex/IndexConfig.hpp"

namespace bagindex {

struct NGram {
    std::string_view text;
    int64_t offset;
};

// Turns raw text into the character stream that n-grams are cut from.
// Characters are UTF-8 code points; offsets count code points of the
// normalized stream.
class Normalizer {
public:
    explicit Normalizer(const TrigramConfig& config);

    // Lowercases, folds runs of out-of-set characters to one space and trims
    // surrounding whitespace when normalization is on; returns the text
    // unchanged otherwise.
    std::string normalize(std::string_view text) const;

    // Overlapping windows of ngramSize characters with stride 1. Views point
    // into text.
    std::vector<NGram> ngrams(std::string_view text) const;

    std::string effectiveCharacterSet() const;
    bool inCharacterSet(char32_t ch) const { return members_.count(ch) != 0; }
    int ngramSize() const { return ngramSize_; }

private:
    std::unordered_set<char32_t> members_;
    std::string characterSet_;
    int ngramSize_;
    bool normalize_;
};

} // namespace bagindex
