#pragma once

#include <cstdint>
#include <vector>

#include "bagindex/BucketCodec.hpp"

namespace bagindex::algo {

// Distinct record ids of a posting list, ascending.
std::vector<int64_t> distinctRecordIds(const PostingList& plist);

// Intersect ascending id lists (AND semantics).
std::vector<int64_t> intersectAll(const std::vector<std::vector<int64_t>>& lists);

// Query n-gram at relativeOffset with its fetched postings.
struct GramPostings {
    int64_t relativeOffset;
    const PostingList* postings;
};

// Keeps the candidates that contain a start offset s such that every gram
// has a posting at s + relativeOffset in the same record.
std::vector<int64_t> verifyChains(const std::vector<GramPostings>& grams, const std::vector<int64_t>& candidates);

} // namespace bagindex::algo
