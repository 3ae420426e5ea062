#include "bagindex/algorithms/PostingMatch.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace bagindex::algo {

namespace {

// Advance pos to the first id >= target, galloping from pos.
inline void advanceTo(const std::vector<int64_t>& list, size_t& pos, int64_t target) {
    if (pos >= list.size() || list[pos] >= target) return;
    size_t step = 1;
    size_t hi = pos + 1;
    while (hi < list.size() && list[hi] < target) {
        pos = hi;
        step *= 2;
        hi = pos + step;
    }
    hi = std::min(hi, list.size());
    pos = static_cast<size_t>(std::lower_bound(list.begin() + pos, list.begin() + hi, target) - list.begin());
}

// Index range of rid inside a posting list sorted by (record id, offset).
std::pair<size_t, size_t> recordRange(const PostingList& plist, int64_t rid) {
    auto range = std::equal_range(plist.recordIds.begin(), plist.recordIds.end(), rid);
    return {static_cast<size_t>(range.first - plist.recordIds.begin()),
            static_cast<size_t>(range.second - plist.recordIds.begin())};
}

bool hasOffset(const PostingList& plist, std::pair<size_t, size_t> range, int64_t offset) {
    auto first = plist.recordOffsets.begin() + static_cast<std::ptrdiff_t>(range.first);
    auto last = plist.recordOffsets.begin() + static_cast<std::ptrdiff_t>(range.second);
    return std::binary_search(first, last, offset);
}

} // namespace

std::vector<int64_t> distinctRecordIds(const PostingList& plist) {
    std::vector<int64_t> ids = plist.recordIds;
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

std::vector<int64_t> intersectAll(const std::vector<std::vector<int64_t>>& lists) {
    if (lists.empty()) return {};
    for (const auto& l : lists) {
        if (l.empty()) return {};
    }
    // sort by list size to reduce work
    std::vector<size_t> order(lists.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return lists[a].size() < lists[b].size();
    });

    std::vector<size_t> pos(lists.size(), 0);
    std::vector<int64_t> out;
    const auto& shortest = lists[order[0]];
    int64_t target = shortest[0];

    while (true) {
        bool anyEnd = false;
        int64_t maxDoc = target;
        for (size_t k = 0; k < order.size(); ++k) {
            size_t idx = order[k];
            advanceTo(lists[idx], pos[idx], target);
            if (pos[idx] >= lists[idx].size()) { anyEnd = true; break; }
            maxDoc = std::max(maxDoc, lists[idx][pos[idx]]);
        }
        if (anyEnd) break;
        bool allEqual = true;
        for (size_t k = 0; k < order.size(); ++k) {
            size_t idx = order[k];
            if (lists[idx][pos[idx]] != maxDoc) {
                allEqual = false;
                break;
            }
        }
        if (allEqual) {
            out.push_back(maxDoc);
            for (size_t k = 0; k < order.size(); ++k) {
                ++pos[order[k]];
            }
            if (pos[order[0]] >= shortest.size()) break;
            target = shortest[pos[order[0]]];
        } else {
            target = maxDoc;
        }
    }
    return out;
}

std::vector<int64_t> verifyChains(const std::vector<GramPostings>& grams, const std::vector<int64_t>& candidates) {
    if (grams.empty()) return {};
    std::vector<int64_t> out;
    std::vector<std::pair<size_t, size_t>> ranges(grams.size());
    for (int64_t rid : candidates) {
        bool present = true;
        for (size_t g = 0; g < grams.size(); ++g) {
            ranges[g] = recordRange(*grams[g].postings, rid);
            if (ranges[g].first == ranges[g].second) { present = false; break; }
        }
        if (!present) continue;

        // Anchor on the gram with the fewest occurrences in this record.
        size_t anchor = 0;
        for (size_t g = 1; g < grams.size(); ++g) {
            if (ranges[g].second - ranges[g].first < ranges[anchor].second - ranges[anchor].first) anchor = g;
        }
        const PostingList& anchorList = *grams[anchor].postings;
        bool matched = false;
        for (size_t i = ranges[anchor].first; i < ranges[anchor].second && !matched; ++i) {
            const int64_t start = anchorList.recordOffsets[i] - grams[anchor].relativeOffset;
            if (start < 0) continue;
            matched = true;
            for (size_t g = 0; g < grams.size(); ++g) {
                if (g == anchor) continue;
                if (!hasOffset(*grams[g].postings, ranges[g], start + grams[g].relativeOffset)) {
                    matched = false;
                    break;
                }
            }
        }
        if (matched) out.push_back(rid);
    }
    return out;
}

} // namespace bagindex::algo
