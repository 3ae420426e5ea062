#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "bagindex/BucketCodec.hpp"
#include "bagindex/IndexConfig.hpp"
#include "bagindex/Normalizer.hpp"
#include "bagindex/RecordStore.hpp"

namespace bagindex {

// TrigramConfig has no occupancy knob; n-gram buckets hold one entry on average.
constexpr double kTrigramBucketOccupancy = 1.0;

class TrigramWriter {
public:
    using Config = TrigramConfig;

    explicit TrigramWriter(TrigramConfig config);

    void addText(std::string_view text, int64_t recordId);
    // Merges an already built posting list for ngram into the accumulator.
    void addPostings(const std::string& ngram, const PostingList& postings);

    std::size_t documentCount() const { return documents_.size(); }
    std::size_t ngramCount() const { return postings_.size(); }
    const TrigramConfig& config() const { return config_; }

    // Throws EmptyIndexError when no document was added.
    void write(const std::string& path) const;
    uint64_t writeTo(RecordStore& store) const;

private:
    // (record id, offset); offset is 0 for indices without positions.
    using Posting = std::pair<int64_t, int64_t>;

    TrigramConfig config_;
    Normalizer normalizer_;
    std::unordered_map<std::string, std::vector<Posting>> postings_;
    std::unordered_set<int64_t> documents_;

    void addPosting(std::vector<Posting>& list, int64_t recordId, int64_t offset);
    PostingList buildPostingList(const std::vector<Posting>& raw) const;
};

class TrigramReader {
public:
    TrigramReader(std::shared_ptr<const RecordSource> store, TrigramConfig config,
                  uint64_t bucketCount, uint64_t ngramCount, uint64_t documentCount);

    // Ascending ids of records containing every n-gram of query; with stored
    // positions only records containing query as a contiguous substring.
    // Throws QueryTooShortError when the normalized query has fewer
    // characters than ngram_size.
    std::vector<int64_t> search(std::string_view query) const;

    bool requiresPostFiltering() const { return !config_.storePositions; }

    std::optional<PostingList> postingsFor(std::string_view ngram) const;
    PostingBucket readBucket(uint64_t slot) const;

    const TrigramConfig& config() const { return config_; }
    uint64_t bucketCount() const { return bucketCount_; }
    uint64_t ngramCount() const { return ngramCount_; }
    uint64_t documentCount() const { return documentCount_; }

private:
    std::shared_ptr<const RecordSource> store_;
    TrigramConfig config_;
    Normalizer normalizer_;
    uint64_t bucketCount_;
    uint64_t ngramCount_;
    uint64_t documentCount_;
};

} // namespace bagindex
