#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bagindex {

struct HashRecord {
    std::string key;
    std::vector<int64_t> recordIds; // strictly ascending
};

// Records sorted by key byte order, each key at most once.
struct HashBucket {
    std::vector<HashRecord> records;
};

// Parallel arrays sorted by (record id, offset). recordOffsets is empty for
// indices built without positions.
struct PostingList {
    std::vector<int64_t> recordIds;
    std::vector<int64_t> recordOffsets;
};

struct PostingEntry {
    std::string ngram;
    PostingList postings;
};

// Entries sorted by n-gram byte order.
struct PostingBucket {
    std::vector<PostingEntry> entries;
};

std::string encodeHashBucket(const HashBucket& bucket);
// Throws CorruptIndexError when bytes do not decode or keys are out of order.
HashBucket decodeHashBucket(std::string_view bytes);

// Binary search by key; nullptr when absent.
const HashRecord* findRecord(const HashBucket& bucket, std::string_view key);

std::string encodePostingBucket(const PostingBucket& bucket, bool withPositions, bool deltaEncode);
PostingBucket decodePostingBucket(std::string_view bytes);

const PostingEntry* findEntry(const PostingBucket& bucket, std::string_view ngram);

// In-place delta transforms over a sorted id list.
void deltaEncode(std::vector<int64_t>& ids);
void deltaDecode(std::vector<int64_t>& ids);

} // namespace bagindex
