#include "bagindex/BucketCodec.hpp"

#include <algorithm>

#include "bagindex/Errors.hpp"
#include "LittleEndian.hpp"

namespace bagindex {

namespace {

using detail::readLE;
using detail::writeLE;

constexpr uint8_t kFlagPositions = 0x1;
constexpr uint8_t kFlagDelta = 0x2;

void writeBytes(std::string& out, std::string_view bytes) {
    writeLE(out, static_cast<uint32_t>(bytes.size()));
    out.append(bytes.data(), bytes.size());
}

void writeIds(std::string& out, const std::vector<int64_t>& ids) {
    for (int64_t id : ids) writeLE(out, id);
}

std::string readBytes(std::string_view data, size_t& cursor, const char* what) {
    uint32_t len = 0;
    if (!readLE(data, cursor, len) || data.size() - cursor < len) {
        throw CorruptIndexError(std::string("truncated ") + what);
    }
    std::string out(data.substr(cursor, len));
    cursor += len;
    return out;
}

std::vector<int64_t> readIds(std::string_view data, size_t& cursor, uint32_t count, const char* what) {
    if ((data.size() - cursor) / sizeof(int64_t) < count) {
        throw CorruptIndexError(std::string("truncated ") + what);
    }
    std::vector<int64_t> ids(count);
    for (uint32_t i = 0; i < count; ++i) {
        readLE(data, cursor, ids[i]);
    }
    return ids;
}

} // namespace

void deltaEncode(std::vector<int64_t>& ids) {
    // Differences are taken modulo 2^64 so extreme ids cannot overflow.
    for (size_t i = ids.size(); i-- > 1;) {
        ids[i] = static_cast<int64_t>(static_cast<uint64_t>(ids[i]) - static_cast<uint64_t>(ids[i - 1]));
    }
}

void deltaDecode(std::vector<int64_t>& ids) {
    for (size_t i = 1; i < ids.size(); ++i) {
        ids[i] = static_cast<int64_t>(static_cast<uint64_t>(ids[i]) + static_cast<uint64_t>(ids[i - 1]));
    }
}

// -----------------------------------------------------------
// Hash buckets
// -----------------------------------------------------------
std::string encodeHashBucket(const HashBucket& bucket) {
    std::string out;
    writeLE(out, static_cast<uint32_t>(bucket.records.size()));
    for (const auto& record : bucket.records) {
        writeBytes(out, record.key);
        writeLE(out, static_cast<uint32_t>(record.recordIds.size()));
        writeIds(out, record.recordIds);
    }
    return out;
}

HashBucket decodeHashBucket(std::string_view bytes) {
    HashBucket bucket;
    size_t cursor = 0;
    uint32_t count = 0;
    if (!readLE(bytes, cursor, count)) {
        throw CorruptIndexError("hash bucket header is truncated");
    }
    // Every record needs at least two length fields.
    if ((bytes.size() - cursor) / (2 * sizeof(uint32_t)) < count) {
        throw CorruptIndexError("hash bucket record count " + std::to_string(count) + " exceeds payload");
    }
    bucket.records.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        HashRecord record;
        record.key = readBytes(bytes, cursor, "hash record key");
        uint32_t idCount = 0;
        if (!readLE(bytes, cursor, idCount)) {
            throw CorruptIndexError("truncated hash record id count");
        }
        record.recordIds = readIds(bytes, cursor, idCount, "hash record ids");
        if (!bucket.records.empty() && !(bucket.records.back().key < record.key)) {
            throw CorruptIndexError("hash bucket keys are not strictly sorted");
        }
        bucket.records.push_back(std::move(record));
    }
    if (cursor != bytes.size()) {
        throw CorruptIndexError("trailing bytes after hash bucket");
    }
    return bucket;
}

const HashRecord* findRecord(const HashBucket& bucket, std::string_view key) {
    auto it = std::lower_bound(bucket.records.begin(), bucket.records.end(), key,
                               [](const HashRecord& r, std::string_view k) { return std::string_view(r.key) < k; });
    if (it == bucket.records.end() || it->key != key) return nullptr;
    return &*it;
}

// -----------------------------------------------------------
// Posting buckets
// -----------------------------------------------------------
std::string encodePostingBucket(const PostingBucket& bucket, bool withPositions, bool deltaEncodeIds) {
    std::string out;
    uint8_t flags = 0;
    if (withPositions) flags |= kFlagPositions;
    if (deltaEncodeIds) flags |= kFlagDelta;
    writeLE(out, flags);
    writeLE(out, static_cast<uint32_t>(bucket.entries.size()));
    for (const auto& entry : bucket.entries) {
        const auto& plist = entry.postings;
        writeBytes(out, entry.ngram);
        writeLE(out, static_cast<uint32_t>(plist.recordIds.size()));
        if (deltaEncodeIds) {
            std::vector<int64_t> ids = plist.recordIds;
            deltaEncode(ids);
            writeIds(out, ids);
        } else {
            writeIds(out, plist.recordIds);
        }
        if (withPositions) {
            if (plist.recordOffsets.size() != plist.recordIds.size()) {
                throw IndexError("posting list for '" + entry.ngram + "' has mismatched offsets");
            }
            writeIds(out, plist.recordOffsets);
        }
    }
    return out;
}

PostingBucket decodePostingBucket(std::string_view bytes) {
    PostingBucket bucket;
    size_t cursor = 0;
    uint8_t flags = 0;
    uint32_t count = 0;
    if (!readLE(bytes, cursor, flags) || !readLE(bytes, cursor, count)) {
        throw CorruptIndexError("posting bucket header is truncated");
    }
    if ((flags & ~(kFlagPositions | kFlagDelta)) != 0) {
        throw CorruptIndexError("posting bucket has unknown flags=" + std::to_string(flags));
    }
    if ((bytes.size() - cursor) / (2 * sizeof(uint32_t)) < count) {
        throw CorruptIndexError("posting bucket entry count " + std::to_string(count) + " exceeds payload");
    }
    const bool withPositions = (flags & kFlagPositions) != 0;
    bucket.entries.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        PostingEntry entry;
        entry.ngram = readBytes(bytes, cursor, "n-gram key");
        uint32_t n = 0;
        if (!readLE(bytes, cursor, n)) {
            throw CorruptIndexError("truncated posting list length");
        }
        entry.postings.recordIds = readIds(bytes, cursor, n, "posting record ids");
        if (flags & kFlagDelta) {
            deltaDecode(entry.postings.recordIds);
        }
        if (withPositions) {
            entry.postings.recordOffsets = readIds(bytes, cursor, n, "posting offsets");
        }
        if (!bucket.entries.empty() && !(bucket.entries.back().ngram < entry.ngram)) {
            throw CorruptIndexError("posting bucket n-grams are not strictly sorted");
        }
        bucket.entries.push_back(std::move(entry));
    }
    if (cursor != bytes.size()) {
        throw CorruptIndexError("trailing bytes after posting bucket");
    }
    return bucket;
}

const PostingEntry* findEntry(const PostingBucket& bucket, std::string_view ngram) {
    auto it = std::lower_bound(bucket.entries.begin(), bucket.entries.end(), ngram,
                               [](const PostingEntry& e, std::string_view g) { return std::string_view(e.ngram) < g; });
    if (it == bucket.entries.end() || it->ngram != ngram) return nullptr;
    return &*it;
}

} // namespace bagindex
