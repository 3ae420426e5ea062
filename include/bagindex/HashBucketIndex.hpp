#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "bagindex/BucketCodec.hpp"
#include "bagindex/IndexConfig.hpp"
#include "bagindex/RecordStore.hpp"

namespace bagindex {

// ceil(keyCount / avgBucketSize), at least 1.
uint64_t hashBucketCount(uint64_t keyCount, double avgBucketSize);

// Accumulates key -> record id sets, then writes one record per bucket
// followed by the config footer.
class HashBucketWriter {
public:
    using Config = HashBucketConfig;

    explicit HashBucketWriter(HashBucketConfig config);

    void addKey(std::string_view key, int64_t recordId);
    void addKeys(std::string_view key, const std::vector<int64_t>& recordIds);

    std::size_t keyCount() const { return data_.size(); }
    const HashBucketConfig& config() const { return config_; }

    // Throws EmptyIndexError when no key was added, IOError on store failure.
    void write(const std::string& path) const;
    // Appends buckets and footer to store; returns the bucket count.
    uint64_t writeTo(RecordStore& store) const;

private:
    HashBucketConfig config_;
    std::unordered_map<std::string, std::set<int64_t>> data_;
};

class HashBucketReader {
public:
    HashBucketReader(std::shared_ptr<const RecordSource> store, HashBucketConfig config,
                     uint64_t bucketCount, uint64_t keyCount);

    // Ascending record ids for key; empty when the key was never added.
    std::vector<int64_t> lookupKey(std::string_view key) const;

    // Hash lookups are exact.
    bool requiresPostFiltering() const { return false; }

    HashBucket readBucket(uint64_t slot) const;

    const HashBucketConfig& config() const { return config_; }
    uint64_t bucketCount() const { return bucketCount_; }
    uint64_t keyCount() const { return keyCount_; }

private:
    std::shared_ptr<const RecordSource> store_;
    HashBucketConfig config_;
    uint64_t bucketCount_;
    uint64_t keyCount_;
};

} // namespace bagindex
