#include "bagindex/HashBucketIndex.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "bagindex/Checksum.hpp"
#include "bagindex/Errors.hpp"

namespace bagindex {

namespace {

// A bucket is addressed by a record position; keep counts well inside that.
constexpr uint64_t kMaxBucketCount = 1ull << 40;

} // namespace

uint64_t hashBucketCount(uint64_t keyCount, double avgBucketSize) {
    if (!(avgBucketSize > 0.0)) {
        throw ConfigError("avg_bucket_size must be > 0");
    }
    const double raw = std::ceil(static_cast<double>(keyCount) / avgBucketSize);
    if (!(raw < static_cast<double>(kMaxBucketCount))) {
        throw ConfigError("bucket count for " + std::to_string(keyCount) + " keys at avg_bucket_size=" +
                          std::to_string(avgBucketSize) + " is too large");
    }
    return std::max<uint64_t>(1, static_cast<uint64_t>(raw));
}

// -----------------------------------------------------------
// Writer
// -----------------------------------------------------------
HashBucketWriter::HashBucketWriter(HashBucketConfig config) : config_(std::move(config)) {
    validate(config_);
}

void HashBucketWriter::addKey(std::string_view key, int64_t recordId) {
    data_[std::string(key)].insert(recordId);
}

void HashBucketWriter::addKeys(std::string_view key, const std::vector<int64_t>& recordIds) {
    auto& ids = data_[std::string(key)];
    ids.insert(recordIds.begin(), recordIds.end());
}

uint64_t HashBucketWriter::writeTo(RecordStore& store) const {
    if (data_.empty()) {
        throw EmptyIndexError("no keys were added to the hashbucket writer");
    }
    const uint64_t bucketCount = hashBucketCount(data_.size(), config_.avgBucketSize);

    std::unordered_map<uint64_t, std::vector<const std::string*>> bucketToKeys;
    for (const auto& kv : data_) {
        bucketToKeys[bucketFor(kv.first, bucketCount)].push_back(&kv.first);
    }

    for (uint64_t slot = 0; slot < bucketCount; ++slot) {
        auto it = bucketToKeys.find(slot);
        if (it == bucketToKeys.end()) {
            store.append(std::string());
            continue;
        }
        auto& keys = it->second;
        std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

        HashBucket bucket;
        bucket.records.reserve(keys.size());
        for (const std::string* key : keys) {
            const auto& ids = data_.at(*key);
            bucket.records.push_back({*key, std::vector<int64_t>(ids.begin(), ids.end())});
        }
        store.append(encodeHashBucket(bucket));
    }

    ConfigFooter footer{config_};
    footer.bucketCount = bucketCount;
    footer.keyCount = data_.size();
    store.append(dumpFooter(footer));
    return bucketCount;
}

void HashBucketWriter::write(const std::string& path) const {
    RecordStore store;
    const uint64_t bucketCount = writeTo(store);
    store.flush(path);
    std::cerr << "BagIndex: wrote hashbucket index keys=" << data_.size() << " buckets=" << bucketCount
              << " to " << path << "\n";
}

// -----------------------------------------------------------
// Reader
// -----------------------------------------------------------
HashBucketReader::HashBucketReader(std::shared_ptr<const RecordSource> store, HashBucketConfig config,
                                   uint64_t bucketCount, uint64_t keyCount)
    : store_(std::move(store)), config_(std::move(config)), bucketCount_(bucketCount), keyCount_(keyCount) {
    if (!store_) {
        throw IndexError("hashbucket reader requires a record store");
    }
    if (bucketCount_ == 0) {
        throw CorruptIndexError("hashbucket index has zero buckets");
    }
}

HashBucket HashBucketReader::readBucket(uint64_t slot) const {
    const std::string bytes = store_->read(static_cast<int64_t>(slot));
    if (bytes.empty()) return {};
    try {
        return decodeHashBucket(bytes);
    } catch (const CorruptIndexError& e) {
        std::cerr << "BagIndex: bucket " << slot << " failed to decode: " << e.what() << "\n";
        throw;
    }
}

std::vector<int64_t> HashBucketReader::lookupKey(std::string_view key) const {
    const uint64_t slot = bucketFor(key, bucketCount_);
    const HashBucket bucket = readBucket(slot);
    const HashRecord* record = findRecord(bucket, key);
    if (record == nullptr) return {};
    return record->recordIds;
}

} // namespace bagindex
