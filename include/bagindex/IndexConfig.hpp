#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace bagindex {

enum class IndexType { HashBucket, Trigram };

// Footer "type" strings.
std::string indexTypeName(IndexType type);
IndexType indexTypeFromName(const std::string& name);

struct HashBucketConfig {
    // Target average number of keys per bucket; values below 1 trade space
    // for fewer collisions.
    double avgBucketSize = 1.0;
    // Name of the message type the keys were serialized from. Opaque here.
    std::string keyProtoName;
};

struct TrigramConfig {
    std::string characterSet;
    int ngramSize = 3;
    bool normalize = false;
    bool storePositions = false;
    bool deltaEncodeRecordIds = false;
};

bool operator==(const HashBucketConfig& a, const HashBucketConfig& b);
bool operator!=(const HashBucketConfig& a, const HashBucketConfig& b);
bool operator==(const TrigramConfig& a, const TrigramConfig& b);
bool operator!=(const TrigramConfig& a, const TrigramConfig& b);

using IndexConfig = std::variant<HashBucketConfig, TrigramConfig>;

IndexType typeOf(const IndexConfig& config);

// Sorted, deduplicated copy of a character set.
std::string canonicalCharacterSet(const std::string& characterSet);

// Throw ConfigError on out-of-range parameters.
void validate(const HashBucketConfig& config);
void validate(const TrigramConfig& config);

// Last record of every index file: the config plus what the writer learned
// while building.
struct ConfigFooter {
    IndexConfig config;
    std::optional<uint64_t> bucketCount;
    uint64_t keyCount = 0;      // distinct keys, or distinct n-grams for trigram indices
    uint64_t documentCount = 0; // trigram indices only
};

nlohmann::json toJson(const HashBucketConfig& config);
nlohmann::json toJson(const TrigramConfig& config);
nlohmann::json toJson(const IndexConfig& config);
nlohmann::json toJson(const ConfigFooter& footer);

// Parse a config or footer document; throws ConfigError.
IndexConfig configFromJson(const std::string& text);
ConfigFooter footerFromJson(const std::string& text);

// Serialized footer bytes as stored in the record file.
std::string dumpFooter(const ConfigFooter& footer);

} // namespace bagindex
