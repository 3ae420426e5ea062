#include "bagindex/IndexConfig.hpp"

#include <algorithm>
#include <climits>
#include <cmath>
#include <vector>

#include "bagindex/Errors.hpp"
#include "bagindex/Utf8.hpp"

using json = nlohmann::json;

namespace bagindex {

namespace {

constexpr const char* kHashBucketType = "hashbucket";
constexpr const char* kTrigramType = "trigram";

template <typename T>
T requireField(const json& j, const char* name) {
    if (!j.contains(name)) {
        throw ConfigError(std::string("missing field '") + name + "'");
    }
    return j.at(name).get<T>();
}

template <typename T>
T optionalField(const json& j, const char* name, T def) {
    if (!j.contains(name) || j.at(name).is_null()) return def;
    return j.at(name).get<T>();
}

// Integer field checked against [lo, hi] before conversion.
int64_t boundedInteger(const json& j, const char* name, int64_t def, int64_t lo, int64_t hi) {
    if (!j.contains(name) || j.at(name).is_null()) return def;
    const json& v = j.at(name);
    if (!v.is_number_integer()) {
        throw ConfigError(std::string("'") + name + "' must be an integer");
    }
    if (v.is_number_unsigned()) {
        const auto u = v.get<uint64_t>();
        if (u <= static_cast<uint64_t>(hi) && static_cast<int64_t>(u) >= lo) return static_cast<int64_t>(u);
    } else {
        const auto value = v.get<int64_t>();
        if (value >= lo && value <= hi) return value;
    }
    throw ConfigError(std::string("'") + name + "' is out of range [" + std::to_string(lo) + ", " +
                      std::to_string(hi) + "]: " + v.dump());
}

uint64_t countField(const json& j, const char* name) {
    return static_cast<uint64_t>(boundedInteger(j, name, 0, 0, INT64_MAX));
}

HashBucketConfig hashBucketFromJson(const json& j) {
    HashBucketConfig cfg;
    if (!j.contains("avg_bucket_size") || !j.at("avg_bucket_size").is_number()) {
        throw ConfigError("'avg_bucket_size' must be a number");
    }
    cfg.avgBucketSize = j.at("avg_bucket_size").get<double>();
    cfg.keyProtoName = optionalField<std::string>(j, "key_proto_name", "");
    validate(cfg);
    return cfg;
}

TrigramConfig trigramFromJson(const json& j) {
    TrigramConfig cfg;
    cfg.characterSet = canonicalCharacterSet(requireField<std::string>(j, "character_set"));
    cfg.ngramSize = static_cast<int>(boundedInteger(j, "ngram_size", 3, 1, INT_MAX));
    cfg.normalize = optionalField<bool>(j, "normalize", false);
    cfg.storePositions = optionalField<bool>(j, "store_positions", false);
    cfg.deltaEncodeRecordIds = optionalField<bool>(j, "delta_encode_record_ids", false);
    validate(cfg);
    return cfg;
}

json parseObject(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw ConfigError("footer is not valid JSON");
    }
    if (!j.is_object()) {
        throw ConfigError("footer must be a JSON object");
    }
    return j;
}

IndexConfig configFromObject(const json& j) {
    if (!j.contains("type") || !j.at("type").is_string()) {
        throw ConfigError("config JSON must contain a string 'type' field");
    }
    try {
        switch (indexTypeFromName(j.at("type").get<std::string>())) {
        case IndexType::HashBucket:
            return hashBucketFromJson(j);
        case IndexType::Trigram:
            return trigramFromJson(j);
        }
    } catch (const json::exception& e) {
        throw ConfigError(e.what());
    }
    throw ConfigError("unhandled index type");
}

} // namespace

std::string indexTypeName(IndexType type) {
    switch (type) {
    case IndexType::HashBucket:
        return kHashBucketType;
    case IndexType::Trigram:
        return kTrigramType;
    }
    throw ConfigError("unhandled index type");
}

IndexType indexTypeFromName(const std::string& name) {
    if (name == kHashBucketType) return IndexType::HashBucket;
    if (name == kTrigramType) return IndexType::Trigram;
    throw ConfigError("unknown index type '" + name + "'");
}

bool operator==(const HashBucketConfig& a, const HashBucketConfig& b) {
    return a.avgBucketSize == b.avgBucketSize && a.keyProtoName == b.keyProtoName;
}

bool operator!=(const HashBucketConfig& a, const HashBucketConfig& b) {
    return !(a == b);
}

bool operator==(const TrigramConfig& a, const TrigramConfig& b) {
    return canonicalCharacterSet(a.characterSet) == canonicalCharacterSet(b.characterSet) &&
           a.ngramSize == b.ngramSize && a.normalize == b.normalize &&
           a.storePositions == b.storePositions && a.deltaEncodeRecordIds == b.deltaEncodeRecordIds;
}

bool operator!=(const TrigramConfig& a, const TrigramConfig& b) {
    return !(a == b);
}

IndexType typeOf(const IndexConfig& config) {
    return std::holds_alternative<HashBucketConfig>(config) ? IndexType::HashBucket : IndexType::Trigram;
}

std::string canonicalCharacterSet(const std::string& characterSet) {
    std::vector<char32_t> chars;
    if (!utf8::decode(characterSet, chars)) {
        throw ConfigError("character_set is not valid UTF-8");
    }
    std::sort(chars.begin(), chars.end());
    chars.erase(std::unique(chars.begin(), chars.end()), chars.end());
    std::string out;
    out.reserve(characterSet.size());
    for (char32_t cp : chars) utf8::append(out, cp);
    return out;
}

void validate(const HashBucketConfig& config) {
    if (!(config.avgBucketSize > 0.0) || !std::isfinite(config.avgBucketSize)) {
        throw ConfigError("avg_bucket_size must be a finite number > 0");
    }
}

void validate(const TrigramConfig& config) {
    if (config.characterSet.empty()) {
        throw ConfigError("character_set must not be empty");
    }
    std::vector<char32_t> chars;
    if (!utf8::decode(config.characterSet, chars)) {
        throw ConfigError("character_set is not valid UTF-8");
    }
    if (config.ngramSize < 1) {
        throw ConfigError("ngram_size must be >= 1, got " + std::to_string(config.ngramSize));
    }
}

json toJson(const HashBucketConfig& config) {
    return json{
        {"type", kHashBucketType},
        {"avg_bucket_size", config.avgBucketSize},
        {"key_proto_name", config.keyProtoName}
    };
}

json toJson(const TrigramConfig& config) {
    return json{
        {"type", kTrigramType},
        {"character_set", canonicalCharacterSet(config.characterSet)},
        {"ngram_size", config.ngramSize},
        {"normalize", config.normalize},
        {"store_positions", config.storePositions},
        {"delta_encode_record_ids", config.deltaEncodeRecordIds}
    };
}

json toJson(const IndexConfig& config) {
    return std::visit([](const auto& c) { return toJson(c); }, config);
}

json toJson(const ConfigFooter& footer) {
    json j = toJson(footer.config);
    if (footer.bucketCount) {
        j["bucket_count"] = *footer.bucketCount;
    }
    if (typeOf(footer.config) == IndexType::HashBucket) {
        j["key_count"] = footer.keyCount;
    } else {
        j["ngram_count"] = footer.keyCount;
        j["document_count"] = footer.documentCount;
    }
    return j;
}

IndexConfig configFromJson(const std::string& text) {
    return configFromObject(parseObject(text));
}

ConfigFooter footerFromJson(const std::string& text) {
    const json j = parseObject(text);
    ConfigFooter footer{configFromObject(j)};
    try {
        if (j.contains("bucket_count") && !j.at("bucket_count").is_null()) {
            footer.bucketCount = static_cast<uint64_t>(boundedInteger(j, "bucket_count", 1, 1, INT64_MAX));
        }
        const char* keyField = typeOf(footer.config) == IndexType::HashBucket ? "key_count" : "ngram_count";
        footer.keyCount = countField(j, keyField);
        footer.documentCount = countField(j, "document_count");
    } catch (const json::exception& e) {
        throw ConfigError(e.what());
    }
    return footer;
}

std::string dumpFooter(const ConfigFooter& footer) {
    try {
        return toJson(footer).dump(4);
    } catch (const json::exception& e) {
        // character_set bytes that are not valid UTF-8 cannot be stored
        throw ConfigError(e.what());
    }
}

} // namespace bagindex
