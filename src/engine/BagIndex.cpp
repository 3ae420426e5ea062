//BagIndex.cpp
#include "BagIndex.hpp"

#include <iostream>

namespace bagindex {

namespace {

template <typename Reader>
Reader expectReader(IndexReader reader, const std::string& path, IndexType expected) {
    if (auto* typed = std::get_if<Reader>(&reader)) {
        return std::move(*typed);
    }
    throw ConfigError(path + " does not hold a '" + indexTypeName(expected) + "' index");
}

void mergeHashBucket(const HashBucketConfig& config, const std::vector<HashBucketReader>& readers,
                     const std::string& output) {
    HashBucketWriter writer(config);
    for (const auto& reader : readers) {
        for (uint64_t slot = 0; slot < reader.bucketCount(); ++slot) {
            for (const auto& record : reader.readBucket(slot).records) {
                writer.addKeys(record.key, record.recordIds);
            }
        }
    }
    writer.write(output);
}

void mergeTrigram(const TrigramConfig& config, const std::vector<TrigramReader>& readers,
                  const std::string& output) {
    TrigramWriter writer(config);
    for (const auto& reader : readers) {
        for (uint64_t slot = 0; slot < reader.bucketCount(); ++slot) {
            for (const auto& entry : reader.readBucket(slot).entries) {
                writer.addPostings(entry.ngram, entry.postings);
            }
        }
    }
    writer.write(output);
}

} // namespace

// -----------------------------------------------------------
// Writers
// -----------------------------------------------------------
HashBucketWriter makeWriter(const HashBucketConfig& config) {
    return HashBucketWriter(config);
}

TrigramWriter makeWriter(const TrigramConfig& config) {
    return TrigramWriter(config);
}

IndexWriter makeWriter(const IndexConfig& config) {
    return std::visit([](const auto& c) -> IndexWriter { return makeWriter(c); }, config);
}

void writeIndex(const IndexWriter& writer, const std::string& path) {
    std::visit([&](const auto& w) { w.write(path); }, writer);
}

// -----------------------------------------------------------
// Footer
// -----------------------------------------------------------
ConfigFooter readFooter(const RecordSource& store) {
    const int64_t count = store.count();
    if (count < 2) {
        throw CorruptIndexError("record store has " + std::to_string(count) +
                                " records; an index needs at least one bucket and a footer");
    }
    ConfigFooter footer = footerFromJson(store.read(count - 1));
    const uint64_t expected = static_cast<uint64_t>(count - 1);
    if (footer.bucketCount && *footer.bucketCount != expected) {
        throw CorruptIndexError("footer bucket_count=" + std::to_string(*footer.bucketCount) +
                                " but the store holds " + std::to_string(expected) + " buckets");
    }
    footer.bucketCount = expected;
    return footer;
}

ConfigFooter readFooter(const std::string& path) {
    RecordFileReader store(path);
    return readFooter(store);
}

IndexConfig readConfig(const std::string& path) {
    return readFooter(path).config;
}

// -----------------------------------------------------------
// Readers
// -----------------------------------------------------------
IndexReader openReader(std::shared_ptr<const RecordSource> store) {
    if (!store) {
        throw IndexError("openReader requires a record store");
    }
    ConfigFooter footer = readFooter(*store);
    switch (typeOf(footer.config)) {
    case IndexType::HashBucket:
        return HashBucketReader(std::move(store), std::get<HashBucketConfig>(footer.config),
                                *footer.bucketCount, footer.keyCount);
    case IndexType::Trigram:
        return TrigramReader(std::move(store), std::get<TrigramConfig>(footer.config),
                             *footer.bucketCount, footer.keyCount, footer.documentCount);
    }
    throw ConfigError("unhandled index type");
}

IndexReader openReader(const std::string& path) {
    return openReader(openRecordFile(path));
}

HashBucketReader openHashBucketReader(const std::string& path) {
    return expectReader<HashBucketReader>(openReader(path), path, IndexType::HashBucket);
}

TrigramReader openTrigramReader(const std::string& path) {
    return expectReader<TrigramReader>(openReader(path), path, IndexType::Trigram);
}

bool requiresPostFiltering(const IndexReader& reader) {
    return std::visit([](const auto& r) { return r.requiresPostFiltering(); }, reader);
}

// -----------------------------------------------------------
// Merge
// -----------------------------------------------------------
void mergeIndices(const std::vector<std::string>& inputs, const std::string& output) {
    if (inputs.empty()) {
        throw ConfigError("at least one input index is required");
    }
    std::vector<IndexReader> readers;
    readers.reserve(inputs.size());
    for (const auto& path : inputs) {
        readers.push_back(openReader(path));
    }

    const IndexConfig config = std::visit([](const auto& r) -> IndexConfig { return r.config(); }, readers.front());
    for (size_t i = 1; i < readers.size(); ++i) {
        const IndexConfig other = std::visit([](const auto& r) -> IndexConfig { return r.config(); }, readers[i]);
        if (!(other == config)) {
            throw ConfigError("all indices must have the same config; " + inputs[i] + " differs from " + inputs[0]);
        }
    }

    std::cerr << "BagIndex: merging " << inputs.size() << " " << indexTypeName(typeOf(config))
              << " indices into " << output << "\n";
    if (typeOf(config) == IndexType::HashBucket) {
        std::vector<HashBucketReader> typed;
        for (auto& r : readers) typed.push_back(std::get<HashBucketReader>(std::move(r)));
        mergeHashBucket(std::get<HashBucketConfig>(config), typed, output);
    } else {
        std::vector<TrigramReader> typed;
        for (auto& r : readers) typed.push_back(std::get<TrigramReader>(std::move(r)));
        mergeTrigram(std::get<TrigramConfig>(config), typed, output);
    }
}

} // namespace bagindex
