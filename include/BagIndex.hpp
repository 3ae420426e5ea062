//BagIndex.hpp
#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "bagindex/Errors.hpp"
#include "bagindex/HashBucketIndex.hpp"
#include "bagindex/IndexConfig.hpp"
#include "bagindex/RecordStore.hpp"
#include "bagindex/TrigramIndex.hpp"

namespace bagindex {

// Each alternative only carries the operations valid for its index type:
// hash writers add keys, trigram writers add text.
using IndexWriter = std::variant<HashBucketWriter, TrigramWriter>;
using IndexReader = std::variant<HashBucketReader, TrigramReader>;

// --- Writers ---

HashBucketWriter makeWriter(const HashBucketConfig& config);
TrigramWriter makeWriter(const TrigramConfig& config);
IndexWriter makeWriter(const IndexConfig& config);

void writeIndex(const IndexWriter& writer, const std::string& path);

// --- Footer ---

// Parses the last record of store. Throws ConfigError for a malformed or
// unknown footer and CorruptIndexError when it disagrees with the store.
ConfigFooter readFooter(const RecordSource& store);
ConfigFooter readFooter(const std::string& path);
IndexConfig readConfig(const std::string& path);

// --- Readers ---

IndexReader openReader(const std::string& path);
IndexReader openReader(std::shared_ptr<const RecordSource> store);

// Throw ConfigError when the file holds the other index type.
HashBucketReader openHashBucketReader(const std::string& path);
TrigramReader openTrigramReader(const std::string& path);

bool requiresPostFiltering(const IndexReader& reader);

// --- Merge ---

// Combines indices built with equal configs into a new index at output.
// Inputs are left untouched.
void mergeIndices(const std::vector<std::string>& inputs, const std::string& output);

} // namespace bagindex
