#include "bagindex/TrigramIndex.hpp"

#include <algorithm>
#include <iostream>
#include <map>

#include "bagindex/Checksum.hpp"
#include "bagindex/Errors.hpp"
#include "bagindex/HashBucketIndex.hpp"
#include "bagindex/Utf8.hpp"
#include "bagindex/algorithms/PostingMatch.hpp"

namespace bagindex {

namespace {

TrigramConfig canonical(TrigramConfig config) {
    validate(config);
    config.characterSet = canonicalCharacterSet(config.characterSet);
    return config;
}

} // namespace

// -----------------------------------------------------------
// Writer
// -----------------------------------------------------------
TrigramWriter::TrigramWriter(TrigramConfig config)
    : config_(canonical(std::move(config))), normalizer_(config_) {}

void TrigramWriter::addPosting(std::vector<Posting>& list, int64_t recordId, int64_t offset) {
    if (!config_.storePositions) {
        // consecutive occurrences in one document collapse here; the rest at write time
        if (!list.empty() && list.back().first == recordId) return;
        offset = 0;
    }
    list.emplace_back(recordId, offset);
}

void TrigramWriter::addText(std::string_view text, int64_t recordId) {
    documents_.insert(recordId);
    const std::string normalized = normalizer_.normalize(text);
    for (const auto& gram : normalizer_.ngrams(normalized)) {
        addPosting(postings_[std::string(gram.text)], recordId, gram.offset);
    }
}

void TrigramWriter::addPostings(const std::string& ngram, const PostingList& postings) {
    if (utf8::length(ngram) != static_cast<size_t>(config_.ngramSize)) {
        throw IndexError("n-gram '" + ngram + "' does not have length " + std::to_string(config_.ngramSize));
    }
    if (config_.storePositions && postings.recordOffsets.size() != postings.recordIds.size()) {
        throw CorruptIndexError("posting list for '" + ngram + "' has no offsets but positions are stored");
    }
    auto& list = postings_[ngram];
    for (size_t i = 0; i < postings.recordIds.size(); ++i) {
        const int64_t rid = postings.recordIds[i];
        documents_.insert(rid);
        addPosting(list, rid, config_.storePositions ? postings.recordOffsets[i] : 0);
    }
}

PostingList TrigramWriter::buildPostingList(const std::vector<Posting>& raw) const {
    std::vector<Posting> sorted = raw;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    PostingList plist;
    plist.recordIds.reserve(sorted.size());
    if (config_.storePositions) plist.recordOffsets.reserve(sorted.size());
    for (const auto& p : sorted) {
        plist.recordIds.push_back(p.first);
        if (config_.storePositions) plist.recordOffsets.push_back(p.second);
    }
    return plist;
}

uint64_t TrigramWriter::writeTo(RecordStore& store) const {
    if (documents_.empty()) {
        throw EmptyIndexError("no documents were added to the trigram writer");
    }
    const uint64_t bucketCount = hashBucketCount(postings_.size(), kTrigramBucketOccupancy);

    std::unordered_map<uint64_t, std::vector<const std::string*>> bucketToGrams;
    for (const auto& kv : postings_) {
        bucketToGrams[bucketFor(kv.first, bucketCount)].push_back(&kv.first);
    }

    for (uint64_t slot = 0; slot < bucketCount; ++slot) {
        auto it = bucketToGrams.find(slot);
        if (it == bucketToGrams.end()) {
            store.append(std::string());
            continue;
        }
        auto& grams = it->second;
        std::sort(grams.begin(), grams.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

        PostingBucket bucket;
        bucket.entries.reserve(grams.size());
        for (const std::string* gram : grams) {
            bucket.entries.push_back({*gram, buildPostingList(postings_.at(*gram))});
        }
        store.append(encodePostingBucket(bucket, config_.storePositions, config_.deltaEncodeRecordIds));
    }

    ConfigFooter footer{config_};
    footer.bucketCount = bucketCount;
    footer.keyCount = postings_.size();
    footer.documentCount = documents_.size();
    store.append(dumpFooter(footer));
    return bucketCount;
}

void TrigramWriter::write(const std::string& path) const {
    RecordStore store;
    const uint64_t bucketCount = writeTo(store);
    store.flush(path);
    std::cerr << "BagIndex: wrote trigram index docs=" << documents_.size() << " ngrams=" << postings_.size()
              << " buckets=" << bucketCount << " positions=" << (config_.storePositions ? "on" : "off")
              << " to " << path << "\n";
}

// -----------------------------------------------------------
// Reader
// -----------------------------------------------------------
TrigramReader::TrigramReader(std::shared_ptr<const RecordSource> store, TrigramConfig config,
                             uint64_t bucketCount, uint64_t ngramCount, uint64_t documentCount)
    : store_(std::move(store)),
      config_(canonical(std::move(config))),
      normalizer_(config_),
      bucketCount_(bucketCount),
      ngramCount_(ngramCount),
      documentCount_(documentCount) {
    if (!store_) {
        throw IndexError("trigram reader requires a record store");
    }
    if (bucketCount_ == 0) {
        throw CorruptIndexError("trigram index has zero buckets");
    }
}

PostingBucket TrigramReader::readBucket(uint64_t slot) const {
    const std::string bytes = store_->read(static_cast<int64_t>(slot));
    if (bytes.empty()) return {};
    PostingBucket bucket;
    try {
        bucket = decodePostingBucket(bytes);
    } catch (const CorruptIndexError& e) {
        std::cerr << "BagIndex: posting bucket " << slot << " failed to decode: " << e.what() << "\n";
        throw;
    }
    if (config_.storePositions) {
        for (const auto& entry : bucket.entries) {
            if (entry.postings.recordOffsets.size() != entry.postings.recordIds.size()) {
                throw CorruptIndexError("posting bucket " + std::to_string(slot) + " is missing offsets");
            }
        }
    }
    return bucket;
}

std::optional<PostingList> TrigramReader::postingsFor(std::string_view ngram) const {
    const PostingBucket bucket = readBucket(bucketFor(ngram, bucketCount_));
    const PostingEntry* entry = findEntry(bucket, ngram);
    if (entry == nullptr) return std::nullopt;
    return entry->postings;
}

std::vector<int64_t> TrigramReader::search(std::string_view query) const {
    const std::string normalized = normalizer_.normalize(query);
    const size_t chars = utf8::length(normalized);
    if (chars < static_cast<size_t>(config_.ngramSize)) {
        throw QueryTooShortError("normalized query has " + std::to_string(chars) +
                                 " characters, ngram_size is " + std::to_string(config_.ngramSize));
    }
    const auto grams = normalizer_.ngrams(normalized);

    // Fetch each distinct n-gram once; any absent n-gram means no match.
    std::map<std::string_view, PostingList> fetched;
    for (const auto& gram : grams) {
        if (fetched.count(gram.text)) continue;
        auto plist = postingsFor(gram.text);
        if (!plist || plist->recordIds.empty()) return {};
        fetched.emplace(gram.text, std::move(*plist));
    }

    std::vector<std::vector<int64_t>> idLists;
    idLists.reserve(fetched.size());
    for (const auto& kv : fetched) {
        idLists.push_back(algo::distinctRecordIds(kv.second));
    }
    std::vector<int64_t> candidates = algo::intersectAll(idLists);
    if (!config_.storePositions || candidates.empty()) {
        return candidates;
    }

    std::vector<algo::GramPostings> chain;
    chain.reserve(grams.size());
    for (const auto& gram : grams) {
        chain.push_back({gram.offset, &fetched.at(gram.text)});
    }
    return algo::verifyChains(chain, candidates);
}

} // namespace bagindex
