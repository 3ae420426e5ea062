#include "BagIndex.hpp"
#include "TestUtil.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace bagindex;
using bagindex::test::expect;
using bagindex::test::expectThrows;
using bagindex::test::ids;

namespace {

const std::vector<std::string> kDocs = {
    "hello world", "world of wonders", "hello there", "a whole new world", "ear sea archers", "search and rescue",
};

const std::vector<std::string> kQueries = {"search", "world", "ld of w", "hello", "xyzxyz", "sea", "rescue"};

TrigramConfig trigramConfig(bool positions) {
    TrigramConfig cfg;
    cfg.characterSet = "zyxwvutsrqponmlkjihgfedcba";
    cfg.normalize = true;
    cfg.storePositions = positions;
    return cfg;
}

HashBucketConfig hashConfig() {
    HashBucketConfig cfg;
    cfg.avgBucketSize = 0.75;
    cfg.keyProtoName = "bagindex.test.GeneKey";
    return cfg;
}

std::shared_ptr<const RecordSource> storeWithFooter(const std::string& footer) {
    auto store = std::make_shared<RecordStore>();
    store->append("");
    store->append(footer);
    return store;
}

void testConfigJson() {
    const IndexConfig trigram = trigramConfig(true);
    const IndexConfig parsedTrigram = configFromJson(toJson(trigram).dump());
    expect(parsedTrigram == trigram, "trigram config survives json");
    expect(std::get<TrigramConfig>(parsedTrigram).characterSet == "abcdefghijklmnopqrstuvwxyz", "character set canonicalized");

    const IndexConfig hash = hashConfig();
    expect(configFromJson(toJson(hash).dump()) == hash, "hashbucket config survives json");

    const auto defaults = std::get<TrigramConfig>(configFromJson(R"({"type":"trigram","character_set":"abc"})"));
    expect(defaults.ngramSize == 3 && !defaults.normalize && !defaults.storePositions && !defaults.deltaEncodeRecordIds,
           "trigram defaults");

    expectThrows<ConfigError>([] { configFromJson(R"({"type":"bloom"})"); }, "unknown type");
    expectThrows<ConfigError>([] { configFromJson(R"({"avg_bucket_size":1.0})"); }, "missing type");
    expectThrows<ConfigError>([] { configFromJson("{not json"); }, "malformed json");
    expectThrows<ConfigError>([] { configFromJson("[1,2]"); }, "not an object");
    expectThrows<ConfigError>([] { configFromJson(R"({"type":"hashbucket","avg_bucket_size":0})"); }, "zero avg");
    expectThrows<ConfigError>([] { configFromJson(R"({"type":"hashbucket","avg_bucket_size":"big"})"); }, "string avg");
    expectThrows<ConfigError>([] { configFromJson(R"({"type":"trigram","character_set":"ab","ngram_size":0})"); }, "zero n");
    expectThrows<ConfigError>([] { configFromJson(R"({"type":"trigram","character_set":""})"); }, "empty set");
    expectThrows<ConfigError>([] { configFromJson(R"({"type":"trigram","character_set":"ab","normalize":"yes"})"); }, "bool field");
    expectThrows<ConfigError>([] { configFromJson(R"({"type":"trigram","character_set":"ab","ngram_size":4294967299})"); },
                              "ngram_size past int range");
    expectThrows<ConfigError>([] { configFromJson(R"({"type":"trigram","character_set":"ab","ngram_size":-2})"); },
                              "negative ngram_size");
    expect(std::get<TrigramConfig>(configFromJson(R"({"type":"trigram","character_set":"\u00e9a"})")).characterSet ==
               "a\u00e9",
           "escaped non-ASCII set parses");
}

void testFooterCountsAreRangeChecked() {
    const std::string base = R"({"type":"hashbucket","avg_bucket_size":1.0)";
    expectThrows<ConfigError>([&] { footerFromJson(base + R"(,"key_count":-1})"); }, "negative key_count");
    expectThrows<ConfigError>([&] { footerFromJson(base + R"(,"key_count":1.5})"); }, "fractional key_count");
    expectThrows<ConfigError>([&] { footerFromJson(base + R"(,"bucket_count":0})"); }, "zero bucket_count");
    expectThrows<ConfigError>([&] { footerFromJson(base + R"(,"bucket_count":18446744073709551615})"); },
                              "bucket_count past int64 range");
    const ConfigFooter footer = footerFromJson(base + R"(,"bucket_count":3,"key_count":5})");
    expect(footer.bucketCount && *footer.bucketCount == 3 && footer.keyCount == 5, "in-range counts parse");

    TrigramConfig utf8;
    utf8.characterSet = "abcé";
    const ConfigFooter trigram = footerFromJson(dumpFooter(ConfigFooter{utf8}));
    expect(std::get<TrigramConfig>(trigram.config).characterSet == "abcé", "non-ASCII set survives dumpFooter");
}

void testFooterDispatch() {
    expectThrows<ConfigError>([] { openReader(storeWithFooter("{not json")); }, "malformed footer");
    expectThrows<ConfigError>([] { openReader(storeWithFooter(R"({"type":"bloom"})")); }, "unknown footer type");

    IndexReader hash = openReader(storeWithFooter(toJson(IndexConfig(hashConfig())).dump()));
    expect(std::holds_alternative<HashBucketReader>(hash), "hashbucket footer gives a hash reader");
    expect(!requiresPostFiltering(hash), "hash readers are exact");
    expect(std::get<HashBucketReader>(hash).lookupKey("missing").empty(), "lookup in an empty bucket");

    IndexReader trigram = openReader(storeWithFooter(toJson(IndexConfig(trigramConfig(false))).dump()));
    expect(std::holds_alternative<TrigramReader>(trigram), "trigram footer gives a trigram reader");
    expect(requiresPostFiltering(trigram), "non-positional trigram readers need post filtering");

    auto lonely = std::make_shared<RecordStore>();
    lonely->append(toJson(IndexConfig(hashConfig())).dump());
    expectThrows<CorruptIndexError>([&] { openReader(std::shared_ptr<const RecordSource>(lonely)); }, "footer without buckets");
}

void testTypedOpenRejectsOtherType() {
    auto dir = bagindex::test::scratchDir("dispatch");
    const std::string hashPath = (dir / "hash.bix").string();
    const std::string trigramPath = (dir / "trigram.bix").string();

    IndexWriter hashWriter = makeWriter(IndexConfig(hashConfig()));
    std::get<HashBucketWriter>(hashWriter).addKey("BRCA1", 11);
    writeIndex(hashWriter, hashPath);

    IndexWriter trigramWriter = makeWriter(IndexConfig(trigramConfig(true)));
    std::get<TrigramWriter>(trigramWriter).addText("breast cancer type one", 11);
    writeIndex(trigramWriter, trigramPath);

    expect(std::holds_alternative<HashBucketConfig>(readConfig(hashPath)), "readConfig hash");
    expect(readConfig(trigramPath) == IndexConfig(trigramConfig(true)), "readConfig trigram");
    const ConfigFooter footer = readFooter(hashPath);
    expect(footer.bucketCount && *footer.bucketCount == 2 && footer.keyCount == 1, "footer stats");

    expect(openHashBucketReader(hashPath).lookupKey("BRCA1") == std::vector<int64_t>{11}, "typed hash open");
    expect(openTrigramReader(trigramPath).search("cancer") == std::vector<int64_t>{11}, "typed trigram open");
    expectThrows<ConfigError>([&] { openTrigramReader(hashPath); }, "hash file opened as trigram");
    expectThrows<ConfigError>([&] { openHashBucketReader(trigramPath); }, "trigram file opened as hash");
}

void testMergeTrigram(bool positions) {
    auto dir = bagindex::test::scratchDir(positions ? "merge_trigram_pos" : "merge_trigram");
    const TrigramConfig cfg = trigramConfig(positions);
    TrigramWriter whole(cfg);
    TrigramWriter even(cfg);
    TrigramWriter odd(cfg);
    for (size_t i = 0; i < kDocs.size(); ++i) {
        whole.addText(kDocs[i], static_cast<int64_t>(i));
        (i % 2 == 0 ? even : odd).addText(kDocs[i], static_cast<int64_t>(i));
    }
    const std::string wholePath = (dir / "whole.bix").string();
    const std::string evenPath = (dir / "even.bix").string();
    const std::string oddPath = (dir / "odd.bix").string();
    const std::string mergedPath = (dir / "merged.bix").string();
    whole.write(wholePath);
    even.write(evenPath);
    odd.write(oddPath);
    mergeIndices({evenPath, oddPath}, mergedPath);

    TrigramReader expected = openTrigramReader(wholePath);
    TrigramReader merged = openTrigramReader(mergedPath);
    expect(merged.ngramCount() == expected.ngramCount(), "merged n-gram count");
    for (const auto& q : kQueries) {
        expect(merged.search(q) == expected.search(q), "merged search for '" + q + "' got " + ids(merged.search(q)));
    }
}

void testMergeHashBucket() {
    auto dir = bagindex::test::scratchDir("merge_hash");
    HashBucketWriter a(hashConfig());
    HashBucketWriter b(hashConfig());
    a.addKeys("TP53", {4, 1});
    a.addKey("EGFR", 9);
    b.addKeys("TP53", {1, 2});
    b.addKey("KRAS", 3);
    const std::string aPath = (dir / "a.bix").string();
    const std::string bPath = (dir / "b.bix").string();
    const std::string mergedPath = (dir / "merged.bix").string();
    a.write(aPath);
    b.write(bPath);
    mergeIndices({aPath, bPath}, mergedPath);

    HashBucketReader merged = openHashBucketReader(mergedPath);
    expect(merged.keyCount() == 3, "merged distinct keys");
    expect(merged.bucketCount() == hashBucketCount(3, 0.75), "bucket count recomputed");
    expect(merged.lookupKey("TP53") == std::vector<int64_t>{1, 2, 4}, "ids unioned");
    expect(merged.lookupKey("EGFR") == std::vector<int64_t>{9}, "key from first input");
    expect(merged.lookupKey("KRAS") == std::vector<int64_t>{3}, "key from second input");
    expect(openHashBucketReader(aPath).lookupKey("KRAS").empty(), "inputs untouched");

    HashBucketConfig other = hashConfig();
    other.avgBucketSize = 2.0;
    HashBucketWriter c(other);
    c.addKey("MYC", 1);
    const std::string cPath = (dir / "c.bix").string();
    c.write(cPath);
    expectThrows<ConfigError>([&] { mergeIndices({aPath, cPath}, (dir / "bad.bix").string()); }, "config mismatch");
    expectThrows<ConfigError>([&] { mergeIndices({}, (dir / "none.bix").string()); }, "no inputs");
}

void testConcurrentReaders() {
    auto dir = bagindex::test::scratchDir("concurrent");
    const std::string path = (dir / "index.bix").string();
    TrigramWriter writer(trigramConfig(true));
    for (size_t i = 0; i < kDocs.size(); ++i) writer.addText(kDocs[i], static_cast<int64_t>(i));
    writer.write(path);

    const TrigramReader shared = openTrigramReader(path);
    std::vector<std::vector<int64_t>> expected;
    for (const auto& q : kQueries) expected.push_back(shared.search(q));

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            // half the threads share one reader, the rest open their own
            const TrigramReader own = openTrigramReader(path);
            const TrigramReader& reader = (t % 2 == 0) ? shared : own;
            for (int round = 0; round < 50; ++round) {
                for (size_t q = 0; q < kQueries.size(); ++q) {
                    if (reader.search(kQueries[q]) != expected[q]) ++mismatches;
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    expect(mismatches.load() == 0, "concurrent searches agree with single-threaded results");
}

} // namespace

int main() {
    testConfigJson();
    testFooterCountsAreRangeChecked();
    testFooterDispatch();
    testTypedOpenRejectsOtherType();
    testMergeTrigram(false);
    testMergeTrigram(true);
    testMergeHashBucket();
    testConcurrentReaders();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
