#include "BagIndex.hpp"
#include "bagindex/ShardedBuilder.hpp"
#include "TestUtil.hpp"

#include <filesystem>
#include <string>
#include <vector>

using namespace bagindex;
using bagindex::test::expect;
using bagindex::test::expectThrows;
using bagindex::test::ids;

namespace {

const std::vector<std::string> kDocs = {
    "hello world", "world of wonders", "hello there", "a whole new world", "ear sea archers", "search and rescue",
    "café au lait", "",
};

const std::vector<std::string> kQueries = {"search", "world", "ld of w", "hello", "xyzxyz", "café", "rescue"};

TrigramConfig trigramConfig() {
    TrigramConfig cfg;
    cfg.characterSet = "abcdefghijklmnopqrstuvwxyzé";
    cfg.normalize = true;
    cfg.storePositions = true;
    return cfg;
}

void testShardedTrigramMatchesSingleBuild() {
    auto dir = bagindex::test::scratchDir("sharded_trigram");
    const std::string singlePath = (dir / "single.bix").string();
    const std::string shardedPath = (dir / "sharded.bix").string();

    TrigramWriter single(trigramConfig());
    for (size_t i = 0; i < kDocs.size(); ++i) single.addText(kDocs[i], static_cast<int64_t>(i));
    single.write(singlePath);

    std::filesystem::path scratch;
    {
        ShardedTrigramBuilder builder(shardedPath, trigramConfig(), 3);
        for (size_t i = 0; i < kDocs.size(); ++i) builder.addText(kDocs[i], static_cast<int64_t>(i));
        expect(builder.shardCount() == 3, "eight records at three per shard start three shards");
        scratch = builder.scratchDir();
        expect(std::filesystem::exists(scratch), "scratch directory exists while building");
        builder.finish();
        expect(!std::filesystem::exists(scratch), "scratch directory removed after finish");
        expectThrows<IndexError>([&] { builder.addText("late", 99); }, "adding after finish");
    }

    TrigramReader expected = openTrigramReader(singlePath);
    TrigramReader sharded = openTrigramReader(shardedPath);
    expect(sharded.config() == expected.config(), "merged index keeps the config");
    for (const auto& q : kQueries) {
        expect(sharded.search(q) == expected.search(q), "sharded search for '" + q + "' got " + ids(sharded.search(q)));
    }
}

void testShardedHashBucketMatchesSingleBuild() {
    auto dir = bagindex::test::scratchDir("sharded_hash");
    const std::string singlePath = (dir / "single.bix").string();
    const std::string shardedPath = (dir / "sharded.bix").string();

    HashBucketConfig cfg;
    cfg.avgBucketSize = 2.0;
    HashBucketWriter single(cfg);
    ShardedHashBucketBuilder builder(shardedPath, cfg, 4);
    for (int64_t i = 0; i < 30; ++i) {
        const std::string key = "gene-" + std::to_string(i % 11);
        single.addKey(key, i);
        builder.addKey(key, i);
    }
    single.addKeys("shared", {100, 7});
    builder.addKeys("shared", {100, 7});
    expect(builder.shardCount() == 8, "thirty one records at four per shard start eight shards");
    builder.finish();
    single.write(singlePath);

    HashBucketReader expected = openHashBucketReader(singlePath);
    HashBucketReader sharded = openHashBucketReader(shardedPath);
    expect(sharded.keyCount() == expected.keyCount(), "distinct keys agree");
    expect(sharded.bucketCount() == expected.bucketCount(), "bucket count agrees");
    for (int i = 0; i < 11; ++i) {
        const std::string key = "gene-" + std::to_string(i);
        expect(sharded.lookupKey(key) == expected.lookupKey(key), "lookup " + key);
    }
    expect(sharded.lookupKey("shared") == std::vector<int64_t>{7, 100}, "batch ids");
}

void testShardLimitOfOneAndEmptyBuild() {
    auto dir = bagindex::test::scratchDir("sharded_edges");
    HashBucketConfig cfg;
    {
        ShardedHashBucketBuilder builder((dir / "one.bix").string(), cfg, 1);
        builder.addKey("a", 1);
        builder.addKey("b", 2);
        builder.finish();
        expect(builder.shardCount() == 2, "one record per shard");
    }
    HashBucketReader reader = openHashBucketReader((dir / "one.bix").string());
    expect(reader.lookupKey("a") == std::vector<int64_t>{1} && reader.lookupKey("b") == std::vector<int64_t>{2},
           "every shard merged");

    ShardedHashBucketBuilder empty((dir / "empty.bix").string(), cfg);
    expectThrows<EmptyIndexError>([&] { empty.finish(); }, "finish without records");
    expect(!std::filesystem::exists(dir / "empty.bix"), "no output for an empty build");

    expectThrows<ConfigError>([&] { ShardedHashBucketBuilder bad((dir / "bad.bix").string(), cfg, 0); }, "zero limit");
}

void testUnfinishedBuilderDiscardsShards() {
    auto dir = bagindex::test::scratchDir("sharded_discard");
    std::filesystem::path scratch;
    {
        ShardedTrigramBuilder builder((dir / "out.bix").string(), trigramConfig(), 1);
        builder.addText("hello world", 1);
        scratch = builder.scratchDir();
        expect(std::filesystem::exists(scratch), "shard written");
    }
    expect(!std::filesystem::exists(scratch), "scratch removed on destruction");
    expect(!std::filesystem::exists(dir / "out.bix"), "no output without finish");
}

} // namespace

int main() {
    testShardedTrigramMatchesSingleBuild();
    testShardedHashBucketMatchesSingleBuild();
    testShardLimitOfOneAndEmptyBuild();
    testUnfinishedBuilderDiscardsShards();
    std::cout << "All sharded builder tests passed." << std::endl;
    return 0;
}
