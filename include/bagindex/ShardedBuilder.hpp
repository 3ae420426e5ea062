#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bagindex/HashBucketIndex.hpp"
#include "bagindex/TrigramIndex.hpp"

namespace bagindex {

constexpr int64_t kDefaultShardLimit = 200000;

// Builds an index in shards of at most shardLimit added records. Each full
// shard is written to a scratch directory; finish() writes the last one and
// merges them all into the output path. Destroying an unfinished builder
// discards its shards.
template <typename Writer>
class ShardedBuilder {
public:
    using Config = typename Writer::Config;

    ShardedBuilder(std::string output, Config config, int64_t shardLimit = kDefaultShardLimit);
    ~ShardedBuilder();

    ShardedBuilder(const ShardedBuilder&) = delete;
    ShardedBuilder& operator=(const ShardedBuilder&) = delete;

    // Throws EmptyIndexError when nothing was added.
    void finish();

    // Shards started so far, including the open one.
    std::size_t shardCount() const { return shardPaths_.size(); }
    const std::filesystem::path& scratchDir() const { return scratch_; }
    const std::string& output() const { return output_; }

protected:
    Writer& writer();
    void recordAdded();

private:
    std::string output_;
    Config config_;
    int64_t shardLimit_;
    std::filesystem::path scratch_;
    std::optional<Writer> current_;
    int64_t currentCount_ = 0;
    std::vector<std::string> shardPaths_;
    bool finished_ = false;

    void writeCurrentShard();
    void removeScratch();
};

class ShardedHashBucketBuilder : public ShardedBuilder<HashBucketWriter> {
public:
    using ShardedBuilder::ShardedBuilder;

    void addKey(std::string_view key, int64_t recordId);
    void addKeys(std::string_view key, const std::vector<int64_t>& recordIds);
};

class ShardedTrigramBuilder : public ShardedBuilder<TrigramWriter> {
public:
    using ShardedBuilder::ShardedBuilder;

    void addText(std::string_view text, int64_t recordId);
};

extern template class ShardedBuilder<HashBucketWriter>;
extern template class ShardedBuilder<TrigramWriter>;

} // namespace bagindex
