#include "bagindex/ShardedBuilder.hpp"

#include <atomic>
#include <cstdio>
#include <iostream>
#include <system_error>
#include <utility>

#include <unistd.h>

#include "BagIndex.hpp"

namespace bagindex {

namespace {

std::filesystem::path makeScratchDir(const std::string& output) {
    static std::atomic<uint64_t> sequence{0};
    const std::string stem = std::filesystem::path(output).stem().string();
    const auto base = std::filesystem::temp_directory_path();
    for (int attempt = 0; attempt < 100; ++attempt) {
        auto dir = base / (stem + "-shards-" + std::to_string(::getpid()) + "-" + std::to_string(sequence++));
        std::error_code ec;
        if (std::filesystem::create_directory(dir, ec)) return dir;
        if (ec) {
            throw IOError("failed to create shard directory " + dir.string() + ": " + ec.message());
        }
    }
    throw IOError("failed to create a unique shard directory under " + base.string());
}

std::string shardFileName(const std::string& output, std::size_t shardId) {
    const std::filesystem::path out(output);
    char id[16];
    std::snprintf(id, sizeof(id), "%05zu", shardId);
    return out.stem().string() + "-" + id + out.extension().string();
}

} // namespace

template <typename Writer>
ShardedBuilder<Writer>::ShardedBuilder(std::string output, Config config, int64_t shardLimit)
    : output_(std::move(output)), config_(std::move(config)), shardLimit_(shardLimit) {
    if (shardLimit_ < 1) {
        throw ConfigError("shard limit must be >= 1, got " + std::to_string(shardLimit_));
    }
    validate(config_);
    scratch_ = makeScratchDir(output_);
}

template <typename Writer>
ShardedBuilder<Writer>::~ShardedBuilder() {
    if (!finished_) {
        std::cerr << "ShardedBuilder: discarding " << shardPaths_.size() << " unfinished shards for " << output_ << "\n";
    }
    removeScratch();
}

template <typename Writer>
Writer& ShardedBuilder<Writer>::writer() {
    if (finished_) {
        throw IndexError("sharded builder for " + output_ + " is already finished");
    }
    if (!current_) {
        shardPaths_.push_back((scratch_ / shardFileName(output_, shardPaths_.size())).string());
        current_.emplace(config_);
        currentCount_ = 0;
    }
    return *current_;
}

template <typename Writer>
void ShardedBuilder<Writer>::recordAdded() {
    if (++currentCount_ >= shardLimit_) {
        writeCurrentShard();
    }
}

template <typename Writer>
void ShardedBuilder<Writer>::writeCurrentShard() {
    if (!current_) return;
    current_->write(shardPaths_.back());
    current_.reset();
}

template <typename Writer>
void ShardedBuilder<Writer>::finish() {
    if (finished_) {
        throw IndexError("sharded builder for " + output_ + " is already finished");
    }
    writeCurrentShard();
    if (shardPaths_.empty()) {
        throw EmptyIndexError("no records were added to the sharded builder for " + output_);
    }
    std::cerr << "ShardedBuilder: merging " << shardPaths_.size() << " shards into " << output_ << "\n";
    mergeIndices(shardPaths_, output_);
    finished_ = true;
    removeScratch();
}

template <typename Writer>
void ShardedBuilder<Writer>::removeScratch() {
    if (scratch_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(scratch_, ec);
    if (ec) {
        std::cerr << "ShardedBuilder: failed to remove " << scratch_ << ": " << ec.message() << "\n";
    }
}

template class ShardedBuilder<HashBucketWriter>;
template class ShardedBuilder<TrigramWriter>;

void ShardedHashBucketBuilder::addKey(std::string_view key, int64_t recordId) {
    writer().addKey(key, recordId);
    recordAdded();
}

void ShardedHashBucketBuilder::addKeys(std::string_view key, const std::vector<int64_t>& recordIds) {
    writer().addKeys(key, recordIds);
    recordAdded();
}

void ShardedTrigramBuilder::addText(std::string_view text, int64_t recordId) {
    writer().addText(text, recordId);
    recordAdded();
}

} // namespace bagindex
