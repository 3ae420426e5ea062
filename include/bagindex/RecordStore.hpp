#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace bagindex {

enum class RecordEncoding : uint16_t { Raw = 0, Zstd = 1 };

// Read side of a positional record container.
class RecordSource {
public:
    virtual ~RecordSource() = default;

    // Throws OutOfRangeError when pos is not in [0, count()).
    virtual std::string read(int64_t pos) const = 0;
    virtual int64_t count() const = 0;
};

// Append-only in-memory store; flush() materializes it as a record file
// that RecordFileReader can open.
class RecordStore : public RecordSource {
public:
    RecordStore();

    // Returns the position of the appended record (monotonic from 0).
    int64_t append(std::string payload);

    std::string read(int64_t pos) const override;
    int64_t count() const override { return static_cast<int64_t>(records_.size()); }

    // Writes every appended record to path, replacing any existing file.
    void flush(const std::string& path) const;

    bool compressionEnabled() const { return compress_; }
    void setCompression(bool enable);

private:
    std::vector<std::string> records_;
    bool compress_ = false;
    int zstdLevel_ = 3;
};

// Read-only view over a flushed record file. The offset table is loaded at
// open time; each read is a single positional read of the payload.
class RecordFileReader : public RecordSource {
public:
    explicit RecordFileReader(const std::string& path);
    ~RecordFileReader() override;

    RecordFileReader(const RecordFileReader&) = delete;
    RecordFileReader& operator=(const RecordFileReader&) = delete;

    std::string read(int64_t pos) const override;
    int64_t count() const override { return static_cast<int64_t>(table_.size()); }

    const std::string& path() const { return path_; }

private:
    struct TableEntry {
        uint64_t offset;
        uint32_t length;
        uint16_t encoding;
        uint32_t crc;
    };

    std::string path_;
    int fd_ = -1;
    uint64_t fileSize_ = 0;
    std::vector<TableEntry> table_;

    void loadTable();
    void preadExact(uint64_t offset, char* out, size_t len) const;
};

std::shared_ptr<const RecordSource> openRecordFile(const std::string& path);

} // namespace bagindex
