#include "bagindex/RecordStore.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string_view>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef BAGINDEX_USE_ZSTD
#include <zstd.h>
#endif

#include "bagindex/Checksum.hpp"
#include "bagindex/Errors.hpp"
#include "LittleEndian.hpp"

namespace bagindex {

namespace {

using detail::readLE;
using detail::writeLE;

constexpr char kMagic[4] = {'B', 'I', 'X', '1'};
constexpr char kTrailerMagic[4] = {'B', 'I', 'X', 'T'};
constexpr uint16_t kVersion = 1;
constexpr size_t kHeaderSize = 16;
constexpr size_t kTrailerSize = 24;
constexpr size_t kTableEntrySize = 20;
constexpr uint16_t kFlagCompressed = 0x1;

#ifdef BAGINDEX_USE_ZSTD
bool compressZstd(const std::string& in, std::string& out, int level) {
    size_t maxSize = ZSTD_compressBound(in.size());
    out.resize(maxSize);
    size_t written = ZSTD_compress(out.data(), maxSize, in.data(), in.size(), level);
    if (ZSTD_isError(written)) return false;
    out.resize(written);
    return true;
}

bool decompressZstd(std::string_view in, std::string& out) {
    unsigned long long rawSize = ZSTD_getFrameContentSize(in.data(), in.size());
    if (rawSize == ZSTD_CONTENTSIZE_ERROR || rawSize == ZSTD_CONTENTSIZE_UNKNOWN) return false;
    out.resize(static_cast<size_t>(rawSize));
    size_t res = ZSTD_decompress(out.data(), out.size(), in.data(), in.size());
    if (ZSTD_isError(res)) return false;
    out.resize(res);
    return true;
}
#endif

// Compresses payload in place when enabled and worthwhile.
uint16_t maybeCompress(std::string& payload, bool enable, int level) {
    if (!enable || payload.empty()) return static_cast<uint16_t>(RecordEncoding::Raw);
#ifdef BAGINDEX_USE_ZSTD
    std::string compressed;
    if (compressZstd(payload, compressed, level) && compressed.size() < payload.size()) {
        payload.swap(compressed);
        return static_cast<uint16_t>(RecordEncoding::Zstd);
    }
#else
    (void)level;
#endif
    return static_cast<uint16_t>(RecordEncoding::Raw);
}

std::string decodePayload(std::string stored, uint16_t encoding, int64_t pos) {
    if (encoding == static_cast<uint16_t>(RecordEncoding::Raw)) {
        return stored;
    }
    if (encoding == static_cast<uint16_t>(RecordEncoding::Zstd)) {
#ifdef BAGINDEX_USE_ZSTD
        std::string out;
        if (!decompressZstd(stored, out)) {
            throw CorruptIndexError("record " + std::to_string(pos) + " failed zstd decompression");
        }
        return out;
#else
        throw CorruptIndexError("record " + std::to_string(pos) + " is zstd-compressed but zstd support is not built in");
#endif
    }
    throw CorruptIndexError("record " + std::to_string(pos) + " has unsupported encoding=" + std::to_string(encoding));
}

bool envFlagEnabled(const char* value) {
    std::string v(value);
    return !(v == "0" || v == "false" || v == "off");
}

} // namespace

// -----------------------------------------------------------
// RecordStore
// -----------------------------------------------------------
RecordStore::RecordStore() {
#ifdef BAGINDEX_USE_ZSTD
    compress_ = true;
#endif
    if (const char* envComp = std::getenv("BAGINDEX_COMPRESS")) {
        compress_ = envFlagEnabled(envComp);
    }
    if (const char* envLevel = std::getenv("BAGINDEX_ZSTD_LEVEL")) {
        try {
            zstdLevel_ = std::stoi(envLevel);
        } catch (const std::exception&) {
            std::cerr << "RecordStore: ignoring invalid BAGINDEX_ZSTD_LEVEL=" << envLevel << "\n";
        }
    }
}

void RecordStore::setCompression(bool enable) {
    compress_ = enable;
}

int64_t RecordStore::append(std::string payload) {
    if (payload.size() > UINT32_MAX) {
        throw IOError("record of " + std::to_string(payload.size()) + " bytes exceeds the 4 GiB record limit");
    }
    records_.push_back(std::move(payload));
    return static_cast<int64_t>(records_.size()) - 1;
}

std::string RecordStore::read(int64_t pos) const {
    if (pos < 0 || pos >= count()) {
        throw OutOfRangeError("position " + std::to_string(pos) + " not in [0, " + std::to_string(count()) + ")");
    }
    return records_[static_cast<size_t>(pos)];
}

void RecordStore::flush(const std::string& path) const {
    std::string header;
    header.append(kMagic, sizeof(kMagic));
    writeLE(header, kVersion);
    writeLE(header, static_cast<uint16_t>(compress_ ? kFlagCompressed : 0));
    writeLE(header, static_cast<uint32_t>(0));
    writeLE(header, crc32(header));

    std::string body;
    std::string table;
    table.reserve(records_.size() * kTableEntrySize);
    uint64_t cursor = kHeaderSize;
    for (const auto& record : records_) {
        std::string stored = record;
        const uint16_t encoding = maybeCompress(stored, compress_, zstdLevel_);
        writeLE(table, cursor);
        writeLE(table, static_cast<uint32_t>(stored.size()));
        writeLE(table, encoding);
        writeLE(table, static_cast<uint16_t>(0));
        writeLE(table, crc32(stored));
        cursor += stored.size();
        body.append(stored);
    }

    std::string trailer;
    writeLE(trailer, cursor);
    writeLE(trailer, static_cast<uint64_t>(records_.size()));
    writeLE(trailer, crc32(table));
    trailer.append(kTrailerMagic, sizeof(kTrailerMagic));

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError("failed to open " + path + " for writing");
    }
    out.write(header.data(), static_cast<std::streamsize>(header.size()));
    out.write(body.data(), static_cast<std::streamsize>(body.size()));
    out.write(table.data(), static_cast<std::streamsize>(table.size()));
    out.write(trailer.data(), static_cast<std::streamsize>(trailer.size()));
    out.flush();
    if (!out) {
        throw IOError("failed to write " + path);
    }
    std::cerr << "RecordStore: flushed " << records_.size() << " records (" << cursor + table.size() + trailer.size()
              << " bytes) to " << path << "\n";
}

// -----------------------------------------------------------
// RecordFileReader
// -----------------------------------------------------------
RecordFileReader::RecordFileReader(const std::string& path) : path_(path) {
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw IOError("failed to open " + path_ + ": " + std::strerror(errno));
    }
    try {
        struct stat st {};
        if (::fstat(fd_, &st) != 0) {
            throw IOError("failed to stat " + path_ + ": " + std::strerror(errno));
        }
        fileSize_ = static_cast<uint64_t>(st.st_size);
        loadTable();
    } catch (...) {
        ::close(fd_);
        fd_ = -1;
        throw;
    }
}

RecordFileReader::~RecordFileReader() {
    if (fd_ >= 0) ::close(fd_);
}

void RecordFileReader::preadExact(uint64_t offset, char* out, size_t len) const {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pread(fd_, out + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IOError("read failed on " + path_ + ": " + std::strerror(errno));
        }
        if (n == 0) {
            throw CorruptIndexError(path_ + " is truncated at offset " + std::to_string(offset + done));
        }
        done += static_cast<size_t>(n);
    }
}

void RecordFileReader::loadTable() {
    if (fileSize_ < kHeaderSize + kTrailerSize) {
        throw CorruptIndexError(path_ + " is too small to be a record file (" + std::to_string(fileSize_) + " bytes)");
    }

    std::string header(kHeaderSize, '\0');
    preadExact(0, header.data(), header.size());
    if (std::memcmp(header.data(), kMagic, sizeof(kMagic)) != 0) {
        throw CorruptIndexError(path_ + " has bad header magic");
    }
    std::string_view hview(header);
    size_t cursor = sizeof(kMagic);
    uint16_t version = 0;
    uint16_t flags = 0;
    uint32_t reserved = 0;
    uint32_t storedHeaderCrc = 0;
    readLE(hview, cursor, version);
    readLE(hview, cursor, flags);
    readLE(hview, cursor, reserved);
    const uint32_t computedHeaderCrc = crc32(hview.substr(0, cursor));
    readLE(hview, cursor, storedHeaderCrc);
    if (storedHeaderCrc != computedHeaderCrc) {
        throw CorruptIndexError(path_ + " header checksum mismatch");
    }
    if (version != kVersion) {
        throw CorruptIndexError(path_ + " has unsupported version=" + std::to_string(version));
    }

    std::string trailer(kTrailerSize, '\0');
    preadExact(fileSize_ - kTrailerSize, trailer.data(), trailer.size());
    if (std::memcmp(trailer.data() + kTrailerSize - sizeof(kTrailerMagic), kTrailerMagic, sizeof(kTrailerMagic)) != 0) {
        throw CorruptIndexError(path_ + " has bad trailer magic");
    }
    std::string_view tview(trailer);
    cursor = 0;
    uint64_t tableOffset = 0;
    uint64_t recordCount = 0;
    uint32_t tableCrc = 0;
    readLE(tview, cursor, tableOffset);
    readLE(tview, cursor, recordCount);
    readLE(tview, cursor, tableCrc);

    const uint64_t tableEnd = fileSize_ - kTrailerSize;
    if (tableOffset < kHeaderSize || tableOffset > tableEnd ||
        (tableEnd - tableOffset) / kTableEntrySize != recordCount ||
        (tableEnd - tableOffset) % kTableEntrySize != 0) {
        throw CorruptIndexError(path_ + " has an inconsistent offset table (records=" + std::to_string(recordCount) + ")");
    }

    std::string tableBytes(static_cast<size_t>(tableEnd - tableOffset), '\0');
    if (!tableBytes.empty()) {
        preadExact(tableOffset, tableBytes.data(), tableBytes.size());
    }
    if (crc32(tableBytes) != tableCrc) {
        throw CorruptIndexError(path_ + " offset table checksum mismatch");
    }

    std::string_view view(tableBytes);
    cursor = 0;
    table_.reserve(static_cast<size_t>(recordCount));
    for (uint64_t i = 0; i < recordCount; ++i) {
        TableEntry e{};
        uint16_t reservedEntry = 0;
        readLE(view, cursor, e.offset);
        readLE(view, cursor, e.length);
        readLE(view, cursor, e.encoding);
        readLE(view, cursor, reservedEntry);
        readLE(view, cursor, e.crc);
        if (e.offset < kHeaderSize || e.offset > tableOffset || tableOffset - e.offset < e.length) {
            throw CorruptIndexError(path_ + " record " + std::to_string(i) + " points outside the payload region");
        }
        table_.push_back(e);
    }
}

std::string RecordFileReader::read(int64_t pos) const {
    if (pos < 0 || pos >= count()) {
        throw OutOfRangeError("position " + std::to_string(pos) + " not in [0, " + std::to_string(count()) + ") of " + path_);
    }
    const auto& e = table_[static_cast<size_t>(pos)];
    if (e.length == 0) return {};

    std::string stored(e.length, '\0');
    preadExact(e.offset, stored.data(), stored.size());
    if (crc32(stored) != e.crc) {
        std::cerr << "RecordStore: checksum mismatch for record " << pos << " in " << path_ << "\n";
        throw CorruptIndexError("record " + std::to_string(pos) + " checksum mismatch in " + path_);
    }
    return decodePayload(std::move(stored), e.encoding, pos);
}

std::shared_ptr<const RecordSource> openRecordFile(const std::string& path) {
    return std::make_shared<const RecordFileReader>(path);
}

} // namespace bagindex
