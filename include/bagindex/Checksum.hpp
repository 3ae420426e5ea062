#pragma once

#include <cstdint>
#include <string_view>

namespace bagindex {

inline uint32_t crc32(std::string_view data) {
    uint32_t crc = 0xFFFFFFFFu;
    for (unsigned char b : data) {
        crc ^= b;
        for (int i = 0; i < 8; ++i) {
            uint32_t mask = (crc & 1u) ? 0xFFFFFFFFu : 0u;
            crc = (crc >> 1) ^ (0xEDB88320u & mask);
        }
    }
    return ~crc;
}

// FNV-1a 64 over raw bytes. Shared by writers and readers to place keys.
inline uint64_t stableHash(std::string_view data) {
    constexpr uint64_t kOffset = 1469598103934665603ull;
    constexpr uint64_t kPrime = 1099511628211ull;
    uint64_t h = kOffset;
    for (unsigned char b : data) {
        h ^= b;
        h *= kPrime;
    }
    return h;
}

inline uint64_t bucketFor(std::string_view key, uint64_t bucketCount) {
    return bucketCount == 0 ? 0 : stableHash(key) % bucketCount;
}

} // namespace bagindex
