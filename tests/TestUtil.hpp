#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace bagindex::test {

inline void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

template <typename Error, typename Fn>
void expectThrows(Fn&& fn, const std::string& msg) {
    try {
        fn();
    } catch (const Error&) {
        return;
    } catch (const std::exception& e) {
        expect(false, msg + " (threw a different error: " + e.what() + ")");
    }
    expect(false, msg + " (nothing thrown)");
}

// Fresh per-test directory under the system temp dir.
inline std::filesystem::path scratchDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("bagindex_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline std::string ids(const std::vector<int64_t>& v) {
    std::string out = "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += ",";
        out += std::to_string(v[i]);
    }
    return out + "]";
}

} // namespace bagindex::test
