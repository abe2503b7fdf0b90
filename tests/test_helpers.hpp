#pragma once

// ============================================================
// test_helpers.hpp -- Temp directories and file fixtures
// ============================================================

#include "../common/platform.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace testutil {

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("lanshare_" + tag + "_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

inline std::vector<u8> pattern_bytes(size_t size, u32 seed) {
    std::vector<u8> out(size);
    std::mt19937 gen(seed);
    for (size_t i = 0; i < size; ++i) out[i] = (u8)(gen() & 0xFF);
    return out;
}

inline void write_file(const fs::path& p, const std::vector<u8>& data) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
}

inline std::vector<u8> read_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::vector<u8>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// Poll pred every 10 ms until it holds or timeout_ms passes
inline bool eventually(const std::function<bool()>& pred, u32 timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace testutil
