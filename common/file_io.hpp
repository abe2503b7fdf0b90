#pragma once

// ============================================================
// file_io.hpp -- Memory-mapped file I/O and output path helpers
// ============================================================

#include "platform.hpp"
#include "hash.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <ctime>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

    // Get pointer to chunk at given offset, clamped to available bytes
    const char* chunk_ptr(u64 offset) const {
        if (offset >= size_) return nullptr;
        return data_ + offset;
    }

    u64 chunk_len(u64 offset, u64 max_len) const {
        if (offset >= size_) return 0;
        u64 remaining = size_ - offset;
        return remaining < max_len ? remaining : max_len;
    }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif
};

// ---- MmapWriter: zero-copy write via mmap ----
// Several workers may call write_at concurrently on disjoint ranges.
class MmapWriter {
public:
    MmapWriter() = default;
    ~MmapWriter();

    MmapWriter(const MmapWriter&) = delete;
    MmapWriter& operator=(const MmapWriter&) = delete;

    // Create/truncate file, preallocate to size, then mmap
    void open(const std::string& path, u64 size);

    // Write data at given offset
    void write_at(u64 offset, const void* data, size_t len);

    // Flush and close
    void close();

    bool is_open() const { return open_; }
    u64 size() const { return size_; }
    const std::string& path() const { return path_; }

private:
    char* data_{nullptr};
    bool  open_{false};
    u64   size_{0};
    std::string path_;

#ifdef _WIN32
    HANDLE file_handle_{INVALID_HANDLE_VALUE};
    HANDLE map_handle_{nullptr};
#else
    int fd_{-1};
#endif
};

// ---- Utility functions ----

// True when relative_path is a non-empty relative path with no ".", ".." or
// empty component, no drive letter and no leading separator. Such a path has
// exactly one spelling, so equal entries compare equal as strings.
// Pure, touches no file system.
bool is_safe_relative_path(const std::string& relative_path);

// Sanitize relative path to prevent directory traversal
// Throws if path is unsafe
fs::path proto_to_fspath(const fs::path& root_dir, const std::string& relative_path);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

// xxh3-128 of a whole file, streamed through a mapping in buffer_size steps
hash::Hash128 hash_file(const std::string& path, size_t buffer_size);

// First free variant of path: "name.ext", "name_1.ext", "name_2.ext", ...
fs::path unique_path(const fs::path& path);

// "batch_YYYYmmdd_HHMMSS" in local time
std::string batch_dir_name(std::time_t when);

} // namespace file_io
