// ============================================================
// file_io.cpp -- Memory-mapped file I/O implementation
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <filesystem>

#ifndef _WIN32
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <fcntl.h>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;
using namespace file_io;

static TransferError io_error(const std::string& msg) {
    return TransferError(ErrorCode::FILE_IO, msg);
}

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
#ifdef _WIN32
    file_handle_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                               nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL |
                               FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw io_error("Cannot open file: " + path);
    }

    LARGE_INTEGER sz{};
    GetFileSizeEx(file_handle_, &sz);
    size_ = (u64)sz.QuadPart;

    if (size_ == 0) {
        // Empty file: no mapping needed
        data_ = nullptr;
        return;
    }

    map_handle_ = CreateFileMappingA(file_handle_, nullptr, PAGE_READONLY, 0, 0, nullptr);
    if (!map_handle_) {
        CloseHandle(file_handle_);
        throw io_error("CreateFileMapping failed: " + path);
    }

    data_ = static_cast<const char*>(MapViewOfFile(map_handle_, FILE_MAP_READ, 0, 0, 0));
    if (!data_) {
        CloseHandle(map_handle_);
        CloseHandle(file_handle_);
        throw io_error("MapViewOfFile failed: " + path);
    }
#else
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw io_error("Cannot open file: " + path + ": " + std::strerror(errno));
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw io_error("fstat failed: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw io_error("mmap failed: " + path);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const char*>(p);
#endif
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
#ifdef _WIN32
    if (data_) { UnmapViewOfFile(data_); data_ = nullptr; }
    if (map_handle_) { CloseHandle(map_handle_); map_handle_ = nullptr; }
    if (file_handle_ != INVALID_HANDLE_VALUE) { CloseHandle(file_handle_); file_handle_ = INVALID_HANDLE_VALUE; }
#else
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
#endif
    size_ = 0;
}

// ============================================================
// MmapWriter
// ============================================================

MmapWriter::~MmapWriter() {
    if (!is_open()) return;
    try {
        close();
    } catch (const std::exception& e) {
        LOG_WARN("MmapWriter: close failed for " + path_ + ": " + e.what());
    }
}

void MmapWriter::open(const std::string& file_path, u64 size) {
    path_ = file_path;
    size_ = size;

    ensure_parent_dirs(file_path);

#ifdef _WIN32
    file_handle_ = CreateFileA(file_path.c_str(), GENERIC_READ | GENERIC_WRITE, FILE_SHARE_READ,
                               nullptr, CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file_handle_ == INVALID_HANDLE_VALUE) {
        throw io_error("Cannot create file: " + file_path);
    }
    open_ = true;

    // Preallocate to full size
    LARGE_INTEGER li;
    li.QuadPart = (LONGLONG)size;
    if (!SetFilePointerEx(file_handle_, li, nullptr, FILE_BEGIN) || !SetEndOfFile(file_handle_)) {
        close();
        throw io_error("Cannot preallocate " + std::to_string(size) + " bytes: " + file_path);
    }

    if (size == 0) {
        data_ = nullptr;
        return;
    }

    DWORD hi = (DWORD)(size >> 32);
    DWORD lo = (DWORD)(size & 0xFFFFFFFF);
    map_handle_ = CreateFileMappingA(file_handle_, nullptr, PAGE_READWRITE, hi, lo, nullptr);
    if (!map_handle_) {
        close();
        throw io_error("CreateFileMapping(write) failed: " + path_);
    }

    data_ = static_cast<char*>(MapViewOfFile(map_handle_, FILE_MAP_WRITE, 0, 0, 0));
    if (!data_) {
        close();
        throw io_error("MapViewOfFile(write) failed: " + path_);
    }
#else
    fd_ = ::open(file_path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
    if (fd_ < 0) {
        throw io_error("Cannot create file: " + file_path + ": " + std::strerror(errno));
    }
    open_ = true;

    if (size > 0) {
        // posix_fallocate is unsupported on some file systems; fall back to a sparse extend
        int rc = posix_fallocate(fd_, 0, (off_t)size);
        if (rc != 0 && ftruncate(fd_, (off_t)size) != 0) {
            int err = errno;
            close();
            throw io_error("Cannot preallocate " + std::to_string(size) + " bytes: " +
                           file_path + ": " + std::strerror(err));
        }

        void* p = mmap(nullptr, (size_t)size, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
        if (p == MAP_FAILED) {
            close();
            throw io_error("mmap(write) failed: " + path_);
        }
        data_ = static_cast<char*>(p);
    } else {
        data_ = nullptr;
    }
#endif
}

void MmapWriter::write_at(u64 offset, const void* data, size_t len) {
    if (len == 0) return;
    if (!data_ || offset + len > size_) {
        throw io_error("MmapWriter::write_at out of bounds: " + path_ +
                       " offset=" + std::to_string(offset) + " len=" + std::to_string(len));
    }
    std::memcpy(data_ + offset, data, len);
}

void MmapWriter::close() {
    bool sync_ok = true;
#ifdef _WIN32
    if (data_) {
        sync_ok = FlushViewOfFile(data_, 0) != 0;
        UnmapViewOfFile(data_);
        data_ = nullptr;
    }
    if (map_handle_) { CloseHandle(map_handle_); map_handle_ = nullptr; }
    if (file_handle_ != INVALID_HANDLE_VALUE) {
        CloseHandle(file_handle_);
        file_handle_ = INVALID_HANDLE_VALUE;
    }
#else
    if (data_ && size_ > 0) {
        sync_ok = msync(data_, (size_t)size_, MS_SYNC) == 0;
        munmap(data_, (size_t)size_);
        data_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
#endif
    open_ = false;
    if (!sync_ok) {
        throw io_error("Flush failed: " + path_);
    }
}

// ============================================================
// Utility functions
// ============================================================

bool file_io::is_safe_relative_path(const std::string& relative_path) {
    if (relative_path.empty()) return false;
    if (relative_path[0] == '/' || relative_path[0] == '\\') return false;
    // Drive letters ("C:...")
    if (relative_path.size() >= 2 && relative_path[1] == ':') return false;

    size_t start = 0;
    while (start <= relative_path.size()) {
        size_t end = relative_path.find_first_of("/\\", start);
        if (end == std::string::npos) end = relative_path.size();
        std::string comp = relative_path.substr(start, end - start);
        if (comp.empty() || comp == "." || comp == "..") return false;
        if (comp.find('\0') != std::string::npos) return false;
        start = end + 1;
    }
    return true;
}

fs::path file_io::proto_to_fspath(const fs::path& root_dir, const std::string& relative_path) {
    if (!is_safe_relative_path(relative_path)) {
        throw io_error("Unsafe relative path rejected: " + relative_path);
    }

    fs::path full = (root_dir / fs::path(relative_path)).lexically_normal();

    // Verify result is still under root_dir
    fs::path rel = full.lexically_relative(root_dir.lexically_normal());
    if (rel.empty() || *rel.begin() == "..") {
        throw io_error("Path escapes root directory: " + relative_path);
    }
    return full;
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw io_error("Cannot create directory " + parent.string() + ": " + ec.message());
    }
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}

hash::Hash128 file_io::hash_file(const std::string& path, size_t buffer_size) {
    MmapReader reader(path);
    hash::StreamHasher128 hasher;
    u64 offset = 0;
    while (offset < reader.size()) {
        u64 len = reader.chunk_len(offset, buffer_size);
        hasher.update(reader.chunk_ptr(offset), (size_t)len);
        offset += len;
    }
    return hasher.digest();
}

fs::path file_io::unique_path(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return path;

    fs::path parent = path.parent_path();
    std::string stem = path.stem().string();
    std::string ext  = path.extension().string();
    for (u32 n = 1;; ++n) {
        fs::path candidate = parent / (stem + "_" + std::to_string(n) + ext);
        if (!fs::exists(candidate, ec)) return candidate;
    }
}

std::string file_io::batch_dir_name(std::time_t when) {
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &when);
#else
    localtime_r(&when, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "batch_%Y%m%d_%H%M%S", &tm_buf);
    return buf;
}
