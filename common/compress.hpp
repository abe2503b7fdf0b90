#pragma once

// ============================================================
// compress.hpp -- zstd wrapper for large handshake envelopes
// ============================================================

#include "platform.hpp"
#include <vector>
#include <string>
#include <stdexcept>

#include <zstd.h>

namespace compress {

// Compression level 1 = fastest
static constexpr int ZSTD_LEVEL = 1;

// Returns the maximum compressed size for a given input size
inline size_t max_compressed_size(size_t input_size) {
    return ZSTD_compressBound(input_size);
}

// Compress to a resizable buffer; returns compressed data
inline std::vector<u8> compress_to_vec(const void* src, size_t src_len) {
    size_t cap = max_compressed_size(src_len);
    std::vector<u8> buf(cap);
    size_t sz = ZSTD_compress(buf.data(), cap, src, src_len, ZSTD_LEVEL);
    if (ZSTD_isError(sz)) {
        throw std::runtime_error(std::string("ZSTD compress error: ") + ZSTD_getErrorName(sz));
    }
    buf.resize(sz);
    return buf;
}

// Decompress to a buffer of known original size.
// Throws if the frame is corrupt or does not expand to exactly original_size.
inline std::vector<u8> decompress_to_vec(const void* src, size_t src_len, size_t original_size) {
    std::vector<u8> buf(original_size);
    size_t sz = ZSTD_decompress(buf.data(), original_size, src, src_len);
    if (ZSTD_isError(sz)) {
        throw std::runtime_error(std::string("ZSTD decompress error: ") + ZSTD_getErrorName(sz));
    }
    if (sz != original_size) {
        throw std::runtime_error("ZSTD decompress size mismatch: expected " +
                                 std::to_string(original_size) + ", got " + std::to_string(sz));
    }
    return buf;
}

} // namespace compress
