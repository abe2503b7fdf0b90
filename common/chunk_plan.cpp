// ============================================================
// chunk_plan.cpp -- Chunk partitioning
// ============================================================

#include "chunk_plan.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

u32 chunk_plan::chunk_count(u64 size, u64 min_chunk_size, u16 parallelism) {
    if (min_chunk_size == 0) min_chunk_size = 1;
    u64 wanted = size / min_chunk_size + (size % min_chunk_size != 0 ? 1 : 0);
    u64 cap = parallelism == 0 ? 1 : parallelism;
    if (wanted < 1)   wanted = 1;
    if (wanted > cap) wanted = cap;
    return (u32)wanted;
}

std::vector<ByteRange> chunk_plan::partition(u64 size, u32 count) {
    if (count == 0) {
        throw std::invalid_argument("partition: count must be >= 1");
    }
    std::vector<ByteRange> ranges;
    ranges.reserve(count);
    u64 base  = size / count;
    u64 extra = size % count;
    u64 offset = 0;
    for (u32 i = 0; i < count; ++i) {
        u64 len = base + (i < extra ? 1 : 0);
        ranges.push_back({offset, len});
        offset += len;
    }
    return ranges;
}

u32 chunk_plan::aux_connection_count(const TransferManifest& m) {
    u64 total = 0;
    for (size_t i = 0; i < m.files.size(); ++i) {
        if (m.is_chunked(i)) {
            total += chunk_count(m.files[i].size, m.min_chunk_size, m.parallelism);
        }
    }
    return (u32)std::min<u64>(total, 0xFFFFFFFFull);
}

std::vector<ChunkAssignment> chunk_plan::plan(const TransferManifest& m, u16 aux_base) {
    std::vector<ChunkAssignment> out;
    u32 next_worker = 1;
    for (size_t i = 0; i < m.files.size(); ++i) {
        if (!m.is_chunked(i)) continue;
        u32 n = chunk_count(m.files[i].size, m.min_chunk_size, m.parallelism);
        for (const auto& r : partition(m.files[i].size, n)) {
            ChunkAssignment a;
            a.worker_id  = next_worker++;
            a.file_index = (u32)i;
            a.offset     = r.offset;
            a.length     = r.length;
            if (aux_base != 0) {
                u32 port = (u32)aux_base + (a.worker_id - 1);
                if (port > 65535) {
                    throw std::invalid_argument("auxiliary port block starting at " +
                                                std::to_string(aux_base) + " overflows");
                }
                a.port = (u16)port;
            }
            out.push_back(a);
        }
    }
    return out;
}
