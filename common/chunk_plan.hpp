#pragma once

// ============================================================
// chunk_plan.hpp -- Deterministic split of large files across workers
//
// A file of size S with parallelism T and minimum chunk size M is cut
// into n = clamp(ceil(S / M), 1, T) contiguous ranges. The first
// S mod n ranges are one byte longer than the rest. Both peers run the
// same computation on the handshake values, so no range table is sent.
// ============================================================

#include "platform.hpp"
#include "envelope.hpp"
#include <vector>

struct ByteRange {
    u64 offset{0};
    u64 length{0};
};

struct ChunkAssignment {
    u32 worker_id{0};    // 1-based; 0 denotes the primary connection
    u32 file_index{0};
    u64 offset{0};
    u64 length{0};
    u16 port{0};         // aux_base + (worker_id - 1)
};

namespace chunk_plan {

u32 chunk_count(u64 size, u64 min_chunk_size, u16 parallelism);

// Exactly 'count' ranges tiling [0, size); count must be >= 1
std::vector<ByteRange> partition(u64 size, u32 count);

// Total auxiliary connections a manifest needs
u32 aux_connection_count(const TransferManifest& m);

// Assignments for every chunked file in manifest order.
// aux_base == 0 plans without ports (every port left 0).
std::vector<ChunkAssignment> plan(const TransferManifest& m, u16 aux_base);

} // namespace chunk_plan
