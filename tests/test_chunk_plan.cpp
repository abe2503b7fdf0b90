// ============================================================
// test_chunk_plan.cpp -- Partitioning and assignment tests
// ============================================================

#include "../common/chunk_plan.hpp"
#include "../common/protocol.hpp"
#include <gtest/gtest.h>
#include <vector>

static void expect_tiles(const std::vector<ByteRange>& ranges, u64 size) {
    u64 next = 0;
    for (const auto& r : ranges) {
        EXPECT_EQ(r.offset, next);
        next = r.offset + r.length;
    }
    EXPECT_EQ(next, size);
}

TEST(ChunkPlanTest, PartitionTilesExactly) {
    const u64 buf = DEFAULT_BUFFER_SIZE;
    const std::vector<u64> sizes = {0, 1, buf - 1, buf, 524288001ull, 7ull * 1024 * 1024 * 1024 + 3};
    for (u32 n = 1; n <= 4; ++n) {
        for (u64 s : sizes) {
            SCOPED_TRACE("size " + std::to_string(s) + " count " + std::to_string(n));
            auto ranges = chunk_plan::partition(s, n);
            ASSERT_EQ(ranges.size(), n);
            expect_tiles(ranges, s);
        }
    }
}

TEST(ChunkPlanTest, FirstRemainderRangesAreOneByteLonger) {
    auto ranges = chunk_plan::partition(10, 4);
    ASSERT_EQ(ranges.size(), 4u);
    EXPECT_EQ(ranges[0].length, 3u);
    EXPECT_EQ(ranges[1].length, 3u);
    EXPECT_EQ(ranges[2].length, 2u);
    EXPECT_EQ(ranges[3].length, 2u);
}

TEST(ChunkPlanTest, PartitionRejectsZeroCount) {
    EXPECT_THROW(chunk_plan::partition(100, 0), std::invalid_argument);
}

TEST(ChunkPlanTest, ChunkCountClampsToParallelismAndMinChunk) {
    const u64 MB = 1024 * 1024;
    EXPECT_EQ(chunk_plan::chunk_count(500 * MB, 100 * MB, 4), 4u);
    EXPECT_EQ(chunk_plan::chunk_count(250 * MB, 100 * MB, 4), 3u);
    EXPECT_EQ(chunk_plan::chunk_count(100 * MB, 100 * MB, 4), 1u);
    EXPECT_EQ(chunk_plan::chunk_count(0, 100 * MB, 4), 1u);
    EXPECT_EQ(chunk_plan::chunk_count(10 * MB, 1, 64), 64u);
}

static TransferManifest make_manifest(const std::vector<u64>& sizes, u64 threshold, u16 parallelism,
                                      u64 min_chunk) {
    TransferManifest m;
    m.parallelism            = parallelism;
    m.multi_stream_threshold = threshold;
    m.min_chunk_size         = min_chunk;
    for (size_t i = 0; i < sizes.size(); ++i) {
        FileDescriptor f;
        f.rel_path = "f" + std::to_string(i);
        f.size     = sizes[i];
        m.files.push_back(f);
    }
    m.select_mode();
    return m;
}

TEST(ChunkPlanTest, FiveHundredMegabytesOverFourWorkers) {
    const u64 MB = 1024 * 1024;
    TransferManifest m = make_manifest({500 * MB}, 200 * MB, 4, 100 * MB);
    ASSERT_EQ(m.mode, TransferMode::MULTI_STREAM);

    auto plan = chunk_plan::plan(m, 20000);
    ASSERT_EQ(plan.size(), 4u);
    u64 next = 0;
    for (size_t k = 0; k < plan.size(); ++k) {
        EXPECT_EQ(plan[k].worker_id, k + 1);
        EXPECT_EQ(plan[k].file_index, 0u);
        EXPECT_EQ(plan[k].port, 20000 + k);
        EXPECT_EQ(plan[k].length, 125 * MB);
        EXPECT_EQ(plan[k].offset, next);
        next += plan[k].length;
    }
}

TEST(ChunkPlanTest, OnlyLargeFilesAreChunkedInManifestOrder) {
    TransferManifest m = make_manifest({50, 1000, 10, 999}, 500, 3, 100);
    auto plan = chunk_plan::plan(m, 0);
    ASSERT_EQ(plan.size(), 6u);
    for (size_t k = 0; k < 3; ++k) EXPECT_EQ(plan[k].file_index, 1u);
    for (size_t k = 3; k < 6; ++k) EXPECT_EQ(plan[k].file_index, 3u);
    for (size_t k = 0; k < plan.size(); ++k) {
        EXPECT_EQ(plan[k].worker_id, k + 1);
        EXPECT_EQ(plan[k].port, 0u);
    }
    EXPECT_EQ(chunk_plan::aux_connection_count(m), 6u);
}

TEST(ChunkPlanTest, SingleStreamManifestHasNoAssignments) {
    TransferManifest m = make_manifest({50, 60}, 500, 4, 10);
    EXPECT_EQ(m.mode, TransferMode::SINGLE_STREAM);
    EXPECT_TRUE(chunk_plan::plan(m, 30000).empty());
}

TEST(ChunkPlanTest, PortBlockOverflowThrows) {
    TransferManifest m = make_manifest({1000}, 100, 4, 100);
    EXPECT_THROW(chunk_plan::plan(m, 65534), std::invalid_argument);
}
