#include <gtest/gtest.h>

#include "chunk_fetcher.hpp"
#include "chunk_plan.hpp"

constexpr std::uint64_t FIRST_BOUNDARY = DEFAULT_CHUNK_SIZE;

TEST(ChunkPlan, WindowInsideFirstChunk)
{
    auto plan = make_chunk_plan(ByteRange{0, 1023, 1024}, DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(plan.aligned_offset, 0u);
    EXPECT_EQ(plan.part_count, 1u);
    EXPECT_EQ(plan.leading_trim, 0u);
    EXPECT_EQ(plan.trailing_trim, 1024u);
}

TEST(ChunkPlan, WholeFileOfFiveChunks)
{
    auto plan =
        make_chunk_plan(ByteRange{0, 4'999'999, 5'000'000}, DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(plan.aligned_offset, 0u);
    EXPECT_EQ(plan.part_count, 5u);
    EXPECT_EQ(plan.leading_trim, 0u);
    EXPECT_EQ(plan.trailing_trim, 4'999'999 % DEFAULT_CHUNK_SIZE + 1);
}

TEST(ChunkPlan, TailWindowStartsAtLastAlignedOffset)
{
    auto plan = make_chunk_plan(ByteRange{4'999'500, 4'999'999, 500},
                                DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(plan.aligned_offset, 4 * DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(plan.part_count, 1u);
    EXPECT_EQ(plan.leading_trim, 4'999'500 - 4 * DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(plan.trailing_trim - plan.leading_trim, 500u);
}

TEST(ChunkPlan, WindowStraddlingAChunkBoundary)
{
    // 10 bytes before and 10 bytes after the first boundary
    auto plan = make_chunk_plan(ByteRange{FIRST_BOUNDARY - 10, FIRST_BOUNDARY + 9, 20},
                                DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(plan.aligned_offset, 0u);
    EXPECT_EQ(plan.part_count, 2u);
    EXPECT_EQ(plan.leading_trim, DEFAULT_CHUNK_SIZE - 10);
    EXPECT_EQ(plan.trailing_trim, 10u);
}

TEST(ChunkPlan, WindowEndingOnChunkBoundary)
{
    auto plan = make_chunk_plan(ByteRange{16, 31, 16}, 16);
    EXPECT_EQ(plan.aligned_offset, 16u);
    EXPECT_EQ(plan.part_count, 1u);
    EXPECT_EQ(plan.leading_trim, 0u);
    EXPECT_EQ(plan.trailing_trim, 16u);
}

TEST(ChunkPlan, EmptyRangeHasNoParts)
{
    auto plan = make_chunk_plan(ByteRange{}, DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(plan.part_count, 0u);
}
