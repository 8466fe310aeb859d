#pragma once

#include <cstdint>

#include "byte_range.hpp"

struct ChunkPlan
{
    std::uint64_t aligned_offset{0};
    std::uint64_t chunk_size{0};
    std::uint64_t part_count{0};
    // Bytes to drop from the front of the first part
    std::uint64_t leading_trim{0};
    // Bytes to keep from the front of the last part
    std::uint64_t trailing_trim{0};
};

inline ChunkPlan make_chunk_plan(const ByteRange &range,
                                 std::uint64_t chunk_size)
{
    ChunkPlan plan;
    plan.chunk_size = chunk_size;
    if (range.length == 0)
    {
        return plan;
    }
    plan.aligned_offset = range.start - range.start % chunk_size;
    plan.leading_trim = range.start - plan.aligned_offset;
    plan.trailing_trim = range.end % chunk_size + 1;
    plan.part_count =
        (range.end - plan.aligned_offset + chunk_size) / chunk_size;
    return plan;
}
