#include <gtest/gtest.h>

#include <limits>

#include "core/planner/chunk_planner.hpp"

using namespace fxfer::core;
using fxfer::infra::ErrorCode;

TEST(ChunkPlannerTest, SplitsWithRemainderInLastChunk)
{
    auto chunks = planner::plan(10'000'000, 2'000'001);
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks->size(), 5u);

    std::uint64_t expected_offset = 0;
    for (const auto& chunk : *chunks) {
        EXPECT_EQ(chunk.offset, expected_offset);
        EXPECT_EQ(chunk.status, ChunkStatus::Pending);
        expected_offset = chunk.end();
    }
    EXPECT_EQ(expected_offset, 10'000'000u);
    EXPECT_EQ(chunks->back().length, 10'000'000u - 4 * 2'000'001u);
}

TEST(ChunkPlannerTest, ExactMultiple)
{
    auto chunks = planner::plan(1 << 20, 1 << 18);
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks->size(), 4u);
    for (const auto& chunk : *chunks) {
        EXPECT_EQ(chunk.length, 1u << 18);
    }
}

TEST(ChunkPlannerTest, ChunkLargerThanFileGivesOneChunk)
{
    auto chunks = planner::plan(81'840'585, 81'840'595);
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks->size(), 1u);
    EXPECT_EQ(chunks->front().offset, 0u);
    EXPECT_EQ(chunks->front().length, 81'840'585u);
}

TEST(ChunkPlannerTest, EmptyFileGetsOneZeroLengthChunk)
{
    auto chunks = planner::plan(0, 1024, 3);
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks->size(), 1u);
    EXPECT_EQ(chunks->front().length, 0u);
    EXPECT_EQ(chunks->front().file_index, 3u);
}

TEST(ChunkPlannerTest, ZeroChunkSizeIsRejected)
{
    auto chunks = planner::plan(100, 0);
    ASSERT_FALSE(chunks.has_value());
    EXPECT_EQ(chunks.error().code, ErrorCode::InvalidArgument);
}

TEST(ChunkPlannerTest, CountMatchesPlan)
{
    static_assert(planner::chunk_count(0, 10) == 1);
    static_assert(planner::chunk_count(81'840'585, 1 << 24) == 5);

    auto chunks = planner::plan(81'840'585, 1 << 24);
    ASSERT_TRUE(chunks.has_value());
    EXPECT_EQ(chunks->size(), planner::chunk_count(81'840'585, 1 << 24));
}

TEST(ChunkPlannerTest, Deterministic)
{
    auto a = planner::plan(12345, 1000);
    auto b = planner::plan(12345, 1000);
    ASSERT_TRUE(a && b);
    ASSERT_EQ(a->size(), b->size());
    for (std::size_t i = 0; i < a->size(); ++i) {
        EXPECT_EQ((*a)[i].offset, (*b)[i].offset);
        EXPECT_EQ((*a)[i].length, (*b)[i].length);
    }
}

TEST(ChunkPlannerTest, HugeChunkSizeStillCoversFile)
{
    constexpr auto max = std::numeric_limits<std::uint64_t>::max();
    static_assert(planner::chunk_count(10, max) == 1);
    static_assert(planner::chunk_count(max, max) == 1);

    for (const auto chunk_size : {max, max - 5}) {
        auto chunks = planner::plan(10, chunk_size);
        ASSERT_TRUE(chunks.has_value());
        ASSERT_EQ(chunks->size(), 1u);
        EXPECT_EQ(chunks->front().offset, 0u);
        EXPECT_EQ(chunks->front().length, 10u);
    }
}
