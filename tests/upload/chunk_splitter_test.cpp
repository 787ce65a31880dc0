#include "rup/upload/chunk_splitter.hpp"

#include <gtest/gtest.h>

using rup::upload::ChunkDescriptor;
using rup::upload::ChunkSplitter;

namespace {
constexpr std::uint64_t kMiB = 1024 * 1024;
}

TEST(ChunkSplitterTest, TwelveMiBInFiveMiBChunks) {
    ChunkSplitter splitter(5 * kMiB);

    auto plan = splitter.plan(12 * kMiB);
    ASSERT_TRUE(plan.is_ok());
    ASSERT_EQ(plan.value().size(), 3u);

    EXPECT_EQ(plan.value()[0], (ChunkDescriptor{0, 0, 5 * kMiB}));
    EXPECT_EQ(plan.value()[1], (ChunkDescriptor{1, 5 * kMiB, 5 * kMiB}));
    EXPECT_EQ(plan.value()[2], (ChunkDescriptor{2, 10 * kMiB, 2 * kMiB}));
}

TEST(ChunkSplitterTest, ExactMultipleHasNoShortTail) {
    ChunkSplitter splitter(5 * kMiB);

    auto plan = splitter.plan(50 * kMiB);
    ASSERT_TRUE(plan.is_ok());
    ASSERT_EQ(plan.value().size(), 10u);
    for (const auto& chunk : plan.value()) {
        EXPECT_EQ(chunk.byte_length, 5 * kMiB);
    }
    EXPECT_EQ(splitter.chunk_count(50 * kMiB), 10u);
}

TEST(ChunkSplitterTest, EmptyFileHasOneEmptyChunk) {
    ChunkSplitter splitter;

    auto plan = splitter.plan(0);
    ASSERT_TRUE(plan.is_ok());
    ASSERT_EQ(plan.value().size(), 1u);
    EXPECT_EQ(plan.value()[0], (ChunkDescriptor{0, 0, 0}));
}

TEST(ChunkSplitterTest, ChunksCoverFileWithoutGaps) {
    ChunkSplitter splitter(7);

    auto plan = splitter.plan(100);
    ASSERT_TRUE(plan.is_ok());

    std::uint64_t expected_offset = 0;
    for (std::size_t i = 0; i < plan.value().size(); ++i) {
        const auto& chunk = plan.value()[i];
        EXPECT_EQ(chunk.index, i);
        EXPECT_EQ(chunk.byte_offset, expected_offset);
        EXPECT_GT(chunk.byte_length, 0u);
        expected_offset += chunk.byte_length;
    }
    EXPECT_EQ(expected_offset, 100u);
    EXPECT_EQ(plan.value().back().byte_length, 2u);
}

TEST(ChunkSplitterTest, ZeroChunkSizeIsInvalid) {
    ChunkSplitter splitter(0);

    auto plan = splitter.plan(10);
    ASSERT_TRUE(plan.is_error());
    EXPECT_EQ(plan.error().kind, rup::ErrorKind::InvalidInput);
}
