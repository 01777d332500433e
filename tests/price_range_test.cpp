#include <gtest/gtest.h>
#include "price_range.hpp"

#include <stdexcept>

using namespace zones;

// ============================================================================
// Construction
// ============================================================================

TEST(PriceRangePartitionTest, RejectsZeroChunks) {
    EXPECT_THROW(PriceRangePartition(0.0, 10.0, 0), std::invalid_argument);
}

TEST(PriceRangePartitionTest, RejectsEmptyOrInvertedRange) {
    EXPECT_THROW(PriceRangePartition(10.0, 10.0, 5), std::invalid_argument);
    EXPECT_THROW(PriceRangePartition(10.0, 5.0, 5), std::invalid_argument);
}

TEST(PriceRangePartitionTest, ChunkSize) {
    PriceRangePartition range(100.0, 200.0, 10);
    EXPECT_DOUBLE_EQ(range.chunk_size(), 10.0);
    EXPECT_DOUBLE_EQ(range.range_length(), 100.0);
}

// ============================================================================
// chunk_index
// ============================================================================

TEST(PriceRangePartitionTest, ChunkIndexStaysInRange) {
    PriceRangePartition range(100.0, 200.0, 7);
    for (double price = 100.0; price <= 200.0; price += 0.37) {
        EXPECT_LT(range.chunk_index(price), 7u) << "price=" << price;
    }
}

TEST(PriceRangePartitionTest, EndMapsToLastChunk) {
    PriceRangePartition range(100.0, 200.0, 10);
    EXPECT_EQ(range.chunk_index(100.0), 0u);
    EXPECT_EQ(range.chunk_index(200.0), 9u);
    EXPECT_EQ(range.chunk_index(155.0), 5u);
}

TEST(PriceRangePartitionTest, OutOfRangePricesClampToEdges) {
    PriceRangePartition range(100.0, 200.0, 10);
    EXPECT_EQ(range.chunk_index(-1000.0), 0u);
    EXPECT_EQ(range.chunk_index(99.99), 0u);
    EXPECT_EQ(range.chunk_index(1e9), 9u);
}

// ============================================================================
// count_intersecting_chunks
// ============================================================================

TEST(PriceRangePartitionTest, IntersectingChunksInclusive) {
    PriceRangePartition range(0.0, 10.0, 10);
    EXPECT_EQ(range.count_intersecting_chunks(2.5, 4.5), 3u);
    EXPECT_EQ(range.count_intersecting_chunks(2.5, 2.7), 1u);
    EXPECT_EQ(range.count_intersecting_chunks(0.0, 10.0), 10u);
}

TEST(PriceRangePartitionTest, IntersectingChunksSymmetric) {
    PriceRangePartition range(50.0, 150.0, 13);
    const double points[] = {40.0, 50.0, 61.3, 99.9, 100.0, 149.0, 150.0, 170.0};
    for (double a : points) {
        for (double b : points) {
            EXPECT_EQ(range.count_intersecting_chunks(a, b),
                      range.count_intersecting_chunks(b, a))
                << "a=" << a << " b=" << b;
        }
    }
}

TEST(PriceRangePartitionTest, IntersectingChunksOutsideRangeIsZero) {
    PriceRangePartition range(100.0, 200.0, 10);
    EXPECT_EQ(range.count_intersecting_chunks(10.0, 20.0), 0u);
    EXPECT_EQ(range.count_intersecting_chunks(250.0, 300.0), 0u);
}

TEST(PriceRangePartitionTest, IntersectingChunksClipsPartialOverlap) {
    PriceRangePartition range(100.0, 200.0, 10);
    EXPECT_EQ(range.count_intersecting_chunks(50.0, 115.0), 2u);
    EXPECT_EQ(range.count_intersecting_chunks(185.0, 500.0), 2u);
    // Touching the upper edge counts the last chunk
    EXPECT_EQ(range.count_intersecting_chunks(200.0, 260.0), 1u);
}

// ============================================================================
// chunk_bounds
// ============================================================================

TEST(PriceRangePartitionTest, ChunkBounds) {
    PriceRangePartition range(100.0, 200.0, 4);
    auto [bottom, top] = range.chunk_bounds(2);
    EXPECT_DOUBLE_EQ(bottom, 150.0);
    EXPECT_DOUBLE_EQ(top, 175.0);
    EXPECT_THROW(range.chunk_bounds(4), std::out_of_range);
}
