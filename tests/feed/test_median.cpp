// QUORUMFEED - Median Tests
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include <gtest/gtest.h>

#include "quorumfeed/feed/errors.h"
#include "quorumfeed/feed/median.h"

#include <limits>
#include <vector>

using namespace quorumfeed;
using namespace quorumfeed::feed;

// ============================================================================
// ComputeMedian Tests
// ============================================================================

TEST(MedianTest, SingleValue) {
    EXPECT_EQ(ComputeMedian({42}), 42);
}

TEST(MedianTest, OddCountIsMiddleElement) {
    EXPECT_EQ(ComputeMedian({300, 100, 200}), 200);
    EXPECT_EQ(ComputeMedian({5, 1, 4, 2, 3}), 3);
}

TEST(MedianTest, EvenCountAveragesMiddlePair) {
    EXPECT_EQ(ComputeMedian({100, 200}), 150);
    EXPECT_EQ(ComputeMedian({4, 1, 3, 2}), 2);  // (2 + 3) / 2 truncated
}

TEST(MedianTest, NegativeAverageTruncatesTowardZero) {
    EXPECT_EQ(ComputeMedian({-2, -3}), -2);
    EXPECT_EQ(ComputeMedian({-1, 2}), 0);
}

TEST(MedianTest, DuplicatesAreKept) {
    EXPECT_EQ(ComputeMedian({7, 7, 1}), 7);
    EXPECT_EQ(ComputeMedian({1, 1, 9, 9}), 5);
}

TEST(MedianTest, EmptyIsMalformed) {
    try {
        ComputeMedian({});
        FAIL() << "expected FeedError";
    } catch (const FeedError& e) {
        EXPECT_EQ(e.Code(), FeedErrorCode::MalformedBatch);
    }
}

TEST(MedianTest, ExtremesDoNotOverflow) {
    const Price max = std::numeric_limits<Price>::max();
    const Price min = std::numeric_limits<Price>::min();

    EXPECT_EQ(ComputeMedian({max, max}), max);
    EXPECT_EQ(ComputeMedian({min, min}), min);
    EXPECT_EQ(ComputeMedian({max - 1, max}), max - 1);
    EXPECT_EQ(ComputeMedian({min, max}), 0);
}

// ============================================================================
// TruncatingAverage Tests
// ============================================================================

TEST(TruncatingAverageTest, MatchesWideArithmetic) {
    const std::vector<std::pair<Price, Price>> cases = {
        {0, 0}, {1, 2}, {-1, -2}, {3, 5}, {-3, -5}, {-7, 4}, {7, -4}, {101, 102}};
    for (const auto& [a, b] : cases) {
        EXPECT_EQ(TruncatingAverage(a, b), (a + b) / 2) << a << " " << b;
    }
}
