// QUORUMFEED - Median Aggregation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#ifndef QUORUMFEED_FEED_MEDIAN_H
#define QUORUMFEED_FEED_MEDIAN_H

#include "quorumfeed/core/types.h"

#include <vector>

namespace quorumfeed {
namespace feed {

/**
 * Median of a list of observations.
 *
 * Odd length: the middle element of the sorted list. Even length: the
 * average of the two central elements, truncated toward zero. Negative and
 * duplicate values are allowed.
 *
 * @throws FeedError(MalformedBatch) if values is empty
 */
Price ComputeMedian(std::vector<Price> values);

/// (a + b) / 2 truncated toward zero, without intermediate overflow
Price TruncatingAverage(Price a, Price b);

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_MEDIAN_H
