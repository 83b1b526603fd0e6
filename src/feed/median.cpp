// QUORUMFEED - Median Aggregation Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/median.h"
#include "quorumfeed/feed/errors.h"

#include <algorithm>

namespace quorumfeed {
namespace feed {

Price TruncatingAverage(Price a, Price b) {
    // Mixed signs cannot overflow
    if ((a < 0) != (b < 0)) {
        return (a + b) / 2;
    }
    // Same sign: halves first, remainders have the same sign and sum to |r| <= 2
    return a / 2 + b / 2 + (a % 2 + b % 2) / 2;
}

Price ComputeMedian(std::vector<Price> values) {
    if (values.empty()) {
        throw FeedError(FeedErrorCode::MalformedBatch, "median of empty list");
    }

    std::sort(values.begin(), values.end());

    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) {
        return values[mid];
    }
    return TruncatingAverage(values[mid - 1], values[mid]);
}

} // namespace feed
} // namespace quorumfeed
