// QUORUMFEED - Feed Errors Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/errors.h"

#include <limits>

namespace quorumfeed {
namespace feed {

const char* FeedErrorCodeToString(FeedErrorCode code) {
    switch (code) {
        case FeedErrorCode::ExpiredBatch:          return "expired batch";
        case FeedErrorCode::MalformedBatch:        return "malformed batch";
        case FeedErrorCode::QuorumNotMet:          return "quorum not met";
        case FeedErrorCode::NonSequentialRound:    return "non-sequential round";
        case FeedErrorCode::UnauthorizedSubmitter: return "unauthorized submitter";
        case FeedErrorCode::InsufficientFunds:     return "insufficient funds";
        case FeedErrorCode::NoData:                return "no data";
        case FeedErrorCode::UnauthorizedReader:    return "unauthorized reader";
        case FeedErrorCode::NotAdmin:              return "not admin";
        case FeedErrorCode::InvalidAmount:         return "invalid amount";
        case FeedErrorCode::ArithmeticOverflow:    return "arithmetic overflow";
        case FeedErrorCode::TransferFailed:        return "transfer failed";
        case FeedErrorCode::InvalidConfig:         return "invalid config";
        case FeedErrorCode::SnapshotCorrupt:       return "snapshot corrupt";
        case FeedErrorCode::ReentrantCall:         return "reentrant call";
        default:                                   return "unknown";
    }
}

FeedError::FeedError(FeedErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(FeedErrorCodeToString(code)) +
                         (detail.empty() ? "" : ": " + detail))
    , code_(code) {}

// ============================================================================
// Checked Arithmetic
// ============================================================================

namespace {
constexpr Amount AMOUNT_MIN = std::numeric_limits<Amount>::min();
constexpr Amount AMOUNT_MAX = std::numeric_limits<Amount>::max();
}

Amount CheckedAdd(Amount a, Amount b) {
    if ((b > 0 && a > AMOUNT_MAX - b) || (b < 0 && a < AMOUNT_MIN - b)) {
        throw FeedError(FeedErrorCode::ArithmeticOverflow,
                        std::to_string(a) + " + " + std::to_string(b));
    }
    return a + b;
}

Amount CheckedSub(Amount a, Amount b) {
    if ((b < 0 && a > AMOUNT_MAX + b) || (b > 0 && a < AMOUNT_MIN + b)) {
        throw FeedError(FeedErrorCode::ArithmeticOverflow,
                        std::to_string(a) + " - " + std::to_string(b));
    }
    return a - b;
}

Amount CheckedMul(Amount a, Amount b) {
    if (a == 0 || b == 0) {
        return 0;
    }
    bool overflow = false;
    if (a > 0) {
        overflow = (b > 0) ? (a > AMOUNT_MAX / b) : (b < AMOUNT_MIN / a);
    } else {
        overflow = (b > 0) ? (a < AMOUNT_MIN / b) : (a != 0 && b < AMOUNT_MAX / a);
    }
    if (overflow) {
        throw FeedError(FeedErrorCode::ArithmeticOverflow,
                        std::to_string(a) + " * " + std::to_string(b));
    }
    return a * b;
}

} // namespace feed
} // namespace quorumfeed
