// QUORUMFEED - Feed Errors and Checked Arithmetic
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Every failure of a feed operation aborts the whole operation and is
// reported as a FeedError carrying one of the codes below.

#ifndef QUORUMFEED_FEED_ERRORS_H
#define QUORUMFEED_FEED_ERRORS_H

#include "quorumfeed/core/types.h"

#include <stdexcept>
#include <string>

namespace quorumfeed {
namespace feed {

// ============================================================================
// Error Codes
// ============================================================================

enum class FeedErrorCode {
    /// Submission deadline already passed
    ExpiredBatch,

    /// Price and signature arrays differ in length, or are empty
    MalformedBatch,

    /// Share of signing oracles below the threshold
    QuorumNotMet,

    /// Round id is not exactly one past the last reported round
    NonSequentialRound,

    /// A recovered signer is not an eligible oracle
    UnauthorizedSubmitter,

    /// A payment or withdrawal would overdraw a balance
    InsufficientFunds,

    /// Round is unanswered or out of range
    NoData,

    /// Caller lacks read access, or is not an externally-owned account
    UnauthorizedReader,

    /// Caller is not the oracle's admin
    NotAdmin,

    /// Zero or negative amount
    InvalidAmount,

    /// Ledger arithmetic would overflow
    ArithmeticOverflow,

    /// Settlement token refused a transfer
    TransferFailed,

    /// Configuration value out of range or unparsable
    InvalidConfig,

    /// Snapshot file truncated or of an unknown format
    SnapshotCorrupt,

    /// Mutating call made from inside a submission's validator
    ReentrantCall
};

/// Convert error code to string
const char* FeedErrorCodeToString(FeedErrorCode code);

/**
 * Exception thrown by every failing feed operation.
 */
class FeedError : public std::runtime_error {
public:
    FeedError(FeedErrorCode code, const std::string& detail);

    FeedErrorCode Code() const noexcept { return code_; }

private:
    FeedErrorCode code_;
};

// ============================================================================
// Checked Arithmetic
// ============================================================================

/// a + b, throws ArithmeticOverflow on overflow
Amount CheckedAdd(Amount a, Amount b);

/// a - b, throws ArithmeticOverflow on overflow
Amount CheckedSub(Amount a, Amount b);

/// a * b, throws ArithmeticOverflow on overflow
Amount CheckedMul(Amount a, Amount b);

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_ERRORS_H
