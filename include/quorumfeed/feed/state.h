// QUORUMFEED - Feed State
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#ifndef QUORUMFEED_FEED_STATE_H
#define QUORUMFEED_FEED_STATE_H

#include "quorumfeed/feed/funds_ledger.h"
#include "quorumfeed/feed/round_ledger.h"
#include "quorumfeed/feed/vesting_ledger.h"

namespace quorumfeed {
namespace feed {

/**
 * All mutable ledgers of one aggregator. Copyable so an operation can run
 * on a working copy and commit by assignment.
 */
struct FeedState {
    RoundLedger rounds;
    FundsLedger funds;
    RewardVestingLedger vesting;
};

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_STATE_H
