// QUORUMFEED - Feed Listener
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#ifndef QUORUMFEED_FEED_LISTENER_H
#define QUORUMFEED_FEED_LISTENER_H

#include "quorumfeed/core/types.h"

#include <string>

namespace quorumfeed {
namespace feed {

/**
 * Listener for aggregator events.
 *
 * Events of one operation are delivered after the operation has committed,
 * in the order they occurred. A failed operation delivers nothing.
 */
class FeedListener {
public:
    virtual ~FeedListener() = default;

    /// Called once per verified signature
    virtual void OnSubmissionReceived(Price price, RoundId roundId, const Address& oracle) {}

    /// Called when the available balance changed
    virtual void OnAvailableFundsUpdated(Amount amount) {}

    /// Called when a round gets a new answer
    virtual void OnAnswerUpdated(Price answer, RoundId roundId, Timestamp updatedAt) {}

    /// Called when a round is created
    virtual void OnNewRound(RoundId roundId, const Address& startedBy, Timestamp startedAt) {}

    /// Called when reward starts vesting for a submitter
    virtual void OnRewardsAppended(const Address& submitter, Amount amount) {}

    /// Called when vested reward is paid out
    virtual void OnRewardsUnlocked(const Address& submitter, Amount amount) {}

    /// Called when the answer validator failed or flagged an answer
    virtual void OnValidatorFailed(RoundId roundId, const std::string& reason) {}
};

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_LISTENER_H
