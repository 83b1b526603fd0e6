// QUORUMFEED - Round Ledger
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// One record per round id. Rounds are created strictly in sequence and a
// new round inherits the previous round's answer until it gets its own.

#ifndef QUORUMFEED_FEED_ROUND_LEDGER_H
#define QUORUMFEED_FEED_ROUND_LEDGER_H

#include "quorumfeed/core/types.h"

#include <map>
#include <vector>

namespace quorumfeed {
namespace feed {

// ============================================================================
// Round Types
// ============================================================================

/**
 * Stored state of one round.
 */
struct Round {
    /// Aggregated answer (inherited until this round is answered)
    Price answer{0};

    /// When the round was created
    Timestamp startedAt{0};

    /// Last mutation time
    Timestamp updatedAt{0};

    /// Round in which answer was computed; 0 if never answered
    RoundId answeredInRound{0};

    /// Raw observations behind the answer
    std::vector<Price> submissions;

    /// Per-oracle payment in effect when the round was created
    Amount paymentAmount{0};

    bool operator==(const Round& other) const {
        return answer == other.answer && startedAt == other.startedAt &&
               updatedAt == other.updatedAt && answeredInRound == other.answeredInRound &&
               submissions == other.submissions && paymentAmount == other.paymentAmount;
    }
};

/// Public view of a round
struct RoundData {
    RoundId roundId{0};
    Price answer{0};
    Timestamp startedAt{0};
    Timestamp updatedAt{0};
    RoundId answeredInRound{0};
};

// ============================================================================
// Round Ledger
// ============================================================================

class RoundLedger {
public:
    /// Empty ledger with a genesis round 0 stamped at genesisTime
    explicit RoundLedger(Timestamp genesisTime = 0);

    /// Rebuild from persisted records
    static RoundLedger Restore(RoundId lastReportedRound, std::map<RoundId, Round> rounds);

    /**
     * Create round id, carrying forward the previous answer.
     * @throws FeedError NonSequentialRound unless id == LastReportedRound() + 1
     */
    void CreateNewRound(RoundId id, Amount paymentAmount, Timestamp now);

    /**
     * Store the median of prices as the answer of round id.
     * @return The new answer
     * @throws FeedError NoData if the round does not exist
     * @throws FeedError MalformedBatch if prices is empty
     */
    Price UpdateRoundPrice(RoundId id, const std::vector<Price>& prices, Timestamp now);

    /// Highest created round
    RoundId LastReportedRound() const { return lastReportedRound_; }

    /// Round record or nullptr
    const Round* Find(RoundId id) const;

    /**
     * Public view of a round.
     * @throws FeedError NoData if id > ROUND_MAX, missing, or unanswered
     */
    RoundData GetRoundInfo(uint64_t id) const;

    /// Answer of round id, 0 when out of range or missing
    Price GetAnswer(uint64_t id) const;

    /// updatedAt of round id, 0 when out of range or missing
    Timestamp GetTimestamp(uint64_t id) const;

    const std::map<RoundId, Round>& Rounds() const { return rounds_; }

private:
    std::map<RoundId, Round> rounds_;
    RoundId lastReportedRound_{0};
};

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_ROUND_LEDGER_H
