// QUORUMFEED - Quorum Gate
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#ifndef QUORUMFEED_FEED_QUORUM_H
#define QUORUMFEED_FEED_QUORUM_H

#include "quorumfeed/core/types.h"
#include "quorumfeed/feed/submission.h"

#include <cstdint>

namespace quorumfeed {
namespace feed {

/// Minimum share of enabled oracles (percent) that must sign a batch
constexpr uint32_t MIN_THRESHOLD_PERCENT = 66;

/**
 * Admission check for a submission batch.
 *
 * The threshold is evaluated on the declared batch size, before any
 * signature is verified. Percentages truncate toward zero, so 2 of 3
 * (66.67%) meets a 66% threshold while 1 of 2 (50%) does not.
 */
class QuorumGate {
public:
    explicit QuorumGate(uint32_t minThresholdPercent = MIN_THRESHOLD_PERCENT);

    /**
     * Validate a batch.
     * @throws FeedError ExpiredBatch if now > deadline
     * @throws FeedError MalformedBatch on empty or mismatched arrays
     * @throws FeedError QuorumNotMet below threshold or with no enabled oracles
     */
    void Check(const SubmissionBatch& batch, Timestamp now, uint64_t enabledOracles) const;

    /// (signers * 100) / total >= percent, false when total is zero
    static bool MeetsThreshold(uint64_t signers, uint64_t total, uint32_t percent);

    uint32_t GetThresholdPercent() const { return thresholdPercent_; }

private:
    uint32_t thresholdPercent_;
};

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_QUORUM_H
