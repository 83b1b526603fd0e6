// QUORUMFEED - Quorum Gate Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/quorum.h"
#include "quorumfeed/feed/errors.h"
#include "quorumfeed/util/logging.h"

#include <string>

namespace quorumfeed {
namespace feed {

QuorumGate::QuorumGate(uint32_t minThresholdPercent)
    : thresholdPercent_(minThresholdPercent) {}

bool QuorumGate::MeetsThreshold(uint64_t signers, uint64_t total, uint32_t percent) {
    if (total == 0) {
        return false;
    }
    return (signers * 100) / total >= percent;
}

void QuorumGate::Check(const SubmissionBatch& batch, Timestamp now,
                       uint64_t enabledOracles) const {
    if (now > batch.deadline) {
        throw FeedError(FeedErrorCode::ExpiredBatch,
                        "deadline " + std::to_string(batch.deadline) +
                        " < now " + std::to_string(now));
    }

    const size_t n = batch.prices.size();
    if (batch.r.size() != n || batch.s.size() != n || batch.v.size() != n) {
        throw FeedError(FeedErrorCode::MalformedBatch, "array lengths differ");
    }
    if (n == 0) {
        throw FeedError(FeedErrorCode::MalformedBatch, "empty batch");
    }

    if (!MeetsThreshold(n, enabledOracles, thresholdPercent_)) {
        LOG_DEBUG(util::LogCategory::QUORUM)
            << n << " of " << enabledOracles << " oracles below "
            << thresholdPercent_ << "%";
        throw FeedError(FeedErrorCode::QuorumNotMet,
                        std::to_string(n) + " of " + std::to_string(enabledOracles));
    }
}

} // namespace feed
} // namespace quorumfeed
