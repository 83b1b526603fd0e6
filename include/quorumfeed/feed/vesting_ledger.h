// QUORUMFEED - Submitter Reward Vesting
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Rewards credited to submitters unlock linearly over VESTING_PERIOD. The
// unlock is computed lazily whenever a record is touched; there is no timer.

#ifndef QUORUMFEED_FEED_VESTING_LEDGER_H
#define QUORUMFEED_FEED_VESTING_LEDGER_H

#include "quorumfeed/core/types.h"

#include <map>
#include <optional>

namespace quorumfeed {
namespace feed {

/// Linear vesting period (30 days)
constexpr int64_t VESTING_PERIOD = 30 * 24 * 60 * 60;

/// Vesting state of one submitter
struct SubmitterRewardsVesting {
    /// Time of the last unlock step
    Timestamp lastUpdated{0};

    /// Withdrawable now
    Amount releasable{0};

    /// Still locked
    Amount remainVesting{0};

    bool operator==(const SubmitterRewardsVesting& other) const {
        return lastUpdated == other.lastUpdated && releasable == other.releasable &&
               remainVesting == other.remainVesting;
    }
};

/**
 * Amount that unlocks between lastUpdated and now:
 * (now - lastUpdated) * remainVesting / VESTING_PERIOD, truncated and capped
 * at remainVesting. Zero if now is not after lastUpdated.
 */
Amount ComputeUnlockable(Timestamp now, Timestamp lastUpdated, Amount remainVesting);

class RewardVestingLedger {
public:
    RewardVestingLedger() = default;

    /// Rebuild from persisted records
    static RewardVestingLedger Restore(std::map<Address, SubmitterRewardsVesting> records);

    /// Move the unlockable part of remainVesting into releasable; always stamps now
    void UpdateWithdrawable(const Address& submitter, Timestamp now);

    /// Unlock step, then add amount to remainVesting
    void Append(const Address& submitter, Amount amount, Timestamp now);

    /// Unlock step, then zero and return releasable. Unknown submitters get 0 and no record.
    Amount TakeReleasable(const Address& submitter, Timestamp now);

    /// Record for a submitter, if one was ever created
    std::optional<SubmitterRewardsVesting> Get(const Address& submitter) const;

    const std::map<Address, SubmitterRewardsVesting>& Records() const { return records_; }

private:
    std::map<Address, SubmitterRewardsVesting> records_;
};

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_VESTING_LEDGER_H
