// QUORUMFEED - Submitter Reward Vesting Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/vesting_ledger.h"
#include "quorumfeed/feed/errors.h"
#include "quorumfeed/util/logging.h"

#include <algorithm>

namespace quorumfeed {
namespace feed {

Amount ComputeUnlockable(Timestamp now, Timestamp lastUpdated, Amount remainVesting) {
    if (remainVesting <= 0 || now <= lastUpdated) {
        return 0;
    }

    const int64_t elapsed = now - lastUpdated;
    if (elapsed >= VESTING_PERIOD) {
        return remainVesting;
    }

    // floor(elapsed * remain / P) with remain = q*P + r; neither term overflows
    const Amount q = remainVesting / VESTING_PERIOD;
    const Amount r = remainVesting % VESTING_PERIOD;
    Amount unlockable = elapsed * q + (elapsed * r) / VESTING_PERIOD;

    return std::min(unlockable, remainVesting);
}

RewardVestingLedger RewardVestingLedger::Restore(
    std::map<Address, SubmitterRewardsVesting> records) {
    for (const auto& [addr, rec] : records) {
        if (rec.releasable < 0 || rec.remainVesting < 0) {
            throw FeedError(FeedErrorCode::SnapshotCorrupt,
                            "negative vesting balance for " + addr.ToString());
        }
    }
    RewardVestingLedger ledger;
    ledger.records_ = std::move(records);
    return ledger;
}

void RewardVestingLedger::UpdateWithdrawable(const Address& submitter, Timestamp now) {
    SubmitterRewardsVesting& rec = records_[submitter];

    if (rec.remainVesting > 0) {
        Amount unlockable = ComputeUnlockable(now, rec.lastUpdated, rec.remainVesting);
        rec.remainVesting -= unlockable;
        rec.releasable = CheckedAdd(rec.releasable, unlockable);
    }
    rec.lastUpdated = now;
}

void RewardVestingLedger::Append(const Address& submitter, Amount amount, Timestamp now) {
    UpdateWithdrawable(submitter, now);

    SubmitterRewardsVesting& rec = records_[submitter];
    rec.remainVesting = CheckedAdd(rec.remainVesting, amount);

    LOG_DEBUG(util::LogCategory::VESTING) << "Appended " << amount << " to "
        << submitter.ToString() << " (vesting " << rec.remainVesting
        << ", releasable " << rec.releasable << ")";
}

Amount RewardVestingLedger::TakeReleasable(const Address& submitter, Timestamp now) {
    if (records_.find(submitter) == records_.end()) {
        return 0;
    }
    UpdateWithdrawable(submitter, now);

    SubmitterRewardsVesting& rec = records_[submitter];
    Amount amount = rec.releasable;
    rec.releasable = 0;
    return amount;
}

std::optional<SubmitterRewardsVesting> RewardVestingLedger::Get(const Address& submitter) const {
    auto it = records_.find(submitter);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace feed
} // namespace quorumfeed
