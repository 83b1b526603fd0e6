// QUORUMFEED - Funds Ledger Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/funds_ledger.h"
#include "quorumfeed/feed/errors.h"
#include "quorumfeed/util/logging.h"

#include <string>

namespace quorumfeed {
namespace feed {

Amount OracleShare(Amount paymentAmount, int64_t rewardRateX10) {
    return CheckedMul(paymentAmount, REWARD_RATE_DENOMINATOR - rewardRateX10) /
           REWARD_RATE_DENOMINATOR;
}

FundsLedger FundsLedger::Restore(const Funds& funds,
                                 std::map<Address, Amount> withdrawable,
                                 Amount rewardAccumulator) {
    if (funds.available < 0 || funds.allocated < 0 || rewardAccumulator < 0) {
        throw FeedError(FeedErrorCode::SnapshotCorrupt, "negative balance");
    }
    FundsLedger ledger;
    ledger.funds_ = funds;
    ledger.withdrawable_ = std::move(withdrawable);
    ledger.rewardAccumulator_ = rewardAccumulator;
    return ledger;
}

bool FundsLedger::UpdateAvailableFunds(Amount tokenBalance) {
    Amount now = CheckedSub(tokenBalance, funds_.allocated);
    if (now < 0) {
        throw FeedError(FeedErrorCode::InsufficientFunds,
                        "balance " + std::to_string(tokenBalance) +
                        " below allocated " + std::to_string(funds_.allocated));
    }
    if (now == funds_.available) {
        return false;
    }
    funds_.available = now;
    return true;
}

Amount FundsLedger::PayOracle(RoundId roundId, const Address& oracle,
                              Amount paymentAmount, int64_t rewardRateX10) {
    if (funds_.available < paymentAmount) {
        throw FeedError(FeedErrorCode::InsufficientFunds,
                        "available " + std::to_string(funds_.available) +
                        " < payment " + std::to_string(paymentAmount));
    }

    Amount oracleShare = OracleShare(paymentAmount, rewardRateX10);
    Amount submitterShare = paymentAmount - oracleShare;

    funds_.available = CheckedSub(funds_.available, paymentAmount);
    funds_.allocated = CheckedAdd(funds_.allocated, paymentAmount);
    withdrawable_[oracle] = CheckedAdd(withdrawable_[oracle], oracleShare);

    LOG_DEBUG(util::LogCategory::FUNDS) << "Round " << roundId << ": paid "
        << oracleShare << " to " << oracle.ToString()
        << ", reserved " << submitterShare << " for submitter";

    return submitterShare;
}

void FundsLedger::AccumulateReward(Amount perOracleShare) {
    rewardAccumulator_ = CheckedAdd(rewardAccumulator_, perOracleShare);
}

Amount FundsLedger::WithdrawablePayment(const Address& oracle) const {
    auto it = withdrawable_.find(oracle);
    return it == withdrawable_.end() ? 0 : it->second;
}

void FundsLedger::WithdrawPayment(const Address& oracle, Amount amount) {
    Amount owed = WithdrawablePayment(oracle);
    if (owed < amount) {
        throw FeedError(FeedErrorCode::InsufficientFunds,
                        "withdrawable " + std::to_string(owed) +
                        " < requested " + std::to_string(amount));
    }
    ReleaseAllocated(amount);
    withdrawable_[oracle] = owed - amount;
}

void FundsLedger::ReleaseAllocated(Amount amount) {
    if (funds_.allocated < amount) {
        throw FeedError(FeedErrorCode::InsufficientFunds,
                        "allocated " + std::to_string(funds_.allocated) +
                        " < released " + std::to_string(amount));
    }
    funds_.allocated -= amount;
}

} // namespace feed
} // namespace quorumfeed
