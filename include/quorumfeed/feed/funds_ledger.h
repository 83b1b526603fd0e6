// QUORUMFEED - Funds Ledger
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Tracks the prepaid pool as two balances:
// - available: spendable on future oracle payments
// - allocated: owed to oracles and submitters but not yet withdrawn
//
// Every oracle payment moves paymentAmount from available to allocated. Of
// that payment, the oracle share is credited to the oracle's withdrawable
// balance and the remainder is reserved for the submitter's vesting reward.

#ifndef QUORUMFEED_FEED_FUNDS_LEDGER_H
#define QUORUMFEED_FEED_FUNDS_LEDGER_H

#include "quorumfeed/core/types.h"

#include <map>

namespace quorumfeed {
namespace feed {

/// Per-mille denominator for the reward rate
constexpr int64_t REWARD_RATE_DENOMINATOR = 1000;

/// Recorded pool balances
struct Funds {
    Amount available{0};
    Amount allocated{0};

    bool operator==(const Funds& other) const {
        return available == other.available && allocated == other.allocated;
    }
};

/// Oracle share of one payment: payment * (1000 - rateX10) / 1000
Amount OracleShare(Amount paymentAmount, int64_t rewardRateX10);

class FundsLedger {
public:
    FundsLedger() = default;

    /// Rebuild from persisted balances
    static FundsLedger Restore(const Funds& funds,
                               std::map<Address, Amount> withdrawable,
                               Amount rewardAccumulator);

    const Funds& GetFunds() const { return funds_; }
    Amount Available() const { return funds_.available; }
    Amount Allocated() const { return funds_.allocated; }

    /**
     * Recompute available = tokenBalance - allocated.
     * @return true if available changed
     * @throws FeedError InsufficientFunds if the balance is below allocated
     */
    bool UpdateAvailableFunds(Amount tokenBalance);

    /**
     * Pay one oracle for one signature.
     * @return The submitter share carved out of the payment
     * @throws FeedError InsufficientFunds if available < paymentAmount
     */
    Amount PayOracle(RoundId roundId, const Address& oracle,
                     Amount paymentAmount, int64_t rewardRateX10);

    /// Add one round's per-oracle share to the running accumulator
    void AccumulateReward(Amount perOracleShare);

    /// Running total of per-oracle shares (bookkeeping only)
    Amount RewardAccumulator() const { return rewardAccumulator_; }

    /// Oracle's withdrawable balance
    Amount WithdrawablePayment(const Address& oracle) const;

    /**
     * Take amount out of an oracle's withdrawable balance and allocated.
     * @throws FeedError InsufficientFunds if the oracle is owed less
     */
    void WithdrawPayment(const Address& oracle, Amount amount);

    /**
     * Release allocated funds that were paid out elsewhere (vested rewards).
     * @throws FeedError InsufficientFunds if allocated < amount
     */
    void ReleaseAllocated(Amount amount);

    const std::map<Address, Amount>& Withdrawables() const { return withdrawable_; }

private:
    Funds funds_;
    std::map<Address, Amount> withdrawable_;
    Amount rewardAccumulator_{0};
};

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_FUNDS_LEDGER_H
