// QUORUMFEED - Price Feed Aggregator
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Entry point of the engine. A submission is validated, advances the round,
// pays every signing oracle, stores the median answer and vests a reward to
// the submitter, all as one atomic operation.

#ifndef QUORUMFEED_FEED_AGGREGATOR_H
#define QUORUMFEED_FEED_AGGREGATOR_H

#include "quorumfeed/core/types.h"
#include "quorumfeed/feed/access.h"
#include "quorumfeed/feed/config.h"
#include "quorumfeed/feed/listener.h"
#include "quorumfeed/feed/quorum.h"
#include "quorumfeed/feed/roster.h"
#include "quorumfeed/feed/state.h"
#include "quorumfeed/feed/submission.h"
#include "quorumfeed/feed/token.h"
#include "quorumfeed/feed/validator.h"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quorumfeed {
namespace feed {

/// Snapshot returned to an oracle deciding whether to report
struct OracleRoundInfo {
    bool eligibleToSubmit{false};
    RoundId roundId{0};
    Price latestAnswer{0};
    Amount availableFunds{0};
    uint64_t oracleCount{0};
    Amount paymentAmount{0};
};

// ============================================================================
// Price Feed Aggregator
// ============================================================================

/**
 * Prepaid, round-based price aggregator.
 *
 * The roster and token are external collaborators and must outlive the
 * aggregator; so must any validator, access controller or listener
 * attached to it. The token account of the aggregator itself is
 * config.contractAddress.
 *
 * Every mutating call runs on a copy of the ledgers and commits only on
 * success; a thrown FeedError leaves ledgers and token balances unchanged.
 * Listeners are notified after commit.
 *
 * Duplicate signers are not detected: a signer appearing twice in one batch
 * counts twice toward the quorum and is paid twice. The coordinator that
 * assembles batches is trusted to prevent this.
 */
class PriceFeedAggregator {
public:
    /// Fresh feed whose genesis round is stamped with the current time
    PriceFeedAggregator(FeedConfig config, OracleRoster& roster, SettlementToken& token);

    /// Feed resuming from a previously saved state
    PriceFeedAggregator(FeedConfig config, OracleRoster& roster, SettlementToken& token,
                        FeedState state);

    PriceFeedAggregator(const PriceFeedAggregator&) = delete;
    PriceFeedAggregator& operator=(const PriceFeedAggregator&) = delete;

    // ========================================================================
    // Collaborators
    // ========================================================================

    /// Attach an answer validator (nullptr detaches)
    void SetValidator(AnswerValidator* validator);

    /// Gate round reads (nullptr lets everyone read)
    void SetAccessController(ReadAccessController* controller);

    void AddListener(FeedListener* listener);
    void RemoveListener(FeedListener* listener);

    // ========================================================================
    // Mutating Operations
    // ========================================================================

    /**
     * Submit a signed batch for the next round. ctx.sender receives the
     * submitter reward.
     * @return The new answer
     * @throws FeedError ExpiredBatch, MalformedBatch, QuorumNotMet,
     *         NonSequentialRound, UnauthorizedSubmitter, InsufficientFunds,
     *         ArithmeticOverflow
     */
    Price Submit(const CallContext& ctx, const SubmissionBatch& batch);

    /**
     * Deposit amount of the settlement token from ctx.sender into the pool.
     * @throws FeedError InvalidAmount, TransferFailed, ArithmeticOverflow
     */
    void AddFunds(const CallContext& ctx, Amount amount);

    /**
     * Pay out a submitter's vested reward. Anyone may call; the reward
     * always goes to submitter.
     * @return Amount paid (0 if nothing was releasable)
     * @throws FeedError InsufficientFunds, TransferFailed
     */
    Amount UnlockSubmitterRewards(const Address& submitter);

    /**
     * Withdraw from an oracle's earned payments. Only the oracle's admin
     * may call.
     * @throws FeedError NotAdmin, InvalidAmount, InsufficientFunds, TransferFailed
     */
    void WithdrawPayment(const CallContext& ctx, const Address& oracle,
                         const Address& recipient, Amount amount);

    /**
     * Recompute available funds from the token balance.
     * @return true if available changed
     * @throws FeedError InsufficientFunds if the balance is below allocated
     */
    bool UpdateAvailableFunds();

    // ========================================================================
    // Round Reads (gated by the access controller)
    // ========================================================================

    Price LatestAnswer(const Address& caller) const;
    Timestamp LatestTimestamp(const Address& caller) const;
    RoundId LatestRound(const Address& caller) const;

    /// @throws FeedError NoData if the latest round is unanswered
    RoundData LatestRoundData(const Address& caller) const;

    /// Answer of round id, 0 for unknown or out-of-range ids
    Price GetAnswer(const Address& caller, uint64_t roundId) const;

    /// updatedAt of round id, 0 for unknown or out-of-range ids
    Timestamp GetTimestamp(const Address& caller, uint64_t roundId) const;

    /// @throws FeedError NoData for unanswered or out-of-range rounds
    RoundData GetRoundData(const Address& caller, uint64_t roundId) const;

    /// Full round record including submissions
    /// @throws FeedError NoData for unanswered or out-of-range rounds
    Round GetRound(const Address& caller, uint64_t roundId) const;

    // ========================================================================
    // Oracle Reads
    // ========================================================================

    std::optional<Address> GetAdmin(const Address& oracle) const;

    /**
     * Round state as seen by an oracle. queriedRoundId 0 means the next
     * round to be reported.
     * @throws FeedError UnauthorizedReader unless the caller is externally owned
     */
    OracleRoundInfo OracleRoundState(const CallContext& ctx, const Address& oracle,
                                     RoundId queriedRoundId) const;

    // ========================================================================
    // Ledger Views
    // ========================================================================

    Amount AvailableFunds() const;
    Amount AllocatedFunds() const;
    Amount WithdrawablePayment(const Address& oracle) const;
    Amount RewardAccumulator() const;
    std::optional<SubmitterRewardsVesting> GetSubmitterVesting(const Address& submitter) const;

    const std::string& Description() const { return config_.description; }
    Amount PaymentAmount() const { return config_.paymentAmount; }
    const Address& ContractAddress() const { return config_.contractAddress; }
    const FeedConfig& GetConfig() const { return config_; }

    /// Copy of the committed ledgers
    FeedState Snapshot() const;

private:
    using Event = std::function<void(FeedListener&)>;

    void CheckReadAccess(const Address& caller) const;
    void CheckNotReentrant(const char* operation) const;
    void RefreshAvailableFunds(FeedState& work, std::vector<Event>& events) const;
    void RunValidator(const FeedState& work, RoundId roundId, Price answer,
                      std::vector<Event>& events);
    void TransferOut(const Address& to, Amount amount);
    void Dispatch(const std::vector<Event>& events);

    const FeedConfig config_;
    const QuorumGate quorum_;
    OracleRoster& roster_;
    SettlementToken& token_;

    mutable std::recursive_mutex mutex_;
    FeedState state_;
    AnswerValidator* validator_{nullptr};
    bool inValidator_{false};
    ReadAccessController* access_{nullptr};

    std::mutex listenersMutex_;
    std::vector<FeedListener*> listeners_;
};

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_AGGREGATOR_H
