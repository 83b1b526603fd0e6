// QUORUMFEED - Price Feed Aggregator Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/aggregator.h"
#include "quorumfeed/feed/errors.h"
#include "quorumfeed/feed/signature.h"
#include "quorumfeed/util/logging.h"
#include "quorumfeed/util/time.h"

#include <algorithm>

namespace quorumfeed {
namespace feed {

namespace {

/// Marks the validator call as in progress for the lifetime of the guard
class ValidatorScope {
public:
    explicit ValidatorScope(bool& flag) : flag_(flag) { flag_ = true; }
    ~ValidatorScope() { flag_ = false; }

    ValidatorScope(const ValidatorScope&) = delete;
    ValidatorScope& operator=(const ValidatorScope&) = delete;

private:
    bool& flag_;
};

FeedState GenesisState() {
    FeedState state;
    state.rounds = RoundLedger(util::GetTime());
    return state;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

PriceFeedAggregator::PriceFeedAggregator(FeedConfig config, OracleRoster& roster,
                                         SettlementToken& token)
    : PriceFeedAggregator(std::move(config), roster, token, GenesisState()) {}

PriceFeedAggregator::PriceFeedAggregator(FeedConfig config, OracleRoster& roster,
                                         SettlementToken& token, FeedState state)
    : config_(std::move(config))
    , quorum_(config_.minThresholdPercent)
    , roster_(roster)
    , token_(token)
    , state_(std::move(state)) {
    config_.Validate();
    LOG_INFO(util::LogCategory::FEED) << "Aggregator '" << config_.description << "' at "
        << config_.contractAddress.ToString() << " starting after round "
        << state_.rounds.LastReportedRound();
}

void PriceFeedAggregator::SetValidator(AnswerValidator* validator) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    validator_ = validator;
}

void PriceFeedAggregator::SetAccessController(ReadAccessController* controller) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    access_ = controller;
}

void PriceFeedAggregator::AddListener(FeedListener* listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.push_back(listener);
}

void PriceFeedAggregator::RemoveListener(FeedListener* listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

// ============================================================================
// Submission
// ============================================================================

Price PriceFeedAggregator::Submit(const CallContext& ctx, const SubmissionBatch& batch) {
    std::vector<Event> events;
    Price answer = 0;

    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        CheckNotReentrant("Submit");
        FeedState work = state_;
        const Timestamp now = util::GetTime();
        const RoundId roundId = batch.roundId;

        try {
            RefreshAvailableFunds(work, events);

            quorum_.Check(batch, now, roster_.OracleCount());

            work.rounds.CreateNewRound(roundId, config_.paymentAmount, now);
            events.push_back([roundId, sender = ctx.sender, now](FeedListener& l) {
                l.OnNewRound(roundId, sender, now);
            });

            const Hash256 reportHash = HashReport(roundId, config_.contractAddress,
                                                  batch.prices, batch.deadline,
                                                  config_.description);

            Amount submitterReward = 0;
            for (size_t i = 0; i < batch.prices.size(); ++i) {
                auto signer = RecoverSigner(reportHash, batch.SignatureAt(i));
                if (!signer) {
                    throw FeedError(FeedErrorCode::UnauthorizedSubmitter,
                                    "signature " + std::to_string(i) + " is not recoverable");
                }
                if (!roster_.IsEligible(*signer, roundId)) {
                    throw FeedError(FeedErrorCode::UnauthorizedSubmitter,
                                    signer->ToString() + " is not an enabled oracle for round " +
                                    std::to_string(roundId));
                }

                Amount share = work.funds.PayOracle(roundId, *signer, config_.paymentAmount,
                                                    config_.rewardRateX10);
                submitterReward = CheckedAdd(submitterReward, share);

                events.push_back([price = batch.prices[i], roundId, oracle = *signer](FeedListener& l) {
                    l.OnSubmissionReceived(price, roundId, oracle);
                });
            }

            work.funds.AccumulateReward(OracleShare(config_.paymentAmount, config_.rewardRateX10));
            work.funds.UpdateAvailableFunds(token_.BalanceOf(config_.contractAddress));
            events.push_back([available = work.funds.Available()](FeedListener& l) {
                l.OnAvailableFundsUpdated(available);
            });

            answer = work.rounds.UpdateRoundPrice(roundId, batch.prices, now);
            events.push_back([answer, roundId, now](FeedListener& l) {
                l.OnAnswerUpdated(answer, roundId, now);
            });

            RunValidator(work, roundId, answer, events);

            work.vesting.Append(ctx.sender, submitterReward, now);
            if (submitterReward > 0) {
                events.push_back([submitter = ctx.sender, submitterReward](FeedListener& l) {
                    l.OnRewardsAppended(submitter, submitterReward);
                });
            }
        } catch (const FeedError& e) {
            LOG_WARN(util::LogCategory::FEED) << "Rejected submission for round " << roundId
                << " from " << ctx.sender.ToString() << ": " << e.what();
            throw;
        }

        state_ = std::move(work);

        LOG_INFO(util::LogCategory::ROUND) << "Round " << roundId << " answered " << answer
            << " (" << batch.prices.size() << " signatures, available "
            << state_.funds.Available() << ", allocated " << state_.funds.Allocated() << ")";
    }

    Dispatch(events);
    return answer;
}

void PriceFeedAggregator::RunValidator(const FeedState& work, RoundId roundId, Price answer,
                                       std::vector<Event>& events) {
    if (!validator_) {
        return;
    }

    const Round* prev = work.rounds.Find(roundId - 1);
    RoundId prevRoundId = prev ? prev->answeredInRound : 0;
    Price prevAnswer = prev ? prev->answer : 0;

    ValidatorOutcome outcome;
    {
        ValidatorScope scope(inValidator_);
        outcome = GuardedValidatorCall(*validator_, prevRoundId, prevAnswer,
                                       roundId, answer, config_.validatorGasLimit);
    }
    if (!outcome.ok) {
        LOG_WARN(util::LogCategory::VALIDATOR) << "Validator failed for round " << roundId
            << ": " << outcome.reason;
        events.push_back([roundId, reason = outcome.reason](FeedListener& l) {
            l.OnValidatorFailed(roundId, reason);
        });
    }
}

// ============================================================================
// Funds
// ============================================================================

void PriceFeedAggregator::RefreshAvailableFunds(FeedState& work,
                                                std::vector<Event>& events) const {
    if (work.funds.UpdateAvailableFunds(token_.BalanceOf(config_.contractAddress))) {
        events.push_back([available = work.funds.Available()](FeedListener& l) {
            l.OnAvailableFundsUpdated(available);
        });
    }
}

void PriceFeedAggregator::TransferOut(const Address& to, Amount amount) {
    if (!token_.Transfer(config_.contractAddress, to, amount)) {
        throw FeedError(FeedErrorCode::TransferFailed,
                        "transfer of " + std::to_string(amount) + " to " + to.ToString());
    }
}

void PriceFeedAggregator::AddFunds(const CallContext& ctx, Amount amount) {
    std::vector<Event> events;

    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        CheckNotReentrant("AddFunds");
        if (amount <= 0) {
            throw FeedError(FeedErrorCode::InvalidAmount,
                            "deposit of " + std::to_string(amount));
        }

        FeedState work = state_;
        Amount balance = CheckedAdd(token_.BalanceOf(config_.contractAddress), amount);
        if (work.funds.UpdateAvailableFunds(balance)) {
            events.push_back([available = work.funds.Available()](FeedListener& l) {
                l.OnAvailableFundsUpdated(available);
            });
        }

        if (!token_.TransferFrom(ctx.sender, config_.contractAddress, amount)) {
            throw FeedError(FeedErrorCode::TransferFailed,
                            "deposit of " + std::to_string(amount) + " from " +
                            ctx.sender.ToString());
        }

        state_ = std::move(work);
        LOG_INFO(util::LogCategory::FUNDS) << ctx.sender.ToString() << " added " << amount
            << " (available " << state_.funds.Available() << ")";
    }

    Dispatch(events);
}

Amount PriceFeedAggregator::UnlockSubmitterRewards(const Address& submitter) {
    std::vector<Event> events;
    Amount amount = 0;

    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        CheckNotReentrant("UnlockSubmitterRewards");
        FeedState work = state_;

        amount = work.vesting.TakeReleasable(submitter, util::GetTime());
        if (amount > 0) {
            work.funds.ReleaseAllocated(amount);
            TransferOut(submitter, amount);
            events.push_back([submitter, amount](FeedListener& l) {
                l.OnRewardsUnlocked(submitter, amount);
            });
            LOG_INFO(util::LogCategory::VESTING) << "Unlocked " << amount << " for "
                << submitter.ToString();
        }

        state_ = std::move(work);
    }

    Dispatch(events);
    return amount;
}

void PriceFeedAggregator::WithdrawPayment(const CallContext& ctx, const Address& oracle,
                                          const Address& recipient, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    CheckNotReentrant("WithdrawPayment");

    auto admin = roster_.GetAdmin(oracle);
    if (!admin || *admin != ctx.sender) {
        throw FeedError(FeedErrorCode::NotAdmin,
                        ctx.sender.ToString() + " is not admin of " + oracle.ToString());
    }
    if (amount <= 0) {
        throw FeedError(FeedErrorCode::InvalidAmount, "withdrawal of " + std::to_string(amount));
    }

    FeedState work = state_;
    work.funds.WithdrawPayment(oracle, amount);
    TransferOut(recipient, amount);
    state_ = std::move(work);

    LOG_INFO(util::LogCategory::FUNDS) << "Withdrew " << amount << " of " << oracle.ToString()
        << " to " << recipient.ToString();
}

bool PriceFeedAggregator::UpdateAvailableFunds() {
    std::vector<Event> events;

    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        CheckNotReentrant("UpdateAvailableFunds");
        FeedState work = state_;
        RefreshAvailableFunds(work, events);
        state_ = std::move(work);
    }

    Dispatch(events);
    return !events.empty();
}

void PriceFeedAggregator::CheckNotReentrant(const char* operation) const {
    if (inValidator_) {
        throw FeedError(FeedErrorCode::ReentrantCall,
                        std::string(operation) + " called while a submission is validating");
    }
}

// ============================================================================
// Round Reads
// ============================================================================

void PriceFeedAggregator::CheckReadAccess(const Address& caller) const {
    if (access_ && !access_->HasAccess(caller)) {
        throw FeedError(FeedErrorCode::UnauthorizedReader,
                        caller.ToString() + " has no read access");
    }
}

Price PriceFeedAggregator::LatestAnswer(const Address& caller) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    CheckReadAccess(caller);
    return state_.rounds.GetAnswer(state_.rounds.LastReportedRound());
}

Timestamp PriceFeedAggregator::LatestTimestamp(const Address& caller) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    CheckReadAccess(caller);
    return state_.rounds.GetTimestamp(state_.rounds.LastReportedRound());
}

RoundId PriceFeedAggregator::LatestRound(const Address& caller) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    CheckReadAccess(caller);
    return state_.rounds.LastReportedRound();
}

RoundData PriceFeedAggregator::LatestRoundData(const Address& caller) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    CheckReadAccess(caller);
    return state_.rounds.GetRoundInfo(state_.rounds.LastReportedRound());
}

Price PriceFeedAggregator::GetAnswer(const Address& caller, uint64_t roundId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    CheckReadAccess(caller);
    return state_.rounds.GetAnswer(roundId);
}

Timestamp PriceFeedAggregator::GetTimestamp(const Address& caller, uint64_t roundId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    CheckReadAccess(caller);
    return state_.rounds.GetTimestamp(roundId);
}

RoundData PriceFeedAggregator::GetRoundData(const Address& caller, uint64_t roundId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    CheckReadAccess(caller);
    return state_.rounds.GetRoundInfo(roundId);
}

Round PriceFeedAggregator::GetRound(const Address& caller, uint64_t roundId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    CheckReadAccess(caller);
    const Round* round = roundId <= ROUND_MAX ? state_.rounds.Find(static_cast<RoundId>(roundId))
                                              : nullptr;
    if (!round || round->answeredInRound == 0) {
        throw FeedError(FeedErrorCode::NoData, "round " + std::to_string(roundId) + " has no answer");
    }
    return *round;
}

// ============================================================================
// Oracle Reads
// ============================================================================

std::optional<Address> PriceFeedAggregator::GetAdmin(const Address& oracle) const {
    return roster_.GetAdmin(oracle);
}

OracleRoundInfo PriceFeedAggregator::OracleRoundState(const CallContext& ctx,
                                                      const Address& oracle,
                                                      RoundId queriedRoundId) const {
    if (!ctx.IsExternallyOwned()) {
        throw FeedError(FeedErrorCode::UnauthorizedReader,
                        "oracle round state requires an externally-owned caller");
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const RoundId last = state_.rounds.LastReportedRound();

    OracleRoundInfo info;
    if (queriedRoundId != 0) {
        info.roundId = queriedRoundId;
    } else {
        info.roundId = last == ROUND_MAX ? last : last + 1;
    }
    info.eligibleToSubmit = roster_.IsEligible(oracle, info.roundId);
    info.latestAnswer = state_.rounds.GetAnswer(last);
    info.availableFunds = state_.funds.Available();
    info.oracleCount = roster_.OracleCount();

    const Round* round = state_.rounds.Find(info.roundId);
    info.paymentAmount = round ? round->paymentAmount : config_.paymentAmount;
    return info;
}

// ============================================================================
// Ledger Views
// ============================================================================

Amount PriceFeedAggregator::AvailableFunds() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.funds.Available();
}

Amount PriceFeedAggregator::AllocatedFunds() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.funds.Allocated();
}

Amount PriceFeedAggregator::WithdrawablePayment(const Address& oracle) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.funds.WithdrawablePayment(oracle);
}

Amount PriceFeedAggregator::RewardAccumulator() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.funds.RewardAccumulator();
}

std::optional<SubmitterRewardsVesting>
PriceFeedAggregator::GetSubmitterVesting(const Address& submitter) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.vesting.Get(submitter);
}

FeedState PriceFeedAggregator::Snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_;
}

// ============================================================================
// Notifications
// ============================================================================

void PriceFeedAggregator::Dispatch(const std::vector<Event>& events) {
    if (events.empty()) {
        return;
    }
    std::vector<FeedListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = listeners_;
    }
    for (const auto& event : events) {
        for (auto* listener : listeners) {
            event(*listener);
        }
    }
}

} // namespace feed
} // namespace quorumfeed
