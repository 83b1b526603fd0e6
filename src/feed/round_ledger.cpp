// QUORUMFEED - Round Ledger Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/round_ledger.h"
#include "quorumfeed/feed/errors.h"
#include "quorumfeed/feed/median.h"
#include "quorumfeed/util/logging.h"

#include <string>

namespace quorumfeed {
namespace feed {

RoundLedger::RoundLedger(Timestamp genesisTime) {
    Round genesis;
    genesis.startedAt = genesisTime;
    genesis.updatedAt = genesisTime;
    rounds_[0] = genesis;
}

RoundLedger RoundLedger::Restore(RoundId lastReportedRound, std::map<RoundId, Round> rounds) {
    if (rounds.find(lastReportedRound) == rounds.end()) {
        throw FeedError(FeedErrorCode::SnapshotCorrupt,
                        "missing record for last reported round " +
                        std::to_string(lastReportedRound));
    }
    RoundLedger ledger;
    ledger.rounds_ = std::move(rounds);
    ledger.lastReportedRound_ = lastReportedRound;
    return ledger;
}

void RoundLedger::CreateNewRound(RoundId id, Amount paymentAmount, Timestamp now) {
    if (lastReportedRound_ == ROUND_MAX ||
        static_cast<uint64_t>(id) != static_cast<uint64_t>(lastReportedRound_) + 1) {
        throw FeedError(FeedErrorCode::NonSequentialRound,
                        "expected " + std::to_string(static_cast<uint64_t>(lastReportedRound_) + 1) +
                        ", got " + std::to_string(id));
    }

    const Round& prev = rounds_.at(lastReportedRound_);

    Round round;
    round.answer = prev.answer;
    round.answeredInRound = prev.answeredInRound;
    round.startedAt = now;
    round.updatedAt = now;
    round.paymentAmount = paymentAmount;

    rounds_[id] = round;
    lastReportedRound_ = id;

    LOG_DEBUG(util::LogCategory::ROUND) << "Created round " << id
        << " (carried answer " << round.answer << " from round "
        << round.answeredInRound << ")";
}

Price RoundLedger::UpdateRoundPrice(RoundId id, const std::vector<Price>& prices, Timestamp now) {
    auto it = rounds_.find(id);
    if (it == rounds_.end()) {
        throw FeedError(FeedErrorCode::NoData, "round " + std::to_string(id));
    }

    Price answer = ComputeMedian(prices);

    Round& round = it->second;
    round.answer = answer;
    round.answeredInRound = id;
    round.updatedAt = now;
    round.submissions = prices;

    return answer;
}

const Round* RoundLedger::Find(RoundId id) const {
    auto it = rounds_.find(id);
    return it == rounds_.end() ? nullptr : &it->second;
}

RoundData RoundLedger::GetRoundInfo(uint64_t id) const {
    if (id > ROUND_MAX) {
        throw FeedError(FeedErrorCode::NoData, "round " + std::to_string(id) + " out of range");
    }
    const Round* round = Find(static_cast<RoundId>(id));
    if (!round || round->answeredInRound == 0) {
        throw FeedError(FeedErrorCode::NoData, "round " + std::to_string(id));
    }

    RoundData data;
    data.roundId = static_cast<RoundId>(id);
    data.answer = round->answer;
    data.startedAt = round->startedAt;
    data.updatedAt = round->updatedAt;
    data.answeredInRound = round->answeredInRound;
    return data;
}

Price RoundLedger::GetAnswer(uint64_t id) const {
    if (id > ROUND_MAX) {
        return 0;
    }
    const Round* round = Find(static_cast<RoundId>(id));
    return round ? round->answer : 0;
}

Timestamp RoundLedger::GetTimestamp(uint64_t id) const {
    if (id > ROUND_MAX) {
        return 0;
    }
    const Round* round = Find(static_cast<RoundId>(id));
    return round ? round->updatedAt : 0;
}

} // namespace feed
} // namespace quorumfeed
