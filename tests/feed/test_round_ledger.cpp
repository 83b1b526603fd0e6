// QUORUMFEED - Round Ledger Tests
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include <gtest/gtest.h>

#include "quorumfeed/feed/errors.h"
#include "quorumfeed/feed/round_ledger.h"

namespace quorumfeed {
namespace feed {
namespace {

template <typename Fn>
FeedErrorCode ErrorCodeOf(Fn&& fn) {
    try {
        fn();
    } catch (const FeedError& e) {
        return e.Code();
    }
    ADD_FAILURE() << "expected FeedError";
    return FeedErrorCode::InvalidConfig;
}

class RoundLedgerTest : public ::testing::Test {
protected:
    RoundLedger ledger_{1000};
};

// ============================================================================
// Genesis
// ============================================================================

TEST_F(RoundLedgerTest, GenesisRound) {
    EXPECT_EQ(ledger_.LastReportedRound(), 0u);

    const Round* genesis = ledger_.Find(0);
    ASSERT_NE(genesis, nullptr);
    EXPECT_EQ(genesis->answer, 0);
    EXPECT_EQ(genesis->answeredInRound, 0u);
    EXPECT_EQ(genesis->startedAt, 1000);
    EXPECT_EQ(genesis->updatedAt, 1000);
}

TEST_F(RoundLedgerTest, GenesisHasNoData) {
    EXPECT_EQ(ErrorCodeOf([&] { ledger_.GetRoundInfo(0); }), FeedErrorCode::NoData);
    EXPECT_EQ(ledger_.GetAnswer(0), 0);
    EXPECT_EQ(ledger_.GetTimestamp(0), 1000);
}

// ============================================================================
// Round Creation
// ============================================================================

TEST_F(RoundLedgerTest, CreateNextRound) {
    ledger_.CreateNewRound(1, 10, 2000);
    EXPECT_EQ(ledger_.LastReportedRound(), 1u);

    const Round* round = ledger_.Find(1);
    ASSERT_NE(round, nullptr);
    EXPECT_EQ(round->startedAt, 2000);
    EXPECT_EQ(round->updatedAt, 2000);
    EXPECT_EQ(round->paymentAmount, 10);
    EXPECT_TRUE(round->submissions.empty());
}

TEST_F(RoundLedgerTest, RejectsNonSequentialRound) {
    EXPECT_EQ(ErrorCodeOf([&] { ledger_.CreateNewRound(2, 10, 2000); }),
              FeedErrorCode::NonSequentialRound);
    EXPECT_EQ(ErrorCodeOf([&] { ledger_.CreateNewRound(0, 10, 2000); }),
              FeedErrorCode::NonSequentialRound);

    ledger_.CreateNewRound(1, 10, 2000);
    EXPECT_EQ(ErrorCodeOf([&] { ledger_.CreateNewRound(1, 10, 3000); }),
              FeedErrorCode::NonSequentialRound);
    EXPECT_EQ(ledger_.LastReportedRound(), 1u);
}

TEST_F(RoundLedgerTest, NewRoundCarriesPreviousAnswer) {
    ledger_.CreateNewRound(1, 10, 2000);
    ledger_.UpdateRoundPrice(1, {100, 200}, 2001);

    ledger_.CreateNewRound(2, 10, 3000);
    const Round* round = ledger_.Find(2);
    ASSERT_NE(round, nullptr);
    EXPECT_EQ(round->answer, 150);
    EXPECT_EQ(round->answeredInRound, 1u);

    // Carried answers report through the new round id
    RoundData data = ledger_.GetRoundInfo(2);
    EXPECT_EQ(data.roundId, 2u);
    EXPECT_EQ(data.answer, 150);
    EXPECT_EQ(data.answeredInRound, 1u);
}

TEST_F(RoundLedgerTest, RefusesToWrapAtRoundMax) {
    std::map<RoundId, Round> rounds;
    Round last;
    last.answer = 5;
    last.answeredInRound = static_cast<RoundId>(ROUND_MAX);
    rounds[static_cast<RoundId>(ROUND_MAX)] = last;
    RoundLedger full = RoundLedger::Restore(static_cast<RoundId>(ROUND_MAX), rounds);

    EXPECT_EQ(ErrorCodeOf([&] { full.CreateNewRound(0, 10, 1); }),
              FeedErrorCode::NonSequentialRound);
}

// ============================================================================
// Price Updates
// ============================================================================

TEST_F(RoundLedgerTest, UpdateRoundPriceStoresMedian) {
    ledger_.CreateNewRound(1, 10, 2000);
    Price answer = ledger_.UpdateRoundPrice(1, {300, 100, 200}, 2005);
    EXPECT_EQ(answer, 200);

    const Round* round = ledger_.Find(1);
    ASSERT_NE(round, nullptr);
    EXPECT_EQ(round->answer, 200);
    EXPECT_EQ(round->answeredInRound, 1u);
    EXPECT_EQ(round->updatedAt, 2005);
    EXPECT_EQ(round->startedAt, 2000);
    EXPECT_EQ(round->submissions, (std::vector<Price>{300, 100, 200}));

    EXPECT_EQ(ledger_.GetAnswer(1), 200);
    EXPECT_EQ(ledger_.GetTimestamp(1), 2005);
}

TEST_F(RoundLedgerTest, UpdateUnknownRoundIsNoData) {
    EXPECT_EQ(ErrorCodeOf([&] { ledger_.UpdateRoundPrice(7, {1}, 1); }),
              FeedErrorCode::NoData);
}

TEST_F(RoundLedgerTest, UpdateWithNoPricesIsMalformed) {
    ledger_.CreateNewRound(1, 10, 2000);
    EXPECT_EQ(ErrorCodeOf([&] { ledger_.UpdateRoundPrice(1, {}, 1); }),
              FeedErrorCode::MalformedBatch);
}

// ============================================================================
// Reads
// ============================================================================

TEST_F(RoundLedgerTest, ReadsOutOfRange) {
    const uint64_t tooLarge = ROUND_MAX + 1;
    EXPECT_EQ(ErrorCodeOf([&] { ledger_.GetRoundInfo(tooLarge); }), FeedErrorCode::NoData);
    EXPECT_EQ(ledger_.GetAnswer(tooLarge), 0);
    EXPECT_EQ(ledger_.GetTimestamp(tooLarge), 0);

    EXPECT_EQ(ErrorCodeOf([&] { ledger_.GetRoundInfo(5); }), FeedErrorCode::NoData);
    EXPECT_EQ(ledger_.GetAnswer(5), 0);
    EXPECT_EQ(ledger_.GetTimestamp(5), 0);
    EXPECT_EQ(ledger_.Find(5), nullptr);
}

TEST_F(RoundLedgerTest, RestoreRequiresLastRound) {
    std::map<RoundId, Round> rounds;
    rounds[0] = Round{};
    EXPECT_EQ(ErrorCodeOf([&] { RoundLedger::Restore(3, rounds); }),
              FeedErrorCode::SnapshotCorrupt);

    RoundLedger restored = RoundLedger::Restore(0, rounds);
    EXPECT_EQ(restored.LastReportedRound(), 0u);
    EXPECT_EQ(restored.Rounds().size(), 1u);
}

} // namespace
} // namespace feed
} // namespace quorumfeed
