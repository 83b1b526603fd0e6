// QUORUMFEED - Submitter Reward Vesting Tests
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include <gtest/gtest.h>

#include "quorumfeed/feed/errors.h"
#include "quorumfeed/feed/vesting_ledger.h"

#include <limits>

namespace quorumfeed {
namespace feed {
namespace {

const Address SUBMITTER = Address::FromHex("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
const Address OTHER = Address::FromHex("0x2b5ad5c4795c026514f8317c7a215e218dccd6cf");

constexpr Timestamp T0 = 1700000000;

// ============================================================================
// Unlock Schedule
// ============================================================================

TEST(ComputeUnlockableTest, NothingBeforeTimePasses) {
    EXPECT_EQ(ComputeUnlockable(T0, T0, 1000), 0);
    EXPECT_EQ(ComputeUnlockable(T0 - 10, T0, 1000), 0);
    EXPECT_EQ(ComputeUnlockable(T0 + 100, T0, 0), 0);
}

TEST(ComputeUnlockableTest, LinearAndTruncated) {
    EXPECT_EQ(ComputeUnlockable(T0 + VESTING_PERIOD / 2, T0, 2), 1);
    EXPECT_EQ(ComputeUnlockable(T0 + VESTING_PERIOD / 2, T0, 3), 1);
    EXPECT_EQ(ComputeUnlockable(T0 + VESTING_PERIOD / 4, T0, 1000), 250);
    EXPECT_EQ(ComputeUnlockable(T0 + 1, T0, VESTING_PERIOD * 3), 3);
}

TEST(ComputeUnlockableTest, FullPeriodReleasesEverything) {
    EXPECT_EQ(ComputeUnlockable(T0 + VESTING_PERIOD, T0, 7), 7);
    EXPECT_EQ(ComputeUnlockable(T0 + 10 * VESTING_PERIOD, T0, 7), 7);
}

TEST(ComputeUnlockableTest, LargeBalancesDoNotOverflow) {
    const Amount huge = std::numeric_limits<Amount>::max() - 1;
    Amount half = ComputeUnlockable(T0 + VESTING_PERIOD / 2, T0, huge);
    EXPECT_GT(half, huge / 2 - 2);
    EXPECT_LE(half, huge / 2 + 1);
    EXPECT_LE(ComputeUnlockable(T0 + VESTING_PERIOD - 1, T0, huge), huge);
}

// ============================================================================
// Ledger Tests
// ============================================================================

class VestingLedgerTest : public ::testing::Test {
protected:
    RewardVestingLedger ledger_;
};

TEST_F(VestingLedgerTest, AppendStartsVesting) {
    ledger_.Append(SUBMITTER, 2, T0);

    auto rec = ledger_.Get(SUBMITTER);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->lastUpdated, T0);
    EXPECT_EQ(rec->remainVesting, 2);
    EXPECT_EQ(rec->releasable, 0);
    EXPECT_FALSE(ledger_.Get(OTHER).has_value());
}

TEST_F(VestingLedgerTest, AppendUnlocksAccruedFirst) {
    ledger_.Append(SUBMITTER, 1000, T0);
    ledger_.Append(SUBMITTER, 500, T0 + VESTING_PERIOD / 2);

    auto rec = ledger_.Get(SUBMITTER);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->releasable, 500);
    EXPECT_EQ(rec->remainVesting, 1000);
    EXPECT_EQ(rec->lastUpdated, T0 + VESTING_PERIOD / 2);
}

TEST_F(VestingLedgerTest, UpdateConservesTotal) {
    ledger_.Append(SUBMITTER, 999, T0);
    for (int i = 1; i <= 7; ++i) {
        ledger_.UpdateWithdrawable(SUBMITTER, T0 + i * 12345);
        auto rec = ledger_.Get(SUBMITTER);
        ASSERT_TRUE(rec.has_value());
        EXPECT_EQ(rec->releasable + rec->remainVesting, 999);
    }
}

TEST_F(VestingLedgerTest, UpdateStampsTimeEvenWhenEmpty) {
    ledger_.UpdateWithdrawable(OTHER, T0 + 5);
    auto rec = ledger_.Get(OTHER);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->lastUpdated, T0 + 5);
    EXPECT_EQ(rec->remainVesting, 0);
}

TEST_F(VestingLedgerTest, TakeReleasableDrainsUnlocked) {
    ledger_.Append(SUBMITTER, 2, T0);

    EXPECT_EQ(ledger_.TakeReleasable(SUBMITTER, T0 + 10), 0);
    EXPECT_EQ(ledger_.TakeReleasable(SUBMITTER, T0 + VESTING_PERIOD + 10), 2);
    EXPECT_EQ(ledger_.TakeReleasable(SUBMITTER, T0 + 2 * VESTING_PERIOD), 0);

    auto rec = ledger_.Get(SUBMITTER);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->releasable, 0);
    EXPECT_EQ(rec->remainVesting, 0);
}

TEST_F(VestingLedgerTest, TakeReleasableForUnknownSubmitterIsNoOp) {
    EXPECT_EQ(ledger_.TakeReleasable(SUBMITTER, T0), 0);
    EXPECT_FALSE(ledger_.Get(SUBMITTER).has_value());
    EXPECT_TRUE(ledger_.Records().empty());
}

TEST_F(VestingLedgerTest, ClockGoingBackwardsUnlocksNothing) {
    ledger_.Append(SUBMITTER, 100, T0);
    ledger_.UpdateWithdrawable(SUBMITTER, T0 - 50);

    auto rec = ledger_.Get(SUBMITTER);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->remainVesting, 100);
    EXPECT_EQ(rec->releasable, 0);
}

TEST_F(VestingLedgerTest, AppendOverflowIsReported) {
    ledger_.Append(SUBMITTER, std::numeric_limits<Amount>::max(), T0);
    try {
        ledger_.Append(SUBMITTER, 1, T0);
        FAIL() << "expected FeedError";
    } catch (const FeedError& e) {
        EXPECT_EQ(e.Code(), FeedErrorCode::ArithmeticOverflow);
    }
}

TEST(VestingRestoreTest, RejectsNegativeRecords) {
    std::map<Address, SubmitterRewardsVesting> records;
    records[SUBMITTER] = SubmitterRewardsVesting{T0, -1, 0};
    EXPECT_THROW(RewardVestingLedger::Restore(records), FeedError);

    records[SUBMITTER] = SubmitterRewardsVesting{T0, 3, 4};
    RewardVestingLedger restored = RewardVestingLedger::Restore(records);
    EXPECT_EQ(restored.Records().size(), 1u);
    EXPECT_EQ(*restored.Get(SUBMITTER), records[SUBMITTER]);
}

} // namespace
} // namespace feed
} // namespace quorumfeed
