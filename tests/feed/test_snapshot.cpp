// QUORUMFEED - State Snapshot Tests
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include <gtest/gtest.h>

#include "quorumfeed/feed/errors.h"
#include "quorumfeed/feed/snapshot.h"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace quorumfeed {
namespace feed {
namespace {

const Address ORACLE = Address::FromHex("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
const Address SUBMITTER = Address::FromHex("0x2b5ad5c4795c026514f8317c7a215e218dccd6cf");

FeedErrorCode DecodeError(const std::vector<Byte>& data) {
    try {
        DeserializeState(data);
    } catch (const FeedError& e) {
        return e.Code();
    }
    ADD_FAILURE() << "expected FeedError";
    return FeedErrorCode::InvalidConfig;
}

class SnapshotTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_.rounds = RoundLedger(1000);
        state_.rounds.CreateNewRound(1, 10, 2000);
        state_.rounds.UpdateRoundPrice(1, {100, 200}, 2001);
        state_.rounds.CreateNewRound(2, 10, 3000);
        state_.rounds.UpdateRoundPrice(2, {-5, 7, 9}, 3001);

        state_.funds.UpdateAvailableFunds(100);
        state_.funds.PayOracle(1, ORACLE, 10, 100);
        state_.funds.AccumulateReward(9);

        state_.vesting.Append(SUBMITTER, 1, 2001);
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
    }

    std::string TempPath() {
        char filename[] = "/tmp/quorumfeed_snapshot_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);
        tempFiles_.push_back(filename);
        return filename;
    }

    static void ExpectSameState(const FeedState& a, const FeedState& b) {
        EXPECT_EQ(a.rounds.LastReportedRound(), b.rounds.LastReportedRound());
        EXPECT_EQ(a.rounds.Rounds(), b.rounds.Rounds());
        EXPECT_EQ(a.funds.GetFunds(), b.funds.GetFunds());
        EXPECT_EQ(a.funds.RewardAccumulator(), b.funds.RewardAccumulator());
        EXPECT_EQ(a.funds.Withdrawables(), b.funds.Withdrawables());
        EXPECT_EQ(a.vesting.Records(), b.vesting.Records());
    }

    FeedState state_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Encoding
// ============================================================================

TEST_F(SnapshotTest, HeaderIsMagicAndVersion) {
    std::vector<Byte> data = SerializeState(state_);
    ASSERT_GE(data.size(), 5u);
    EXPECT_EQ(data[0], 'Q');
    EXPECT_EQ(data[1], 'F');
    EXPECT_EQ(data[2], 'S');
    EXPECT_EQ(data[3], '1');
    EXPECT_EQ(data[4], SNAPSHOT_VERSION);
}

TEST_F(SnapshotTest, DecodeRestoresEveryLedger) {
    FeedState decoded = DeserializeState(SerializeState(state_));
    ExpectSameState(decoded, state_);

    EXPECT_EQ(decoded.rounds.GetRoundInfo(2).answer, 7);
    EXPECT_EQ(decoded.funds.WithdrawablePayment(ORACLE), 9);
    EXPECT_EQ(decoded.vesting.Get(SUBMITTER)->remainVesting, 1);
}

TEST_F(SnapshotTest, DecodedStateKeepsWorking) {
    FeedState decoded = DeserializeState(SerializeState(state_));
    decoded.rounds.CreateNewRound(3, 10, 4000);
    EXPECT_EQ(decoded.rounds.Find(3)->answer, 7);
    EXPECT_EQ(decoded.rounds.Find(3)->answeredInRound, 2u);
}

// ============================================================================
// Corruption
// ============================================================================

TEST_F(SnapshotTest, RejectsBadMagic) {
    std::vector<Byte> data = SerializeState(state_);
    data[0] = 'X';
    EXPECT_EQ(DecodeError(data), FeedErrorCode::SnapshotCorrupt);
}

TEST_F(SnapshotTest, RejectsUnknownVersion) {
    std::vector<Byte> data = SerializeState(state_);
    data[4] = SNAPSHOT_VERSION + 1;
    EXPECT_EQ(DecodeError(data), FeedErrorCode::SnapshotCorrupt);
}

TEST_F(SnapshotTest, RejectsTruncation) {
    std::vector<Byte> data = SerializeState(state_);
    for (size_t len : {size_t{0}, size_t{3}, size_t{5}, data.size() / 2, data.size() - 1}) {
        std::vector<Byte> cut(data.begin(), data.begin() + len);
        EXPECT_EQ(DecodeError(cut), FeedErrorCode::SnapshotCorrupt) << "length " << len;
    }
}

TEST_F(SnapshotTest, RejectsTrailingBytes) {
    std::vector<Byte> data = SerializeState(state_);
    data.push_back(0);
    EXPECT_EQ(DecodeError(data), FeedErrorCode::SnapshotCorrupt);
}

TEST_F(SnapshotTest, RejectsNegativeBalances) {
    FeedState bad;
    bad.funds = FundsLedger::Restore(Funds{0, 0}, {{ORACLE, 5}}, 0);
    std::vector<Byte> data = SerializeState(bad);

    // The single withdrawable amount is the last 8 bytes before the vesting count
    ASSERT_GE(data.size(), 9u);
    size_t amountPos = data.size() - 1 - 8;
    for (size_t i = 0; i < 8; ++i) {
        data[amountPos + i] = 0xFF;
    }
    EXPECT_EQ(DecodeError(data), FeedErrorCode::SnapshotCorrupt);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(SnapshotTest, SaveAndLoadFile) {
    std::string path = TempPath();
    SaveSnapshot(state_, path);

    FeedState loaded = LoadSnapshot(path);
    ExpectSameState(loaded, state_);
}

TEST_F(SnapshotTest, LoadMissingFile) {
    EXPECT_THROW(LoadSnapshot("/nonexistent/dir/feed.snapshot"), FeedError);
}

TEST_F(SnapshotTest, SaveToUnwritablePath) {
    EXPECT_THROW(SaveSnapshot(state_, "/nonexistent/dir/feed.snapshot"), FeedError);
}

TEST_F(SnapshotTest, LoadGarbageFile) {
    std::string path = TempPath();
    {
        std::ofstream out(path, std::ios::binary);
        out << "not a snapshot";
    }
    EXPECT_THROW(LoadSnapshot(path), FeedError);
}

} // namespace
} // namespace feed
} // namespace quorumfeed
