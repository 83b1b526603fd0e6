// QUORUMFEED - State Snapshots Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/snapshot.h"
#include "quorumfeed/core/serialize.h"
#include "quorumfeed/feed/errors.h"
#include "quorumfeed/util/logging.h"

#include <cstring>
#include <fstream>
#include <iterator>

namespace quorumfeed {
namespace feed {

namespace {

void WriteRounds(DataStream& s, const RoundLedger& rounds) {
    s << rounds.LastReportedRound();
    WriteCompactSize(s, rounds.Rounds().size());
    for (const auto& [id, round] : rounds.Rounds()) {
        s << id << round.answer << round.startedAt << round.updatedAt
          << round.answeredInRound << round.submissions << round.paymentAmount;
    }
}

RoundLedger ReadRounds(DataStream& s) {
    RoundId lastReportedRound = 0;
    s >> lastReportedRound;

    std::map<RoundId, Round> rounds;
    uint64_t count = ReadCompactSize(s);
    for (uint64_t i = 0; i < count; ++i) {
        RoundId id = 0;
        Round round;
        s >> id >> round.answer >> round.startedAt >> round.updatedAt
          >> round.answeredInRound >> round.submissions >> round.paymentAmount;
        if (!rounds.emplace(id, std::move(round)).second) {
            throw FeedError(FeedErrorCode::SnapshotCorrupt,
                            "duplicate round " + std::to_string(id));
        }
    }
    return RoundLedger::Restore(lastReportedRound, std::move(rounds));
}

void WriteFunds(DataStream& s, const FundsLedger& funds) {
    s << funds.Available() << funds.Allocated() << funds.RewardAccumulator();
    WriteCompactSize(s, funds.Withdrawables().size());
    for (const auto& [oracle, amount] : funds.Withdrawables()) {
        s << oracle << amount;
    }
}

FundsLedger ReadFunds(DataStream& s) {
    Funds funds;
    Amount accumulator = 0;
    s >> funds.available >> funds.allocated >> accumulator;

    std::map<Address, Amount> withdrawable;
    uint64_t count = ReadCompactSize(s);
    for (uint64_t i = 0; i < count; ++i) {
        Address oracle;
        Amount amount = 0;
        s >> oracle >> amount;
        if (amount < 0) {
            throw FeedError(FeedErrorCode::SnapshotCorrupt,
                            "negative withdrawable for " + oracle.ToString());
        }
        withdrawable[oracle] = amount;
    }
    return FundsLedger::Restore(funds, std::move(withdrawable), accumulator);
}

void WriteVesting(DataStream& s, const RewardVestingLedger& vesting) {
    WriteCompactSize(s, vesting.Records().size());
    for (const auto& [submitter, rec] : vesting.Records()) {
        s << submitter << rec.lastUpdated << rec.releasable << rec.remainVesting;
    }
}

RewardVestingLedger ReadVesting(DataStream& s) {
    std::map<Address, SubmitterRewardsVesting> records;
    uint64_t count = ReadCompactSize(s);
    for (uint64_t i = 0; i < count; ++i) {
        Address submitter;
        SubmitterRewardsVesting rec;
        s >> submitter >> rec.lastUpdated >> rec.releasable >> rec.remainVesting;
        records[submitter] = rec;
    }
    return RewardVestingLedger::Restore(std::move(records));
}

} // anonymous namespace

std::vector<Byte> SerializeState(const FeedState& state) {
    DataStream s;
    s.Write(SNAPSHOT_MAGIC, sizeof(SNAPSHOT_MAGIC));
    s << SNAPSHOT_VERSION;
    WriteRounds(s, state.rounds);
    WriteFunds(s, state.funds);
    WriteVesting(s, state.vesting);
    return s.Data();
}

FeedState DeserializeState(const std::vector<Byte>& data) {
    DataStream s(data);
    try {
        char magic[sizeof(SNAPSHOT_MAGIC)];
        s.Read(magic, sizeof(magic));
        if (std::memcmp(magic, SNAPSHOT_MAGIC, sizeof(magic)) != 0) {
            throw FeedError(FeedErrorCode::SnapshotCorrupt, "bad magic");
        }

        uint8_t version = 0;
        s >> version;
        if (version != SNAPSHOT_VERSION) {
            throw FeedError(FeedErrorCode::SnapshotCorrupt,
                            "unsupported version " + std::to_string(version));
        }

        FeedState state;
        state.rounds = ReadRounds(s);
        state.funds = ReadFunds(s);
        state.vesting = ReadVesting(s);

        if (!s.empty()) {
            throw FeedError(FeedErrorCode::SnapshotCorrupt,
                            std::to_string(s.size()) + " trailing bytes");
        }
        return state;
    } catch (const std::ios_base::failure& e) {
        throw FeedError(FeedErrorCode::SnapshotCorrupt, e.what());
    }
}

void SaveSnapshot(const FeedState& state, const std::string& path) {
    std::vector<Byte> data = SerializeState(state);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw FeedError(FeedErrorCode::SnapshotCorrupt, "cannot open " + path + " for writing");
    }
    file.write(reinterpret_cast<const char*>(data.data()), data.size());
    if (!file.good()) {
        throw FeedError(FeedErrorCode::SnapshotCorrupt, "write failed: " + path);
    }

    LOG_INFO(util::LogCategory::SNAPSHOT) << "Saved snapshot " << path
        << " (" << data.size() << " bytes, last round "
        << state.rounds.LastReportedRound() << ")";
}

FeedState LoadSnapshot(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FeedError(FeedErrorCode::SnapshotCorrupt, "cannot open " + path);
    }
    std::vector<Byte> data((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());

    FeedState state = DeserializeState(data);

    LOG_INFO(util::LogCategory::SNAPSHOT) << "Loaded snapshot " << path
        << " (last round " << state.rounds.LastReportedRound() << ")";
    return state;
}

} // namespace feed
} // namespace quorumfeed
