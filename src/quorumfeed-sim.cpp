// QUORUMFEED Simulator - Main Entry Point
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// quorumfeed-sim drives a complete feed in memory:
// - generates oracle keys and registers them in a roster
// - funds the pool from a sponsor account
// - submits signed rounds, one hour of simulated time apart
// - unlocks the submitter's vested reward and writes a snapshot

#include <quorumfeed/core/types.h>
#include <quorumfeed/crypto/keys.h>
#include <quorumfeed/feed/aggregator.h>
#include <quorumfeed/feed/errors.h>
#include <quorumfeed/feed/reporter.h>
#include <quorumfeed/feed/snapshot.h>
#include <quorumfeed/util/config.h>
#include <quorumfeed/util/logging.h>
#include <quorumfeed/util/time.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <vector>

namespace quorumfeed {

// ============================================================================
// Simulation Settings
// ============================================================================

struct SimConfig {
    int64_t oracles{3};
    int64_t signers{3};
    int64_t rounds{5};
    Amount funding{1000};
    std::string snapshotPath;
    std::string logLevel{"info"};
};

/// Base price of the simulated pair, in 1e-2 units
constexpr Price BASE_PRICE = 100000;

/// Validity window of each report
constexpr int64_t REPORT_WINDOW = 300;

// ============================================================================
// Command Line
// ============================================================================

void PrintHelp() {
    std::cout << "QUORUMFEED Simulator\n\n";
    std::cout << "Usage: quorumfeed-sim [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                        Show this help message\n";
    std::cout << "  -conf=FILE                   Config file (default: quorumfeed.conf if present)\n";
    std::cout << "\nFeed Options:\n";
    std::cout << "  -paymentamount=N             Fee per oracle signature (default: 10)\n";
    std::cout << "  -rewardratex10=N             Submitter share per mille (default: 100)\n";
    std::cout << "  -description=TEXT            Pair description (default: DTO / USD)\n";
    std::cout << "  -contractaddress=HEX         Aggregator address (default: derived)\n";
    std::cout << "  -minthresholdpercent=N       Quorum threshold (default: 66)\n";
    std::cout << "  -validatorgaslimit=N         Validator budget (default: 100000)\n";
    std::cout << "\nSimulation Options:\n";
    std::cout << "  -sim.oracles=N               Enabled oracles (default: 3)\n";
    std::cout << "  -sim.signers=N               Signers per round (default: all)\n";
    std::cout << "  -sim.rounds=N                Rounds to submit (default: 5)\n";
    std::cout << "  -sim.funding=N               Initial pool deposit (default: 1000)\n";
    std::cout << "  -sim.snapshot=FILE           Write final state to FILE\n";
    std::cout << "  -sim.loglevel=LEVEL          trace, debug, info, warn, error\n";
    std::cout << "\n";
}

bool LoadConfiguration(int argc, char* argv[], util::ConfigManager& config) {
    auto result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage << "\n";
        return false;
    }

    std::string confPath = config.GetString(util::ConfigKeys::CONF, "");
    bool explicitConf = !confPath.empty();
    if (!explicitConf) {
        confPath = util::DEFAULT_CONFIG_FILENAME;
    }

    if (explicitConf || std::ifstream(confPath).good()) {
        result = config.ParseFile(confPath);
        if (!result.success) {
            std::cerr << "Error: " << result.errorFile << ":" << result.errorLine
                      << ": " << result.errorMessage << "\n";
            return false;
        }
    }
    return true;
}

SimConfig LoadSimConfig(const util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    SimConfig sim;
    sim.oracles = config.GetInt(SIM_ORACLES, sim.oracles, SIM_SECTION);
    sim.signers = config.GetInt(SIM_SIGNERS, sim.oracles, SIM_SECTION);
    sim.rounds = config.GetInt(SIM_ROUNDS, sim.rounds, SIM_SECTION);
    sim.funding = config.GetInt(SIM_FUNDING, sim.funding, SIM_SECTION);
    sim.snapshotPath = config.GetString(SIM_SNAPSHOT, "", SIM_SECTION);
    sim.logLevel = config.GetString(SIM_LOGLEVEL, sim.logLevel, SIM_SECTION);

    if (sim.oracles <= 0 || sim.signers < 0 || sim.signers > sim.oracles ||
        sim.rounds < 0 || sim.funding <= 0) {
        throw feed::FeedError(feed::FeedErrorCode::InvalidConfig,
                              "[sim] needs oracles > 0, 0 <= signers <= oracles, "
                              "rounds >= 0 and funding > 0");
    }
    return sim;
}

void SetupLogging(const SimConfig& sim) {
    auto& logger = util::Logger::Instance();
    logger.Initialize();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(sim.logLevel);
    logger.SetLevel(level);

    util::ConsoleSink::Config consoleConfig;
    consoleConfig.level = level;
    consoleConfig.useColors = true;
    consoleConfig.showTimestamp = true;
    logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
}

// ============================================================================
// Event Log
// ============================================================================

class SimListener : public feed::FeedListener {
public:
    void OnNewRound(RoundId roundId, const Address& startedBy, Timestamp startedAt) override {
        LOG_DEBUG(util::LogCategory::ROUND) << "Round " << roundId << " started by "
            << startedBy.ToString() << " at " << util::FormatISO8601(startedAt);
    }

    void OnAnswerUpdated(Price answer, RoundId roundId, Timestamp updatedAt) override {
        ++answers_;
        LOG_INFO(util::LogCategory::FEED) << "Answer " << answer << " for round " << roundId
            << " at " << util::FormatISO8601(updatedAt);
    }

    void OnRewardsUnlocked(const Address& submitter, Amount amount) override {
        LOG_INFO(util::LogCategory::VESTING) << submitter.ToString() << " received "
            << amount << " vested reward";
    }

    void OnValidatorFailed(RoundId roundId, const std::string& reason) override {
        LOG_WARN(util::LogCategory::VALIDATOR) << "Round " << roundId << ": " << reason;
    }

    int Answers() const { return answers_; }

private:
    int answers_{0};
};

// ============================================================================
// Simulation
// ============================================================================

/// Observation of oracle index i for a round: a slow drift plus per-oracle spread
Price ObservedPrice(int64_t round, int64_t i) {
    return BASE_PRICE + round * 25 + (i % 5) * 7 - 14;
}

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    if (!LoadConfiguration(argc, argv, config)) {
        return 1;
    }
    if (config.HasKey("help") || config.HasKey("h")) {
        PrintHelp();
        return 0;
    }

    SimConfig sim = LoadSimConfig(config);
    SetupLogging(sim);
    feed::FeedConfig feedConfig = feed::FeedConfig::Load(config);

    LOG_INFO(util::LogCategory::DEFAULT) << "QUORUMFEED Simulator starting: "
        << sim.oracles << " oracles, " << sim.signers << " signers, "
        << sim.rounds << " rounds";

    util::Timer timer;
    util::EnableMockTime();

    // Accounts
    PrivateKey sponsor = PrivateKey::Generate();
    PrivateKey oracleAdmin = PrivateKey::Generate();
    PrivateKey submitter = PrivateKey::Generate();

    feed::InMemoryOracleRoster roster;
    std::vector<PrivateKey> oracleKeys;
    for (int64_t i = 0; i < sim.oracles; ++i) {
        oracleKeys.push_back(PrivateKey::Generate());
        roster.AddOracle(oracleKeys.back().GetAddress(), oracleAdmin.GetAddress());
        LOG_INFO(util::LogCategory::FEED) << "Oracle " << i << ": "
            << feed::OracleAddress(oracleKeys.back());
    }
    std::vector<PrivateKey> signerKeys(oracleKeys.begin(), oracleKeys.begin() + sim.signers);

    feed::InMemoryToken token;
    if (!token.Mint(sponsor.GetAddress(), sim.funding)) {
        LOG_ERROR(util::LogCategory::FUNDS) << "Cannot mint " << sim.funding;
        return 1;
    }

    feed::PriceFeedAggregator aggregator(feedConfig, roster, token);
    SimListener listener;
    aggregator.AddListener(&listener);
    aggregator.AddFunds(feed::CallContext::Direct(sponsor.GetAddress()), sim.funding);

    const Address reader = submitter.GetAddress();
    const auto ctx = feed::CallContext::Direct(submitter.GetAddress());

    for (int64_t r = 1; r <= sim.rounds; ++r) {
        util::AdvanceMockTime(util::Seconds(util::SECONDS_PER_HOUR));

        std::vector<Price> prices;
        for (int64_t i = 0; i < sim.signers; ++i) {
            prices.push_back(ObservedPrice(r, i));
        }

        RoundId roundId = aggregator.LatestRound(reader) + 1;
        feed::SubmissionBatch batch = feed::BuildSignedBatch(
            roundId, aggregator.ContractAddress(), prices,
            util::GetTime() + REPORT_WINDOW, aggregator.Description(), signerKeys);

        try {
            aggregator.Submit(ctx, batch);
        } catch (const feed::FeedError& e) {
            LOG_ERROR(util::LogCategory::FEED) << "Round " << roundId << " failed: " << e.what();
            break;
        }

        LOG_INFO(util::LogCategory::FUNDS) << "After round " << roundId
            << ": available " << aggregator.AvailableFunds()
            << ", allocated " << aggregator.AllocatedFunds()
            << ", accumulator " << aggregator.RewardAccumulator();
    }

    util::AdvanceMockTime(util::Seconds(util::SECONDS_PER_DAY));
    Amount unlocked = aggregator.UnlockSubmitterRewards(submitter.GetAddress());

    auto vesting = aggregator.GetSubmitterVesting(submitter.GetAddress());
    if (vesting) {
        LOG_INFO(util::LogCategory::VESTING) << "Submitter " << submitter.GetAddress().ToString()
            << ": unlocked " << unlocked << ", still vesting " << vesting->remainVesting
            << " (" << util::FormatDuration(util::Seconds(feed::VESTING_PERIOD)) << " period)";
    }

    for (const auto& key : oracleKeys) {
        LOG_INFO(util::LogCategory::FUNDS) << "Oracle " << key.GetAddress().ToString()
            << " earned " << aggregator.WithdrawablePayment(key.GetAddress());
    }

    if (!sim.snapshotPath.empty()) {
        feed::SaveSnapshot(aggregator.Snapshot(), sim.snapshotPath);
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "Simulation finished: " << listener.Answers()
        << " answers, latest " << aggregator.LatestAnswer(reader)
        << " (" << timer.ElapsedMillis() << " ms)";

    aggregator.RemoveListener(&listener);
    util::Logger::Instance().Shutdown();
    return 0;
}

} // namespace quorumfeed

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return quorumfeed::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
