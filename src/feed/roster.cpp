// QUORUMFEED - In-Memory Oracle Roster
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/roster.h"
#include "quorumfeed/util/logging.h"

namespace quorumfeed {
namespace feed {

bool InMemoryOracleRoster::IsOracleEnabled(const Address& oracle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = oracles_.find(oracle);
    return it != oracles_.end() && it->second.enabled;
}

uint64_t InMemoryOracleRoster::OracleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t count = 0;
    for (const auto& [addr, status] : oracles_) {
        if (status.enabled) {
            ++count;
        }
    }
    return count;
}

RoundId InMemoryOracleRoster::EndingRound(const Address& oracle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = oracles_.find(oracle);
    return it == oracles_.end() ? 0 : it->second.endingRound;
}

std::optional<Address> InMemoryOracleRoster::GetAdmin(const Address& oracle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = oracles_.find(oracle);
    if (it == oracles_.end()) {
        return std::nullopt;
    }
    return it->second.admin;
}

std::vector<Address> InMemoryOracleRoster::GetOracles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Address> result;
    result.reserve(oracles_.size());
    for (const auto& [addr, status] : oracles_) {
        result.push_back(addr);
    }
    return result;
}

bool InMemoryOracleRoster::AddOracle(const Address& oracle, const Address& admin,
                                     RoundId startingRound) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = oracles_.find(oracle);
    if (it != oracles_.end()) {
        if (it->second.enabled) {
            return false;
        }
        it->second.enabled = true;
        it->second.startingRound = startingRound;
        it->second.endingRound = static_cast<RoundId>(ROUND_MAX);
        return true;
    }

    OracleStatus status;
    status.admin = admin;
    status.startingRound = startingRound;
    status.endingRound = static_cast<RoundId>(ROUND_MAX);
    status.enabled = true;
    oracles_[oracle] = status;

    LOG_DEBUG(util::LogCategory::FEED) << "Oracle " << oracle.ToString()
        << " added (admin " << admin.ToString() << ", from round " << startingRound << ")";
    return true;
}

bool InMemoryOracleRoster::DisableOracle(const Address& oracle, RoundId endingRound) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = oracles_.find(oracle);
    if (it == oracles_.end() || !it->second.enabled) {
        return false;
    }
    it->second.enabled = false;
    it->second.endingRound = endingRound;
    return true;
}

std::optional<InMemoryOracleRoster::OracleStatus>
InMemoryOracleRoster::GetStatus(const Address& oracle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = oracles_.find(oracle);
    if (it == oracles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace feed
} // namespace quorumfeed
