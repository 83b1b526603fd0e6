// QUORUMFEED - Oracle Roster
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Read-only view of the oracle set consumed by the aggregator. Roster
// administration lives outside the engine; InMemoryOracleRoster offers just
// enough of it for tests and the simulator.

#ifndef QUORUMFEED_FEED_ROSTER_H
#define QUORUMFEED_FEED_ROSTER_H

#include "quorumfeed/core/types.h"

#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace quorumfeed {
namespace feed {

// ============================================================================
// Roster Interface
// ============================================================================

class OracleRoster {
public:
    virtual ~OracleRoster() = default;

    /// Whether oracle is currently enabled
    virtual bool IsOracleEnabled(const Address& oracle) const = 0;

    /// Number of currently enabled oracles
    virtual uint64_t OracleCount() const = 0;

    /// Last round the oracle may report in (0 if unknown)
    virtual RoundId EndingRound(const Address& oracle) const = 0;

    /// Admin allowed to withdraw the oracle's payments
    virtual std::optional<Address> GetAdmin(const Address& oracle) const = 0;

    /// Every oracle ever added, enabled or not
    virtual std::vector<Address> GetOracles() const = 0;

    /// Enabled and still inside its reporting window for roundId
    bool IsEligible(const Address& oracle, RoundId roundId) const {
        return IsOracleEnabled(oracle) && EndingRound(oracle) >= roundId;
    }
};

// ============================================================================
// In-Memory Roster
// ============================================================================

class InMemoryOracleRoster : public OracleRoster {
public:
    struct OracleStatus {
        Address admin;
        RoundId startingRound{0};
        RoundId endingRound{0};
        bool enabled{false};
    };

    InMemoryOracleRoster() = default;

    bool IsOracleEnabled(const Address& oracle) const override;
    uint64_t OracleCount() const override;
    RoundId EndingRound(const Address& oracle) const override;
    std::optional<Address> GetAdmin(const Address& oracle) const override;
    std::vector<Address> GetOracles() const override;

    /**
     * Enable oracle with the given admin, eligible from startingRound on
     * with no end. Re-adding a disabled oracle re-enables it and keeps its
     * original admin.
     * @return false if the oracle is already enabled
     */
    bool AddOracle(const Address& oracle, const Address& admin, RoundId startingRound = 1);

    /**
     * Disable oracle; it stays eligible through endingRound.
     * @return false if the oracle is unknown or already disabled
     */
    bool DisableOracle(const Address& oracle, RoundId endingRound);

    std::optional<OracleStatus> GetStatus(const Address& oracle) const;

private:
    mutable std::mutex mutex_;
    std::map<Address, OracleStatus> oracles_;
};

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_ROSTER_H
