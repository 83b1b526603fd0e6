// QUORUMFEED - Settlement Token
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// The asset the pool is funded with and oracles are paid in. The engine only
// needs balance lookups and two transfer primitives.

#ifndef QUORUMFEED_FEED_TOKEN_H
#define QUORUMFEED_FEED_TOKEN_H

#include "quorumfeed/core/types.h"

#include <map>
#include <mutex>

namespace quorumfeed {
namespace feed {

// ============================================================================
// Token Interface
// ============================================================================

class SettlementToken {
public:
    virtual ~SettlementToken() = default;

    /// Balance held by account
    virtual Amount BalanceOf(const Address& account) const = 0;

    /// Move amount from `from` to `to`. Returns false if refused.
    virtual bool Transfer(const Address& from, const Address& to, Amount amount) = 0;

    /// Pull amount from owner into `to`. Returns false if refused.
    virtual bool TransferFrom(const Address& owner, const Address& to, Amount amount) = 0;
};

// ============================================================================
// In-Memory Token
// ============================================================================

/**
 * Token ledger kept in a map. Transfers are refused for non-positive
 * amounts, insufficient balance, or a receiving balance that would overflow.
 */
class InMemoryToken : public SettlementToken {
public:
    InMemoryToken() = default;

    Amount BalanceOf(const Address& account) const override;
    bool Transfer(const Address& from, const Address& to, Amount amount) override;
    bool TransferFrom(const Address& owner, const Address& to, Amount amount) override;

    /// Create amount out of thin air for account
    bool Mint(const Address& account, Amount amount);

    /// Sum of all balances
    Amount TotalSupply() const;

private:
    bool MoveLocked(const Address& from, const Address& to, Amount amount);

    mutable std::mutex mutex_;
    std::map<Address, Amount> balances_;
};

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_TOKEN_H
