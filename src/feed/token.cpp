// QUORUMFEED - In-Memory Settlement Token
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/token.h"

namespace quorumfeed {
namespace feed {

Amount InMemoryToken::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

bool InMemoryToken::Transfer(const Address& from, const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    return MoveLocked(from, to, amount);
}

bool InMemoryToken::TransferFrom(const Address& owner, const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    return MoveLocked(owner, to, amount);
}

bool InMemoryToken::Mint(const Address& account, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount <= 0) {
        return false;
    }
    Amount& balance = balances_[account];
    if (balance > MAX_AMOUNT - amount) {
        return false;
    }
    balance += amount;
    return true;
}

Amount InMemoryToken::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0;
    for (const auto& [account, balance] : balances_) {
        total += balance;
    }
    return total;
}

bool InMemoryToken::MoveLocked(const Address& from, const Address& to, Amount amount) {
    if (amount <= 0) {
        return false;
    }
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    if (from == to) {
        return true;
    }
    Amount toBalance = 0;
    auto dest = balances_.find(to);
    if (dest != balances_.end()) {
        toBalance = dest->second;
    }
    if (toBalance > MAX_AMOUNT - amount) {
        return false;
    }
    it->second -= amount;
    balances_[to] = toBalance + amount;
    return true;
}

} // namespace feed
} // namespace quorumfeed
