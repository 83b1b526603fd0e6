// QUORUMFEED - Read Access Control
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#ifndef QUORUMFEED_FEED_ACCESS_H
#define QUORUMFEED_FEED_ACCESS_H

#include "quorumfeed/core/types.h"

#include <atomic>
#include <mutex>
#include <set>

namespace quorumfeed {
namespace feed {

/**
 * Capability check for gated read endpoints.
 */
class ReadAccessController {
public:
    virtual ~ReadAccessController() = default;

    /// Whether caller may read round data
    virtual bool HasAccess(const Address& caller) const = 0;
};

/// Grants everyone access
class AllowAllAccess : public ReadAccessController {
public:
    bool HasAccess(const Address&) const override { return true; }
};

/**
 * Allow-list based controller. While checking is enabled only listed
 * addresses have access; with checking disabled everyone does.
 */
class AllowListAccessController : public ReadAccessController {
public:
    AllowListAccessController() = default;

    bool HasAccess(const Address& caller) const override;

    /// @return false if already listed
    bool AddAccess(const Address& account);

    /// @return false if not listed
    bool RemoveAccess(const Address& account);

    void EnableAccessCheck() { checkEnabled_ = true; }
    void DisableAccessCheck() { checkEnabled_ = false; }
    bool IsCheckEnabled() const { return checkEnabled_; }

private:
    mutable std::mutex mutex_;
    std::set<Address> allowed_;
    std::atomic<bool> checkEnabled_{true};
};

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_ACCESS_H
