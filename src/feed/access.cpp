// QUORUMFEED - Read Access Control Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/access.h"

namespace quorumfeed {
namespace feed {

bool AllowListAccessController::HasAccess(const Address& caller) const {
    if (!checkEnabled_) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return allowed_.count(caller) > 0;
}

bool AllowListAccessController::AddAccess(const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    return allowed_.insert(account).second;
}

bool AllowListAccessController::RemoveAccess(const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    return allowed_.erase(account) > 0;
}

} // namespace feed
} // namespace quorumfeed
