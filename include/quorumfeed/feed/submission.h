// QUORUMFEED - Submission Batch and Call Context
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#ifndef QUORUMFEED_FEED_SUBMISSION_H
#define QUORUMFEED_FEED_SUBMISSION_H

#include "quorumfeed/core/types.h"
#include "quorumfeed/crypto/keys.h"

#include <vector>

namespace quorumfeed {
namespace feed {

/// (r, s, v) as produced by a reporter
using Signature = RecoverableSignature;

/**
 * One signed report for a round: the observed prices and one signature per
 * price, all over the same canonical report message.
 *
 * prices, r, s and v are parallel arrays.
 */
struct SubmissionBatch {
    RoundId roundId{0};
    std::vector<Price> prices;
    Timestamp deadline{0};
    std::vector<std::array<Byte, 32>> r;
    std::vector<std::array<Byte, 32>> s;
    std::vector<uint8_t> v;

    /// Signature i assembled from the parallel arrays
    Signature SignatureAt(size_t i) const {
        Signature sig;
        sig.r = r[i];
        sig.s = s[i];
        sig.v = v[i];
        return sig;
    }

    void AddSignature(const Signature& sig) {
        r.push_back(sig.r);
        s.push_back(sig.s);
        v.push_back(sig.v);
    }
};

/**
 * Who is calling an entry point.
 *
 * sender is the immediate caller; origin is the account that started the
 * call chain. A caller is externally owned when the two are equal.
 */
struct CallContext {
    Address sender;
    Address origin;

    static CallContext Direct(const Address& account) {
        return CallContext{account, account};
    }

    bool IsExternallyOwned() const { return sender == origin; }
};

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_SUBMISSION_H
