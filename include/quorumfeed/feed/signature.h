// QUORUMFEED - Report Message and Signature Verification
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Canonical report message layout (tightly packed, big-endian):
//   uint32 roundId | address contract | int256[] prices | uint256 deadline | description
// The report hash is Keccak-256 of that message. Oracles sign the personal
// message digest keccak256("\x19Ethereum Signed Message:\n32" || reportHash).

#ifndef QUORUMFEED_FEED_SIGNATURE_H
#define QUORUMFEED_FEED_SIGNATURE_H

#include "quorumfeed/core/types.h"
#include "quorumfeed/feed/submission.h"

#include <optional>
#include <string>
#include <vector>

namespace quorumfeed {
namespace feed {

/// Prefix of a 32-byte personal message
constexpr const char* PERSONAL_MESSAGE_PREFIX = "\x19" "Ethereum Signed Message:\n32";

/// Packed report message for a round
std::vector<Byte> BuildReportMessage(RoundId roundId,
                                     const Address& contract,
                                     const std::vector<Price>& prices,
                                     Timestamp deadline,
                                     const std::string& description);

/// Keccak-256 of the packed report message
Hash256 HashReport(RoundId roundId,
                   const Address& contract,
                   const std::vector<Price>& prices,
                   Timestamp deadline,
                   const std::string& description);

/// keccak256(PERSONAL_MESSAGE_PREFIX || hash)
Hash256 ToEthSignedMessageHash(const Hash256& hash);

/**
 * Recover the account that signed reportHash as a personal message.
 * Returns nullopt for out-of-range, high-S or otherwise unrecoverable
 * signatures. Pure; no state.
 */
std::optional<Address> RecoverSigner(const Hash256& reportHash, const Signature& sig);

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_SIGNATURE_H
