// QUORUMFEED - Reporter Helpers
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Off-chain side of a report: how an oracle signs a round's report, and the
// self-describing signed payload (rawData || r || s || v) reporters exchange
// with the coordinator before a batch is submitted.

#ifndef QUORUMFEED_FEED_REPORTER_H
#define QUORUMFEED_FEED_REPORTER_H

#include "quorumfeed/core/types.h"
#include "quorumfeed/crypto/keys.h"
#include "quorumfeed/feed/submission.h"

#include <optional>
#include <string>
#include <vector>

namespace quorumfeed {
namespace feed {

/// Trailing signature length of a signed payload
constexpr size_t SIGNED_PAYLOAD_SIGNATURE_SIZE = 65;

/**
 * Sign a packed report message the way the aggregator verifies it:
 * over the personal message digest of keccak256(reportMessage).
 * @return nullopt if the key is invalid
 */
std::optional<Signature> SignReport(const PrivateKey& key, const std::vector<Byte>& reportMessage);

/// Sign keccak256(rawData) directly, without the personal message prefix
std::optional<Signature> SignPayload(const PrivateKey& key, const std::vector<Byte>& rawData);

/// rawData || r || s || v
std::vector<Byte> EncodeSignedPayload(const std::vector<Byte>& rawData, const Signature& sig);

/// Everything before the trailing 65-byte signature; nullopt if too short
std::optional<std::vector<Byte>> ExtractRawData(const std::vector<Byte>& payload);

/// Result of recovering a signed payload
struct RecoveredPayload {
    Address signer;
    Hash256 messageHash;
    std::vector<Byte> rawData;
};

/**
 * Split a signed payload and recover who signed keccak256(rawData).
 * @return nullopt if shorter than 65 bytes or the signature is unrecoverable
 */
std::optional<RecoveredPayload> RecoverPayloadSigner(const std::vector<Byte>& payload);

/// Lowercase 0x-prefixed address of the reporter's key
std::string OracleAddress(const PrivateKey& key);

/**
 * Build a complete submission: every signer signs the same report for
 * (roundId, contract, prices, deadline, description).
 * @throws std::invalid_argument if a key is invalid
 */
SubmissionBatch BuildSignedBatch(RoundId roundId,
                                 const Address& contract,
                                 const std::vector<Price>& prices,
                                 Timestamp deadline,
                                 const std::string& description,
                                 const std::vector<PrivateKey>& signers);

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_REPORTER_H
