// QUORUMFEED - Reporter Helpers Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/reporter.h"
#include "quorumfeed/crypto/keccak256.h"
#include "quorumfeed/feed/signature.h"

#include <stdexcept>

namespace quorumfeed {
namespace feed {

std::optional<Signature> SignReport(const PrivateKey& key, const std::vector<Byte>& reportMessage) {
    return key.Sign(ToEthSignedMessageHash(Keccak256Hash(reportMessage)));
}

std::optional<Signature> SignPayload(const PrivateKey& key, const std::vector<Byte>& rawData) {
    return key.Sign(Keccak256Hash(rawData));
}

std::vector<Byte> EncodeSignedPayload(const std::vector<Byte>& rawData, const Signature& sig) {
    std::vector<Byte> payload;
    payload.reserve(rawData.size() + SIGNED_PAYLOAD_SIGNATURE_SIZE);
    payload.insert(payload.end(), rawData.begin(), rawData.end());
    std::vector<Byte> sigBytes = sig.ToBytes();
    payload.insert(payload.end(), sigBytes.begin(), sigBytes.end());
    return payload;
}

std::optional<std::vector<Byte>> ExtractRawData(const std::vector<Byte>& payload) {
    if (payload.size() < SIGNED_PAYLOAD_SIGNATURE_SIZE) {
        return std::nullopt;
    }
    return std::vector<Byte>(payload.begin(),
                             payload.end() - SIGNED_PAYLOAD_SIGNATURE_SIZE);
}

std::optional<RecoveredPayload> RecoverPayloadSigner(const std::vector<Byte>& payload) {
    auto rawData = ExtractRawData(payload);
    if (!rawData) {
        return std::nullopt;
    }

    auto sig = RecoverableSignature::FromBytes(
        payload.data() + rawData->size(), SIGNED_PAYLOAD_SIGNATURE_SIZE);
    if (!sig) {
        return std::nullopt;
    }

    RecoveredPayload result;
    result.messageHash = Keccak256Hash(*rawData);

    auto signer = RecoverAddress(result.messageHash, *sig);
    if (!signer) {
        return std::nullopt;
    }
    result.signer = *signer;
    result.rawData = std::move(*rawData);
    return result;
}

std::string OracleAddress(const PrivateKey& key) {
    return key.GetAddress().ToString();
}

SubmissionBatch BuildSignedBatch(RoundId roundId,
                                 const Address& contract,
                                 const std::vector<Price>& prices,
                                 Timestamp deadline,
                                 const std::string& description,
                                 const std::vector<PrivateKey>& signers) {
    SubmissionBatch batch;
    batch.roundId = roundId;
    batch.prices = prices;
    batch.deadline = deadline;

    std::vector<Byte> message = BuildReportMessage(roundId, contract, prices, deadline, description);
    for (const auto& key : signers) {
        auto sig = SignReport(key, message);
        if (!sig) {
            throw std::invalid_argument("cannot sign report with an invalid key");
        }
        batch.AddSignature(*sig);
    }
    return batch;
}

} // namespace feed
} // namespace quorumfeed
