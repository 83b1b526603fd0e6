// QUORUMFEED - Report Message and Signature Verification Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/feed/signature.h"
#include "quorumfeed/core/abi.h"
#include "quorumfeed/crypto/keccak256.h"
#include "quorumfeed/util/logging.h"

#include <cstring>

namespace quorumfeed {
namespace feed {

std::vector<Byte> BuildReportMessage(RoundId roundId,
                                     const Address& contract,
                                     const std::vector<Price>& prices,
                                     Timestamp deadline,
                                     const std::string& description) {
    PackedEncoder enc;
    enc.WriteUint32(roundId)
       .WriteAddress(contract)
       .WriteInt256Array(prices)
       .WriteUint256(static_cast<uint64_t>(deadline))
       .WriteString(description);
    return enc.Data();
}

Hash256 HashReport(RoundId roundId,
                   const Address& contract,
                   const std::vector<Price>& prices,
                   Timestamp deadline,
                   const std::string& description) {
    return Keccak256Hash(BuildReportMessage(roundId, contract, prices, deadline, description));
}

Hash256 ToEthSignedMessageHash(const Hash256& hash) {
    Keccak256 hasher;
    hasher.Write(reinterpret_cast<const Byte*>(PERSONAL_MESSAGE_PREFIX),
                 std::strlen(PERSONAL_MESSAGE_PREFIX));
    hasher.Write(hash.data(), hash.size());

    Hash256 result;
    hasher.Finalize(result.data());
    return result;
}

std::optional<Address> RecoverSigner(const Hash256& reportHash, const Signature& sig) {
    auto signer = RecoverAddress(ToEthSignedMessageHash(reportHash), sig);
    if (!signer) {
        LOG_DEBUG(util::LogCategory::CRYPTO)
            << "Unrecoverable signature (v=" << static_cast<int>(sig.v) << ")";
    }
    return signer;
}

} // namespace feed
} // namespace quorumfeed
