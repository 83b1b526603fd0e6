// QUORUMFEED - Core Types Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/core/types.h"
#include "quorumfeed/core/hex.h"

namespace quorumfeed {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

namespace {

template<typename HashT>
HashT ParseFixedHex(const std::string& hex) {
    std::vector<Byte> bytes = HexToBytes(StripHexPrefix(hex));
    if (bytes.size() != HashT::SIZE) {
        throw std::invalid_argument("Invalid hex string length: expected " +
                                    std::to_string(HashT::SIZE * 2) + " digits");
    }
    return HashT(bytes.data(), bytes.size());
}

} // anonymous namespace

Hash256 Hash256::FromHex(const std::string& hex) {
    return ParseFixedHex<Hash256>(hex);
}

Address Address::FromHex(const std::string& hex) {
    return ParseFixedHex<Address>(hex);
}

} // namespace quorumfeed
