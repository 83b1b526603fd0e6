// QUORUMFEED - Packed ABI Encoding
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Tightly packed big-endian encoding, byte-compatible with Solidity's
// abi.encodePacked for the value types used in report messages:
// - uintN is written in N/8 bytes
// - int256/uint256 are written in 32 bytes (two's complement for signed)
// - elements of a dynamic array are padded to 32 bytes, no length prefix
// - strings and bytes are written raw, no length prefix

#ifndef QUORUMFEED_CORE_ABI_H
#define QUORUMFEED_CORE_ABI_H

#include "quorumfeed/core/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace quorumfeed {

class PackedEncoder {
public:
    PackedEncoder() = default;

    /// uint32 (4 bytes)
    PackedEncoder& WriteUint32(uint32_t value);

    /// uint256 from a 64-bit value (32 bytes, zero-extended)
    PackedEncoder& WriteUint256(uint64_t value);

    /// int256 from a 64-bit value (32 bytes, sign-extended)
    PackedEncoder& WriteInt256(int64_t value);

    /// address (20 bytes)
    PackedEncoder& WriteAddress(const Address& addr);

    /// bytes32 (32 bytes)
    PackedEncoder& WriteBytes32(const Hash256& value);

    /// int256[] (each element 32 bytes, no length prefix)
    PackedEncoder& WriteInt256Array(const std::vector<int64_t>& values);

    /// string (raw bytes, no length prefix)
    PackedEncoder& WriteString(const std::string& str);

    /// Raw bytes
    PackedEncoder& WriteBytes(const Byte* data, size_t len);

    const std::vector<Byte>& Data() const { return data_; }
    size_t size() const { return data_.size(); }

private:
    std::vector<Byte> data_;
};

} // namespace quorumfeed

#endif // QUORUMFEED_CORE_ABI_H
