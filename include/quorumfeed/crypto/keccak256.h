// QUORUMFEED - Keccak-256 Hash Function
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Keccak-256 as used by Ethereum (original Keccak padding 0x01, not the
// FIPS 202 SHA3 padding 0x06).

#ifndef QUORUMFEED_CRYPTO_KECCAK256_H
#define QUORUMFEED_CRYPTO_KECCAK256_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "quorumfeed/core/types.h"

namespace quorumfeed {

/// Incremental Keccak-256 hasher
class Keccak256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Sponge rate in bytes (1600 - 2*256 bits)
    static constexpr size_t RATE = 136;

    Keccak256();

    /// Absorb data
    Keccak256& Write(const Byte* data, size_t len);

    /// Pad, permute and squeeze 32 bytes of output
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    Keccak256& Reset();

private:
    uint64_t state_[25];
    Byte buffer_[RATE];
    size_t bufferLen_;

    void AbsorbBlock(const Byte block[RATE]);
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute Keccak-256 of data in a single call
Hash256 Keccak256Hash(const Byte* data, size_t len);

inline Hash256 Keccak256Hash(const std::vector<Byte>& data) {
    return Keccak256Hash(data.data(), data.size());
}

inline Hash256 Keccak256Hash(const std::string& str) {
    return Keccak256Hash(reinterpret_cast<const Byte*>(str.data()), str.size());
}

} // namespace quorumfeed

#endif // QUORUMFEED_CRYPTO_KECCAK256_H
