// QUORUMFEED - Key Management
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// secp256k1 key pairs with Ethereum-style account addresses.

#ifndef QUORUMFEED_CRYPTO_KEYS_H
#define QUORUMFEED_CRYPTO_KEYS_H

#include "quorumfeed/core/types.h"
#include "quorumfeed/crypto/secp256k1.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace quorumfeed {

// ============================================================================
// RecoverableSignature
// ============================================================================

/// ECDSA signature with Ethereum recovery byte (v = 27 + recid)
struct RecoverableSignature {
    std::array<Byte, 32> r{};
    std::array<Byte, 32> s{};
    uint8_t v{0};

    /// 65-byte r || s || v form
    std::vector<Byte> ToBytes() const;

    /// Parse r || s || v; nullopt if the length is not 65
    static std::optional<RecoverableSignature> FromBytes(const Byte* data, size_t len);

    bool operator==(const RecoverableSignature& other) const {
        return r == other.r && s == other.s && v == other.v;
    }
};

// ============================================================================
// PublicKey
// ============================================================================

/**
 * An uncompressed secp256k1 public key (0x04 || X || Y).
 */
class PublicKey {
public:
    static constexpr size_t SIZE = secp256k1::UNCOMPRESSED_PUBKEY_SIZE;

    /// Default constructor - invalid/empty key
    PublicKey() { data_.fill(0); }

    /// Construct from 65 raw bytes; any other length yields an invalid key
    PublicKey(const uint8_t* data, size_t len);

    /// Check prefix byte and length
    bool IsValid() const { return valid_; }

    const uint8_t* data() const { return data_.data(); }
    size_t size() const { return SIZE; }

    /// Account address: last 20 bytes of Keccak-256(X || Y)
    Address GetAddress() const;

    std::string ToHex() const;

    bool operator==(const PublicKey& other) const {
        return valid_ == other.valid_ && data_ == other.data_;
    }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

private:
    std::array<uint8_t, SIZE> data_;
    bool valid_{false};
};

// ============================================================================
// PrivateKey
// ============================================================================

/**
 * A secp256k1 private key.
 *
 * Always exactly 32 bytes in the range [1, n-1]. The key material is
 * wiped when the object is destroyed.
 */
class PrivateKey {
public:
    static constexpr size_t SIZE = secp256k1::PRIVATE_KEY_SIZE;

    /// Default constructor - invalid key
    PrivateKey() { data_.fill(0); }

    /// Construct from raw 32 bytes
    explicit PrivateKey(const uint8_t* data);

    PrivateKey(const PrivateKey& other) = default;
    PrivateKey& operator=(const PrivateKey& other) = default;

    ~PrivateKey();

    /// Generate a new random key (OpenSSL RAND_bytes)
    static PrivateKey Generate();

    /// Parse 64 hex chars (optional 0x prefix)
    static std::optional<PrivateKey> FromHex(const std::string& hex);

    bool IsValid() const { return valid_; }

    const uint8_t* data() const { return data_.data(); }

    PublicKey GetPublicKey() const;

    Address GetAddress() const { return GetPublicKey().GetAddress(); }

    /**
     * Sign a 32-byte digest.
     * @return nullopt if the key is invalid or signing fails
     */
    std::optional<RecoverableSignature> Sign(const Hash256& hash) const;

    std::string ToHex() const;

private:
    std::array<uint8_t, SIZE> data_;
    bool valid_{false};
};

// ============================================================================
// Recovery
// ============================================================================

/// Recover the public key behind a signature. v may be 0, 1, 27 or 28.
std::optional<PublicKey> RecoverPublicKey(const Hash256& hash,
                                          const RecoverableSignature& sig);

/// Recover the signer's address; nullopt on any malformed or high-S signature
std::optional<Address> RecoverAddress(const Hash256& hash,
                                      const RecoverableSignature& sig);

} // namespace quorumfeed

#endif // QUORUMFEED_CRYPTO_KEYS_H
