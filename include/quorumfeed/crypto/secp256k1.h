// QUORUMFEED - secp256k1 Elliptic Curve Operations
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Recoverable ECDSA over secp256k1, backed by OpenSSL's EC and BN
// primitives. Signatures are always produced in low-S form.

#ifndef QUORUMFEED_CRYPTO_SECP256K1_H
#define QUORUMFEED_CRYPTO_SECP256K1_H

#include <array>
#include <cstddef>
#include <cstdint>

namespace quorumfeed {
namespace secp256k1 {

// ============================================================================
// Curve Parameters
// ============================================================================

/// Private key size
constexpr size_t PRIVATE_KEY_SIZE = 32;

/// Uncompressed public key size (0x04 || X || Y)
constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;

/// Size of one signature scalar (r or s)
constexpr size_t SCALAR_SIZE = 32;

/// Field prime p
extern const std::array<uint8_t, 32> FIELD_PRIME;

/// Group order n
extern const std::array<uint8_t, 32> CURVE_ORDER;

/// n / 2, the largest s accepted in a low-S signature
extern const std::array<uint8_t, 32> HALF_CURVE_ORDER;

// ============================================================================
// Scalar Checks
// ============================================================================

/// Compare two big-endian 32-byte integers (-1, 0, 1)
int Compare32(const uint8_t* a, const uint8_t* b);

/// Check 0 < key < n
bool IsValidPrivateKey(const uint8_t* key);

/// Check 0 < value < n (valid r or s)
bool IsValidSignatureScalar(const uint8_t* value);

/// Check s <= n/2
bool IsLowS(const uint8_t* s);

// ============================================================================
// Key and Signature Operations
// ============================================================================

/**
 * Derive the uncompressed public key for a private key.
 * @param privateKey 32-byte private key
 * @param publicKey Output 65-byte uncompressed key
 * @return false if the private key is out of range
 */
bool ComputePublicKey(const uint8_t* privateKey, uint8_t publicKey[UNCOMPRESSED_PUBKEY_SIZE]);

/**
 * Sign a 32-byte digest, producing (r, s, recid).
 *
 * The nonce is derived deterministically from the key and digest. The
 * output s is normalised to the lower half of the order and recid is
 * adjusted to match.
 *
 * @param hash 32-byte digest
 * @param privateKey 32-byte private key
 * @param r Output r scalar
 * @param s Output s scalar
 * @param recid Output recovery id (0 or 1)
 */
bool ECDSASignRecoverable(const uint8_t* hash, const uint8_t* privateKey,
                          uint8_t r[SCALAR_SIZE], uint8_t s[SCALAR_SIZE],
                          int* recid);

/**
 * Recover the uncompressed public key that produced (r, s) over hash.
 * @param recid Recovery id in [0, 3]
 * @return false if the signature does not describe a valid point
 */
bool ECDSARecover(const uint8_t* hash,
                  const uint8_t r[SCALAR_SIZE], const uint8_t s[SCALAR_SIZE],
                  int recid, uint8_t publicKey[UNCOMPRESSED_PUBKEY_SIZE]);

} // namespace secp256k1
} // namespace quorumfeed

#endif // QUORUMFEED_CRYPTO_SECP256K1_H
