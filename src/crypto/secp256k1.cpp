// QUORUMFEED - secp256k1 Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/crypto/secp256k1.h"
#include "quorumfeed/crypto/keccak256.h"
#include <cstring>
#include <memory>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

namespace quorumfeed {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

const std::array<uint8_t, 32> FIELD_PRIME = {{
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFE, 0xFF, 0xFF, 0xFC, 0x2F
}};

const std::array<uint8_t, 32> CURVE_ORDER = {{
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
}};

const std::array<uint8_t, 32> HALF_CURVE_ORDER = {{
    0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0x5D, 0x57, 0x6E, 0x73, 0x57, 0xA4, 0x50, 0x1D,
    0xDF, 0xE9, 0x2F, 0x46, 0x68, 0x1B, 0x20, 0xA0
}};

namespace {

inline void SecureClear(void* ptr, size_t len) {
    volatile uint8_t* p = static_cast<volatile uint8_t*>(ptr);
    while (len--) *p++ = 0;
}

bool IsZero32(const uint8_t* a) {
    for (int i = 0; i < 32; ++i) {
        if (a[i] != 0) return false;
    }
    return true;
}

// ----------------------------------------------------------------------------
// OpenSSL handle ownership
// ----------------------------------------------------------------------------

struct BNDeleter { void operator()(BIGNUM* p) const { BN_clear_free(p); } };
struct BNCtxDeleter { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
struct GroupDeleter { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
struct PointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };

using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;
using BNCtxPtr = std::unique_ptr<BN_CTX, BNCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

BNPtr BNFromBytes(const uint8_t* data, size_t len) {
    return BNPtr(BN_bin2bn(data, static_cast<int>(len), nullptr));
}

BNPtr NewBN() {
    return BNPtr(BN_new());
}

/// Group, context and order bundled for one operation
struct Curve {
    GroupPtr group{EC_GROUP_new_by_curve_name(NID_secp256k1)};
    BNCtxPtr ctx{BN_CTX_new()};
    BNPtr order{BNFromBytes(CURVE_ORDER.data(), 32)};

    bool IsReady() const { return group && ctx && order; }
};

bool PointToUncompressed(const Curve& curve, const EC_POINT* point,
                         uint8_t out[UNCOMPRESSED_PUBKEY_SIZE]) {
    if (EC_POINT_is_at_infinity(curve.group.get(), point)) {
        return false;
    }
    size_t written = EC_POINT_point2oct(curve.group.get(), point,
                                        POINT_CONVERSION_UNCOMPRESSED,
                                        out, UNCOMPRESSED_PUBKEY_SIZE,
                                        curve.ctx.get());
    return written == UNCOMPRESSED_PUBKEY_SIZE;
}

} // anonymous namespace

// ============================================================================
// Scalar Checks
// ============================================================================

int Compare32(const uint8_t* a, const uint8_t* b) {
    for (int i = 0; i < 32; ++i) {
        if (a[i] < b[i]) return -1;
        if (a[i] > b[i]) return 1;
    }
    return 0;
}

bool IsValidPrivateKey(const uint8_t* key) {
    return IsValidSignatureScalar(key);
}

bool IsValidSignatureScalar(const uint8_t* value) {
    if (IsZero32(value)) return false;
    return Compare32(value, CURVE_ORDER.data()) < 0;
}

bool IsLowS(const uint8_t* s) {
    return Compare32(s, HALF_CURVE_ORDER.data()) <= 0;
}

// ============================================================================
// Key and Signature Operations
// ============================================================================

bool ComputePublicKey(const uint8_t* privateKey, uint8_t publicKey[UNCOMPRESSED_PUBKEY_SIZE]) {
    if (!IsValidPrivateKey(privateKey)) return false;

    Curve curve;
    if (!curve.IsReady()) return false;

    BNPtr d = BNFromBytes(privateKey, 32);
    PointPtr pub(EC_POINT_new(curve.group.get()));
    if (!d || !pub) return false;

    if (EC_POINT_mul(curve.group.get(), pub.get(), d.get(), nullptr, nullptr,
                     curve.ctx.get()) != 1) {
        return false;
    }
    return PointToUncompressed(curve, pub.get(), publicKey);
}

bool ECDSASignRecoverable(const uint8_t* hash, const uint8_t* privateKey,
                          uint8_t r[SCALAR_SIZE], uint8_t s[SCALAR_SIZE],
                          int* recid) {
    if (!hash || !privateKey || !recid) return false;
    if (!IsValidPrivateKey(privateKey)) return false;

    Curve curve;
    if (!curve.IsReady()) return false;

    BNPtr d = BNFromBytes(privateKey, 32);
    BNPtr e = BNFromBytes(hash, 32);
    BNPtr k = NewBN();
    BNPtr kInv = NewBN();
    BNPtr x = NewBN();
    BNPtr y = NewBN();
    BNPtr rBN = NewBN();
    BNPtr sBN = NewBN();
    BNPtr tmp = NewBN();
    PointPtr R(EC_POINT_new(curve.group.get()));
    if (!d || !e || !k || !kInv || !x || !y || !rBN || !sBN || !tmp || !R) {
        return false;
    }

    // Deterministic nonce: k = H(privkey || hash), rehashed until usable
    uint8_t seed[64];
    std::memcpy(seed, privateKey, 32);
    std::memcpy(seed + 32, hash, 32);
    Hash256 kHash = Keccak256Hash(seed, sizeof(seed));
    SecureClear(seed, sizeof(seed));

    for (int attempt = 0; attempt < 64; ++attempt) {
        if (attempt > 0) {
            kHash = Keccak256Hash(kHash.data(), kHash.size());
        }
        if (!IsValidSignatureScalar(kHash.data())) continue;
        if (!BN_bin2bn(kHash.data(), 32, k.get())) return false;

        // R = k * G
        if (EC_POINT_mul(curve.group.get(), R.get(), k.get(), nullptr, nullptr,
                         curve.ctx.get()) != 1) {
            return false;
        }
        if (EC_POINT_get_affine_coordinates(curve.group.get(), R.get(), x.get(),
                                            y.get(), curve.ctx.get()) != 1) {
            return false;
        }

        // r = R.x mod n
        if (BN_nnmod(rBN.get(), x.get(), curve.order.get(), curve.ctx.get()) != 1) {
            return false;
        }
        if (BN_is_zero(rBN.get())) continue;

        int id = BN_is_odd(y.get()) ? 1 : 0;
        if (BN_cmp(x.get(), curve.order.get()) >= 0) {
            id |= 2;
        }

        // s = k^-1 * (e + r * d) mod n
        if (!BN_mod_inverse(kInv.get(), k.get(), curve.order.get(), curve.ctx.get())) {
            return false;
        }
        if (BN_mod_mul(tmp.get(), rBN.get(), d.get(), curve.order.get(), curve.ctx.get()) != 1 ||
            BN_mod_add(tmp.get(), tmp.get(), e.get(), curve.order.get(), curve.ctx.get()) != 1 ||
            BN_mod_mul(sBN.get(), kInv.get(), tmp.get(), curve.order.get(), curve.ctx.get()) != 1) {
            return false;
        }
        if (BN_is_zero(sBN.get())) continue;

        if (BN_bn2binpad(rBN.get(), r, SCALAR_SIZE) != static_cast<int>(SCALAR_SIZE) ||
            BN_bn2binpad(sBN.get(), s, SCALAR_SIZE) != static_cast<int>(SCALAR_SIZE)) {
            return false;
        }

        // Low-S normalisation flips the parity of R
        if (!IsLowS(s)) {
            if (BN_sub(sBN.get(), curve.order.get(), sBN.get()) != 1 ||
                BN_bn2binpad(sBN.get(), s, SCALAR_SIZE) != static_cast<int>(SCALAR_SIZE)) {
                return false;
            }
            id ^= 1;
        }

        *recid = id;
        return true;
    }

    return false;
}

bool ECDSARecover(const uint8_t* hash,
                  const uint8_t r[SCALAR_SIZE], const uint8_t s[SCALAR_SIZE],
                  int recid, uint8_t publicKey[UNCOMPRESSED_PUBKEY_SIZE]) {
    if (!hash || !r || !s) return false;
    if (recid < 0 || recid > 3) return false;
    if (!IsValidSignatureScalar(r) || !IsValidSignatureScalar(s)) return false;

    Curve curve;
    if (!curve.IsReady()) return false;

    BNPtr rBN = BNFromBytes(r, 32);
    BNPtr sBN = BNFromBytes(s, 32);
    BNPtr e = BNFromBytes(hash, 32);
    BNPtr p = BNFromBytes(FIELD_PRIME.data(), 32);
    BNPtr x = NewBN();
    BNPtr rInv = NewBN();
    BNPtr u1 = NewBN();
    BNPtr u2 = NewBN();
    PointPtr R(EC_POINT_new(curve.group.get()));
    PointPtr Q(EC_POINT_new(curve.group.get()));
    if (!rBN || !sBN || !e || !p || !x || !rInv || !u1 || !u2 || !R || !Q) {
        return false;
    }

    // x = r + (recid / 2) * n
    if (!BN_copy(x.get(), rBN.get())) return false;
    if (recid & 2) {
        if (BN_add(x.get(), x.get(), curve.order.get()) != 1) return false;
    }
    if (BN_cmp(x.get(), p.get()) >= 0) return false;

    if (EC_POINT_set_compressed_coordinates(curve.group.get(), R.get(), x.get(),
                                            recid & 1, curve.ctx.get()) != 1) {
        return false;
    }

    // Q = r^-1 * (s*R - e*G) = (-e * r^-1) * G + (s * r^-1) * R
    if (!BN_mod_inverse(rInv.get(), rBN.get(), curve.order.get(), curve.ctx.get())) {
        return false;
    }
    if (BN_mod_mul(u2.get(), sBN.get(), rInv.get(), curve.order.get(), curve.ctx.get()) != 1 ||
        BN_mod_mul(u1.get(), e.get(), rInv.get(), curve.order.get(), curve.ctx.get()) != 1 ||
        BN_mod_sub(u1.get(), curve.order.get(), u1.get(), curve.order.get(), curve.ctx.get()) != 1) {
        return false;
    }

    if (EC_POINT_mul(curve.group.get(), Q.get(), u1.get(), R.get(), u2.get(),
                     curve.ctx.get()) != 1) {
        return false;
    }

    return PointToUncompressed(curve, Q.get(), publicKey);
}

} // namespace secp256k1
} // namespace quorumfeed
