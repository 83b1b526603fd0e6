// QUORUMFEED - Key Management Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/crypto/keys.h"
#include "quorumfeed/crypto/keccak256.h"
#include "quorumfeed/core/hex.h"

#include <cstring>
#include <stdexcept>

#include <openssl/rand.h>

namespace quorumfeed {

namespace {

inline void SecureClear(void* ptr, size_t len) {
    volatile uint8_t* p = static_cast<volatile uint8_t*>(ptr);
    while (len--) *p++ = 0;
}

void GetRandBytes(uint8_t* buf, size_t len) {
    if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
}

} // anonymous namespace

// ============================================================================
// RecoverableSignature
// ============================================================================

std::vector<Byte> RecoverableSignature::ToBytes() const {
    std::vector<Byte> out;
    out.reserve(65);
    out.insert(out.end(), r.begin(), r.end());
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(v);
    return out;
}

std::optional<RecoverableSignature> RecoverableSignature::FromBytes(const Byte* data, size_t len) {
    if (!data || len != 65) {
        return std::nullopt;
    }
    RecoverableSignature sig;
    std::memcpy(sig.r.data(), data, 32);
    std::memcpy(sig.s.data(), data + 32, 32);
    sig.v = data[64];
    return sig;
}

// ============================================================================
// PublicKey
// ============================================================================

PublicKey::PublicKey(const uint8_t* data, size_t len) {
    data_.fill(0);
    if (data && len == SIZE && data[0] == 0x04) {
        std::memcpy(data_.data(), data, SIZE);
        valid_ = true;
    }
}

Address PublicKey::GetAddress() const {
    if (!valid_) {
        return Address();
    }
    // Skip the 0x04 prefix, keep the low 20 bytes of the digest
    Hash256 digest = Keccak256Hash(data_.data() + 1, SIZE - 1);
    return Address(digest.data() + 12, Address::SIZE);
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

// ============================================================================
// PrivateKey
// ============================================================================

PrivateKey::PrivateKey(const uint8_t* data) {
    data_.fill(0);
    if (data) {
        std::memcpy(data_.data(), data, SIZE);
        valid_ = secp256k1::IsValidPrivateKey(data_.data());
    }
}

PrivateKey::~PrivateKey() {
    SecureClear(data_.data(), SIZE);
    valid_ = false;
}

PrivateKey PrivateKey::Generate() {
    PrivateKey key;

    // Generate random bytes until we get a valid key
    for (int attempts = 0; attempts < 100; ++attempts) {
        GetRandBytes(key.data_.data(), SIZE);
        if (secp256k1::IsValidPrivateKey(key.data_.data())) {
            key.valid_ = true;
            return key;
        }
    }

    throw std::runtime_error("PrivateKey::Generate: no valid key produced");
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    std::vector<uint8_t> bytes;
    try {
        bytes = HexToBytes(hex);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    if (bytes.size() != SIZE) {
        return std::nullopt;
    }
    PrivateKey key(bytes.data());
    SecureClear(bytes.data(), bytes.size());
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

PublicKey PrivateKey::GetPublicKey() const {
    if (!valid_) {
        return PublicKey();
    }
    uint8_t pub[PublicKey::SIZE];
    if (!secp256k1::ComputePublicKey(data_.data(), pub)) {
        return PublicKey();
    }
    return PublicKey(pub, PublicKey::SIZE);
}

std::optional<RecoverableSignature> PrivateKey::Sign(const Hash256& hash) const {
    if (!valid_) {
        return std::nullopt;
    }
    RecoverableSignature sig;
    int recid = 0;
    if (!secp256k1::ECDSASignRecoverable(hash.data(), data_.data(),
                                         sig.r.data(), sig.s.data(), &recid)) {
        return std::nullopt;
    }
    sig.v = static_cast<uint8_t>(27 + recid);
    return sig;
}

std::string PrivateKey::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

// ============================================================================
// Recovery
// ============================================================================

std::optional<PublicKey> RecoverPublicKey(const Hash256& hash,
                                          const RecoverableSignature& sig) {
    int recid;
    if (sig.v == 27 || sig.v == 28) {
        recid = sig.v - 27;
    } else if (sig.v == 0 || sig.v == 1) {
        recid = sig.v;
    } else {
        return std::nullopt;
    }

    // Malleable upper-half s values are rejected outright
    if (!secp256k1::IsLowS(sig.s.data())) {
        return std::nullopt;
    }

    uint8_t pub[PublicKey::SIZE];
    if (!secp256k1::ECDSARecover(hash.data(), sig.r.data(), sig.s.data(), recid, pub)) {
        return std::nullopt;
    }
    return PublicKey(pub, PublicKey::SIZE);
}

std::optional<Address> RecoverAddress(const Hash256& hash,
                                      const RecoverableSignature& sig) {
    auto pub = RecoverPublicKey(hash, sig);
    if (!pub || !pub->IsValid()) {
        return std::nullopt;
    }
    return pub->GetAddress();
}

} // namespace quorumfeed
