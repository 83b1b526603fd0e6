// QUORUMFEED - Core Types Header
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// This file defines fundamental types used throughout QUORUMFEED.

#ifndef QUORUMFEED_CORE_TYPES_H
#define QUORUMFEED_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>
#include <limits>

namespace quorumfeed {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest settlement token units
using Amount = int64_t;

/// Aggregated or observed price (signed, prices may be negative)
using Price = int64_t;

/// Round identifier
using RoundId = uint32_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Largest round id that can ever be stored
constexpr uint64_t ROUND_MAX = std::numeric_limits<RoundId>::max();

/// Largest amount a ledger may hold
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

/// Check if amount is in valid range
inline bool AmountRange(Amount value) {
    return value >= 0 && value <= MAX_AMOUNT;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size byte string. Hex form is big-endian (byte 0 printed first),
/// matching how digests and account addresses are written on the wire.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to lowercase hex string (no prefix)
    std::string ToHex() const;

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit digest (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;

    /// Parse from hex (optional 0x prefix); throws std::invalid_argument on bad input
    static Hash256 FromHex(const std::string& hex);
};

/// 160-bit account address (20 bytes)
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;

    /// Format as 0x-prefixed lowercase hex
    std::string ToString() const { return "0x" + ToHex(); }

    /// Parse from hex (optional 0x prefix); throws std::invalid_argument on bad input
    static Address FromHex(const std::string& hex);
};

} // namespace quorumfeed

#endif // QUORUMFEED_CORE_TYPES_H
