// QUORUMFEED - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#ifndef QUORUMFEED_CORE_HEX_H
#define QUORUMFEED_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace quorumfeed {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string (no prefix)
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes. Accepts an optional 0x prefix.
/// Throws std::invalid_argument on odd length or non-hex characters.
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex (optional 0x prefix, even length)
bool IsValidHex(const std::string& str);

/// Drop a leading "0x"/"0X" if present
std::string StripHexPrefix(const std::string& str);

} // namespace quorumfeed

#endif // QUORUMFEED_CORE_HEX_H
