// QUORUMFEED - Packed ABI Encoding Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/core/abi.h"

namespace quorumfeed {

PackedEncoder& PackedEncoder::WriteUint32(uint32_t value) {
    for (int i = 3; i >= 0; --i) {
        data_.push_back(static_cast<Byte>(value >> (8 * i)));
    }
    return *this;
}

PackedEncoder& PackedEncoder::WriteUint256(uint64_t value) {
    data_.insert(data_.end(), 24, 0x00);
    for (int i = 7; i >= 0; --i) {
        data_.push_back(static_cast<Byte>(value >> (8 * i)));
    }
    return *this;
}

PackedEncoder& PackedEncoder::WriteInt256(int64_t value) {
    // Sign extension: 24 bytes of 0xff for negative values
    const Byte fill = value < 0 ? 0xFF : 0x00;
    data_.insert(data_.end(), 24, fill);
    const uint64_t bits = static_cast<uint64_t>(value);
    for (int i = 7; i >= 0; --i) {
        data_.push_back(static_cast<Byte>(bits >> (8 * i)));
    }
    return *this;
}

PackedEncoder& PackedEncoder::WriteAddress(const Address& addr) {
    data_.insert(data_.end(), addr.begin(), addr.end());
    return *this;
}

PackedEncoder& PackedEncoder::WriteBytes32(const Hash256& value) {
    data_.insert(data_.end(), value.begin(), value.end());
    return *this;
}

PackedEncoder& PackedEncoder::WriteInt256Array(const std::vector<int64_t>& values) {
    data_.reserve(data_.size() + values.size() * 32);
    for (int64_t v : values) {
        WriteInt256(v);
    }
    return *this;
}

PackedEncoder& PackedEncoder::WriteString(const std::string& str) {
    data_.insert(data_.end(), str.begin(), str.end());
    return *this;
}

PackedEncoder& PackedEncoder::WriteBytes(const Byte* data, size_t len) {
    if (data && len > 0) {
        data_.insert(data_.end(), data, data + len);
    }
    return *this;
}

} // namespace quorumfeed
