// QUORUMFEED - Serialization Header
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Little-endian binary serialization used for ledger snapshots.
// Based on Bitcoin's serialization with simplifications for clarity.

#ifndef QUORUMFEED_CORE_SERIALIZE_H
#define QUORUMFEED_CORE_SERIALIZE_H

#include "quorumfeed/core/types.h"
#include "quorumfeed/core/hex.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <string>
#include <stdexcept>
#include <ios>
#include <limits>

namespace quorumfeed {

// ============================================================================
// Constants
// ============================================================================

/// Maximum size for serialized objects to prevent memory exhaustion
static constexpr uint64_t MAX_SERIALIZED_SIZE = 0x02000000;  // 32 MB

/// Maximum vector allocation size
static constexpr unsigned int MAX_VECTOR_ALLOCATE = 5000000;

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using value_type = uint8_t;
    using size_type = std::size_t;

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;

public:
    DataStream() = default;

    explicit DataStream(const std::vector<uint8_t>& data) : data_(data), read_pos_(0) {}

    explicit DataStream(std::vector<uint8_t>&& data) : data_(std::move(data)), read_pos_(0) {}

    DataStream(const uint8_t* data, size_type len) : data_(data, data + len), read_pos_(0) {}

    /// Returns unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }

    bool empty() const noexcept { return size() == 0; }

    void clear() {
        data_.clear();
        read_pos_ = 0;
    }

    /// Whole buffer, including bytes already read
    const std::vector<uint8_t>& Data() const noexcept { return data_; }

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_type len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }

    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    std::string ToHex() const;

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);
};

// ============================================================================
// Low-Level Serialization Functions (little-endian)
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    uint8_t buf[4];
    for (int i = 0; i < 4; ++i) buf[i] = static_cast<uint8_t>(obj >> (8 * i));
    s.Write(buf, 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) buf[i] = static_cast<uint8_t>(obj >> (8 * i));
    s.Write(buf, 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint8_t buf[4];
    s.Read(buf, 4);
    uint32_t obj = 0;
    for (int i = 0; i < 4; ++i) obj |= static_cast<uint32_t>(buf[i]) << (8 * i);
    return obj;
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint8_t buf[8];
    s.Read(buf, 8);
    uint64_t obj = 0;
    for (int i = 0; i < 8; ++i) obj |= static_cast<uint64_t>(buf[i]) << (8 * i);
    return obj;
}

// ============================================================================
// CompactSize Encoding
// ============================================================================

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else if (size <= std::numeric_limits<uint32_t>::max()) {
        ser_writedata8(s, 254);
        ser_writedata32(s, static_cast<uint32_t>(size));
    } else {
        ser_writedata8(s, 255);
        ser_writedata64(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t tag = ser_readdata8(s);
    uint64_t size;
    if (tag < 253) {
        size = tag;
    } else if (tag == 254) {
        size = ser_readdata32(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (tag == 255) {
        size = ser_readdata64(s);
        if (size <= std::numeric_limits<uint32_t>::max()) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        throw std::ios_base::failure("unsupported CompactSize tag");
    }
    if (size > MAX_SERIALIZED_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Serialize/Unserialize for Primitives
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = (ser_readdata8(s) != 0); }

// ============================================================================
// Serialize/Unserialize for Hash Types
// ============================================================================

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

// ============================================================================
// Serialize/Unserialize for Strings and Vectors
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    v.reserve(std::min(size, static_cast<uint64_t>(MAX_VECTOR_ALLOCATE / sizeof(T))));
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

// ============================================================================
// DataStream Stream Operators Implementation
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace quorumfeed

#endif // QUORUMFEED_CORE_SERIALIZE_H
