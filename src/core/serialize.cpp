// QUORUMFEED - Serialization Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/core/serialize.h"
#include "quorumfeed/core/hex.h"

namespace quorumfeed {

std::string DataStream::ToHex() const {
    return BytesToHex(data_.data() + read_pos_, data_.size() - read_pos_);
}

} // namespace quorumfeed
