// QUORUMFEED - State Snapshots
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Binary layout (little-endian, DataStream encoding):
//   "QFS1" | version u8
//   lastReportedRound u32 | round count | { id u32, answer, startedAt,
//     updatedAt, answeredInRound u32, submissions[], paymentAmount }...
//   available | allocated | rewardAccumulator | count | { oracle, amount }...
//   count | { submitter, lastUpdated, releasable, remainVesting }...
// Counts are CompactSize; all other integers are 64-bit unless noted.

#ifndef QUORUMFEED_FEED_SNAPSHOT_H
#define QUORUMFEED_FEED_SNAPSHOT_H

#include "quorumfeed/core/types.h"
#include "quorumfeed/feed/state.h"

#include <string>
#include <vector>

namespace quorumfeed {
namespace feed {

/// File magic
constexpr const char SNAPSHOT_MAGIC[4] = {'Q', 'F', 'S', '1'};

/// Current format version
constexpr uint8_t SNAPSHOT_VERSION = 1;

/// Encode state
std::vector<Byte> SerializeState(const FeedState& state);

/**
 * Decode state.
 * @throws FeedError SnapshotCorrupt on bad magic, version, truncation or
 *         trailing bytes
 */
FeedState DeserializeState(const std::vector<Byte>& data);

/// Write state to path, replacing any existing file
/// @throws FeedError SnapshotCorrupt if the file cannot be written
void SaveSnapshot(const FeedState& state, const std::string& path);

/// @throws FeedError SnapshotCorrupt if the file is missing or invalid
FeedState LoadSnapshot(const std::string& path);

} // namespace feed
} // namespace quorumfeed

#endif // QUORUMFEED_FEED_SNAPSHOT_H
