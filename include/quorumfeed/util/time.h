// QUORUMFEED - Time Utilities
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps
// - Time and duration formatting for logs
// - Mock time for testing deadlines and vesting

#ifndef QUORUMFEED_UTIL_TIME_H
#define QUORUMFEED_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace quorumfeed {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

using SystemClock = std::chrono::system_clock;
using SteadyClock = std::chrono::steady_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;
using SteadyTimePoint = std::chrono::steady_clock::time_point;

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Current Unix timestamp in milliseconds (mock time when enabled)
int64_t GetTimeMillis();

SystemTimePoint FromUnixTime(int64_t timestamp);
int64_t ToUnixTime(SystemTimePoint tp);

// ============================================================================
// Formatting
// ============================================================================

/// Format as ISO 8601 UTC (e.g. "2024-01-15T10:30:00Z")
std::string FormatISO8601(SystemTimePoint tp);

/// Format a Unix timestamp as ISO 8601 UTC
inline std::string FormatISO8601(int64_t timestamp) {
    return FormatISO8601(FromUnixTime(timestamp));
}

/// Format duration as "2d 3h 15m 7s"
std::string FormatDuration(Seconds duration);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time, starting from the current wall clock if none is set
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

void SetMockTime(int64_t timestamp);

void AdvanceMockTime(Seconds duration);

int64_t GetMockTime();

// ============================================================================
// Timer
// ============================================================================

/// Wall-clock stopwatch on the steady clock
class Timer {
public:
    Timer() : start_(SteadyClock::now()) {}

    void Reset() { start_ = SteadyClock::now(); }

    int64_t ElapsedMillis() const {
        return std::chrono::duration_cast<Milliseconds>(SteadyClock::now() - start_).count();
    }

private:
    SteadyTimePoint start_;
};

} // namespace util
} // namespace quorumfeed

#endif // QUORUMFEED_UTIL_TIME_H
