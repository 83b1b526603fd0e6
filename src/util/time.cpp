// QUORUMFEED - Time Utilities Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace quorumfeed {
namespace util {

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
    std::mutex g_mockTimeMutex;

    int64_t WallClockSeconds() {
        return std::chrono::duration_cast<Seconds>(
            SystemClock::now().time_since_epoch()).count();
    }
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return WallClockSeconds();
}

int64_t GetTimeMillis() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load() * 1000;
    }
    return std::chrono::duration_cast<Milliseconds>(
        SystemClock::now().time_since_epoch()).count();
}

SystemTimePoint FromUnixTime(int64_t timestamp) {
    return SystemTimePoint{Seconds{timestamp}};
}

int64_t ToUnixTime(SystemTimePoint tp) {
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatISO8601(SystemTimePoint tp) {
    auto time = SystemClock::to_time_t(tp);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(Seconds duration) {
    int64_t total = duration.count();

    if (total < 0) {
        return "-" + FormatDuration(Seconds{-total});
    }
    if (total == 0) {
        return "0s";
    }

    int64_t days = total / SECONDS_PER_DAY;
    total %= SECONDS_PER_DAY;
    int64_t hours = total / SECONDS_PER_HOUR;
    total %= SECONDS_PER_HOUR;
    int64_t minutes = total / SECONDS_PER_MINUTE;
    int64_t seconds = total % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";
    if (seconds > 0) oss << seconds << "s";

    std::string result = oss.str();
    if (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTime.load() == 0) {
        g_mockTime.store(WallClockSeconds());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(Seconds duration) {
    g_mockTime.fetch_add(duration.count());
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

} // namespace util
} // namespace quorumfeed
