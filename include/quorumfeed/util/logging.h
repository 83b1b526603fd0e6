// QUORUMFEED - Logging System
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Provides a small logging system with:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Per-subsystem categories for filtering
// - Console, file and callback sinks
// - Printf-style and stream-style interfaces

#ifndef QUORUMFEED_UTIL_LOGGING_H
#define QUORUMFEED_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace quorumfeed {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Very detailed debugging
    Debug = 1,   // Debug information
    Info = 2,    // General information
    Warn = 3,    // Warnings
    Error = 4,   // Errors
    Fatal = 5,   // Fatal errors
    Off = 6      // Disable logging
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive). Unknown names map to Info.
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

/// Predefined log categories
namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* FEED = "feed";
    constexpr const char* ROUND = "round";
    constexpr const char* FUNDS = "funds";
    constexpr const char* VESTING = "vesting";
    constexpr const char* QUORUM = "quorum";
    constexpr const char* VALIDATOR = "validator";
    constexpr const char* CRYPTO = "crypto";
    constexpr const char* CONFIG = "config";
    constexpr const char* SNAPSHOT = "snapshot";
}

// ============================================================================
// Log Entry
// ============================================================================

/// A single log entry
struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::chrono::system_clock::time_point timestamp;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sink Interface
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /// Write a log entry
    virtual void Write(const LogEntry& entry) = 0;

    /// Flush any buffered output
    virtual void Flush() = 0;

    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Log sink that writes to stdout (errors optionally to stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // ANSI colors when attached to a tty
        bool useStderr{true};           // Write errors to stderr
        bool showTimestamp{true};
        bool showCategory{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// File Sink
// ============================================================================

/// Log sink that appends to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::ofstream file_;
    std::mutex mutex_;
    LogLevel level_;
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Log sink that calls a callback function
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger
class Logger {
public:
    /// Get the singleton instance
    static Logger& Instance();

    /// Install the default console sink (idempotent)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    /// Set global minimum log level
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the named category (plus any others enabled)
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    /// Log with printf-style formatting
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

    /// Check if a message would be logged
    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    bool allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Stream-style logging helper; emits on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define QUORUMFEED_LOGGER ::quorumfeed::util::Logger::Instance()

#define QUORUMFEED_LOG_ENABLED(level, category) \
    QUORUMFEED_LOGGER.WillLog(::quorumfeed::util::LogLevel::level, category)

#define QUORUMFEED_LOG(level, category) \
    if (QUORUMFEED_LOG_ENABLED(level, category)) \
        ::quorumfeed::util::LogStream(::quorumfeed::util::LogLevel::level, category, \
                                      __FILE__, __LINE__)

#define LOG_TRACE(category)   QUORUMFEED_LOG(Trace, category)
#define LOG_DEBUG(category)   QUORUMFEED_LOG(Debug, category)
#define LOG_INFO(category)    QUORUMFEED_LOG(Info, category)
#define LOG_WARN(category)    QUORUMFEED_LOG(Warn, category)
#define LOG_ERROR(category)   QUORUMFEED_LOG(Error, category)
#define LOG_FATAL(category)   QUORUMFEED_LOG(Fatal, category)

/// Printf-style logging
#define QUORUMFEED_LOGF(level, category, ...) \
    do { \
        if (QUORUMFEED_LOG_ENABLED(level, category)) { \
            QUORUMFEED_LOGGER.LogF(::quorumfeed::util::LogLevel::level, category, \
                                   __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while(0)

#define LogDebugF(category, ...)  QUORUMFEED_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   QUORUMFEED_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   QUORUMFEED_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  QUORUMFEED_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging (local time, millisecond precision)
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace quorumfeed

#endif // QUORUMFEED_UTIL_LOGGING_H
