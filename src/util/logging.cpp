// QUORUMFEED - Logging Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace quorumfeed {
namespace util {

// ============================================================================
// Log Level Functions
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
        default:              return "UNKNOWN";
    }
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO")  return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "FATAL") return LogLevel::Fatal;
    if (upper == "OFF")   return LogLevel::Off;

    return LogLevel::Info;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string GetBasename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos != std::string::npos) {
        return path.substr(pos + 1);
    }
    return path;
}

namespace {

std::string PlainFormat(const LogEntry& entry, bool withTimestamp, bool withCategory) {
    std::ostringstream oss;
    if (withTimestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << " ";
    }
    oss << "[" << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    if (withCategory && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << "[" << entry.category << "] ";
    }
    oss << entry.message;
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

ConsoleSink::ConsoleSink() = default;

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    std::string formatted = Format(entry);

    std::lock_guard<std::mutex> lock(mutex_);

    FILE* stream = stdout;
    if (config_.useStderr && entry.level >= LogLevel::Error) {
        stream = stderr;
    }

    if (config_.useColors && isatty(fileno(stream))) {
        fprintf(stream, "%s%s\033[0m\n", GetColorCode(entry.level), formatted.c_str());
    } else {
        fprintf(stream, "%s\n", formatted.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(stdout);
    fflush(stderr);
}

std::string ConsoleSink::Format(const LogEntry& entry) const {
    return PlainFormat(entry, config_.showTimestamp, config_.showCategory);
}

const char* ConsoleSink::GetColorCode(LogLevel level) const {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";      // Dark gray
        case LogLevel::Debug: return "\033[36m";      // Cyan
        case LogLevel::Info:  return "\033[32m";      // Green
        case LogLevel::Warn:  return "\033[33m";      // Yellow
        case LogLevel::Error: return "\033[31m";      // Red
        case LogLevel::Fatal: return "\033[35;1m";    // Bold magenta
        default:              return "\033[0m";
    }
}

// ============================================================================
// FileSink Implementation
// ============================================================================

FileSink::FileSink(const std::string& path, LogLevel level)
    : file_(path, std::ios::out | std::ios::app), level_(level) {}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < level_) {
        return;
    }

    std::string formatted = PlainFormat(entry, true, true);
    if (!entry.file.empty()) {
        formatted += " (" + GetBasename(entry.file) + ":" + std::to_string(entry.line) + ")";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << formatted << '\n';
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// CallbackSink Implementation
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : callback_(std::move(callback)), level_(level) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (entry.level < level_ || !callback_) {
        return;
    }
    callback_(entry);
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

void Logger::Initialize() {
    if (initialized_.exchange(true)) {
        return;
    }
    AddSink(std::make_shared<ConsoleSink>());
}

void Logger::Shutdown() {
    if (!initialized_.exchange(false)) {
        return;
    }
    Flush();
    ClearSinks();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.insert(category);
    allCategoriesEnabled_ = false;
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    if (allCategoriesEnabled_) {
        // Switch to an explicit list holding every known category but this one
        allCategoriesEnabled_ = false;
        for (const char* c : {LogCategory::DEFAULT, LogCategory::FEED, LogCategory::ROUND,
                              LogCategory::FUNDS, LogCategory::VESTING, LogCategory::QUORUM,
                              LogCategory::VALIDATOR, LogCategory::CRYPTO, LogCategory::CONFIG,
                              LogCategory::SNAPSHOT}) {
            enabledCategories_.insert(c);
        }
    }
    enabledCategories_.erase(category);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    if (allCategoriesEnabled_) {
        return true;
    }
    return enabledCategories_.find(category) != enabledCategories_.end();
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    allCategoriesEnabled_ = true;
    enabledCategories_.clear();
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message, const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    char buffer[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer, file, line);
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level < level_.load() || level == LogLevel::Off) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream Implementation
// ============================================================================

LogStream::LogStream(LogLevel level, const std::string& category,
                     const char* file, int line)
    : level_(level)
    , category_(category)
    , file_(file)
    , line_(line)
    , active_(Logger::Instance().WillLog(level, category)) {}

LogStream::~LogStream() {
    if (active_) {
        Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
    }
}

} // namespace util
} // namespace quorumfeed
