// QUORUMFEED - Configuration File Parser
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License
//
// Parses INI-style configuration files for the feed engine and simulator.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef QUORUMFEED_UTIL_CONFIG_H
#define QUORUMFEED_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quorumfeed {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "quorumfeed.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or "<command-line>"
    int lineNumber{0};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration read from a file and the command line.
 *
 * Command-line values always win over file values. A command-line key may
 * address a section as "section.key".
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse command-line arguments of the form -key=value, --key=value,
     * -key value or -flag. Positional arguments are collected separately.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Whole-string signed integer; nullopt if missing or not a number
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Comma-separated list, trimmed, empty items dropped
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// Arguments that were not options
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically (overwrites)
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    // ========================================================================
    // Utilities
    // ========================================================================

    std::vector<std::string> GetSections() const;

    void Clear();

    size_t Size() const { return entries_.size(); }

    /// Expand ${VAR} and $VAR references from the environment
    static std::string ExpandEnvVars(const std::string& value);

    /// Dump all configuration as INI text
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseLines(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum, bool fromCommandLine);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, bool> commandLineKeys_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Feed engine (global section)
    constexpr const char* PAYMENT_AMOUNT = "paymentamount";
    constexpr const char* REWARD_RATE_X10 = "rewardratex10";
    constexpr const char* DESCRIPTION = "description";
    constexpr const char* CONTRACT_ADDRESS = "contractaddress";
    constexpr const char* MIN_THRESHOLD_PERCENT = "minthresholdpercent";
    constexpr const char* VALIDATOR_GAS_LIMIT = "validatorgaslimit";

    // Simulator
    constexpr const char* SIM_SECTION = "sim";
    constexpr const char* SIM_ORACLES = "oracles";
    constexpr const char* SIM_SIGNERS = "signers";
    constexpr const char* SIM_ROUNDS = "rounds";
    constexpr const char* SIM_FUNDING = "funding";
    constexpr const char* SIM_SNAPSHOT = "snapshot";
    constexpr const char* SIM_LOGLEVEL = "loglevel";
    constexpr const char* CONF = "conf";
}

} // namespace util
} // namespace quorumfeed

#endif // QUORUMFEED_UTIL_CONFIG_H
