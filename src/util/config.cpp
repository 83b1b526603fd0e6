// QUORUMFEED - Configuration File Parser Implementation
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include "quorumfeed/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace quorumfeed {
namespace util {

// ============================================================================
// Static Helper Functions
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }

    char first = str.front();
    char last = str.back();
    if (!((first == '"' && last == '"') || (first == '\'' && last == '\''))) {
        return str;
    }

    std::string result = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return result;
    }

    // Escape sequences in double-quoted strings
    std::string unescaped;
    unescaped.reserve(result.length());
    for (size_t i = 0; i < result.length(); ++i) {
        if (result[i] == '\\' && i + 1 < result.length()) {
            char next = result[i + 1];
            switch (next) {
                case 'n': unescaped += '\n'; ++i; break;
                case 't': unescaped += '\t'; ++i; break;
                case '\\': unescaped += '\\'; ++i; break;
                case '"': unescaped += '"'; ++i; break;
                default: unescaped += result[i]; break;
            }
        } else {
            unescaped += result[i];
        }
    }
    return unescaped;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            if (value[i + 1] == '{') {
                size_t end = value.find('}', i + 2);
                if (end != std::string::npos) {
                    std::string varName = value.substr(i + 2, end - i - 2);
                    if (const char* envValue = std::getenv(varName.c_str())) {
                        result += envValue;
                    }
                    i = end + 1;
                    continue;
                }
            } else {
                size_t start = i + 1;
                size_t end = start;
                while (end < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[end])) || value[end] == '_')) {
                    ++end;
                }
                if (end > start) {
                    std::string varName = value.substr(start, end - start);
                    if (const char* envValue = std::getenv(varName.c_str())) {
                        result += envValue;
                    }
                    i = end;
                    continue;
                }
            }
        }
        result += value[i];
        ++i;
    }

    return result;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + "." + key;
}

void ConfigManager::Store(const std::string& key, const std::string& value,
                          const std::string& section, const std::string& source,
                          int lineNum, bool fromCommandLine) {
    std::string fullKey = MakeKey(key, section);

    // File values never override the command line
    if (!fromCommandLine && commandLineKeys_.count(fullKey)) {
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = source;
    entry.lineNumber = lineNum;
    entries_[fullKey] = entry;

    if (fromCommandLine) {
        commandLineKeys_[fullKey] = true;
    }
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    // Section header [section]
    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        return true;
    }

    size_t eqPos = trimmed.find('=');
    std::string key = Trim(eqPos == std::string::npos ? trimmed : trimmed.substr(0, eqPos));
    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            result = ConfigParseResult::Error(
                "Invalid character in key: " + std::string(1, c), source, lineNum);
            return false;
        }
    }

    // A bare key is a boolean flag
    std::string value = "true";
    if (eqPos != std::string::npos) {
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    Store(key, value, currentSection, source, lineNum, false);
    return true;
}

ConfigParseResult ConfigManager::ParseLines(std::istream& in, const std::string& source) {
    std::string currentSection;
    std::string line;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }
        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            return result;
        }
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string expandedPath = ExpandEnvVars(filePath);

    std::ifstream file(expandedPath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + expandedPath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            expandedPath);
    }

    return ParseLines(file, expandedPath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseLines(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.empty() || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        while (!arg.empty() && arg[0] == '-') {
            arg = arg.substr(1);
        }
        if (arg.empty()) {
            continue;
        }

        std::string key;
        std::string value = "true";
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else {
            key = arg;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                value = argv[++i];
            }
        }

        // section.key addresses a section
        std::string section;
        size_t dot = key.find('.');
        if (dot != std::string::npos) {
            section = key.substr(0, dot);
            key = key.substr(dot + 1);
        }
        if (key.empty()) {
            return ConfigParseResult::Error("Empty key", "<command-line>", i);
        }

        Store(key, value, section, "<command-line>", 0, true);
    }

    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.find(MakeKey(key, section)) != entries_.end();
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it != entries_.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        int64_t value = std::stoll(*str, &pos);
        if (pos != str->size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> result;
    auto str = TryGetString(key, section);
    if (!str) {
        return result;
    }
    std::istringstream ss(*str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    Store(key, value, section, "<programmatic>", 0, true);
}

// ============================================================================
// Utilities
// ============================================================================

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& [fullKey, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

void ConfigManager::Clear() {
    entries_.clear();
    commandLineKeys_.clear();
    positional_.clear();
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;

    // Global section first, then each named section
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section.empty()) {
            oss << entry.key << "=" << entry.value << "\n";
        }
    }
    for (const auto& section : GetSections()) {
        oss << "\n[" << section << "]\n";
        for (const auto& [fullKey, entry] : entries_) {
            if (entry.section == section) {
                oss << entry.key << "=" << entry.value << "\n";
            }
        }
    }
    return oss.str();
}

} // namespace util
} // namespace quorumfeed
