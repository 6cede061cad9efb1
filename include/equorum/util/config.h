// EQUORUM - Configuration File Parser
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// Parses INI-style configuration for the governance engine.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Durations: 30s, 15m, 48h, 7d, 2w
//
// Command-line arguments of the form -key=value or -section.key=value
// override file values.

#ifndef EQUORUM_UTIL_CONFIG_H
#define EQUORUM_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace equorum {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name inside the data directory
constexpr const char* DEFAULT_CONFIG_FILENAME = "equorum.conf";

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

    /// "file:line: message"
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration values from files and the command line.
 *
 * A later source overwrites an earlier one for the same section and key,
 * so parse the file first and the command line last.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse command-line arguments.
     * "-votingperiod=3d" sets a global key; "-governance.votingperiod=3d"
     * sets a key inside [governance]. A bare "-flag" is boolean true.
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

    /// Integer value; nullopt if missing or not an integer
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Duration in seconds; see ParseDuration for the accepted syntax
    std::optional<int64_t> TryGetDuration(const std::string& key,
                                          const std::string& section = "") const;

    /// Comma-separated list; empty items are dropped
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    // ========================================================================
    // Mutation and Inspection
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    std::vector<std::string> GetSections() const;
    std::vector<ConfigEntry> GetEntries(const std::string& section = "") const;

    void Clear() { entries_.clear(); }
    size_t Size() const { return entries_.size(); }

    /// Dump all configuration in INI form
    std::string Dump() const;

    /// Expand a leading ~ to $HOME
    static std::string ExpandTilde(const std::string& path);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    // "section.key" (or just "key" for the global section) -> entry
    std::map<std::string, ConfigEntry> entries_;
};

} // namespace util
} // namespace equorum

#endif // EQUORUM_UTIL_CONFIG_H
