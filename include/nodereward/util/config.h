// NODEREWARD - Configuration File Parser
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Parses INI-style configuration files for the reward engine.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef NODEREWARD_UTIL_CONFIG_H
#define NODEREWARD_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace nodereward {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Maximum include depth
constexpr int MAX_INCLUDE_DEPTH = 10;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or "<string>", "<programmatic>", "<default>"
    int lineNumber{0};
    bool isDefault{false};
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

    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration parsed from files, strings and programmatic overrides.
 * Later definitions of the same key replace earlier ones; defaults never
 * replace an explicit value.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value; accepts k/m/g suffixes (powers of 1024)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Comma-separated list
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// Path value with ~ and environment expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value only if none is present
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections
    // ========================================================================

    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    // ========================================================================
    // Validation
    // ========================================================================

    void RequireKey(const std::string& key, const std::string& section = "");
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Allow every key in a section whose name starts with prefix
    void AllowKeyPrefix(const std::string& prefix, const std::string& section);

    /// Missing required keys and unknown keys (when any key is allowed explicitly)
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const;

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

    /// Commented sample file listing every recognized key
    static std::string GenerateSampleConfig();

    /// Dump all configuration to string
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    bool IsAllowed(const ConfigEntry& entry, const std::string& fullKey) const;

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;

    std::set<std::string> requiredKeys_;
    std::set<std::string> allowedKeys_;
    std::set<std::string> allowedPrefixes_;

    int includeDepth_{0};
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* SECTION_REWARDS = "rewards";
    constexpr const char* MIN_AMOUNT = "min_amount";
    constexpr const char* MAX_AMOUNT = "max_amount";
    constexpr const char* MAX_DAILY = "max_daily";
    constexpr const char* MAX_MONTHLY = "max_monthly";
    constexpr const char* MIN_INTERVAL = "min_interval";
    constexpr const char* MAX_BATCH_SIZE = "max_batch_size";
    constexpr const char* ASSET_MODE = "asset_mode";
    constexpr const char* TREASURY = "treasury";

    constexpr const char* SECTION_SLASHING = "slashing";
    constexpr const char* THRESHOLD = "threshold";
    constexpr const char* MAX_PERCENTAGE = "max_percentage";
    constexpr const char* COOLDOWN = "cooldown";

    constexpr const char* SECTION_RATELIMIT = "ratelimit";
    constexpr const char* SUFFIX_MAX = ".max";
    constexpr const char* SUFFIX_WINDOW = ".window";

    constexpr const char* SECTION_TIMELOCK = "timelock";
    constexpr const char* MIN_DELAY = "min_delay";
    constexpr const char* MAX_DELAY = "max_delay";

    constexpr const char* SECTION_ANOMALY = "anomaly";
    constexpr const char* THRESHOLD_PERCENT = "threshold_percent";
    constexpr const char* BASELINE_PREFIX = "baseline.";

    constexpr const char* SECTION_STORAGE = "storage";
    constexpr const char* BACKEND = "backend";
    constexpr const char* PATH = "path";

    constexpr const char* SECTION_LOGGING = "logging";
    constexpr const char* LOG_LEVEL = "level";
    constexpr const char* LOG_FILE = "file";
    constexpr const char* LOG_CONSOLE = "console";
    constexpr const char* LOG_COLORS = "colors";
}

} // namespace util
} // namespace nodereward

#endif // NODEREWARD_UTIL_CONFIG_H
