// NODEREWARD - Configuration File Parser Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace nodereward {
namespace util {

std::string ConfigParseResult::ToString() const {
    if (success) return "OK";
    std::string result = errorMessage;
    if (!errorFile.empty()) {
        result += " (" + errorFile;
        if (errorLine > 0) {
            result += ":" + std::to_string(errorLine);
        }
        result += ")";
    }
    return result;
}

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

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

    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }

    // Double-quoted strings honour \n \t \\ \"
    std::string unescaped;
    unescaped.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            char next = inner[i + 1];
            switch (next) {
                case 'n': unescaped += '\n'; ++i; continue;
                case 't': unescaped += '\t'; ++i; continue;
                case '\\': unescaped += '\\'; ++i; continue;
                case '"': unescaped += '"'; ++i; continue;
                default: break;
            }
        }
        unescaped += inner[i];
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
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string varName = value.substr(i + 2, end - i - 2);
                const char* envValue = std::getenv(varName.c_str());
                if (envValue) {
                    result += envValue;
                }
                i = end + 1;
                continue;
            }
        }
        result += value[i];
        ++i;
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.length() > 1 && path[1] != '/') {
        return path;
    }

    std::string home;
    const char* homeEnv = std::getenv("HOME");
    if (homeEnv) {
        home = homeEnv;
    } else {
        struct passwd* pw = getpwuid(getuid());
        if (pw) {
            home = pw->pw_dir;
        }
    }
    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
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

    if (trimmed.compare(0, 8, "include ") == 0) {
        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            result = ConfigParseResult::Error(
                "Maximum include depth exceeded", source, lineNum);
            return false;
        }
        std::string includePath = ExpandEnvVars(ExpandTilde(Unquote(Trim(trimmed.substr(8)))));

        ++includeDepth_;
        ConfigParseResult included = ParseFile(includePath);
        --includeDepth_;

        if (!included.success) {
            result = included;
            return false;
        }
        return true;
    }

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        result = ConfigParseResult::Error("Expected key=value", source, lineNum);
        return false;
    }

    std::string key = Trim(trimmed.substr(0, eqPos));
    std::string value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));

    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            result = ConfigParseResult::Error(
                "Invalid character in key: " + std::string(1, c), source, lineNum);
            return false;
        }
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;
    entries_[MakeKey(key, currentSection)] = entry;
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string currentSection;
    std::string line;
    std::string continuationLine;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            continuationLine += line.substr(0, line.length() - 1);
            continue;
        }
        if (!continuationLine.empty()) {
            line = continuationLine + line;
            continuationLine.clear();
        }

        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            return result;
        }
    }

    if (!continuationLine.empty() &&
        !ParseLine(continuationLine, source, lineNum, currentSection, result)) {
        return result;
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string expandedPath = ExpandEnvVars(ExpandTilde(filePath));

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

    return ParseStream(file, expandedPath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
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
        size_t pos;
        int64_t value = std::stoll(*str, &pos);

        std::string suffix = Trim(str->substr(pos));
        if (suffix.empty()) {
            return value;
        }
        if (suffix.length() > 1) {
            return std::nullopt;
        }
        switch (std::tolower(static_cast<unsigned char>(suffix[0]))) {
            case 'k': return value * 1024;
            case 'm': return value * 1024 * 1024;
            case 'g': return value * 1024LL * 1024 * 1024;
            default: return std::nullopt;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key,
                              int64_t defaultValue,
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

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
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

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";
    entries_[MakeKey(key, section)] = entry;
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.find(fullKey) != entries_.end()) {
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[fullKey] = entry;
}

// ============================================================================
// Sections
// ============================================================================

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& [key, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::RequireKey(const std::string& key, const std::string& section) {
    requiredKeys_.insert(MakeKey(key, section));
}

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

void ConfigManager::AllowKeyPrefix(const std::string& prefix, const std::string& section) {
    allowedPrefixes_.insert(MakeKey(prefix, section));
}

bool ConfigManager::IsAllowed(const ConfigEntry& entry, const std::string& fullKey) const {
    if (entry.isDefault) return true;
    if (allowedKeys_.count(fullKey) || requiredKeys_.count(fullKey)) return true;
    for (const auto& prefix : allowedPrefixes_) {
        if (fullKey.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;

    for (const auto& requiredKey : requiredKeys_) {
        if (entries_.find(requiredKey) == entries_.end()) {
            errors.push_back("Required key missing: " + requiredKey);
        }
    }

    if (!allowedKeys_.empty() || !allowedPrefixes_.empty()) {
        for (const auto& [fullKey, entry] : entries_) {
            if (!IsAllowed(entry, fullKey)) {
                errors.push_back("Unknown key: " + fullKey +
                                 " (defined in " + entry.source + ")");
            }
        }
    }

    return errors;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    requiredKeys_.clear();
    allowedKeys_.clear();
    allowedPrefixes_.clear();
    includeDepth_ = 0;
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

std::string ConfigManager::GenerateSampleConfig() {
    std::ostringstream oss;

    oss << "# Reward engine configuration\n\n";

    oss << "[rewards]\n";
    oss << "# Bounds for base and adjusted amounts (base units, 1 token = 100000000)\n";
    oss << "#min_amount=100000\n";
    oss << "#max_amount=100000000000\n";
    oss << "# Per-operator caps per day and per 30-day month\n";
    oss << "#max_daily=1000000000000\n";
    oss << "#max_monthly=10000000000000\n";
    oss << "# Seconds between two calculations for the same operator\n";
    oss << "#min_interval=3600\n";
    oss << "#max_batch_size=50\n";
    oss << "# transfer: pay from the treasury account; mint: create new units\n";
    oss << "#asset_mode=transfer\n";
    oss << "#treasury=<40 hex chars>\n\n";

    oss << "[slashing]\n";
    oss << "#threshold=70\n";
    oss << "#max_percentage=50\n";
    oss << "#cooldown=86400\n\n";

    oss << "[ratelimit]\n";
    oss << "#rewardCalculation.max=100\n";
    oss << "#rewardCalculation.window=3600\n";
    oss << "#rewardDistribution.max=100\n";
    oss << "#rewardDistribution.window=3600\n";
    oss << "#slashing.max=10\n";
    oss << "#slashing.window=3600\n\n";

    oss << "[timelock]\n";
    oss << "#min_delay=3600\n";
    oss << "#max_delay=2592000\n\n";

    oss << "[anomaly]\n";
    oss << "#threshold_percent=200\n";
    oss << "#baseline.rewardCalculation.amount=0\n\n";

    oss << "[storage]\n";
    oss << "# leveldb or memory\n";
    oss << "#backend=leveldb\n";
    oss << "#path=~/.nodereward/ledger\n\n";

    oss << "[logging]\n";
    oss << "#level=info\n";
    oss << "#console=1\n";
    oss << "#colors=1\n";
    oss << "#file=\n";

    return oss.str();
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    oss << "# Configuration Dump (" << entries_.size() << " entries)\n";

    std::map<std::string, std::vector<const ConfigEntry*>> bySection;
    for (const auto& [key, entry] : entries_) {
        bySection[entry.section].push_back(&entry);
    }

    for (const auto& [section, entries] : bySection) {
        oss << "\n";
        if (!section.empty()) {
            oss << "[" << section << "]\n";
        }
        for (const ConfigEntry* entry : entries) {
            oss << entry->key << "=" << entry->value << "  # " << entry->source;
            if (entry->lineNumber > 0) {
                oss << ":" << entry->lineNumber;
            }
            oss << "\n";
        }
    }

    return oss.str();
}

} // namespace util
} // namespace nodereward
