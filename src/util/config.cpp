// ECSIG - Configuration File Parser Implementation
// Copyright (c) 2024 ECSIG Developers
// MIT License

#include "ecsig/util/config.h"
#include "ecsig/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace ecsig {
namespace util {

// ============================================================================
// ConfigManager Implementation
// ============================================================================

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

    std::string result = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return result;
    }

    // Escape sequences are only honored in double quotes
    std::string unescaped;
    unescaped.reserve(result.length());
    for (size_t i = 0; i < result.length(); ++i) {
        if (result[i] == '\\' && i + 1 < result.length()) {
            switch (result[i + 1]) {
                case 'n': unescaped += '\n'; ++i; break;
                case 't': unescaped += '\t'; ++i; break;
                case 'r': unescaped += '\r'; ++i; break;
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
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

bool ConfigManager::IsValidKey(const std::string& key, char& badChar) {
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.') {
            badChar = c;
            return false;
        }
    }
    return true;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            if (value[i + 1] == '{') {
                // ${VAR}
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
            } else {
                // $VAR, up to the first character that cannot be in a name
                size_t start = i + 1;
                size_t end = start;
                while (end < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[end])) ||
                        value[end] == '_')) {
                    ++end;
                }
                if (end > start) {
                    std::string varName = value.substr(start, end - start);
                    const char* envValue = std::getenv(varName.c_str());
                    if (envValue) {
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

    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

// ============================================================================
// Internal Key Management
// ============================================================================

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
}

void ConfigManager::Store(const std::string& key, const std::string& value,
                          const std::string& section, const std::string& source,
                          int lineNum, bool overwrite) {
    std::string fullKey = MakeKey(key, section);

    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !it->second.isDefault && !overwrite) {
        LOG_TRACE(LogCategory::CONFIG) << "Keeping earlier value for " << fullKey
                                       << ", ignoring " << source << ":" << lineNum;
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = source;
    entry.lineNumber = lineNum;
    entry.isDefault = false;
    entries_[fullKey] = entry;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, bool overwrite, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    // Empty line or comment
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

    // Include directive
    if (trimmed.compare(0, 8, "include ") == 0) {
        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            result = ConfigParseResult::Error(
                "Maximum include depth exceeded", source, lineNum);
            return false;
        }

        std::string includePath = Unquote(Trim(trimmed.substr(8)));

        ++includeDepth_;
        ConfigParseResult includeResult = ParseFile(includePath, overwrite);
        --includeDepth_;

        if (!includeResult.success) {
            result = includeResult;
            return false;
        }
        return true;
    }

    std::string key;
    std::string value;

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // A bare key is a flag; "nokey" negates it
        ResolveFlag(trimmed, currentSection, key, value);
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }

    char badChar = 0;
    if (!IsValidKey(key, badChar)) {
        result = ConfigParseResult::Error(
            "Invalid character in key: " + std::string(1, badChar), source, lineNum);
        return false;
    }

    Store(key, value, currentSection, source, lineNum, overwrite);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& stream,
                                             const std::string& sourceName,
                                             bool overwrite) {
    std::string currentSection;
    std::string line;
    std::string continuationLine;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(stream, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }

        // Line continuation
        if (!line.empty() && line.back() == '\\') {
            continuationLine += line.substr(0, line.length() - 1);
            continue;
        }
        if (!continuationLine.empty()) {
            line = continuationLine + line;
            continuationLine.clear();
        }

        if (!ParseLine(line, sourceName, lineNum, overwrite, currentSection, result)) {
            return result;
        }
    }

    if (!continuationLine.empty()) {
        if (!ParseLine(continuationLine, sourceName, lineNum, overwrite,
                       currentSection, result)) {
            return result;
        }
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath, bool overwrite) {
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

    LOG_DEBUG(LogCategory::CONFIG) << "Reading config file " << expandedPath;
    return ParseStream(file, expandedPath, overwrite);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName,
                                             bool overwrite) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName, overwrite);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    bool optionsDone = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (optionsDone || arg.empty() || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            optionsDone = true;
            continue;
        }

        // Remove leading dashes
        size_t start = arg.find_first_not_of('-');
        if (start == std::string::npos) {
            // A lone "-" names stdin
            if (arg == "-") {
                positional_.push_back(arg);
                continue;
            }
            return ConfigParseResult::Error("Empty option", "<command-line>", i);
        }
        arg = arg.substr(start);

        std::string key;
        std::string value;

        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else {
            ResolveFlag(arg, "", key, value);
        }

        char badChar = 0;
        if (key.empty() || !IsValidKey(key, badChar)) {
            return ConfigParseResult::Error("Invalid option: " + std::string(argv[i]),
                                            "<command-line>", i);
        }

        // Command line always overwrites
        Store(key, value, "", "<command-line>", i, true);
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
    auto strValue = TryGetString(key, section);
    if (!strValue) {
        return std::nullopt;
    }

    try {
        size_t pos = 0;
        int64_t value = std::stoll(*strValue, &pos);
        if (!Trim(strValue->substr(pos)).empty()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
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
    auto strValue = TryGetString(key, section);
    if (!strValue) {
        return std::nullopt;
    }
    return ParseBool(*strValue);
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
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
    Store(key, value, section, "<set>", 0, true);
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
// Flags
// ============================================================================

bool ConfigManager::IsKnownKey(const std::string& key, const std::string& section) const {
    std::string fullKey = MakeKey(key, section);
    return allowedKeys_.count(fullKey) > 0 || entries_.count(fullKey) > 0;
}

void ConfigManager::ResolveFlag(const std::string& name, const std::string& section,
                                std::string& key, std::string& value) const {
    key = name;
    value = "true";

    if (name.length() <= 2 || name.compare(0, 2, "no") != 0 ||
        !std::islower(static_cast<unsigned char>(name[2]))) {
        return;
    }

    // "normalize" is a flag of its own, not the negation of "rmalize"
    if (IsKnownKey(name, section)) {
        return;
    }
    std::string negated = name.substr(2);
    if (IsKnownKey(negated, section) || allowedKeys_.empty()) {
        key = negated;
        value = "false";
    }
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;
    if (allowedKeys_.empty()) {
        return errors;
    }

    for (const auto& [fullKey, entry] : entries_) {
        if (allowedKeys_.find(fullKey) == allowedKeys_.end()) {
            errors.push_back("Unknown key: " + fullKey +
                             " (defined in " + entry.source + ")");
        }
    }
    return errors;
}

// ============================================================================
// Utilities
// ============================================================================

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }
    return keys;
}

void ConfigManager::Clear() {
    entries_.clear();
    positional_.clear();
    allowedKeys_.clear();
    includeDepth_ = 0;
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;

    for (const auto& [fullKey, entry] : entries_) {
        oss << fullKey << "=" << entry.value;
        if (entry.isDefault) {
            oss << "  # (default)";
        } else {
            oss << "  # " << entry.source;
            if (entry.lineNumber > 0) {
                oss << ":" << entry.lineNumber;
            }
        }
        oss << "\n";
    }

    return oss.str();
}

} // namespace util
} // namespace ecsig
