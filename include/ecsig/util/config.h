// ECSIG - Configuration File Parser
// Copyright (c) 2024 ECSIG Developers
// MIT License
//
// Parses INI-style configuration for the ecsig tools.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare key is a flag set to true, "nokey" sets it to false
// - Environment variable expansion: ${VAR_NAME} or $VAR_NAME
// - "include <path>" pulls in another file

#ifndef ECSIG_UTIL_CONFIG_H
#define ECSIG_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ecsig {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name, looked up in the user's home directory
constexpr const char* DEFAULT_CONFIG_FILENAME = ".ecsig.conf";

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
    std::string source;    // File path where this was defined
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
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Manages configuration from files and command-line arguments.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments
 * 2. Config files, in the order they were parsed with overwrite=true
 * 3. Defaults registered with SetDefault()
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file (~ and $VARS are expanded)
     * @param overwrite If true, replace values that are already set
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /**
     * Parse command-line arguments.
     *
     * Options take the form -key=value, --key=value, -flag or -noflag and
     * always overwrite. Anything not starting with '-' is collected as a
     * positional argument, as is a lone "-". A lone "--" ends option
     * parsing. Register keys with AllowKey() first so that flags such as
     * -normalize are not read as negations.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /// Arguments that were not options, in order
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value; nullopt if missing or not a number
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    /// Boolean value; nullopt if missing or not a recognized boolean
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Path value with ~ expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value that any parsed file or argument overrides
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Validation
    // ========================================================================

    /// Register a known key
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Report keys that were set but never registered with AllowKey()
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    /// All keys in a section (empty for global)
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    void Clear();
    size_t Size() const;

    /// Dump all configuration as key=value lines
    std::string Dump() const;

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& stream, const std::string& sourceName,
                                  bool overwrite);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   bool overwrite, std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum, bool overwrite);

    /// Registered with AllowKey() or already holding a value
    bool IsKnownKey(const std::string& key, const std::string& section) const;

    /// Split a bare flag into key and value. "noX" becomes X=false when
    /// X is a known key and "noX" is not; with no registered keys every
    /// "no" prefix negates.
    void ResolveFlag(const std::string& name, const std::string& section,
                     std::string& key, std::string& value) const;

        static bool IsValidKey(const std::string& key, char& badChar);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;
    std::set<std::string> allowedKeys_;
    int includeDepth_{0};
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* CURVE = "curve";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* NORMALIZE = "normalize";
    constexpr const char* FORMAT = "format";
    constexpr const char* HELP = "help";
}

} // namespace util
} // namespace ecsig

#endif // ECSIG_UTIL_CONFIG_H
