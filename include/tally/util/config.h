// TALLY - Configuration File Parser
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Parses INI-style configuration for tallyd and tally-cli.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally grouped under [section] headers
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
// - "include <path>" pulls in another file

#ifndef TALLY_UTIL_CONFIG_H
#define TALLY_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tally {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name
constexpr const char* DEFAULT_DATADIR_NAME = ".tally";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "tally.conf";

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
    std::string source;    // File path, "<command-line>", "<default>", ...
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

    /// "file:line: message" for display
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration gathered from files and the command line.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments (-key=value)
 * 2. The config file (-conf, or <datadir>/tally.conf)
 * 3. Defaults registered with SetDefault
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file. Values already present are replaced.
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text (used by tests and by ParseFile)
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse command-line arguments of the form -key=value, --key=value,
     * -flag or -noflag. Positional arguments are returned in order.
     */
    ConfigParseResult ParseCommandLine(int argc, char* argv[],
                                       std::vector<std::string>* positional = nullptr);

    /**
     * Load the config file named by -conf (or <datadir>/tally.conf when it
     * exists), then re-apply command-line values on top.
     */
    ConfigParseResult LoadConfigFile();

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integers accept k/m/g suffixes (powers of 1024)
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

    /// Get path value with ~ and ${VAR} expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value only if nothing else has provided one
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    /// SetDefault from an environment variable, when it is set and non-empty
    void SetDefaultFromEnv(const std::string& key, const char* envVar);

    // ========================================================================
    // Utilities
    // ========================================================================

    std::vector<std::string> GetKeys(const std::string& section = "") const;
    std::vector<std::string> GetSections() const;

    void Clear();
    size_t Size() const;

    /// Data directory from -datadir, else ~/.tally
    std::string GetDataDir() const;

    static std::string GetDefaultDataDir();
    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);
    static std::optional<bool> ParseBool(const std::string& str);

    /// Dump all configuration, secrets masked
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum, bool isDefault);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::string> commandLine_;
    int includeDepth_{0};
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* ENVIRONMENT = "environment";

    // Logging
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* DEBUG = "debug";

    // Access gate
    constexpr const char* JWTSECRET = "jwtsecret";

    // Treasury
    constexpr const char* NFTMINTVALUE = "nftmintvalue";
    constexpr const char* SEEDDEFAULTS = "seeddefaults";

    // Contention handling
    constexpr const char* RETRYATTEMPTS = "retryattempts";
    constexpr const char* RETRYBASEMS = "retrybasems";
    constexpr const char* RETRYMAXMS = "retrymaxms";
    constexpr const char* LOCKTIMEOUTMS = "locktimeoutms";

    // HTTP
    constexpr const char* HTTPBIND = "httpbind";
    constexpr const char* HTTPPORT = "httpport";
    constexpr const char* HTTPTHREADS = "httpthreads";
    constexpr const char* MAXREQUESTSIZE = "maxrequestsize";
}

/// Environment variables read as fallbacks
namespace ConfigEnv {
    constexpr const char* APP_ENVIRONMENT = "APP_ENVIRONMENT";
    constexpr const char* JWT_SECRET = "GUARDIAN_JWT_SECRET";
}

} // namespace util
} // namespace tally

#endif // TALLY_UTIL_CONFIG_H
