// LOCKBOX - Configuration File Parser
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// INI-style configuration for the ledger and command-line tool.
//
// Format:
// - Lines starting with # or ; are comments
// - key=value pairs, values optionally quoted
// - [section] headers; "key" under [section] is addressed as "section.key"
// - A bare "key" means key=true and "nokey" means key=false
// - ${VAR} and $VAR expand from the environment
//
// Command-line options use the same keys: -key=value, -key, -nokey.
// Command-line values win over file values.

#ifndef LOCKBOX_UTIL_CONFIG_H
#define LOCKBOX_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lockbox {
namespace util {

// ============================================================================
// Constants
// ============================================================================

/// Default data directory under $HOME
constexpr const char* DEFAULT_DATADIR_NAME = ".lockbox";

/// Config file looked up in the data directory
constexpr const char* DEFAULT_CONFIG_FILENAME = "lockbox.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;       // Fully qualified, e.g. "rent.exemptionthreshold"
    std::string value;
    std::string source;    // File path, "<command-line>" or "<default>"
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    std::vector<std::string> warnings;
    
    static ConfigParseResult Success() {
        return {true, "", "", 0, {}};
    }
    
    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line, {}};
    }
    
    /// "file:line: message"
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from defaults, a config file and the command line.
 * 
 * Priority (highest first): command line, Set(), config file, SetDefault().
 */
class ConfigManager {
public:
    ConfigManager() = default;
    
    // ========================================================================
    // Parsing
    // ========================================================================
    
    /**
     * Parse a configuration file.
     * @param overwrite If false, keys already set from a non-default source
     *                  keep their value
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);
    
    /// Parse configuration text; sourceName is used in error messages
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);
    
    /**
     * Parse options from argv. Arguments not starting with '-' are returned
     * in positional, in order. "--" ends option parsing.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[],
                                       std::vector<std::string>* positional = nullptr);
    
    /**
     * Load the config file named by "conf", or lockbox.conf in the data
     * directory. A missing default file is not an error.
     */
    ConfigParseResult LoadConfigFile();
    
    // ========================================================================
    // Value Retrieval
    // ========================================================================
    
    bool HasKey(const std::string& key) const;
    
    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;
    
    /// Decimal integer; nullopt if absent or malformed
    std::optional<int64_t> TryGetInt(const std::string& key) const;
    int64_t GetInt(const std::string& key, int64_t defaultValue) const;
    
    std::optional<uint64_t> TryGetUInt(const std::string& key) const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue) const;
    
    /// true/false, yes/no, on/off, 1/0
    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool defaultValue) const;
    
    /// String value with ~ and environment expansion
    std::string GetPath(const std::string& key, const std::string& defaultValue = "") const;
    
    /// Where a key's value came from, nullopt if unset
    std::optional<ConfigEntry> GetEntry(const std::string& key) const;
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value);
    
    /// Only takes effect if the key is not set
    void SetDefault(const std::string& key, const std::string& value);
    
    // ========================================================================
    // Validation
    // ========================================================================
    
    void AllowKey(const std::string& key);
    
    /// Keys not registered with AllowKey (empty if none registered)
    std::vector<std::string> UnknownKeys() const;
    
    // ========================================================================
    // Utilities
    // ========================================================================
    
    void Clear();
    size_t Size() const { return entries_.size(); }
    
    /// "datadir" with expansion, or the default data directory
    std::string GetDataDir() const;
    
    /// $HOME/.lockbox
    static std::string GetDefaultDataDir();
    
    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);
    
    /// Commented sample lockbox.conf
    static std::string GenerateSampleConfig();

private:
    ConfigParseResult ParseStream(std::istream& in, const std::string& source, bool overwrite);
    
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   bool overwrite, std::string& section, ConfigParseResult& result);
    
    void Store(const std::string& key, const std::string& value, const std::string& source,
               int lineNum, bool overwrite);
    
    static bool IsValidKey(const std::string& key);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    
    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* PROGRAMID = "programid";
    constexpr const char* RENT_LAMPORTS_PER_BYTE_YEAR = "rent.lamportsperbyteyear";
    constexpr const char* RENT_EXEMPTION_THRESHOLD = "rent.exemptionthreshold";
}

} // namespace util
} // namespace lockbox

#endif // LOCKBOX_UTIL_CONFIG_H
