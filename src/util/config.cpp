// LOCKBOX - Configuration File Parser Implementation
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include "lockbox/util/config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace lockbox {
namespace util {

std::string ConfigParseResult::ToString() const {
    if (success) return "OK";
    std::ostringstream oss;
    if (!errorFile.empty()) {
        oss << errorFile;
        if (errorLine > 0) oss << ":" << errorLine;
        oss << ": ";
    }
    oss << errorMessage;
    return oss.str();
}

// ============================================================================
// Static Helpers
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
    if ((first != '"' && first != '\'') || str.back() != first) {
        return str;
    }
    
    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }
    
    // Double quotes honour \n \t \\ \"
    std::string out;
    out.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            switch (inner[i + 1]) {
                case 'n': out += '\n'; ++i; continue;
                case 't': out += '\t'; ++i; continue;
                case '\\': out += '\\'; ++i; continue;
                case '"': out += '"'; ++i; continue;
                default: break;
            }
        }
        out += inner[i];
    }
    return out;
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

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) return false;
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());
    
    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            size_t nameStart;
            size_t nameEnd;
            size_t next;
            if (value[i + 1] == '{') {
                nameStart = i + 2;
                nameEnd = value.find('}', nameStart);
                if (nameEnd == std::string::npos) {
                    result += value.substr(i);
                    break;
                }
                next = nameEnd + 1;
            } else {
                nameStart = i + 1;
                nameEnd = nameStart;
                while (nameEnd < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                        value[nameEnd] == '_')) {
                    ++nameEnd;
                }
                next = nameEnd;
            }
            
            if (nameEnd > nameStart) {
                std::string name = value.substr(nameStart, nameEnd - nameStart);
                if (const char* env = std::getenv(name.c_str())) {
                    result += env;
                }
                i = next;
                continue;
            }
        }
        result += value[i++];
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
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    
    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    return ExpandTilde(std::string("~/") + DEFAULT_DATADIR_NAME);
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(const std::string& key, const std::string& value,
                          const std::string& source, int lineNum, bool overwrite) {
    auto it = entries_.find(key);
    if (it != entries_.end() && !it->second.isDefault && !overwrite) {
        return;
    }
    
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.source = source;
    entry.lineNumber = lineNum;
    entry.isDefault = false;
    entries_[key] = entry;
}

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, bool overwrite, std::string& section,
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
        section = Trim(trimmed.substr(1, end - 1));
        if (!section.empty() && !IsValidKey(section)) {
            result = ConfigParseResult::Error("Invalid section name: " + section,
                                              source, lineNum);
            return false;
        }
        return true;
    }
    
    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        key = trimmed;
        value = "true";
        if (key.size() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }
    
    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        return false;
    }
    
    Store(section.empty() ? key : section + "." + key, value, source, lineNum, overwrite);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source,
                                             bool overwrite) {
    ConfigParseResult result = ConfigParseResult::Success();
    std::string section;
    std::string line;
    int lineNum = 0;
    
    while (std::getline(in, line)) {
        ++lineNum;
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }
        if (!ParseLine(line, source, lineNum, overwrite, section, result)) {
            return result;
        }
    }
    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath, bool overwrite) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));
    
    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }
    
    file.seekg(0, std::ios::end);
    auto size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", path);
    }
    
    return ParseStream(file, path, overwrite);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName,
                                             bool overwrite) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName, overwrite);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[],
                                                  std::vector<std::string>* positional) {
    bool optionsDone = false;
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i] ? argv[i] : "";
        
        if (optionsDone || arg.empty() || arg[0] != '-' || arg == "-") {
            if (positional) positional->push_back(arg);
            continue;
        }
        if (arg == "--") {
            optionsDone = true;
            continue;
        }
        
        size_t start = arg.find_first_not_of('-');
        if (start == std::string::npos) {
            return ConfigParseResult::Error("Invalid option: " + arg, "<command-line>");
        }
        std::string body = arg.substr(start);
        
        std::string key;
        std::string value;
        size_t eqPos = body.find('=');
        if (eqPos != std::string::npos) {
            key = body.substr(0, eqPos);
            value = body.substr(eqPos + 1);
        } else {
            key = body;
            value = "true";
            if (key.size() > 2 && key.compare(0, 2, "no") == 0 &&
                std::islower(static_cast<unsigned char>(key[2]))) {
                key = key.substr(2);
                value = "false";
            }
        }
        
        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid option: " + arg, "<command-line>");
        }
        Store(key, value, "<command-line>", 0, true);
    }
    
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::LoadConfigFile() {
    auto explicitPath = TryGetString(ConfigKeys::CONF);
    if (explicitPath) {
        return ParseFile(*explicitPath, false);
    }
    
    std::string path = GetDataDir() + "/" + DEFAULT_CONFIG_FILENAME;
    std::ifstream existing(path);
    if (!existing.is_open()) {
        return ConfigParseResult::Success();
    }
    existing.close();
    return ParseFile(path, false);
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return entries_.count(key) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue) const {
    return TryGetString(key).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str || str->empty()) {
        return std::nullopt;
    }
    
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(str->c_str(), &end, 10);
    if (errno == ERANGE || end == str->c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue) const {
    return TryGetInt(key).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str || str->empty() || !std::isdigit(static_cast<unsigned char>((*str)[0]))) {
        return std::nullopt;
    }
    
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(str->c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue) const {
    return TryGetUInt(key).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    return TryGetBool(key).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key, const std::string& defaultValue) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue)));
}

std::optional<ConfigEntry> ConfigManager::GetEntry(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value) {
    Store(key, value, "<programmatic>", 0, true);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value) {
    if (entries_.count(key) > 0) {
        return;
    }
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[key] = entry;
}

// ============================================================================
// Validation and Utilities
// ============================================================================

void ConfigManager::AllowKey(const std::string& key) {
    allowedKeys_.insert(key);
}

std::vector<std::string> ConfigManager::UnknownKeys() const {
    std::vector<std::string> unknown;
    if (allowedKeys_.empty()) {
        return unknown;
    }
    for (const auto& [key, entry] : entries_) {
        if (allowedKeys_.count(key) == 0) {
            unknown.push_back(key + " (" + entry.source + ")");
        }
    }
    return unknown;
}

void ConfigManager::Clear() {
    entries_.clear();
    allowedKeys_.clear();
}

std::string ConfigManager::GetDataDir() const {
    auto dir = TryGetString(ConfigKeys::DATADIR);
    if (!dir || dir->empty()) {
        return GetDefaultDataDir();
    }
    return ExpandEnvVars(ExpandTilde(*dir));
}

std::string ConfigManager::GenerateSampleConfig() {
    std::ostringstream oss;
    
    oss << "# LOCKBOX Configuration File\n\n";
    
    oss << "# Data directory holding the ledger database and keys (default: ~/.lockbox)\n";
    oss << "#datadir=~/.lockbox\n\n";
    
    oss << "# Log level: trace, debug, info, warn, error, off\n";
    oss << "#loglevel=info\n\n";
    
    oss << "# Also write log lines to this file\n";
    oss << "#logfile=~/.lockbox/lockbox.log\n\n";
    
    oss << "# Print log lines to the console\n";
    oss << "#printtoconsole=1\n\n";
    
    oss << "# Program id (64 hex characters); defaults to the built-in id\n";
    oss << "#programid=\n\n";
    
    oss << "[rent]\n";
    oss << "# Rent-exempt minimum = (128 + data bytes) * lamportsperbyteyear * exemptionthreshold\n";
    oss << "#lamportsperbyteyear=3480\n";
    oss << "#exemptionthreshold=2\n";
    
    return oss.str();
}

} // namespace util
} // namespace lockbox
