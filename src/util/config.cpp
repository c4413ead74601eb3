// TALLY - Configuration File Parser Implementation
// Copyright (c) 2024 TALLY Developers
// MIT License

#include "tally/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace tally {
namespace util {

// ============================================================================
// ConfigParseResult
// ============================================================================

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "ok";
    }
    std::string out;
    if (!errorFile.empty()) {
        out += errorFile;
        if (errorLine > 0) {
            out += ":" + std::to_string(errorLine);
        }
        out += ": ";
    }
    return out + errorMessage;
}

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
    if (first != last || (first != '"' && first != '\'')) {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }

    // Double quotes honour \n \t \r \\ \"
    std::string unescaped;
    unescaped.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            switch (inner[i + 1]) {
                case 'n':  unescaped += '\n'; ++i; continue;
                case 't':  unescaped += '\t'; ++i; continue;
                case 'r':  unescaped += '\r'; ++i; continue;
                case '\\': unescaped += '\\'; ++i; continue;
                case '"':  unescaped += '"';  ++i; continue;
                default: break;
            }
        }
        unescaped += inner[i];
    }
    return unescaped;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.') {
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
            size_t nameStart;
            size_t nameEnd;
            size_t resume;
            if (value[i + 1] == '{') {
                nameStart = i + 2;
                nameEnd = value.find('}', nameStart);
                if (nameEnd == std::string::npos) {
                    result += value.substr(i);
                    break;
                }
                resume = nameEnd + 1;
            } else {
                nameStart = i + 1;
                nameEnd = nameStart;
                while (nameEnd < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                        value[nameEnd] == '_')) {
                    ++nameEnd;
                }
                resume = nameEnd;
            }

            if (nameEnd > nameStart) {
                std::string varName = value.substr(nameStart, nameEnd - nameStart);
                if (const char* envValue = std::getenv(varName.c_str())) {
                    result += envValue;
                }
                i = resume;
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
    if (const char* homeEnv = std::getenv("HOME")) {
        home = homeEnv;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }

    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        return DEFAULT_DATADIR_NAME;
    }
    return std::string(home) + "/" + DEFAULT_DATADIR_NAME;
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
                          int lineNum, bool isDefault) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = source;
    entry.lineNumber = lineNum;
    entry.isDefault = isDefault;
    entries_[MakeKey(key, section)] = std::move(entry);
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
        ConfigParseResult includeResult = ParseFile(includePath);
        --includeDepth_;

        if (!includeResult.success) {
            result = includeResult;
            return false;
        }
        return true;
    }

    size_t eqPos = trimmed.find('=');
    std::string key;
    std::string value;

    if (eqPos == std::string::npos) {
        // Bare flag; "nofoo" means foo=false
        key = trimmed;
        value = "true";
        if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid character in key: " + key, source, lineNum);
        return false;
    }

    Store(key, value, currentSection, source, lineNum, false);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string currentSection;
    std::string line;
    std::string continuation;
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
            continuation += line.substr(0, line.length() - 1);
            continue;
        }
        if (!continuation.empty()) {
            line = continuation + line;
            continuation.clear();
        }

        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            return result;
        }
    }

    if (!continuation.empty() &&
        !ParseLine(continuation, source, lineNum, currentSection, result)) {
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

ConfigParseResult ConfigManager::ParseCommandLine(int argc, char* argv[],
                                                  std::vector<std::string>* positional) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.size() < 2 || arg[0] != '-') {
            if (positional) {
                positional->push_back(arg);
            }
            continue;
        }

        arg.erase(0, arg.find_first_not_of('-'));
        if (arg.empty()) {
            continue;
        }

        std::string key;
        std::string value;
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else if (arg.length() > 2 && arg.compare(0, 2, "no") == 0 &&
                   std::islower(static_cast<unsigned char>(arg[2]))) {
            key = arg.substr(2);
            value = "false";
        } else {
            key = arg;
            value = "true";
        }

        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid option: " + std::string(argv[i]),
                                            "<command-line>");
        }

        commandLine_[key] = value;
        Store(key, value, "", "<command-line>", 0, false);
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::LoadConfigFile() {
    std::string confPath;
    bool explicitConf = false;

    if (auto conf = TryGetString(ConfigKeys::CONF)) {
        confPath = ExpandEnvVars(ExpandTilde(*conf));
        explicitConf = true;
    } else {
        confPath = GetDataDir() + "/" + DEFAULT_CONFIG_FILENAME;
    }

    std::ifstream confFile(confPath);
    if (!confFile.is_open()) {
        if (explicitConf) {
            return ConfigParseResult::Error("Cannot open file: " + confPath);
        }
        return ConfigParseResult::Success();
    }
    confFile.close();

    auto result = ParseFile(confPath);
    if (!result.success) {
        return result;
    }

    // Command line beats the file
    for (const auto& [key, value] : commandLine_) {
        Store(key, value, "", "<command-line>", 0, false);
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
        size_t pos;
        int64_t value = std::stoll(*str, &pos);

        std::string suffix = Trim(str->substr(pos));
        if (!suffix.empty()) {
            switch (std::tolower(static_cast<unsigned char>(suffix[0]))) {
                case 'k': value *= 1024; break;
                case 'm': value *= 1024 * 1024; break;
                case 'g': value *= 1024LL * 1024 * 1024; break;
                default: return std::nullopt;
            }
        }
        return value;
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
    Store(key, value, section, "<programmatic>", 0, false);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    if (entries_.find(MakeKey(key, section)) == entries_.end()) {
        Store(key, value, section, "<default>", 0, true);
    }
}

void ConfigManager::SetDefaultFromEnv(const std::string& key, const char* envVar) {
    const char* value = std::getenv(envVar);
    if (value && *value) {
        if (entries_.find(key) == entries_.end()) {
            Store(key, value, "", std::string("<env:") + envVar + ">", 0, false);
        }
    }
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
    commandLine_.clear();
    includeDepth_ = 0;
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

std::string ConfigManager::GetDataDir() const {
    auto dir = TryGetString(ConfigKeys::DATADIR);
    if (!dir || dir->empty()) {
        return GetDefaultDataDir();
    }
    return ExpandEnvVars(ExpandTilde(*dir));
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    oss << "# Configuration Dump (" << entries_.size() << " entries)\n";

    std::map<std::string, std::vector<const ConfigEntry*>> bySection;
    for (const auto& [fullKey, entry] : entries_) {
        bySection[entry.section].push_back(&entry);
    }

    for (const auto& [section, entries] : bySection) {
        if (!section.empty()) {
            oss << "[" << section << "]\n";
        }
        for (const ConfigEntry* entry : entries) {
            bool secret = entry->key.find("secret") != std::string::npos;
            oss << entry->key << "=" << (secret ? "****" : entry->value);
            if (entry->isDefault) {
                oss << "  # (default)";
            } else {
                oss << "  # " << entry->source;
                if (entry->lineNumber > 0) {
                    oss << ":" << entry->lineNumber;
                }
            }
            oss << "\n";
        }
    }
    return oss.str();
}

} // namespace util
} // namespace tally
