// MILESCROW - Configuration File Parser Implementation
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include "milescrow/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace milescrow {
namespace util {

namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

std::string Trim(const std::string& str) {
    size_t start = 0;
    size_t end = str.size();
    while (start < end && IsSpace(str[start])) ++start;
    while (end > start && IsSpace(str[end - 1])) --end;
    return str.substr(start, end - start);
}

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

bool IsValidName(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), IsNameChar);
}

/**
 * Parses one source into a staging map so a failure never leaves a
 * partially applied file behind.
 */
class SourceParser {
public:
    using Sections = std::map<std::string, std::map<std::string, ConfigEntry>>;

    explicit SourceParser(const std::string& source) : source_(source) {}

    ConfigParseResult Parse(std::istream& in) {
        std::string line;
        int lineNum = 0;
        while (std::getline(in, line)) {
            ++lineNum;
            std::string error = ParseLine(Trim(line), lineNum);
            if (!error.empty()) {
                return ConfigParseResult::Error(error, source_, lineNum);
            }
        }
        return ConfigParseResult::Success();
    }

    Sections& Result() { return parsed_; }

private:
    // Returns an error message, empty on success
    std::string ParseLine(const std::string& line, int lineNum) {
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            return "";
        }

        if (line[0] == '[') {
            if (line.back() != ']') {
                return "section header must end with ']'";
            }
            std::string name = Trim(line.substr(1, line.size() - 2));
            if (!IsValidName(name)) {
                return "invalid section name '" + name + "'";
            }
            section_ = name;
            parsed_[section_];
            return "";
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return "expected key = value";
        }

        std::string key = Trim(line.substr(0, eq));
        if (!IsValidName(key)) {
            return "invalid key '" + key + "'";
        }

        auto& entries = parsed_[section_];
        auto existing = entries.find(key);
        if (existing != entries.end()) {
            return "duplicate key '" + key + "' (first set on line " +
                   std::to_string(existing->second.line) + ")";
        }

        std::string value;
        std::string error = ParseValue(Trim(line.substr(eq + 1)), value);
        if (!error.empty()) {
            return error;
        }

        entries[key] = ConfigEntry{value, source_, lineNum};
        return "";
    }

    static std::string ParseValue(const std::string& raw, std::string& out) {
        if (raw.empty()) {
            out.clear();
            return "";
        }

        if (raw[0] == '\'') {
            size_t close = raw.find('\'', 1);
            if (close == std::string::npos) {
                return "unterminated quoted value";
            }
            if (!IsTrailerOnly(raw, close + 1)) {
                return "unexpected text after quoted value";
            }
            out = raw.substr(1, close - 1);
            return "";
        }

        std::string text;
        if (raw[0] == '"') {
            size_t i = 1;
            bool closed = false;
            for (; i < raw.size(); ++i) {
                char c = raw[i];
                if (c == '"') {
                    closed = true;
                    break;
                }
                if (c == '\\' && i + 1 < raw.size()) {
                    char next = raw[++i];
                    switch (next) {
                        case 'n': text += '\n'; break;
                        case 't': text += '\t'; break;
                        case '"': text += '"'; break;
                        case '\\': text += '\\'; break;
                        default: text += '\\'; text += next; break;
                    }
                    continue;
                }
                text += c;
            }
            if (!closed) {
                return "unterminated quoted value";
            }
            if (!IsTrailerOnly(raw, i + 1)) {
                return "unexpected text after quoted value";
            }
        } else {
            // '#' or ';' after whitespace starts a trailing comment
            size_t end = raw.size();
            for (size_t i = 1; i < raw.size(); ++i) {
                if ((raw[i] == '#' || raw[i] == ';') && IsSpace(raw[i - 1])) {
                    end = i;
                    break;
                }
            }
            text = Trim(raw.substr(0, end));
        }

        auto expanded = ConfigManager::ExpandEnvVars(text);
        if (!expanded) {
            return "undefined or malformed ${...} reference in '" + text + "'";
        }
        out = *expanded;
        return "";
    }

    static bool IsTrailerOnly(const std::string& raw, size_t pos) {
        std::string rest = Trim(raw.substr(pos));
        return rest.empty() || rest[0] == '#' || rest[0] == ';';
    }

    std::string source_;
    std::string section_;
    Sections parsed_;
};

std::optional<bool> ParseBoolWord(std::string word) {
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (word == "true" || word == "yes" || word == "on" || word == "1") return true;
    if (word == "false" || word == "no" || word == "off" || word == "0") return false;
    return std::nullopt;
}

} // namespace

// ============================================================================
// ConfigParseResult
// ============================================================================

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "ok";
    }
    std::ostringstream ss;
    if (!errorFile.empty()) {
        ss << errorFile << ':';
        if (errorLine > 0) ss << errorLine << ':';
        ss << ' ';
    }
    ss << errorMessage;
    return ss.str();
}

// ============================================================================
// Parsing
// ============================================================================

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file) {
        return ConfigParseResult::Error("cannot open config file", filePath);
    }

    const std::streamoff size = file.tellg();
    if (size < 0 || static_cast<size_t>(size) > MAX_CONFIG_SIZE) {
        return ConfigParseResult::Error("config file exceeds " +
                                        std::to_string(MAX_CONFIG_SIZE) + " bytes", filePath);
    }
    file.seekg(0);

    std::ostringstream content;
    content << file.rdbuf();
    return ParseString(content.str(), filePath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream in(content);
    SourceParser parser(sourceName);
    ConfigParseResult result = parser.Parse(in);
    if (!result.success) {
        return result;
    }
    for (auto& [name, entries] : parser.Result()) {
        auto& section = sections_[name];
        for (auto& [key, entry] : entries) {
            section[key] = std::move(entry);
        }
    }
    return result;
}

std::optional<std::string> ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    size_t pos = 0;
    while (true) {
        size_t start = value.find("${", pos);
        if (start == std::string::npos) {
            result.append(value, pos, std::string::npos);
            return result;
        }
        size_t close = value.find('}', start + 2);
        if (close == std::string::npos) {
            return std::nullopt;
        }
        std::string name = value.substr(start + 2, close - start - 2);
        const char* env = name.empty() ? nullptr : std::getenv(name.c_str());
        if (!env) {
            return std::nullopt;
        }
        result.append(value, pos, start - pos);
        result += env;
        pos = close + 1;
    }
}

// ============================================================================
// Lookup
// ============================================================================

const ConfigManager::Section* ConfigManager::GetSection(const std::string& section) const {
    auto it = sections_.find(section);
    return it == sections_.end() ? nullptr : &it->second;
}

const ConfigEntry* ConfigManager::Find(const std::string& key,
                                       const std::string& section) const {
    const Section* entries = GetSection(section);
    if (!entries) {
        return nullptr;
    }
    auto it = entries->find(key);
    return it == entries->end() ? nullptr : &it->second;
}

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return Find(key, section) != nullptr;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (!entry) {
        return std::nullopt;
    }
    return entry->value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (!entry || entry->value.empty()) {
        return std::nullopt;
    }

    uint64_t result = 0;
    constexpr uint64_t max = std::numeric_limits<uint64_t>::max();
    for (char c : entry->value) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (result > (max - digit) / 10) {
            return std::nullopt;
        }
        result = result * 10 + digit;
    }
    return result;
}

uint64_t ConfigManager::GetUInt(const std::string& key,
                                uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (!entry) {
        return std::nullopt;
    }
    return ParseBoolWord(entry->value);
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    sections_[section][key] = ConfigEntry{value, "<set>", 0};
}

std::vector<std::string> ConfigManager::GetSections() const {
    std::vector<std::string> names;
    for (const auto& [name, entries] : sections_) {
        if (!name.empty()) {
            names.push_back(name);
        }
    }
    return names;
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    if (const Section* entries = GetSection(section)) {
        for (const auto& [key, entry] : *entries) {
            keys.push_back(key);
        }
    }
    return keys;
}

std::vector<std::string> ConfigManager::UnknownKeys(
    const std::string& section, std::initializer_list<const char*> allowed) const {
    std::vector<std::string> unknown;
    for (const auto& key : GetKeys(section)) {
        bool known = std::any_of(allowed.begin(), allowed.end(),
                                 [&key](const char* name) { return key == name; });
        if (!known) {
            unknown.push_back(key);
        }
    }
    return unknown;
}

void ConfigManager::Clear() {
    sections_.clear();
}

size_t ConfigManager::Size() const {
    size_t total = 0;
    for (const auto& [name, entries] : sections_) {
        total += entries.size();
    }
    return total;
}

} // namespace util
} // namespace milescrow
