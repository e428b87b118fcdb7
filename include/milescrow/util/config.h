// MILESCROW - Configuration File Parser
// Copyright (c) 2024 MILESCROW Developers
// MIT License
//
// INI-style files describing escrow instances and logging.
//
//   # comment            ; comment
//   [escrow]
//   threshold_percentage = 77      # trailing comment
//   pool_id = ${ESCROW_POOL}
//   label = "quoted, with \"escapes\""
//
// A key may appear once per section of a source; a later source overrides
// values from an earlier one. Keys outside any section belong to
// the global section (""). ${VAR} is replaced from the environment and an
// undefined variable is a parse error.

#ifndef MILESCROW_UTIL_CONFIG_H
#define MILESCROW_UTIL_CONFIG_H

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace milescrow {
namespace util {

/// Largest config file ParseFile accepts (64 KiB)
constexpr size_t MAX_CONFIG_SIZE = 64 * 1024;

/**
 * One key/value definition and where it came from.
 */
struct ConfigEntry {
    std::string value;
    std::string source;
    int line{0};
};

/**
 * Outcome of a parse or of applying configuration.
 */
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

    /// "file:line: message", or "ok"
    std::string ToString() const;
};

/**
 * Configuration grouped by section.
 *
 * A failed parse leaves previously loaded values untouched.
 */
class ConfigManager {
public:
    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    bool HasKey(const std::string& key, const std::string& section = "") const;

    /// Entry with its source location, or nullptr
    const ConfigEntry* Find(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Decimal digits only; nullopt if missing, signed, or out of range
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    uint64_t GetUInt(const std::string& key,
                     uint64_t defaultValue,
                     const std::string& section = "") const;

    /// true/false, yes/no, on/off, 1/0 in any case
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Overrides (or adds) a value; the source is recorded as "<set>"
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    std::vector<std::string> GetSections() const;

    /// Keys of a section in sorted order
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Keys of a section not named in allowed
    std::vector<std::string> UnknownKeys(const std::string& section,
                                         std::initializer_list<const char*> allowed) const;

    void Clear();

    size_t Size() const;

    /// Replace ${VAR} references; nullopt on an undefined or unterminated reference
    static std::optional<std::string> ExpandEnvVars(const std::string& value);

private:
    using Section = std::map<std::string, ConfigEntry>;

    const Section* GetSection(const std::string& section) const;

    std::map<std::string, Section> sections_;
};

} // namespace util
} // namespace milescrow

#endif // MILESCROW_UTIL_CONFIG_H
