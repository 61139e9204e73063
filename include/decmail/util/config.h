// DECMAIL - Configuration
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// INI-style settings for decmail-tool and the mailbox:
//
//   # comment            ; comment
//   [mailbox]
//   fanout_threads = 4
//   resolver_cache = yes
//   nocolor                      (flag; "color=false")
//   name = "quoted \"value\""    (escapes only inside double quotes)
//   seed = ${DECMAIL_SEED}       (environment expansion)
//   list = a, b, \               (trailing backslash joins the next line)
//          c
//
// A source is applied all or nothing: when parsing fails nothing it
// defined is kept. Later definitions of a key replace earlier ones.

#ifndef DECMAIL_UTIL_CONFIG_H
#define DECMAIL_UTIL_CONFIG_H

#include <decmail/util/logging.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace decmail {
namespace util {

constexpr const char* DEFAULT_CONFIG_FILENAME = "decmail.conf";

/// Larger files or strings are rejected
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Per physical line, before continuations are joined
constexpr size_t MAX_LINE_LENGTH = 4096;

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // "" is the global section
    std::string source;    // file path, "<string>" or "<programmatic>"
    int lineNumber{0};
};

struct ConfigParseResult {
    bool success{true};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Ok() { return {}; }

    static ConfigParseResult Fail(std::string message, std::string file = "", int line = 0) {
        return {false, std::move(message), std::move(file), line};
    }
};

// ============================================================================
// ConfigManager
// ============================================================================

class ConfigManager {
public:
    ConfigParseResult ParseFile(const std::string& filePath);
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key, const std::string& defaultValue,
                          const std::string& section = "") const;

    /// nullopt when missing or not entirely a number
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// As TryGetInt, negative values included in nullopt
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Comma separated items, trimmed, empty ones dropped
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    void Clear() { sections_.clear(); }
    size_t Size() const;

    /// Entries of one section ordered by key
    std::vector<ConfigEntry> GetEntries(const std::string& section = "") const;

    /// Replaces ${NAME} with the variable's value, or nothing when unset
    static std::string ExpandEnvVars(const std::string& value);

    /// true/yes/on/1 and false/no/off/0, any case
    static std::optional<bool> ParseBool(const std::string& str);

private:
    const ConfigEntry* Find(const std::string& key, const std::string& section) const;
    void Store(ConfigEntry entry);

    ConfigParseResult Parse(const std::string& content, const std::string& source);

    // section -> key -> entry
    std::map<std::string, std::map<std::string, ConfigEntry>> sections_;
};

// ============================================================================
// Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* LOG_SECTION = "log";
    constexpr const char* LOG_LEVEL = "level";
    constexpr const char* LOG_CATEGORIES = "categories";   // list, or "all"
    constexpr const char* LOG_COLOR = "color";

    constexpr const char* MAILBOX_SECTION = "mailbox";
    constexpr const char* FANOUT_THREADS = "fanout_threads";
    constexpr const char* RECEIVE_LIMIT = "receive_limit";
    constexpr const char* RESOLVER_CACHE = "resolver_cache";
}

/**
 * Sets the global logger level and category filter from [log] and returns
 * the console sink settings it implies. Unknown level names are ignored with
 * a warning.
 */
ConsoleSink::Config ApplyLogConfig(const ConfigManager& config);

} // namespace util
} // namespace decmail

#endif // DECMAIL_UTIL_CONFIG_H
