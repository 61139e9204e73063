// DECMAIL - Configuration
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include "decmail/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace decmail {
namespace util {

namespace {

std::string Trim(const std::string& str) {
    const char* blanks = " \t\r\n";
    size_t first = str.find_first_not_of(blanks);
    if (first == std::string::npos) {
        return {};
    }
    return str.substr(first, str.find_last_not_of(blanks) - first + 1);
}

char Unescape(char c) {
    switch (c) {
        case 'n': return '\n';
        case 't': return '\t';
        default:  return c;
    }
}

/// Strips matching quotes; double quotes also take \n \t \\ and \"
std::string Unquote(const std::string& str) {
    if (str.size() < 2 || str.front() != str.back() ||
        (str.front() != '"' && str.front() != '\'')) {
        return str;
    }
    std::string inner = str.substr(1, str.size() - 2);
    if (str.front() == '\'') {
        return inner;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        char next = i + 1 < inner.size() ? inner[i + 1] : '\0';
        if (inner[i] == '\\' && (next == 'n' || next == 't' || next == '\\' || next == '"')) {
            out += Unescape(next);
            ++i;
        } else {
            out += inner[i];
        }
    }
    return out;
}

bool IsKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

/// Turns config text into entries; stops at the first malformed line
class Parser {
public:
    explicit Parser(std::string source) : source_(std::move(source)) {}

    ConfigParseResult Run(std::istream& in, std::vector<ConfigEntry>& out) {
        std::string physical;
        std::string logical;
        while (std::getline(in, physical)) {
            ++lineNumber_;
            if (physical.size() > MAX_LINE_LENGTH) {
                return Fail("Line too long (max " + std::to_string(MAX_LINE_LENGTH) +
                            " characters)");
            }
            if (!physical.empty() && physical.back() == '\\') {
                logical.append(physical, 0, physical.size() - 1);
                continue;
            }
            logical += physical;
            if (auto error = Line(logical, out)) {
                return *error;
            }
            logical.clear();
        }
        if (!logical.empty()) {
            if (auto error = Line(logical, out)) {
                return *error;
            }
        }
        return ConfigParseResult::Ok();
    }

private:
    ConfigParseResult Fail(const std::string& message) const {
        return ConfigParseResult::Fail(message, source_, lineNumber_);
    }

    std::optional<ConfigParseResult> Line(const std::string& raw, std::vector<ConfigEntry>& out) {
        std::string line = Trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            return std::nullopt;
        }

        if (line[0] == '[') {
            size_t close = line.find(']');
            if (close == std::string::npos) {
                return Fail("Missing closing bracket in section header");
            }
            section_ = Trim(line.substr(1, close - 1));
            return std::nullopt;
        }

        ConfigEntry entry;
        size_t eq = line.find('=');
        if (eq != std::string::npos) {
            entry.key = Trim(line.substr(0, eq));
            entry.value = ConfigManager::ExpandEnvVars(Unquote(Trim(line.substr(eq + 1))));
        } else if (line.size() > 2 && line.compare(0, 2, "no") == 0 &&
                   std::islower(static_cast<unsigned char>(line[2]))) {
            entry.key = line.substr(2);
            entry.value = "false";
        } else {
            entry.key = line;
            entry.value = "true";
        }

        if (entry.key.empty()) {
            return Fail("Empty key");
        }
        auto bad = std::find_if_not(entry.key.begin(), entry.key.end(), IsKeyChar);
        if (bad != entry.key.end()) {
            return Fail(std::string("Invalid character in key: ") + *bad);
        }

        entry.section = section_;
        entry.source = source_;
        entry.lineNumber = lineNumber_;
        out.push_back(std::move(entry));
        return std::nullopt;
    }

    std::string source_;
    std::string section_;
    int lineNumber_{0};
};

} // namespace

// ============================================================================
// Parsing
// ============================================================================

ConfigParseResult ConfigManager::Parse(const std::string& content, const std::string& source) {
    if (content.size() > MAX_CONFIG_SIZE) {
        return ConfigParseResult::Fail(
            "Config too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", source);
    }

    std::istringstream in(content);
    std::vector<ConfigEntry> parsed;
    ConfigParseResult result = Parser(source).Run(in, parsed);
    if (!result.success) {
        return result;
    }
    for (auto& entry : parsed) {
        Store(std::move(entry));
    }
    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(filePath);
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ConfigParseResult::Fail("Cannot open file: " + path);
    }

    std::string content;
    char buffer[4096];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        content.append(buffer, static_cast<size_t>(file.gcount()));
        if (content.size() > MAX_CONFIG_SIZE) {
            break;
        }
    }

    ConfigParseResult result = Parse(content, path);
    if (result.success) {
        LOG_DEBUG(LogCategory::CONFIG) << "Loaded configuration from " << path;
    }
    return result;
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    return Parse(content, sourceName);
}

// ============================================================================
// Lookup
// ============================================================================

const ConfigEntry* ConfigManager::Find(const std::string& key, const std::string& section) const {
    auto sec = sections_.find(section);
    if (sec == sections_.end()) {
        return nullptr;
    }
    auto it = sec->second.find(key);
    return it == sec->second.end() ? nullptr : &it->second;
}

void ConfigManager::Store(ConfigEntry entry) {
    auto& section = sections_[entry.section];
    std::string key = entry.key;
    section[key] = std::move(entry);
}

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return Find(key, section) != nullptr;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    if (const ConfigEntry* entry = Find(key, section)) {
        return entry->value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto text = TryGetString(key, section);
    if (!text) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        long long value = std::stoll(*text, &used);
        if (!Trim(text->substr(used)).empty()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto value = TryGetInt(key, section);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto text = TryGetString(key, section);
    return text ? ParseBool(*text) : std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> items;
    auto text = TryGetString(key, section);
    if (!text) {
        return items;
    }
    size_t start = 0;
    while (start <= text->size()) {
        size_t comma = text->find(',', start);
        if (comma == std::string::npos) {
            comma = text->size();
        }
        std::string item = Trim(text->substr(start, comma - start));
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        start = comma + 1;
    }
    return items;
}

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";
    Store(std::move(entry));
}

size_t ConfigManager::Size() const {
    size_t count = 0;
    for (const auto& [name, keys] : sections_) {
        count += keys.size();
    }
    return count;
}

std::vector<ConfigEntry> ConfigManager::GetEntries(const std::string& section) const {
    std::vector<ConfigEntry> entries;
    auto sec = sections_.find(section);
    if (sec != sections_.end()) {
        for (const auto& [key, entry] : sec->second) {
            entries.push_back(entry);
        }
    }
    return entries;
}

// ============================================================================
// Value helpers
// ============================================================================

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    size_t pos = 0;
    while (pos < value.size()) {
        size_t open = value.find("${", pos);
        size_t close = open == std::string::npos ? open : value.find('}', open + 2);
        if (close == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        out.append(value, pos, open - pos);
        std::string name = value.substr(open + 2, close - open - 2);
        if (const char* env = std::getenv(name.c_str())) {
            out += env;
        }
        pos = close + 1;
    }
    return out;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower;
    std::transform(str.begin(), str.end(), std::back_inserter(lower),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const char* yes : {"true", "yes", "on", "1"}) {
        if (lower == yes) {
            return true;
        }
    }
    for (const char* no : {"false", "no", "off", "0"}) {
        if (lower == no) {
            return false;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Logging
// ============================================================================

ConsoleSink::Config ApplyLogConfig(const ConfigManager& config) {
    using namespace ConfigKeys;
    auto& logger = Logger::Instance();
    ConsoleSink::Config sink;

    if (auto name = config.TryGetString(LOG_LEVEL, LOG_SECTION)) {
        if (auto level = TryParseLogLevel(*name)) {
            logger.SetLevel(*level);
            sink.level = *level;
        } else {
            LOG_WARN(LogCategory::CONFIG) << "Ignoring unknown log level '" << *name << "'";
        }
    }

    if (config.HasKey(LOG_CATEGORIES, LOG_SECTION)) {
        auto categories = config.GetList(LOG_CATEGORIES, LOG_SECTION);
        bool all = std::find(categories.begin(), categories.end(), "all") != categories.end();
        logger.SetCategories(all ? std::vector<std::string>{} : categories);
    }

    sink.useColors = config.GetBool(LOG_COLOR, sink.useColors, LOG_SECTION);
    return sink;
}

} // namespace util
} // namespace decmail
