// DECMAIL - Logging Implementation
// Copyright (c) 2024 DECMAIL Developers
// MIT License

#include <decmail/util/logging.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace decmail {
namespace util {

// ============================================================================
// Levels
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> TryParseLogLevel(const std::string& str) {
    std::string name;
    name.reserve(str.size());
    for (unsigned char c : str) {
        name += static_cast<char>(std::tolower(c));
    }

    static const std::pair<const char*, LogLevel> names[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},   {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn}, {"error", LogLevel::Error},
        {"off", LogLevel::Off},     {"none", LogLevel::Off},
    };
    for (const auto& [text, level] : names) {
        if (name == text) {
            return level;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Helpers
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

std::string GetBasename(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// ============================================================================
// ConsoleSink
// ============================================================================

namespace {

const char* ColorOf(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default:              return "";
    }
}

} // namespace

ConsoleSink::ConsoleSink() : ConsoleSink(Config()) {}

ConsoleSink::ConsoleSink(const Config& config)
    : LogSink(config.level), config_(config) {}

std::string ConsoleSink::Format(const LogRecord& record) const {
    std::ostringstream line;
    if (config_.showTimestamp) {
        line << FormatLogTimestamp(record.time) << ' ';
    }
    line << std::left << std::setw(5) << LogLevelToString(record.level) << ' ';
    if (config_.showCategory && !record.category.empty()) {
        line << '[' << record.category << "] ";
    }
    if (config_.showThread) {
        line << "(" << record.thread << ") ";
    }
    line << record.message;
    return line.str();
}

void ConsoleSink::Write(const LogRecord& record) {
    std::string text = Format(record);
    FILE* out = (config_.stderrOnly || record.level >= LogLevel::Error) ? stderr : stdout;

    std::lock_guard<std::mutex> lock(mutex_);
    const char* color = ColorOf(record.level);
    if (config_.useColors && *color != '\0' && isatty(fileno(out))) {
        std::fprintf(out, "%s%s\033[0m\n", color, text.c_str());
    } else {
        std::fprintf(out, "%s\n", text.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::SetCategories(const std::vector<std::string>& categories) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_ = std::set<std::string>(categories.begin(), categories.end());
    filtered_.store(!categories_.empty());
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    if (!filtered_.load()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return categories_.count(category) != 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level != LogLevel::Off && level >= level_.load() && IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogRecord record;
    record.level = level;
    record.category = category;
    record.message = message;
    record.file = file ? file : "";
    record.line = line;
    record.time = std::chrono::system_clock::now();
    record.thread = std::this_thread::get_id();

    // Sinks run outside the lock so that one may log itself
    std::vector<std::shared_ptr<LogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->Submit(record);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

} // namespace util
} // namespace decmail
