// DECMAIL - Logging
// Copyright (c) 2024 DECMAIL Developers
// MIT License
//
// Leveled logging with per-subsystem categories and pluggable sinks.
//
// The library itself never installs a sink: records produced by library code
// go nowhere until the application (decmail-tool, a test) adds one. Each
// record passes two filters, the logger level plus category filter checked
// before the message is even formatted, and the threshold of every sink.

#ifndef DECMAIL_UTIL_LOGGING_H
#define DECMAIL_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace decmail {
namespace util {

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; accepts "warning" and "none" as aliases
std::optional<LogLevel> TryParseLogLevel(const std::string& str);

/// One category per subsystem
namespace LogCategory {
    constexpr const char* KEYS = "keys";           // derivation, codecs
    constexpr const char* RESOLVE = "resolve";     // name and key lookups
    constexpr const char* TRANSPORT = "transport"; // storage backends
    constexpr const char* MAILBOX = "mailbox";
    constexpr const char* PROTECT = "protect";     // signing, encryption
    constexpr const char* CLAIM = "claim";
    constexpr const char* CONFIG = "config";
    constexpr const char* TOOL = "tool";
}

// ============================================================================
// Records and Sinks
// ============================================================================

struct LogRecord {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point time;
    std::thread::id thread;
};

/**
 * Destination of log records. Records below the sink level are dropped
 * before Write is called.
 */
class LogSink {
public:
    explicit LogSink(LogLevel level = LogLevel::Info) : level_(level) {}
    virtual ~LogSink() = default;

    void Submit(const LogRecord& record) {
        if (record.level >= level_.load()) {
            Write(record);
        }
    }

    virtual void Flush() {}

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

protected:
    virtual void Write(const LogRecord& record) = 0;

private:
    std::atomic<LogLevel> level_;
};

/// Human readable lines on stdout, errors on stderr
class ConsoleSink : public LogSink {
public:
    struct Config {
        bool useColors{true};           // ANSI colors when the stream is a tty
        bool stderrOnly{false};         // every level to stderr
        bool showTimestamp{true};
        bool showCategory{true};
        bool showThread{false};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Flush() override;

    const Config& GetConfig() const { return config_; }

    /// Line for a record, without color codes or newline
    std::string Format(const LogRecord& record) const;

protected:
    void Write(const LogRecord& record) override;

private:
    Config config_;
    std::mutex mutex_;
};

/// Hands records to a function; used to capture logs in tests
class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : LogSink(level), callback_(std::move(callback)) {}

protected:
    void Write(const LogRecord& record) override {
        if (callback_) {
            callback_(record);
        }
    }

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void AddSink(std::shared_ptr<LogSink> sink);
    void RemoveSink(const std::shared_ptr<LogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Only log the given categories; an empty list logs all of them
    void SetCategories(const std::vector<std::string>& categories);

    bool IsCategoryEnabled(const std::string& category) const;

    /// Whether a record of this level and category reaches the sinks
    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

private:
    Logger() = default;

    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};

    std::set<std::string> categories_;
    std::atomic<bool> filtered_{false};
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// LogStream
// ============================================================================

/// Collects a message with operator<< and logs it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
    }

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Macros
// ============================================================================

/// Stream a record; the operands are not evaluated when it would be dropped
#define DECMAIL_LOG(level, category) \
    if (!::decmail::util::Logger::Instance().WillLog(::decmail::util::LogLevel::level, category)) { \
    } else \
        ::decmail::util::LogStream(::decmail::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category) DECMAIL_LOG(Trace, category)
#define LOG_DEBUG(category) DECMAIL_LOG(Debug, category)
#define LOG_INFO(category)  DECMAIL_LOG(Info, category)
#define LOG_WARN(category)  DECMAIL_LOG(Warn, category)
#define LOG_ERROR(category) DECMAIL_LOG(Error, category)

// ============================================================================
// Helpers
// ============================================================================

/// Local time as "YYYY-MM-DD HH:MM:SS.mmm"
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Last component of a path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace decmail

#endif // DECMAIL_UTIL_LOGGING_H
