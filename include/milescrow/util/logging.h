// MILESCROW - Logging
// Copyright (c) 2024 MILESCROW Developers
// MIT License
//
// Escrow code reports through a process-wide Logger:
// - one default level plus per-category overrides ("vote" at Debug while
//   everything else stays at Info)
// - sinks with their own minimum level (ostream or callback)
// - LOG_* stream macros that skip formatting when nothing would be written
// - levels loadable from the [log] section of a config file

#ifndef MILESCROW_UTIL_LOGGING_H
#define MILESCROW_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace milescrow {
namespace util {

class ConfigManager;
struct ConfigParseResult;

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,   // Individual votes and checks
    Info = 2,    // Committed state transitions
    Warn = 3,    // Refused operations
    Error = 4,   // Collaborator failures after commit
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; accepts "warning" for Warn
std::optional<LogLevel> ParseLogLevel(const std::string& str);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* ESCROW = "escrow";
    constexpr const char* VOTE = "vote";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* AUTH = "auth";
    constexpr const char* CONFIG = "config";
}

/// Config section read by Logger::Configure
constexpr const char* LOG_CONFIG_SECTION = "log";

// ============================================================================
// Entries and Formatting
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

/// Which fields FormatLogEntry prints in front of the message
struct LogFormat {
    bool timestamp{true};
    bool category{true};
    bool location{false};
};

/// "2024-05-01 12:00:00.123 [WARN ] [escrow] message"
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format = LogFormat());

/// Local time with millisecond resolution
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// File name without its directory
std::string GetBasename(const char* path);

// ============================================================================
// Sinks
// ============================================================================

/**
 * Destination for log entries.
 *
 * The Logger only hands a sink entries at or above the sink's level, so
 * implementations never filter by level themselves.
 */
class ILogSink {
public:
    explicit ILogSink(LogLevel level = LogLevel::Trace) : level_(level) {}
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }
    bool Accepts(LogLevel level) const { return level >= level_.load(); }

private:
    std::atomic<LogLevel> level_;
};

/// Writes formatted lines to a caller-owned stream (std::clog, a file, ...)
class StreamSink : public ILogSink {
public:
    explicit StreamSink(std::ostream& out, LogFormat format = LogFormat(),
                        LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    std::ostream& out_;
    LogFormat format_;
    std::mutex mutex_;
};

/// Hands every entry to a callback; used to capture output in tests
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    /// Level for categories without an override
    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }

    void SetCategoryLevel(const std::string& category, LogLevel level);
    void ClearCategoryLevels();

    /// Override for the category if one is set, the default level otherwise
    LogLevel GetEffectiveLevel(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

    /**
     * Apply levels from the [log] section.
     *
     *   [log]
     *   level = info      # default level
     *   vote = debug      # any other key names a category
     *
     * Nothing changes when a value does not name a level.
     */
    ConfigParseResult Configure(const ConfigManager& config);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::map<std::string, LogLevel> categoryLevels_;
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Stream Interface
// ============================================================================

/// Collects one message and hands it to the Logger when destroyed
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

#define MILESCROW_LOG(level, category) \
    if (!::milescrow::util::Logger::Instance().WillLog( \
            ::milescrow::util::LogLevel::level, category)) {} \
    else ::milescrow::util::LogStream(::milescrow::util::LogLevel::level, category, \
                                      __FILE__, __LINE__)

#define LOG_TRACE(category) MILESCROW_LOG(Trace, category)
#define LOG_DEBUG(category) MILESCROW_LOG(Debug, category)
#define LOG_INFO(category)  MILESCROW_LOG(Info, category)
#define LOG_WARN(category)  MILESCROW_LOG(Warn, category)
#define LOG_ERROR(category) MILESCROW_LOG(Error, category)

} // namespace util
} // namespace milescrow

#endif // MILESCROW_UTIL_LOGGING_H
