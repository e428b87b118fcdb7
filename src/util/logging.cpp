// MILESCROW - Logging Implementation
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include "milescrow/util/logging.h"
#include "milescrow/util/config.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>

namespace milescrow {
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

std::optional<LogLevel> ParseLogLevel(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t time = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string GetBasename(const char* path) {
    if (!path) {
        return "";
    }
    std::string p(path);
    const size_t slash = p.find_last_of("/\\");
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format) {
    std::ostringstream ss;
    if (format.timestamp) {
        ss << FormatLogTimestamp(entry.timestamp) << ' ';
    }
    ss << '[' << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    if (format.category && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        ss << '[' << entry.category << "] ";
    }
    if (format.location && entry.file) {
        ss << GetBasename(entry.file) << ':' << entry.line << ' ';
    }
    ss << entry.message;
    return ss.str();
}

// ============================================================================
// Sinks
// ============================================================================

StreamSink::StreamSink(std::ostream& out, LogFormat format, LogLevel level)
    : ILogSink(level), out_(out), format_(format) {}

void StreamSink::Write(const LogEntry& entry) {
    const std::string line = FormatLogEntry(entry, format_);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
}

void StreamSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : ILogSink(level), callback_(std::move(callback)) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (callback_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
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

void Logger::SetLevel(LogLevel level) {
    level_.store(level);
}

void Logger::SetCategoryLevel(const std::string& category, LogLevel level) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categoryLevels_[category] = level;
}

void Logger::ClearCategoryLevels() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categoryLevels_.clear();
}

LogLevel Logger::GetEffectiveLevel(const std::string& category) const {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    auto it = categoryLevels_.find(category);
    return it != categoryLevels_.end() ? it->second : level_.load();
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level != LogLevel::Off && level >= GetEffectiveLevel(category);
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file;
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    // Sinks may log from Write (a callback calling back into escrow code)
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        if (sink->Accepts(level)) {
            sink->Write(entry);
        }
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

ConfigParseResult Logger::Configure(const ConfigManager& config) {
    std::optional<LogLevel> defaultLevel;
    std::map<std::string, LogLevel> overrides;

    for (const auto& key : config.GetKeys(LOG_CONFIG_SECTION)) {
        const std::string value = config.GetString(key, "", LOG_CONFIG_SECTION);
        auto level = ParseLogLevel(value);
        if (!level) {
            return ConfigParseResult::Error("[" + std::string(LOG_CONFIG_SECTION) + "] " +
                                            key + ": unknown log level '" + value + "'");
        }
        if (key == "level") {
            defaultLevel = *level;
        } else {
            overrides[key] = *level;
        }
    }

    if (defaultLevel) {
        SetLevel(*defaultLevel);
    }
    for (const auto& [category, level] : overrides) {
        SetCategoryLevel(category, level);
    }
    return ConfigParseResult::Success();
}

} // namespace util
} // namespace milescrow
