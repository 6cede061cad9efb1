// EQUORUM - Logging System
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// Category-filtered, leveled logging with pluggable sinks:
// - console output (optionally colored)
// - append-only log file
// - callback sink used by tests and embedders to observe log traffic

#ifndef EQUORUM_UTIL_LOGGING_H
#define EQUORUM_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace equorum {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

const char* LogLevelToString(LogLevel level);

/// Parse log level name (case-insensitive); unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* GOV = "gov";
    constexpr const char* TIMELOCK = "timelock";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

/// Which fields a sink renders in front of the message
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showLocation{false};
};

/// Render an entry as a single line (no trailing newline)
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

protected:
    bool Accepts(const LogEntry& entry) const { return entry.level >= level_.load(); }

private:
    std::atomic<LogLevel> level_{LogLevel::Trace};
};

/// Writes to stdout, or stderr for Error and above when configured
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{false};
        LogFormat format;
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a log file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }
    const std::string& GetPath() const { return path_; }

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
    LogFormat format_{true, true, true, true};
};

/// Forwards every accepted entry to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

    void Write(const LogEntry& entry) override;
    void Flush() override {}

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger
class Logger {
public:
    static Logger& Instance();

    /// Install the default console sink (idempotent)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    bool allCategoriesEnabled_{true};
    mutable std::mutex categoriesMutex_;

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line);
    ~LogStream();

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
// Logging Macros
// ============================================================================

#define EQUORUM_LOGGER ::equorum::util::Logger::Instance()

#define EQUORUM_LOG_ENABLED(level, category) \
    EQUORUM_LOGGER.WillLog(::equorum::util::LogLevel::level, category)

#define EQUORUM_LOG(level, category) \
    if (!EQUORUM_LOG_ENABLED(level, category)) {} else \
        ::equorum::util::LogStream(::equorum::util::LogLevel::level, category, \
                                   __FILE__, __LINE__)

#define LOG_TRACE(category)   EQUORUM_LOG(Trace, category)
#define LOG_DEBUG(category)   EQUORUM_LOG(Debug, category)
#define LOG_INFO(category)    EQUORUM_LOG(Info, category)
#define LOG_WARN(category)    EQUORUM_LOG(Warn, category)
#define LOG_ERROR(category)   EQUORUM_LOG(Error, category)

// ============================================================================
// Utility Functions
// ============================================================================

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace equorum

#endif // EQUORUM_UTIL_LOGGING_H
