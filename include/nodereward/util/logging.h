// NODEREWARD - Logging System
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Provides a flexible logging system with:
// - Multiple log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Log categories for filtering
// - Console, rotating file and callback output
// - Printf-style and stream-style interfaces

#ifndef NODEREWARD_UTIL_LOGGING_H
#define NODEREWARD_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace nodereward {
namespace util {

class ConfigManager;

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Very detailed debugging
    Debug = 1,   // Rejected calls, internal decisions
    Info = 2,    // Committed state transitions
    Warn = 3,    // Trips, pauses, anomalies, capacity rejections
    Error = 4,   // Infrastructure failures
    Fatal = 5,
    Off = 6      // Disable logging
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (unknown strings map to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* REWARDS = "rewards";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* SLASHING = "slashing";
    constexpr const char* RESILIENCE = "resilience";
    constexpr const char* TIMELOCK = "timelock";
    constexpr const char* ANOMALY = "anomaly";
    constexpr const char* EVENTS = "events";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sink Interface
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // ANSI colors when attached to a tty
        bool useStderr{false};          // Errors go to stderr
        bool showTimestamp{true};
        bool showLevel{true};
        bool showCategory{true};
        bool showLocation{false};       // file:line
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// File Sink
// ============================================================================

/// Log sink that writes to a file with size-based rotation
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};             // Rotated files kept as path.1 .. path.N
        bool rotate{true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool Open(const std::string& path);
    void Close();
    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    size_t GetCurrentSize() const { return currentSize_; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    std::string Format(const LogEntry& entry) const;
    void Rotate();
};

// ============================================================================
// Callback Sink
// ============================================================================

class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    /// Get the singleton instance
    static Logger& Instance();

    /// Install a default console sink (idempotent)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    const char* function_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define NODEREWARD_LOGGER ::nodereward::util::Logger::Instance()

#define NODEREWARD_LOG_ENABLED(level, category) \
    NODEREWARD_LOGGER.WillLog(::nodereward::util::LogLevel::level, category)

#define NODEREWARD_LOG(level, category) \
    if (NODEREWARD_LOG_ENABLED(level, category)) \
        ::nodereward::util::LogStream(::nodereward::util::LogLevel::level, category, \
                                      __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   NODEREWARD_LOG(Trace, category)
#define LOG_DEBUG(category)   NODEREWARD_LOG(Debug, category)
#define LOG_INFO(category)    NODEREWARD_LOG(Info, category)
#define LOG_WARN(category)    NODEREWARD_LOG(Warn, category)
#define LOG_ERROR(category)   NODEREWARD_LOG(Error, category)

#define NODEREWARD_LOGF(level, category, ...) \
    do { \
        if (NODEREWARD_LOG_ENABLED(level, category)) { \
            NODEREWARD_LOGGER.LogF(::nodereward::util::LogLevel::level, category, \
                                   __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while(0)

#define LogDebugF(category, ...)  NODEREWARD_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   NODEREWARD_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   NODEREWARD_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  NODEREWARD_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// RAII timer that logs the duration of a scope at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Setup
// ============================================================================

/**
 * Configure the global logger from the [logging] section:
 *   level   - trace|debug|info|warn|error|off (default info)
 *   console - enable the console sink (default true)
 *   colors  - ANSI colors on the console (default true)
 *   file    - optional path of a rotating log file
 * Existing sinks are replaced. Returns false if the log file cannot be opened.
 */
bool InitializeLogging(const ConfigManager& config);

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace nodereward

#endif // NODEREWARD_UTIL_LOGGING_H
