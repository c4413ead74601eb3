// TALLY - Logging System
// Copyright (c) 2024 TALLY Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks:
// - Levels TRACE..FATAL, global threshold plus per-sink threshold
// - Categories per subsystem, optionally restricted with EnableCategory
// - Console, append-only file and callback sinks
// - Stream-style macros: LOG_INFO(LogCategory::LEDGER) << ...

#ifndef TALLY_UTIL_LOGGING_H
#define TALLY_UTIL_LOGGING_H

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

namespace tally {
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

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (unknown strings map to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* ALLOC = "alloc";
    constexpr const char* RECON = "recon";
    constexpr const char* AUTH = "auth";
    constexpr const char* DB = "db";
    constexpr const char* HTTP = "http";
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

/// Which decorations a sink prepends to the message
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showThread{false};
    bool showLocation{false};
};

/// Render an entry as a single line (no trailing newline)
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Log Sink Interface
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Writes to stdout, optionally routing errors to stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{false};
        LogFormat format;
        LogLevel level{LogLevel::Info};
    };

    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;

    static const char* ColorCode(LogLevel level);
};

// ============================================================================
// File Sink
// ============================================================================

/// Appends to a file; entries at Error and above are flushed immediately
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool autoFlush{false};
        LogFormat format{true, true, true, true, false};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
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

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install a default console sink if no sink has been added yet
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void ClearSinks();

    void SetLevel(LogLevel level) { level_.store(level); }

    /// Restrict output to the enabled categories (first call switches from "all")
    void EnableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

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
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
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
    std::string category_;
    const char* file_;
    int line_;
    const char* function_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define TALLY_LOGGER ::tally::util::Logger::Instance()

#define TALLY_LOG_ENABLED(level, category) \
    TALLY_LOGGER.WillLog(::tally::util::LogLevel::level, category)

#define TALLY_LOG(level, category) \
    if (!TALLY_LOG_ENABLED(level, category)) {} else \
        ::tally::util::LogStream(::tally::util::LogLevel::level, category, \
                                 __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   TALLY_LOG(Trace, category)
#define LOG_DEBUG(category)   TALLY_LOG(Debug, category)
#define LOG_INFO(category)    TALLY_LOG(Info, category)
#define LOG_WARN(category)    TALLY_LOG(Warn, category)
#define LOG_ERROR(category)   TALLY_LOG(Error, category)
#define LOG_FATAL(category)   TALLY_LOG(Fatal, category)

} // namespace util
} // namespace tally

#endif // TALLY_UTIL_LOGGING_H
