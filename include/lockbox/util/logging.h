// LOCKBOX - Logging
// Copyright (c) 2024 LOCKBOX Developers
// MIT License
//
// Levelled logging with pluggable sinks. Each record carries the subsystem
// that produced it (program, ledger, db, cli).
//
//   LOG_INFO(LogCategory::LEDGER) << "Committed deposit at slot " << slot;
//
// The stream expression is not evaluated when the level is filtered out.

#ifndef LOCKBOX_UTIL_LOGGING_H
#define LOCKBOX_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace lockbox {
namespace util {

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

/// "TRACE", "DEBUG", ...
const char* LogLevelName(LogLevel level);

/// Case-insensitive; "warning" and "none" are accepted. False if unknown.
bool ParseLogLevel(const std::string& str, LogLevel& level);

namespace LogCategory {
    constexpr const char* PROGRAM = "program";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* DB = "db";
    constexpr const char* CLI = "cli";
}

struct LogRecord {
    LogLevel level{LogLevel::Info};
    const char* category{""};
    std::string message;
    const char* file{""};
    int line{0};
    std::chrono::system_clock::time_point time;
};

/// Fields added around the message
struct LineFormat {
    bool timestamp{true};
    bool location{false};
};

/// "2024-05-01 12:00:00.123 [INFO ] [ledger] message"
std::string FormatRecord(const LogRecord& record, const LineFormat& format);

// ============================================================================
// Sinks
// ============================================================================

/**
 * Destination for records. Accept drops records below the sink's own
 * minimum level and hands the rest to Emit.
 */
class LogSink {
public:
    explicit LogSink(LogLevel minLevel) : minLevel_(minLevel) {}
    virtual ~LogSink() = default;

    void Accept(const LogRecord& record) {
        if (record.level >= minLevel_) {
            Emit(record);
        }
    }

    virtual void Flush() {}

    LogLevel MinLevel() const { return minLevel_; }

protected:
    virtual void Emit(const LogRecord& record) = 0;

private:
    LogLevel minLevel_;
};

/// Warn and above go to stderr, the rest to stdout; colour only on a tty
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(LogLevel minLevel = LogLevel::Info, bool colour = true)
        : LogSink(minLevel), colour_(colour) {}

    void Flush() override;

protected:
    void Emit(const LogRecord& record) override;

private:
    bool colour_;
    std::mutex mutex_;
};

/**
 * Appends to path. Once the file reaches maxBytes it is renamed to path.1,
 * older files shift up one number and path.<keep+1> is deleted.
 */
class FileSink : public LogSink {
public:
    FileSink(std::string path, LogLevel minLevel = LogLevel::Debug,
             size_t maxBytes = 8 * 1024 * 1024, int keep = 3,
             LineFormat format = LineFormat{true, true});

    bool IsOpen() const;
    void Flush() override;

protected:
    void Emit(const LogRecord& record) override;

private:
    void Rotate();

    std::string path_;
    size_t maxBytes_;
    int keep_;
    LineFormat format_;
    std::ofstream out_;
    size_t written_{0};
    mutable std::mutex mutex_;
};

/// Hands each record to a function
class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback callback, LogLevel minLevel = LogLevel::Trace)
        : LogSink(minLevel), callback_(std::move(callback)) {}

protected:
    void Emit(const LogRecord& record) override { callback_(record); }

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide fan-out to the installed sinks
class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<LogSink> sink);
    void ClearSinks();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    bool Enabled(LogLevel level) const {
        return level != LogLevel::Off && level >= level_.load();
    }

    void Write(const LogRecord& record);
    void Flush();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::mutex mutex_;
    std::atomic<LogLevel> level_{LogLevel::Info};
};

/// Builds one record and writes it when destroyed
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        buf_ << value;
        return *this;
    }

private:
    LogRecord record_;
    std::ostringstream buf_;
};

#define LOCKBOX_LOG(level, category) \
    if (!::lockbox::util::Logger::Instance().Enabled(::lockbox::util::LogLevel::level)) {} else \
        ::lockbox::util::LogStream(::lockbox::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category) LOCKBOX_LOG(Trace, category)
#define LOG_DEBUG(category) LOCKBOX_LOG(Debug, category)
#define LOG_INFO(category)  LOCKBOX_LOG(Info, category)
#define LOG_WARN(category)  LOCKBOX_LOG(Warn, category)
#define LOG_ERROR(category) LOCKBOX_LOG(Error, category)

} // namespace util
} // namespace lockbox

#endif // LOCKBOX_UTIL_LOGGING_H
