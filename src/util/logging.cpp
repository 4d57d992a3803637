// LOCKBOX - Logging Implementation
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include "lockbox/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace lockbox {
namespace util {

namespace {

const char* Basename(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

void AppendTimestamp(std::ostream& os, std::chrono::system_clock::time_point tp) {
    std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    std::tm local;
    localtime_r(&secs, &local);
    os << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
       << std::setfill('0') << std::setw(3) << millis << std::setfill(' ');
}

const char* Colour(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default:              return "";
    }
}

} // anonymous namespace

// ============================================================================
// Levels and Formatting
// ============================================================================

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "?";
}

bool ParseLogLevel(const std::string& str, LogLevel& level) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::pair<const char*, LogLevel> NAMES[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},   {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn}, {"error", LogLevel::Error},
        {"off", LogLevel::Off},     {"none", LogLevel::Off},
    };
    for (const auto& [name, value] : NAMES) {
        if (lower == name) {
            level = value;
            return true;
        }
    }
    return false;
}

std::string FormatRecord(const LogRecord& record, const LineFormat& format) {
    std::ostringstream os;
    if (format.timestamp) {
        AppendTimestamp(os, record.time);
        os << ' ';
    }
    os << '[' << std::left << std::setw(5) << LogLevelName(record.level) << "] ";
    if (record.category && *record.category) {
        os << '[' << record.category << "] ";
    }
    if (format.location && record.file && *record.file) {
        os << Basename(record.file) << ':' << record.line << ' ';
    }
    os << record.message;
    return os.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

void ConsoleSink::Emit(const LogRecord& record) {
    std::string line = FormatRecord(record, LineFormat{true, false});
    FILE* stream = record.level >= LogLevel::Warn ? stderr : stdout;

    std::lock_guard<std::mutex> lock(mutex_);
    const char* colour = colour_ && isatty(fileno(stream)) ? Colour(record.level) : "";
    if (*colour) {
        std::fprintf(stream, "%s%s\033[0m\n", colour, line.c_str());
    } else {
        std::fprintf(stream, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(std::string path, LogLevel minLevel, size_t maxBytes, int keep,
                   LineFormat format)
    : LogSink(minLevel), path_(std::move(path)), maxBytes_(maxBytes),
      keep_(keep), format_(format) {
    out_.open(path_, std::ios::out | std::ios::app);
    if (out_.is_open()) {
        out_.seekp(0, std::ios::end);
        std::streamoff size = out_.tellp();
        written_ = size > 0 ? static_cast<size_t>(size) : 0;
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return out_.is_open();
}

void FileSink::Emit(const LogRecord& record) {
    std::string line = FormatRecord(record, format_);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open() && written_ >= maxBytes_) {
        Rotate();
    }
    if (!out_.is_open()) {
        return;
    }
    out_ << line;
    written_ += line.size();
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_.flush();
    }
}

void FileSink::Rotate() {
    out_.close();
    auto numbered = [this](int n) { return path_ + "." + std::to_string(n); };

    std::remove(numbered(keep_).c_str());
    for (int n = keep_ - 1; n >= 1; --n) {
        std::rename(numbered(n).c_str(), numbered(n + 1).c_str());
    }
    if (keep_ > 0) {
        std::rename(path_.c_str(), numbered(1).c_str());
    }

    out_.open(path_, std::ios::out | std::ios::trunc);
    written_ = 0;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::Write(const LogRecord& record) {
    if (!Enabled(record.level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Accept(record);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::LogStream(LogLevel level, const char* category, const char* file, int line) {
    record_.level = level;
    record_.category = category;
    record_.file = file;
    record_.line = line;
}

LogStream::~LogStream() {
    record_.message = buf_.str();
    record_.time = std::chrono::system_clock::now();
    Logger::Instance().Write(record_);
}

} // namespace util
} // namespace lockbox
