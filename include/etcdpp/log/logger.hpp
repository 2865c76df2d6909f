#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <mutex>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>

namespace etcdpp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Wire-level detail
    Debug = 1,
    Info  = 2,  // Connects, retries
    Warn  = 3,  // Recoverable failures
    Error = 4,  // Request failed
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse "trace", "debug", ... (case-sensitive, lower case). Unknown names map to Info.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// LogRecord
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, msg, loc);
    }

    // Arguments are only formatted when the level is enabled. These record
    // the location of the helper, not the caller.
    template<typename... Args>
    void trace_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

private:
    void write(LogLevel level, std::string_view msg, std::source_location loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    template<typename... Args>
    void write_fmt(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(level)) {
            log(LogRecord(level, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - default, discards everything
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - plain text to a stream (stderr unless told otherwise)
// ─────────────────────────────────────────────────────────────────────────────
// Worker threads log concurrently; lines are written whole under a lock.

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info);

    /// `out` must outlive the logger.
    ConsoleLogger(std::ostream& out, LogLevel min_level);

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_.load());
    }

    void set_level(LogLevel level) noexcept {
        min_level_.store(level);
    }

    [[nodiscard]] LogLevel level() const noexcept {
        return min_level_.load();
    }

private:
    std::ostream& out_;
    std::mutex mutex_;
    std::atomic<LogLevel> min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

// The returned handle keeps the logger alive across a concurrent set_logger().
[[nodiscard]] std::shared_ptr<ILogger> get_logger() noexcept;

// nullptr resets to NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// One logger snapshot per statement; the level check happens inside.
#define ETCDPP_LOG_AT(method, msg) \
    do { ::etcdpp::get_logger()->method(msg); } while(false)

#define ETCDPP_LOG_TRACE(msg) ETCDPP_LOG_AT(trace, msg)
#define ETCDPP_LOG_DEBUG(msg) ETCDPP_LOG_AT(debug, msg)
#define ETCDPP_LOG_INFO(msg)  ETCDPP_LOG_AT(info, msg)
#define ETCDPP_LOG_WARN(msg)  ETCDPP_LOG_AT(warn, msg)
#define ETCDPP_LOG_ERROR(msg) ETCDPP_LOG_AT(error, msg)

}  // namespace etcdpp
