#include "etcdpp/log/logger.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace etcdpp {

namespace {

[[nodiscard]] std::string format_timestamp(
    const std::chrono::system_clock::time_point& tp
) {
    const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms;
    return oss.str();
}

[[nodiscard]] std::string_view extract_filename(const char* path) noexcept {
    std::string_view sv(path);
    const auto last_slash = sv.find_last_of('/');
    if (last_slash != std::string_view::npos) {
        return sv.substr(last_slash + 1);
    }
    return sv;
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "fatal") return LogLevel::Fatal;
    if (name == "off")   return LogLevel::Off;
    return LogLevel::Info;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────
// 12:00:01.042 INFO  [140213] etcd_transport.cpp:88 Connected to 127.0.0.1:2379

ConsoleLogger::ConsoleLogger(LogLevel min_level)
    : ConsoleLogger(std::cerr, min_level)
{}

ConsoleLogger::ConsoleLogger(std::ostream& out, LogLevel min_level)
    : out_(out)
    , min_level_(min_level)
{}

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    std::ostringstream line;
    line << format_timestamp(record.timestamp) << ' '
         << std::setw(5) << std::left << to_string(record.level) << ' '
         << '[' << std::this_thread::get_id() << "] "
         << extract_filename(record.location.file_name()) << ':' << record.location.line()
         << ' ' << record.message << '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line.str();
    out_.flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

struct GlobalLogger {
    std::mutex mutex;
    std::shared_ptr<ILogger> instance = std::make_shared<NullLogger>();
};

GlobalLogger& global_logger() {
    static GlobalLogger global;
    return global;
}

}  // namespace

std::shared_ptr<ILogger> get_logger() noexcept {
    auto& global = global_logger();
    std::lock_guard<std::mutex> lock(global.mutex);
    return global.instance;
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::shared_ptr<ILogger> replacement;
    if (logger != nullptr) {
        replacement = std::move(logger);
    } else {
        replacement = std::make_shared<NullLogger>();
    }

    auto& global = global_logger();
    {
        std::lock_guard<std::mutex> lock(global.mutex);
        global.instance.swap(replacement);
    }
    // The previous logger is released here, outside the lock
}

}  // namespace etcdpp
