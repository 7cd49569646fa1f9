#pragma once
#include <atomic>
#include <sstream>
#include <string>
#include <mutex>
#include <ostream>
#include <memory>
#include <iostream>

enum class LogLevel {TRACE, DEBUG, INFO, WARN, ERROR };

// "trace", "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Throws std::invalid_argument on anything else.
LogLevel parse_log_level(const std::string& s);
const char* to_string(LogLevel lvl) noexcept;

class Logger {
public:
    // create with component name and optional output stream
    explicit Logger(std::string name, std::ostream& out = std::cout);

    // non-copyable, movable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;

    void set_level(LogLevel level) noexcept;
    LogLevel level() const noexcept;
    bool enabled(LogLevel lvl) const noexcept;
    const std::string& name() const noexcept { return name_; }

    // Basic logging API (thread-safe)
    void log(LogLevel lvl, const std::string& msg);
    void trace(const std::string& msg);
    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

    // convenience: arguments are streamed one after another
    template<typename... Args>
    void debug_fmt(Args&&... args) { log_fmt(LogLevel::DEBUG, std::forward<Args>(args)...); }
    template<typename... Args>
    void info_fmt(Args&&... args)  { log_fmt(LogLevel::INFO,  std::forward<Args>(args)...); }
    template<typename... Args>
    void warn_fmt(Args&&... args)  { log_fmt(LogLevel::WARN,  std::forward<Args>(args)...); }
    template<typename... Args>
    void error_fmt(Args&&... args) { log_fmt(LogLevel::ERROR, std::forward<Args>(args)...); }

private:
    std::string name_;
    std::atomic<LogLevel> level_;
    std::ostream* out_;
    std::unique_ptr<std::mutex> mutex_;
    void emit(LogLevel lvl, const std::string& payload);

    template<typename... Args>
    void log_fmt(LogLevel lvl, Args&&... args);
};

template<typename... Args>
inline void Logger::log_fmt(LogLevel lvl, Args&&... args) {
    // skip the formatting work when the line would be dropped anyway
    if (!enabled(lvl)) return;
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    emit(lvl, oss.str());
}
