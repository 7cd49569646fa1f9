#pragma once
#include "logger.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

class Config {
public:
    // Built-in defaults: localhost:3000, one I/O thread per core
    static Config defaults();

    // Load settings from json file; keys missing from the file keep their defaults
    static Config load_from_file(const std::string& path);

    // Override from BASE_URL, HOST, PORT, IO_THREADS, CLICK_WORKERS, LOG_LEVEL
    void apply_env();

    // Throws std::invalid_argument describing the first bad value
    void validate() const;

    // Accessors (read-only)
    const std::string& base_url() const { return base_url_; }
    const std::string& host() const { return host_; }
    std::uint16_t port() const { return port_; }
    std::size_t io_threads() const { return io_threads_; }
    std::size_t click_workers() const { return click_workers_; }
    std::size_t click_queue_capacity() const { return click_queue_capacity_; }
    std::chrono::milliseconds drain_timeout() const { return drain_timeout_; }
    std::chrono::milliseconds request_timeout() const { return request_timeout_; }
    std::size_t code_length() const { return code_length_; }
    std::size_t id_length() const { return id_length_; }
    int max_code_attempts() const { return max_code_attempts_; }
    LogLevel log_level() const { return log_level_; }

    // Setters used by tests and by apply_env
    void set_base_url(std::string v) { base_url_ = std::move(v); }
    void set_port(std::uint16_t v) { port_ = v; }

private:
    // private ctor enforce factory methods
    Config() = default;

    std::string base_url_ = "http://localhost:3000";
    std::string host_ = "0.0.0.0";
    std::uint16_t port_ = 3000;
    std::size_t io_threads_ = 1;
    std::size_t click_workers_ = 2;
    std::size_t click_queue_capacity_ = 65536;
    std::chrono::milliseconds drain_timeout_{5000};
    std::chrono::milliseconds request_timeout_{30000};
    std::size_t code_length_ = 6;
    std::size_t id_length_ = 10;
    int max_code_attempts_ = 8;
    LogLevel log_level_ = LogLevel::INFO;
};
