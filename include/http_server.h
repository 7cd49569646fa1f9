#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

class ApiRouter;
class Logger;

class HttpServer {
public:
    struct Options {
        std::string address = "0.0.0.0";
        std::uint16_t port = 3000;                        // 0 = ephemeral
        std::size_t threads = 1;                          // io_context runners
        std::chrono::milliseconds request_timeout{30000}; // per read/write
        std::size_t body_limit = 1024 * 1024;             // 1 MiB
    };

    HttpServer(ApiRouter& router, Logger& log);
    HttpServer(ApiRouter& router, Logger& log, Options opts);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Lifecycle
    // bind + listen + spawn I/O threads; throws boost::system::system_error on bind failure
    void start();
    void stop();      // close acceptor, stop I/O, join

    // Introspection
    bool running() const noexcept { return running_.load(); }
    std::uint16_t port() const noexcept { return bound_port_; }
    const Options& options() const noexcept { return opts_; }

private:
    struct Impl;        // pimpl to keep Boost.Beast/Asio out of headers
    Impl* impl_;

    Logger& log_;
    Options opts_;
    std::atomic<bool> running_{false};
    std::uint16_t bound_port_ = 0;
};
