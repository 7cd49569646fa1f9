#pragma once
#include "click_queue.h"
#include "url_store.h"
#include "logger.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

// Applies redirect clicks to the store off the request path.
// record() enqueues and returns; worker threads drain the queue and call
// UrlStore::increment_access exactly once per recorded click.
class ClickRecorder {
public:
    ClickRecorder(ClickQueue& q, UrlStore& store, Logger& log, std::size_t workers = 1);
    ~ClickRecorder();

    ClickRecorder(const ClickRecorder&) = delete;
    ClickRecorder& operator=(const ClickRecorder&) = delete;

    bool start();                         // spawn workers
    // close the queue, give pending clicks up to drain_timeout, join.
    // Returns the number of clicks abandoned.
    std::uint64_t stop(std::chrono::milliseconds drain_timeout = std::chrono::seconds(5));

    // Fire-and-forget. False once the recorder is shutting down.
    bool record(const std::string& code);

    // Blocks until every recorded click has been applied (or timeout)
    bool wait_idle(std::chrono::milliseconds timeout);

    std::uint64_t submitted() const noexcept { return submitted_.load(); }
    std::uint64_t applied() const noexcept { return applied_.load(); }
    std::uint64_t missed() const noexcept { return missed_.load(); }
    bool running() const noexcept { return running_.load(); }

private:
    void run();
    void apply(const std::string& code);
    bool idle() const noexcept;

    ClickQueue& q_;
    UrlStore& store_;
    Logger& log_;
    std::size_t worker_count_;

    std::atomic<bool> running_{false};
    std::atomic<bool> abort_{false};
    std::vector<std::thread> threads_;

    std::atomic<std::uint64_t> submitted_{0};
    std::atomic<std::uint64_t> applied_{0};
    std::atomic<std::uint64_t> missed_{0};   // code no longer in the store

    std::mutex idle_mu_;
    std::condition_variable idle_cv_;
};
