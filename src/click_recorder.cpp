#include "click_recorder.h"

ClickRecorder::ClickRecorder(ClickQueue& q, UrlStore& store, Logger& log, std::size_t workers)
    : q_(q), store_(store), log_(log), worker_count_(workers ? workers : 1) {}

ClickRecorder::~ClickRecorder() { stop(); }

bool ClickRecorder::start() {
    if (running_.exchange(true)) return true;
    abort_.store(false);
    threads_.reserve(worker_count_);
    for (std::size_t i = 0; i < worker_count_; ++i) {
        threads_.emplace_back([this]{ run(); });
    }
    log_.debug_fmt("click recorder started with ", worker_count_, " worker(s)");
    return true;
}

std::uint64_t ClickRecorder::stop(std::chrono::milliseconds drain_timeout) {
    if (!running_.exchange(false)) return 0;

    q_.close();
    if (!wait_idle(drain_timeout)) {
        log_.warn_fmt("click drain timed out after ", drain_timeout.count(),
                      "ms with ", q_.size(), " click(s) queued");
        abort_.store(true);
    }
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();

    const std::uint64_t done = applied_.load() + missed_.load();
    const std::uint64_t sub = submitted_.load();
    const std::uint64_t dropped = sub > done ? sub - done : 0;
    if (dropped) log_.error_fmt("abandoned ", dropped, " click(s) on shutdown");
    else log_.debug_fmt("click recorder drained (", done, " applied)");
    return dropped;
}

bool ClickRecorder::record(const std::string& code) {
    submitted_.fetch_add(1);
    if (!q_.push(code)) {
        submitted_.fetch_sub(1);
        log_.warn("click for " + code + " rejected: recorder shutting down");
        return false;
    }
    return true;
}

bool ClickRecorder::idle() const noexcept {
    return applied_.load() + missed_.load() >= submitted_.load();
}

bool ClickRecorder::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(idle_mu_);
    return idle_cv_.wait_for(lk, timeout, [this]{ return idle(); });
}

void ClickRecorder::apply(const std::string& code) {
    if (store_.increment_access(code)) {
        applied_.fetch_add(1);
    } else {
        log_.warn("click for unknown code " + code);
        missed_.fetch_add(1);
    }
    // lock so a waiter cannot miss the wakeup between its check and its wait
    { std::lock_guard<std::mutex> lk(idle_mu_); }
    idle_cv_.notify_all();
}

void ClickRecorder::run() {
    std::string code;
    while (q_.pop(code)) {
        if (abort_.load()) break;
        apply(code);
    }
}
