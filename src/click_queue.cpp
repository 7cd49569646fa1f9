#include "click_queue.h"
#include <utility>

static inline bool is_power_of_two(std::size_t x) { return x && ((x & (x - 1)) == 0); }

std::size_t ClickQueue::next_pow2(std::size_t n) noexcept {
    if (n < 8) return 8;
    if (is_power_of_two(n)) return n;
    n--;
    for (std::size_t i = 1; i < sizeof(std::size_t) * 8; i <<= 1) n |= (n >> i);
    return n + 1;
}

ClickQueue::ClickQueue(std::size_t capacity)
    : buf_(next_pow2(capacity)), mask_(buf_.size() - 1) {}

void ClickQueue::put_locked(std::string&& code) {
    buf_[head_ & mask_] = std::move(code);
    ++head_;
}

void ClickQueue::take_locked(std::string& out) {
    out = std::move(buf_[tail_ & mask_]);
    ++tail_;
}

bool ClickQueue::push(std::string code) {
    std::unique_lock<std::mutex> lk(mu_);
    not_full_.wait(lk, [this]{ return closed_ || head_ - tail_ < capacity(); });
    if (closed_) return false;
    put_locked(std::move(code));
    lk.unlock();
    not_empty_.notify_one();
    return true;
}

bool ClickQueue::try_push(std::string code) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_ || head_ - tail_ == capacity()) return false;
        put_locked(std::move(code));
    }
    not_empty_.notify_one();
    return true;
}

bool ClickQueue::pop(std::string& out) {
    std::unique_lock<std::mutex> lk(mu_);
    not_empty_.wait(lk, [this]{ return closed_ || head_ != tail_; });
    if (head_ == tail_) return false; // closed and drained
    take_locked(out);
    lk.unlock();
    not_full_.notify_one();
    return true;
}

bool ClickQueue::try_pop(std::string& out) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (head_ == tail_) return false;
        take_locked(out);
    }
    not_full_.notify_one();
    return true;
}

void ClickQueue::close() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

std::size_t ClickQueue::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return head_ - tail_;
}

bool ClickQueue::empty() const {
    return size() == 0;
}

bool ClickQueue::full() const {
    return size() == capacity();
}

bool ClickQueue::closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}
