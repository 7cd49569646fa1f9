#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

// Bounded FIFO of short codes shared by every redirect handler (producers)
// and the click workers (consumers).
class ClickQueue {
public:
    // capacity will be rounded up to next power of two (min 8)
    explicit ClickQueue(std::size_t capacity);

    ClickQueue(const ClickQueue&) = delete;
    ClickQueue& operator=(const ClickQueue&) = delete;
    ClickQueue(ClickQueue&&) = delete;
    ClickQueue& operator=(ClickQueue&&) = delete;

    // Producers (I/O threads)
    // push blocks while full; returns false only once the queue is closed
    bool push(std::string code);
    // returns false if full or closed
    bool try_push(std::string code);

    // Consumers (click workers)
    // blocks until an item arrives; false when closed and drained
    bool pop(std::string& out);
    bool try_pop(std::string& out);

    // Wakes every waiter; pending items can still be popped
    void close();

    std::size_t size() const;
    std::size_t capacity() const noexcept { return mask_ + 1; }
    bool empty() const;
    bool full() const;
    bool closed() const;

private:
    // power-of-two ring: index & mask_ for wrap
    std::vector<std::string> buf_;
    const std::size_t mask_;             // capacity - 1

    // head_ (next write) and tail_ (next read) grow monotonically
    std::size_t head_ = 0;
    std::size_t tail_ = 0;
    bool closed_ = false;

    mutable std::mutex mu_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;

    void put_locked(std::string&& code);
    void take_locked(std::string& out);

    static std::size_t next_pow2(std::size_t n) noexcept;
};
