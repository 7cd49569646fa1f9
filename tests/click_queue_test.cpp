#include "click_queue.h"
#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

int main() {
    // Small capacity to exercise wrap & full conditions (rounded to next pow2).
    ClickQueue q(5);
    assert(q.capacity() == 8);

    // Edge: empty pop
    std::string tmp;
    assert(!q.try_pop(tmp));
    assert(q.empty());

    // FIFO
    bool ok = q.try_push("a");
    assert(ok);
    ok = q.try_push("b");
    assert(ok);
    assert(q.size() == 2);
    ok = q.try_pop(tmp);
    assert(ok && tmp == "a");
    ok = q.try_pop(tmp);
    assert(ok && tmp == "b");
    assert(q.empty());

    // Fill to full, wrapping around the ring
    for (std::size_t i = 0; i < q.capacity(); ++i) {
        ok = q.try_push(std::to_string(i));
        assert(ok);
    }
    assert(q.full());
    // One more must fail
    ok = q.try_push("x");
    assert(!ok);

    // blocked producer resumes once a consumer makes room
    std::thread blocked([&]{
        bool pushed = q.push("late");
        assert(pushed);
        (void)pushed;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ok = q.pop(tmp);
    assert(ok && tmp == "0");
    blocked.join();
    assert(q.full());

    // close: pending items still drain, then pop reports false
    q.close();
    assert(q.closed());
    ok = q.push("after-close");
    assert(!ok);
    std::size_t drained = 0;
    while (q.pop(tmp)) ++drained;
    assert(drained == q.capacity());
    assert(tmp == "late");
    assert(q.empty());

    // close wakes a consumer blocked on an empty queue
    ClickQueue idle(8);
    std::thread waiter([&]{
        std::string s;
        bool got = idle.pop(s);
        assert(!got);
        (void)got;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    idle.close();
    waiter.join();

    // MPMC: every pushed code arrives exactly once
    const int producers = 4;
    const int per_producer = 5000;
    ClickQueue q2(64);

    std::vector<std::thread> prod;
    for (int p = 0; p < producers; ++p) {
        prod.emplace_back([&q2, p]{
            for (int i = 0; i < per_producer; ++i) {
                bool pushed = q2.push(std::to_string(p) + ":" + std::to_string(i));
                assert(pushed);
                (void)pushed;
            }
        });
    }

    std::vector<std::vector<std::string>> got(2);
    std::vector<std::thread> cons;
    for (int c = 0; c < 2; ++c) {
        cons.emplace_back([&q2, &got, c]{
            std::string s;
            while (q2.pop(s)) got[c].push_back(s);
        });
    }

    for (auto& t : prod) t.join();
    q2.close();
    for (auto& t : cons) t.join();

    std::set<std::string> all;
    for (auto& v : got) all.insert(v.begin(), v.end());
    assert(got[0].size() + got[1].size() == static_cast<std::size_t>(producers * per_producer));
    assert(all.size() == static_cast<std::size_t>(producers * per_producer));

    std::cout << "ClickQueue test passed.\n";
    return 0;
}
