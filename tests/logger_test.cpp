#include "logger.h"
#include <cassert>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <iostream>

static std::size_t count_lines(const std::string& s) {
    std::size_t n = 0;
    for (char c : s) if (c == '\n') ++n;
    return n;
}

int main() {
    // level parsing
    assert(parse_log_level("debug") == LogLevel::DEBUG);
    assert(parse_log_level("WARNING") == LogLevel::WARN);
    assert(parse_log_level("Error") == LogLevel::ERROR);
    bool threw = false;
    try { parse_log_level("loud"); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    // filtering
    {
        std::ostringstream out;
        Logger log("filter", out);
        log.set_level(LogLevel::WARN);
        log.info("hidden");
        log.debug_fmt("hidden ", 1);
        log.warn_fmt("shown ", 2, " of ", 3);
        const std::string s = out.str();
        assert(count_lines(s) == 1);
        assert(s.find("[WARN] filter: shown 2 of 3") != std::string::npos);
        assert(s.find("hidden") == std::string::npos);
    }

    // concurrent writers never interleave inside a line
    std::ostringstream out;
    Logger log("logger_test", out);
    log.set_level(LogLevel::DEBUG);

    const int threads = 4;
    const int msgs = 200;

    std::vector<std::thread> th;
    for (int t = 0; t < threads; ++t) {
        th.emplace_back([t, &log](){
            for (int i = 0; i < msgs; ++i) {
                log.debug_fmt("threads=", t, " msg=", i);
            }
        });
    }
    for (auto &x : th) x.join();

    const std::string all = out.str();
    assert(count_lines(all) == static_cast<std::size_t>(threads * msgs));
    std::istringstream lines(all);
    std::string line;
    while (std::getline(lines, line)) {
        assert(line.find("[DEBUG] logger_test: threads=") != std::string::npos);
    }

    std::cout << "Logger test passed.\n";
    return 0;
}
