#pragma once
#include <chrono>
#include <cstdint>
#include <string>

// One shortened URL. Everything except access_count is fixed at creation.
struct UrlRecord {
    std::string id;                                      // 10-char generator output
    std::string original_url;                            // absolute http(s) URL
    std::string short_code;                              // lookup key
    std::chrono::system_clock::time_point created_at{};  // UTC, set once
    std::uint64_t access_count = 0;                      // redirects served so far
    std::uint64_t seq = 0;                               // insertion order, assigned by UrlStore
};
