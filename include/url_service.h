#pragma once
#include "url_record.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class UrlStore;
class CodeGenerator;
class ClickRecorder;
class Logger;

// Rejected input URL (maps to 400 at the HTTP layer)
class InvalidUrlError : public std::invalid_argument {
public:
    explicit InvalidUrlError(const std::string& url)
        : std::invalid_argument("Invalid URL provided: " + url) {}
};

struct Analytics {
    std::uint64_t total_urls = 0;
    std::uint64_t total_clicks = 0;
    std::vector<UrlRecord> urls;          // by access_count, descending
};

class UrlService {
public:
    struct Options {
        std::string base_url = "http://localhost:3000";
        std::size_t code_length = 6;
        std::size_t id_length = 10;
        int max_code_attempts = 8;        // regenerations on short_code collision
    };

    // Borrow existing instances; no ownership.
    UrlService(UrlStore& store, const CodeGenerator& gen, ClickRecorder& clicks,
               Logger& log, Options opts);

    // Throws InvalidUrlError, or std::runtime_error if no free code was found
    UrlRecord create(const std::string& url);

    // Lookup for the redirect path; a hit records one click asynchronously.
    // The returned record is the state before that click.
    std::optional<UrlRecord> resolve(const std::string& code);

    // Lookup without counting
    std::optional<UrlRecord> lookup(const std::string& code) const;

    std::vector<UrlRecord> list_urls() const;   // newest first
    Analytics analytics() const;

    std::string short_url(const std::string& code) const;
    const Options& options() const noexcept { return opts_; }

    // http(s) scheme, non-empty host, no whitespace or control bytes
    static bool is_valid_url(const std::string& url);

private:
    UrlStore& store_;
    const CodeGenerator& gen_;
    ClickRecorder& clicks_;
    Logger& log_;
    Options opts_;
};
