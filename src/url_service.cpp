#include "url_service.h"
#include "url_store.h"
#include "code_generator.h"
#include "click_recorder.h"
#include "logger.h"

#include <algorithm>
#include <chrono>

namespace {

bool has_prefix(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool newer_first(const UrlRecord& a, const UrlRecord& b) {
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.seq > b.seq;
}

} // namespace

UrlService::UrlService(UrlStore& store, const CodeGenerator& gen, ClickRecorder& clicks,
                       Logger& log, Options opts)
    : store_(store), gen_(gen), clicks_(clicks), log_(log), opts_(std::move(opts)) {
    while (!opts_.base_url.empty() && opts_.base_url.back() == '/') opts_.base_url.pop_back();
}

bool UrlService::is_valid_url(const std::string& url) {
    std::size_t scheme_len = 0;
    if (has_prefix(url, "https://"))     scheme_len = 8;
    else if (has_prefix(url, "http://")) scheme_len = 7;
    else return false;

    // the value ends up in a Location header: no whitespace or control bytes
    for (unsigned char c : url) {
        if (c <= 0x20 || c == 0x7F) return false;
    }

    const auto host_end = url.find_first_of("/?#", scheme_len);
    const auto host_len = (host_end == std::string::npos ? url.size() : host_end) - scheme_len;
    return host_len > 0;
}

UrlRecord UrlService::create(const std::string& url) {
    if (!is_valid_url(url)) throw InvalidUrlError(url);

    UrlRecord rec;
    rec.id = gen_.generate(opts_.id_length);
    rec.original_url = url;
    rec.created_at = std::chrono::system_clock::now();
    rec.access_count = 0;

    for (int attempt = 1; attempt <= opts_.max_code_attempts; ++attempt) {
        rec.short_code = gen_.generate(opts_.code_length);
        if (store_.try_insert(rec.short_code, rec)) {
            log_.debug_fmt("created ", rec.short_code, " -> ", url);
            // re-read so the caller sees the insertion sequence
            auto stored = store_.get(rec.short_code);
            return stored ? *stored : rec;
        }
        log_.warn_fmt("short code collision on ", rec.short_code, " (attempt ", attempt, ")");
    }
    throw std::runtime_error("no free short code after " +
                             std::to_string(opts_.max_code_attempts) + " attempts");
}

std::optional<UrlRecord> UrlService::resolve(const std::string& code) {
    auto rec = store_.get(code);
    if (!rec) return std::nullopt;
    clicks_.record(code);
    return rec;
}

std::optional<UrlRecord> UrlService::lookup(const std::string& code) const {
    return store_.get(code);
}

std::vector<UrlRecord> UrlService::list_urls() const {
    auto all = store_.list_all();
    std::sort(all.begin(), all.end(), newer_first);
    return all;
}

Analytics UrlService::analytics() const {
    Analytics out;
    out.urls = store_.list_all();
    std::sort(out.urls.begin(), out.urls.end(), [](const UrlRecord& a, const UrlRecord& b) {
        if (a.access_count != b.access_count) return a.access_count > b.access_count;
        return newer_first(a, b);
    });
    // totals from the same snapshot, so they agree with the listed records
    out.total_urls = out.urls.size();
    for (const auto& r : out.urls) out.total_clicks += r.access_count;
    return out;
}

std::string UrlService::short_url(const std::string& code) const {
    return opts_.base_url + "/" + code;
}
