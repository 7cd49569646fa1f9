#include "api_json.h"
#include "url_service.h"

#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const auto since_epoch = tp.time_since_epoch();
    auto secs = duration_cast<seconds>(since_epoch);
    auto us = duration_cast<microseconds>(since_epoch - secs);
    if (us.count() < 0) {          // pre-epoch: floor to the previous second
        secs -= seconds(1);
        us += seconds(1);
    }

    const std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << us.count() << 'Z';
    return oss.str();
}

json url_to_json(const UrlRecord& rec, const std::string& short_url) {
    return json{
        {"original_url", rec.original_url},
        {"short_code",   rec.short_code},
        {"short_url",    short_url},
        {"created_at",   format_timestamp(rec.created_at)},
        {"access_count", rec.access_count}
    };
}

json urls_to_json(const std::vector<UrlRecord>& recs, const std::string& base_url) {
    json arr = json::array();
    for (const auto& r : recs) arr.push_back(url_to_json(r, base_url + "/" + r.short_code));
    return arr;
}

json analytics_to_json(const Analytics& a, const std::string& base_url) {
    return json{
        {"total_urls",   a.total_urls},
        {"total_clicks", a.total_clicks},
        {"urls",         urls_to_json(a.urls, base_url)}
    };
}

std::optional<std::string> parse_shorten_request(const std::string& body) {
    json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    auto it = j.find("url");
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

json error_json(const std::string& message) {
    return json{{"error", message}};
}
