#pragma once
#include "url_record.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct Analytics;

// RFC 3339 UTC with microseconds: 2024-05-01T12:00:00.123456Z
std::string format_timestamp(std::chrono::system_clock::time_point tp);

// {original_url, short_code, short_url, created_at, access_count}
nlohmann::json url_to_json(const UrlRecord& rec, const std::string& short_url);

// base_url must not end with '/'
nlohmann::json urls_to_json(const std::vector<UrlRecord>& recs, const std::string& base_url);
nlohmann::json analytics_to_json(const Analytics& a, const std::string& base_url);

// Body of POST /api/shorten: {"url": "..."}. nullopt if the JSON is
// malformed, not an object, or "url" is missing or not a string.
std::optional<std::string> parse_shorten_request(const std::string& body);

nlohmann::json error_json(const std::string& message);
