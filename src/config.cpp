#include "config.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <thread>

namespace {

constexpr std::size_t kMaxClickQueueCapacity = std::size_t{1} << 24;

const char* env_or_null(const char* key) {
    const char* v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

unsigned long parse_unsigned(const std::string& key, const std::string& text) {
    try {
        std::size_t pos = 0;
        unsigned long v = std::stoul(text, &pos);
        if (pos != text.size() || text.front() == '-') throw std::invalid_argument(text);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument("Config: " + key + " is not a non-negative integer: " + text);
    }
}

std::uint16_t to_port(const std::string& key, unsigned long v) {
    if (v > std::numeric_limits<std::uint16_t>::max())
        throw std::invalid_argument("Config: " + key + " out of range: " + std::to_string(v));
    return static_cast<std::uint16_t>(v);
}

// Counts come in as signed so that -1 is refused instead of wrapping to SIZE_MAX
std::size_t positive_size(const nlohmann::json& j, const char* key, std::size_t fallback) {
    if (!j.contains(key)) return fallback;
    const auto& v = j.at(key);
    if (!v.is_number_integer())
        throw std::invalid_argument(std::string("Config: ") + key + " must be an integer");
    const long long n = v.get<long long>();
    if (n <= 0)
        throw std::invalid_argument(std::string("Config: ") + key + " must be positive, got " + std::to_string(n));
    return static_cast<std::size_t>(n);
}

std::uint16_t port_from_json(const nlohmann::json& j, std::uint16_t fallback) {
    if (!j.contains("port")) return fallback;
    const auto& v = j.at("port");
    if (!v.is_number_integer())
        throw std::invalid_argument("Config: port must be an integer");
    const long long n = v.get<long long>();
    if (n < 0 || n > std::numeric_limits<std::uint16_t>::max())
        throw std::invalid_argument("Config: port out of range: " + std::to_string(n));
    return static_cast<std::uint16_t>(n);
}

} // namespace

Config Config::defaults() {
    Config cfg;
    cfg.io_threads_ = std::max(1u, std::thread::hardware_concurrency());
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Config file not found: " + path);
    }

    nlohmann::json j;
    in >> j;
    if (!j.is_object()) {
        throw std::runtime_error("Config file must hold a JSON object: " + path);
    }

    Config cfg = defaults();
    cfg.base_url_             = j.value("base_url", cfg.base_url_);
    cfg.host_                 = j.value("host", cfg.host_);
    cfg.port_                 = port_from_json(j, cfg.port_);
    cfg.io_threads_           = positive_size(j, "io_threads", cfg.io_threads_);
    cfg.click_workers_        = positive_size(j, "click_workers", cfg.click_workers_);
    cfg.click_queue_capacity_ = positive_size(j, "click_queue_capacity", cfg.click_queue_capacity_);
    cfg.drain_timeout_        = std::chrono::milliseconds(j.value("drain_timeout_ms", cfg.drain_timeout_.count()));
    cfg.request_timeout_      = std::chrono::milliseconds(j.value("request_timeout_ms", cfg.request_timeout_.count()));
    cfg.code_length_          = positive_size(j, "code_length", cfg.code_length_);
    cfg.id_length_            = positive_size(j, "id_length", cfg.id_length_);
    cfg.max_code_attempts_    = j.value("max_code_attempts", cfg.max_code_attempts_);
    if (j.contains("log_level")) {
        cfg.log_level_ = parse_log_level(j.at("log_level").get<std::string>());
    }

    cfg.validate();
    return cfg;
}

void Config::apply_env() {
    if (auto v = env_or_null("BASE_URL"))      base_url_ = v;
    if (auto v = env_or_null("HOST"))          host_ = v;
    if (auto v = env_or_null("PORT"))          port_ = to_port("PORT", parse_unsigned("PORT", v));
    if (auto v = env_or_null("IO_THREADS"))    io_threads_ = parse_unsigned("IO_THREADS", v);
    if (auto v = env_or_null("CLICK_WORKERS")) click_workers_ = parse_unsigned("CLICK_WORKERS", v);
    if (auto v = env_or_null("LOG_LEVEL"))     log_level_ = parse_log_level(v);
    validate();
}

void Config::validate() const {
    if (base_url_.rfind("http://", 0) != 0 && base_url_.rfind("https://", 0) != 0)
        throw std::invalid_argument("Config: base_url must start with http:// or https://");
    if (io_threads_ == 0)           throw std::invalid_argument("Config: io_threads must be positive");
    if (click_workers_ == 0)        throw std::invalid_argument("Config: click_workers must be positive");
    if (click_queue_capacity_ == 0) throw std::invalid_argument("Config: click_queue_capacity must be positive");
    if (click_queue_capacity_ > kMaxClickQueueCapacity)
        throw std::invalid_argument("Config: click_queue_capacity too large");
    if (code_length_ == 0)          throw std::invalid_argument("Config: code_length must be positive");
    if (id_length_ == 0)            throw std::invalid_argument("Config: id_length must be positive");
    if (max_code_attempts_ <= 0)    throw std::invalid_argument("Config: max_code_attempts must be positive");
    if (drain_timeout_.count() < 0) throw std::invalid_argument("Config: drain_timeout_ms must not be negative");
    if (request_timeout_.count() <= 0)
        throw std::invalid_argument("Config: request_timeout_ms must be positive");
}
