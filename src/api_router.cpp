#include "api_router.h"
#include "api_json.h"
#include "url_service.h"
#include "logger.h"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <exception>

namespace http = boost::beast::http;

// ================ helper ====================
static std::string path_of(boost::beast::string_view target) {
    auto q = target.find('?');
    if (q != boost::beast::string_view::npos) target = target.substr(0, q);
    return std::string(target);
}

static void common_headers(ApiRouter::Response& res, const ApiRouter::Request& req) {
    res.set(http::field::server, ApiRouter::kServerName);
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(req.keep_alive());
}

// ================= ApiRouter ===================
ApiRouter::ApiRouter(UrlService& svc, Logger& log) : svc_(svc), log_(log) {}

ApiRouter::Response ApiRouter::handle(const Request& req) {
    const auto start = std::chrono::steady_clock::now();
    const std::string path = path_of(req.target());

    Response res;
    try {
        res = dispatch(req, path);
    } catch (const std::exception& e) {
        log_.error_fmt(req.method_string(), " ", path, " failed: ", e.what());
        res = error(req, http::status::internal_server_error, "Internal server error");
    }

    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();
    res.set("X-Process-Time", std::to_string(static_cast<double>(us) / 1e6));   // seconds
    log_.debug_fmt(req.method_string(), " ", req.target(), " -> ", res.result_int(), " (", us, "us)");
    return res;
}

ApiRouter::Response ApiRouter::dispatch(const Request& req, const std::string& path) {
    const auto verb = req.method();

    // CORS preflight is answered the same way on every path
    if (verb == http::verb::options) return preflight(req);

    if (path == "/api/shorten") {
        if (verb != http::verb::post) return method_not_allowed(req, "POST");
        return shorten(req);
    }
    if (path == "/api/urls") {
        if (verb != http::verb::get) return method_not_allowed(req, "GET");
        return list_urls(req);
    }
    if (path == "/api/analytics") {
        if (verb != http::verb::get) return method_not_allowed(req, "GET");
        return analytics(req);
    }

    // /{code}: exactly one non-empty segment outside /api
    if (path.size() > 1 && path.find('/', 1) == std::string::npos && path != "/api") {
        if (verb != http::verb::get) return method_not_allowed(req, "GET");
        return redirect(req, path.substr(1));
    }
    return error(req, http::status::not_found, "URL not found");
}

ApiRouter::Response ApiRouter::shorten(const Request& req) {
    auto url = parse_shorten_request(req.body());
    if (!url) return error(req, http::status::bad_request, "Invalid request");

    try {
        UrlRecord rec = svc_.create(*url);
        return json_response(req, http::status::ok, url_to_json(rec, svc_.short_url(rec.short_code)));
    } catch (const InvalidUrlError&) {
        log_.debug("rejected url: " + *url);
        return error(req, http::status::bad_request, "Invalid URL provided");
    }
}

ApiRouter::Response ApiRouter::list_urls(const Request& req) {
    return json_response(req, http::status::ok, urls_to_json(svc_.list_urls(), svc_.options().base_url));
}

ApiRouter::Response ApiRouter::analytics(const Request& req) {
    return json_response(req, http::status::ok, analytics_to_json(svc_.analytics(), svc_.options().base_url));
}

ApiRouter::Response ApiRouter::redirect(const Request& req, const std::string& code) {
    auto rec = svc_.resolve(code);
    if (!rec) return error(req, http::status::not_found, "URL not found");

    Response res{http::status::moved_permanently, req.version()};
    common_headers(res, req);
    res.set(http::field::location, rec->original_url);
    res.prepare_payload();
    return res;
}

ApiRouter::Response ApiRouter::preflight(const Request& req) const {
    Response res{http::status::no_content, req.version()};
    common_headers(res, req);
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    const auto wanted = req[http::field::access_control_request_headers];
    res.set(http::field::access_control_allow_headers, wanted.empty() ? boost::beast::string_view("*") : wanted);
    res.set(http::field::access_control_max_age, "86400");
    res.prepare_payload();
    return res;
}

ApiRouter::Response ApiRouter::json_response(const Request& req, http::status st,
                                             const nlohmann::json& body) const {
    Response res{st, req.version()};
    common_headers(res, req);
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

ApiRouter::Response ApiRouter::error(const Request& req, http::status st,
                                     const std::string& message) const {
    return json_response(req, st, error_json(message));
}

ApiRouter::Response ApiRouter::method_not_allowed(const Request& req, const char* allow) const {
    auto res = error(req, http::status::method_not_allowed, "Method not allowed");
    res.set(http::field::allow, allow);
    return res;
}
