#pragma once
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <nlohmann/json.hpp>
#include <string>

class UrlService;
class Logger;

// Maps one HTTP request onto the URL service:
//   POST /api/shorten    create
//   GET  /api/urls       list, newest first
//   GET  /api/analytics  totals + list by clicks
//   GET  /{code}         301 to the original URL
//   OPTIONS *            204 CORS preflight
// Stateless apart from the borrowed service; safe to call from any I/O thread.
class ApiRouter {
public:
    using Request  = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    static constexpr const char* kServerName = "url-shortener/1.0";

    ApiRouter(UrlService& svc, Logger& log);

    Response handle(const Request& req);

private:
    Response dispatch(const Request& req, const std::string& path);
    Response shorten(const Request& req);
    Response list_urls(const Request& req);
    Response analytics(const Request& req);
    Response redirect(const Request& req, const std::string& code);

    Response json_response(const Request& req, boost::beast::http::status st,
                           const nlohmann::json& body) const;
    Response error(const Request& req, boost::beast::http::status st,
                   const std::string& message) const;
    Response method_not_allowed(const Request& req, const char* allow) const;
    Response preflight(const Request& req) const;

    UrlService& svc_;
    Logger& log_;
};
