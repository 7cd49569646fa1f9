#pragma once
#include <string>
#include <map>
#include <chrono>

struct HttpResponse {
    int status = 0;
    std::string body;
    std::map<std::string, std::string> headers;   // names lower-cased
};

// Blocking plain-HTTP client, one connection per call. Does not follow redirects.
class HTTPClient {
public:
    struct Options {
        std::chrono::milliseconds timeout{std::chrono::seconds(10)};
        std::string user_agent = "url-shortener-client/1.0";
    };

    HTTPClient();
    explicit HTTPClient(Options opts);

    // http_url must start with http://
    HttpResponse get(const std::string& http_url);

    // POST with Content-Type: application/json
    HttpResponse post_json(const std::string& http_url, const std::string& json_body);

private:
    struct UrlParts {
        std::string host;
        std::string port;   // "80" by default
        std::string target; // path + query, as given
    };

    static UrlParts parse_http_url(const std::string& http_url);

    HttpResponse perform(const std::string& method, const UrlParts& u,
                         const std::string& body, const std::string& content_type);

    Options opts_;
};
