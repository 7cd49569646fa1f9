#include "http_client.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <cctype>
#include <stdexcept>


using tcp = boost::asio::ip::tcp;
namespace http = boost::beast::http;


// ================ helper ====================
static std::string to_lower(std::string s){ for (auto& c:s) c=char(::tolower(static_cast<unsigned char>(c))); return s;}

// ================= HTTPClient ===================
HTTPClient::HTTPClient() : opts_{} {}
HTTPClient::HTTPClient(Options opts) : opts_(std::move(opts)) {}

HTTPClient::UrlParts HTTPClient::parse_http_url(const std::string& http_url)
{
    const std::string scheme = "http://";
    if (http_url.rfind(scheme,0)!=0)
        throw std::runtime_error("HTTPClient: only http:// URLs supported");

    auto rest = http_url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string hostport = slash==std::string::npos ? rest : rest.substr(0,slash);
    std::string path     = slash==std::string::npos ? "/" : rest.substr(slash);

    std::string host = hostport;
    std::string port = "80";

    if (auto colon = hostport.find(':'); colon!=std::string::npos) {
        host = hostport.substr(0, colon);
        port = hostport.substr(colon+1);
        if (port.empty()) port = "80";
    }
    if (host.empty())
        throw std::runtime_error("HTTPClient: missing host in " + http_url);

    return {host, port, path};
}

HttpResponse HTTPClient::perform(const std::string& method, const UrlParts& u,
                                 const std::string& body, const std::string& content_type)
{
    boost::asio::io_context ioc;
    tcp::resolver resolver(ioc);
    auto const results = resolver.resolve(u.host, u.port);

    boost::beast::tcp_stream stream(ioc);
    stream.expires_after(opts_.timeout);
    stream.connect(results);

    http::request<http::string_body> req{http::string_to_verb(method), u.target, 11};
    req.set(http::field::host, u.host + ":" + u.port);
    req.set(http::field::user_agent, opts_.user_agent);
    if (method == "POST") {
        req.set(http::field::content_type, content_type);
        req.body() = body;
        req.prepare_payload();
    }

    //send
    http::write(stream, req);

    //receive
    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    // shutdown (best effort)
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    HttpResponse out;
    out.status = static_cast<int>(res.result_int());
    out.body   = std::move(res.body());
    for (auto const& f: res.base()) {
        out.headers.emplace(to_lower(std::string(f.name_string())), std::string(f.value()));
    }
    return out;
}

HttpResponse HTTPClient::get(const std::string& http_url)
{
    return perform("GET", parse_http_url(http_url), {}, {});
}

HttpResponse HTTPClient::post_json(const std::string& http_url, const std::string& json_body)
{
    return perform("POST", parse_http_url(http_url), json_body, "application/json");
}
