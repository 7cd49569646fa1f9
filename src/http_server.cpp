#include "http_server.h"
#include "api_router.h"
#include "logger.h"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;

namespace {

// One client connection: read request, route, write response, repeat while keep-alive.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, ApiRouter& router, Logger& log, const HttpServer::Options& opts)
        : stream_(std::move(socket)), router_(router), log_(log),
          timeout_(opts.request_timeout), body_limit_(opts.body_limit) {}

    void run() {
        // start on the connection's strand
        asio::dispatch(stream_.get_executor(),
                       beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(body_limit_);
        stream_.expires_after(timeout_);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) return do_close();
        if (ec == beast::error::timeout || ec == asio::error::operation_aborted) return;
        if (ec) {
            log_.debug("[http] read error: " + ec.message());
            return;
        }

        auto req = parser_->release();
        res_ = std::make_shared<ApiRouter::Response>(router_.handle(req));

        stream_.expires_after(timeout_);
        http::async_write(stream_, *res_,
                          beast::bind_front_handler(&Session::on_write, shared_from_this(),
                                                    res_->need_eof()));
    }

    void on_write(bool close, beast::error_code ec, std::size_t) {
        if (ec) {
            log_.debug("[http] write error: " + ec.message());
            return;
        }
        res_.reset();
        if (close) return do_close();
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<ApiRouter::Response> res_;

    ApiRouter& router_;
    Logger& log_;
    std::chrono::milliseconds timeout_;
    std::size_t body_limit_;
};

} // namespace

struct HttpServer::Impl {
    ApiRouter& router;
    Logger& log;
    Options opts;

    asio::io_context ioc;
    tcp::acceptor acceptor{asio::make_strand(ioc)};
    std::vector<std::thread> threads;

    Impl(ApiRouter& r, Logger& l, Options o)
        : router(r), log(l), opts(std::move(o)), ioc(static_cast<int>(opts.threads ? opts.threads : 1)) {}

    void listen() {
        const auto address = asio::ip::make_address(opts.address);
        const tcp::endpoint endpoint{address, opts.port};

        acceptor.open(endpoint.protocol());
        acceptor.set_option(asio::socket_base::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen(asio::socket_base::max_listen_connections);
    }

    void do_accept() {
        acceptor.async_accept(asio::make_strand(ioc), [this](beast::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) return;   // acceptor closed
            if (ec) {
                log.warn("[http] accept error: " + ec.message());
            } else {
                std::make_shared<Session>(std::move(socket), router, log, opts)->run();
            }
            if (acceptor.is_open()) do_accept();
        });
    }

    void run_threads() {
        const std::size_t n = opts.threads ? opts.threads : 1;
        threads.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            threads.emplace_back([this] { ioc.run(); });
        }
    }

    void stop() {
        ioc.stop();
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
        threads.clear();
        // no runner left, so the acceptor can be touched from here
        beast::error_code ec;
        acceptor.close(ec);
    }
};

// ---- public API ----

HttpServer::HttpServer(ApiRouter& router, Logger& log)
    : HttpServer(router, log, Options{}) {}

HttpServer::HttpServer(ApiRouter& router, Logger& log, Options opts)
    : impl_(new Impl(router, log, opts)),
      log_(log),
      opts_(std::move(opts)) {}

HttpServer::~HttpServer() {
    stop();
    delete impl_;
}

void HttpServer::start() {
    if (running_.load()) return;
    impl_->listen();
    bound_port_ = impl_->acceptor.local_endpoint().port();
    impl_->do_accept();
    impl_->run_threads();
    running_.store(true);
    log_.info_fmt("listening on ", opts_.address, ":", bound_port_,
                  " (", impl_->threads.size(), " I/O thread(s))");
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    impl_->stop();
    log_.info("http server stopped");
}
