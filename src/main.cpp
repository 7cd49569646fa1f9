#include "config.h"
#include "logger.h"
#include "code_generator.h"
#include "url_store.h"
#include "click_queue.h"
#include "click_recorder.h"
#include "url_service.h"
#include "api_router.h"
#include "http_server.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <iostream>

static Config load_config(int argc, char** argv) {
    Config cfg = argc > 1 ? Config::load_from_file(argv[1]) : Config::defaults();
    cfg.apply_env();
    return cfg;
}

int main(int argc, char** argv) {
    Logger log("url-shortener");

    try {
        const Config cfg = load_config(argc, argv);
        log.set_level(cfg.log_level());

        UrlStore store;
        CodeGenerator gen;
        ClickQueue clicks_q(cfg.click_queue_capacity());
        ClickRecorder clicks(clicks_q, store, log, cfg.click_workers());

        UrlService::Options sopts;
        sopts.base_url = cfg.base_url();
        sopts.code_length = cfg.code_length();
        sopts.id_length = cfg.id_length();
        sopts.max_code_attempts = cfg.max_code_attempts();
        UrlService service(store, gen, clicks, log, sopts);

        ApiRouter router(service, log);

        HttpServer::Options hopts;
        hopts.address = cfg.host();
        hopts.port = cfg.port();
        hopts.threads = cfg.io_threads();
        hopts.request_timeout = cfg.request_timeout();
        HttpServer server(router, log, hopts);

        clicks.start();
        server.start();
        log.info("base url " + service.options().base_url);

        // block until SIGINT / SIGTERM
        boost::asio::io_context sig_ioc;
        boost::asio::signal_set signals(sig_ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (!ec) log.info_fmt("received signal ", signo, ", shutting down");
        });
        sig_ioc.run();

        // no new clicks once the server is down; then let the queued ones land
        server.stop();
        const auto dropped = clicks.stop(cfg.drain_timeout());
        log.info_fmt("served ", store.count(), " url(s), ", store.total_clicks(), " click(s)");
        return dropped == 0 ? 0 : 3;
    } catch (const std::exception& e) {
        log.error(std::string("fatal: ") + e.what());
        return 1;
    }
}
