#include "config.h"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <stdexcept>

// Writes body to a scratch file and reports whether loading it throws invalid_argument
static bool load_rejects(const std::string& body) {
    const auto path = std::filesystem::temp_directory_path() / "url_shortener_cfg_test.json";
    {
        std::ofstream out(path);
        out << body;
    }
    bool threw = false;
    try { Config::load_from_file(path.string()); }
    catch (const std::invalid_argument&) { threw = true; }
    std::filesystem::remove(path);
    return threw;
}

int main() {
    try {
        // defaults
        Config d = Config::defaults();
        assert(d.base_url() == "http://localhost:3000");
        assert(d.port() == 3000);
        assert(d.code_length() == 6);
        assert(d.id_length() == 10);
        assert(d.io_threads() >= 1);
        assert(d.log_level() == LogLevel::INFO);

        // file values; absent keys keep defaults
        Config cfg = Config::load_from_file("tests/config.json");
        if (cfg.base_url() != "https://sho.rt") {
            std::cerr << "base_url mismatch\n";
            return 2;
        }
        assert(cfg.host() == "127.0.0.1");
        assert(cfg.port() == 8081);
        assert(cfg.io_threads() == 2);
        assert(cfg.click_workers() == 3);
        assert(cfg.click_queue_capacity() == 1024);
        assert(cfg.drain_timeout().count() == 250);
        assert(cfg.code_length() == 7);
        assert(cfg.id_length() == 10);
        assert(cfg.max_code_attempts() == 8);
        assert(cfg.log_level() == LogLevel::DEBUG);

        // environment overrides
        setenv("BASE_URL", "http://example.test:9000", 1);
        setenv("PORT", "4000", 1);
        setenv("LOG_LEVEL", "warn", 1);
        cfg.apply_env();
        assert(cfg.base_url() == "http://example.test:9000");
        assert(cfg.port() == 4000);
        assert(cfg.log_level() == LogLevel::WARN);

        // bad values are rejected
        setenv("PORT", "70000", 1);
        bool threw = false;
        try { cfg.apply_env(); } catch (const std::invalid_argument&) { threw = true; }
        assert(threw);

        setenv("PORT", "abc", 1);
        threw = false;
        try { cfg.apply_env(); } catch (const std::invalid_argument&) { threw = true; }
        assert(threw);
        unsetenv("PORT");

        setenv("BASE_URL", "ftp://nope", 1);
        threw = false;
        try { cfg.apply_env(); } catch (const std::invalid_argument&) { threw = true; }
        assert(threw);
        unsetenv("BASE_URL");
        unsetenv("LOG_LEVEL");

        // counts must be positive integers; -1 must not wrap to a huge size
        assert(load_rejects(R"({"io_threads": -1})"));
        assert(load_rejects(R"({"io_threads": 0})"));
        assert(load_rejects(R"({"click_workers": -4})"));
        assert(load_rejects(R"({"click_queue_capacity": -1})"));
        assert(load_rejects(R"({"click_queue_capacity": 0})"));
        assert(load_rejects(R"({"click_queue_capacity": 1099511627776})"));
        assert(load_rejects(R"({"code_length": -6})"));
        assert(load_rejects(R"({"id_length": 0})"));
        assert(load_rejects(R"({"io_threads": "four"})"));
        assert(load_rejects(R"({"port": -1})"));
        assert(load_rejects(R"({"port": 65536})"));
        assert(!load_rejects(R"({"io_threads": 4, "port": 0})"));

        setenv("IO_THREADS", "-1", 1);
        threw = false;
        try { cfg.apply_env(); } catch (const std::invalid_argument&) { threw = true; }
        assert(threw);
        unsetenv("IO_THREADS");

        // missing file
        threw = false;
        try { Config::load_from_file("tests/does_not_exist.json"); }
        catch (const std::runtime_error&) { threw = true; }
        assert(threw);

        std::cout << "Config load test passed\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }
}
