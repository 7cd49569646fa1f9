#include "url_service.h"
#include "url_store.h"
#include "code_generator.h"
#include "click_queue.h"
#include "click_recorder.h"
#include "logger.h"
#include <cassert>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

int main() {
    std::ostringstream sink;
    Logger log("url_service_test", sink);
    CodeGenerator gen;

    UrlStore store;
    ClickQueue q(1024);
    ClickRecorder clicks(q, store, log, 2);
    clicks.start();

    UrlService::Options opts;
    opts.base_url = "http://localhost:3000/";   // trailing slash is trimmed
    UrlService svc(store, gen, clicks, log, opts);

    // validation
    assert(UrlService::is_valid_url("https://example.com"));
    assert(UrlService::is_valid_url("http://x"));
    assert(!UrlService::is_valid_url("https://"));
    assert(!UrlService::is_valid_url("ftp://example.com"));
    assert(!UrlService::is_valid_url("example.com"));
    assert(!UrlService::is_valid_url(""));
    assert(UrlService::is_valid_url("https://example.com/path?q=1#frag"));
    assert(!UrlService::is_valid_url("https:///path"));
    assert(!UrlService::is_valid_url("http://?q=1"));
    assert(!UrlService::is_valid_url("https://#x"));
    assert(!UrlService::is_valid_url("https://a b"));
    assert(!UrlService::is_valid_url("https://a.com/\r\nX: y"));
    assert(!UrlService::is_valid_url("https://a.com/\tx"));
    assert(!UrlService::is_valid_url(std::string("https://a.com/") + '\x7f'));
    assert(!UrlService::is_valid_url(std::string("https://a.com/\0x", 16)));

    bool threw = false;
    try { svc.create("not a url"); } catch (const InvalidUrlError&) { threw = true; }
    assert(threw);
    assert(store.count() == 0);   // invalid input never reaches the store

    // create -> fixed length code from the alphabet
    UrlRecord a = svc.create("https://example.com/a");
    assert(a.short_code.size() == 6);
    assert(CodeGenerator::is_valid_code(a.short_code, 6));
    assert(a.id.size() == 10);
    assert(a.access_count == 0);
    assert(svc.short_url(a.short_code) == "http://localhost:3000/" + a.short_code);

    // round trip + three redirects counted asynchronously
    auto r = svc.resolve(a.short_code);
    assert(r.has_value());
    assert(r->original_url == "https://example.com/a");
    svc.resolve(a.short_code);
    svc.resolve(a.short_code);
    bool idle = clicks.wait_idle(5s);
    assert(idle);
    assert(svc.lookup(a.short_code)->access_count == 3);

    // unknown code: not found, and no click recorded
    const auto before = clicks.submitted();
    assert(!svc.resolve("zzzzzz").has_value());
    assert(!svc.lookup("zzzzzz").has_value());
    assert(clicks.submitted() == before);

    // list: newest first
    UrlRecord b = svc.create("http://example.org/b");
    auto list = svc.list_urls();
    assert(list.size() == 2);
    assert(list[0].short_code == b.short_code);
    assert(list[1].short_code == a.short_code);

    // analytics: by clicks, with totals
    svc.resolve(b.short_code);
    idle = clicks.wait_idle(5s);
    assert(idle);
    Analytics an = svc.analytics();
    assert(an.total_urls == 2);
    assert(an.total_clicks == 4);
    assert(an.urls.size() == 2);
    assert(an.urls[0].short_code == a.short_code && an.urls[0].access_count == 3);
    assert(an.urls[1].short_code == b.short_code && an.urls[1].access_count == 1);

    // code space exhaustion: with 1-char codes only 64 fit
    {
        UrlStore tiny;
        ClickQueue tq(8);
        ClickRecorder tc(tq, tiny, log, 1);
        UrlService::Options topts;
        topts.code_length = 1;
        topts.max_code_attempts = 4;
        UrlService small(tiny, gen, tc, log, topts);

        for (char c : CodeGenerator::alphabet()) {
            UrlRecord rec;
            rec.short_code = std::string(1, c);
            rec.original_url = "https://example.com";
            tiny.insert(rec.short_code, rec);
        }
        threw = false;
        try { small.create("https://example.com/full"); }
        catch (const std::runtime_error&) { threw = true; }
        assert(threw);
        assert(tiny.count() == 64);
        assert(sink.str().find("short code collision") != std::string::npos);
    }

    // concurrent creates never overwrite each other
    {
        UrlStore s2;
        ClickQueue q2(8);
        ClickRecorder c2(q2, s2, log, 1);
        UrlService svc2(s2, gen, c2, log, UrlService::Options{});
        std::vector<std::thread> th;
        for (int t = 0; t < 8; ++t) {
            th.emplace_back([&svc2]{
                for (int i = 0; i < 250; ++i) svc2.create("https://example.com/" + std::to_string(i));
            });
        }
        for (auto& t : th) t.join();
        assert(s2.count() == 2000);
    }

    assert(clicks.stop(1s) == 0);
    std::cout << "UrlService test passed.\n";
    return 0;
}
