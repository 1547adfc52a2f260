#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using namespace Catch;
using namespace std::chrono_literals;

namespace {

    // Manually advanced clock for deterministic TTL checks.
    struct fake_clock {
        std::shared_ptr<Stanza::path_cache::time_point> now =
            std::make_shared<Stanza::path_cache::time_point>(Stanza::path_cache::time_point{ 1h });

        void advance(std::chrono::milliseconds d) { *now += d; }

        Stanza::path_cache::clock_fn fn() const {
            auto p = now;
            return [p] { return *p; };
        }
    };

    Stanza::document must_parse(std::string_view s) {
        auto r = Stanza::parse(s);
        REQUIRE(r);
        return *r;
    }

    constexpr std::string_view text = R"({"user":{"name":"ada","langs":["c++","ml"]},"n":7})";
}


TEST_CASE("Cached Resolution Matches Direct Resolution") {
    auto doc = must_parse(text);
    Stanza::path_cache cache;

    for (std::string_view p : { "user.name", "user.langs.1", "n", "user.missing", "user.langs[0]", "" }) {
        INFO("path: " << p);
        auto first = cache.resolve(doc, p, 10s);
        auto second = cache.resolve(doc, p, 10s);
        REQUIRE(first == doc.get_path(p));
        REQUIRE(second == doc.get_path(p));
    }

    auto s = cache.stats();
    REQUIRE(s.misses == 6);
    REQUIRE(s.hits == 6);
    REQUIRE(s.sets == 6);
    REQUIRE(s.size == 6);
    REQUIRE(s.hit_rate() == Approx(0.5));
}

TEST_CASE("Absent Results Are Cached Too") {
    auto doc = must_parse(text);
    Stanza::path_cache cache;

    REQUIRE_FALSE(cache.resolve(doc, "nope.nothing", 1s).exists());
    REQUIRE_FALSE(cache.resolve(doc, "nope.nothing", 1s).exists());
    REQUIRE(cache.stats().hits == 1);
}

TEST_CASE("Entries Expire After Their TTL") {
    auto doc = must_parse(text);
    fake_clock clock;
    Stanza::path_cache cache{ {}, clock.fn() };

    REQUIRE(cache.resolve(doc, "user.name", 100ms).string_or("") == "ada");

    clock.advance(99ms);
    REQUIRE(cache.resolve(doc, "user.name", 100ms).string_or("") == "ada");
    REQUIRE(cache.stats().hits == 1);

    clock.advance(1ms);
    REQUIRE(cache.resolve(doc, "user.name", 100ms).string_or("") == "ada");

    auto s = cache.stats();
    REQUIRE(s.hits == 1);
    REQUIRE(s.expirations == 1);
    REQUIRE(s.misses == 2);
    REQUIRE(s.size == 1);
}

TEST_CASE("Default TTL Comes From CacheOptions") {
    auto doc = must_parse(text);
    fake_clock clock;
    Stanza::CacheOptions opts;
    opts.default_ttl = 5s;
    Stanza::path_cache cache{ opts, clock.fn() };

    (void)cache.resolve(doc, "n");
    clock.advance(4s);
    (void)cache.resolve(doc, "n");
    REQUIRE(cache.stats().hits == 1);

    clock.advance(2s);
    (void)cache.resolve(doc, "n");
    REQUIRE(cache.stats().expirations == 1);
}

TEST_CASE("Least Recently Used Entry is Evicted") {
    auto doc = must_parse(text);
    Stanza::CacheOptions opts;
    opts.max_entries = 2;

    std::vector<std::string> log;
    opts.logger = [&](Stanza::log_level lvl, std::string_view msg) {
        if (lvl == Stanza::log_level::trace) log.emplace_back(msg);
    };
    Stanza::path_cache cache{ opts };

    (void)cache.resolve(doc, "user.name", 1min);
    (void)cache.resolve(doc, "n", 1min);
    (void)cache.resolve(doc, "user.name", 1min); // touch: "n" is now oldest
    (void)cache.resolve(doc, "user.langs", 1min);

    auto s = cache.stats();
    REQUIRE(s.size == 2);
    REQUIRE(s.max_size == 2);
    REQUIRE(s.evictions == 1);
    REQUIRE(log.size() == 1);
    REQUIRE(log[0].find("'n'") != std::string::npos);

    (void)cache.resolve(doc, "user.name", 1min);
    REQUIRE(cache.stats().hits == 2);

    (void)cache.resolve(doc, "n", 1min);
    REQUIRE(cache.stats().misses == 4);
}

TEST_CASE("Logger May Call Back Into the Cache") {
    auto doc = must_parse(text);
    fake_clock clock;
    Stanza::CacheOptions opts;
    opts.max_entries = 1;

    Stanza::path_cache* self = nullptr;
    std::vector<std::uint64_t> seen_evictions;
    std::size_t expiry_records = 0;
    opts.logger = [&](Stanza::log_level, std::string_view msg) {
        auto s = self->stats();
        if (msg.find("evicted") != std::string_view::npos) seen_evictions.push_back(s.evictions);
        if (msg.find("expired") != std::string_view::npos) expiry_records++;
    };
    Stanza::path_cache cache{ opts, clock.fn() };
    self = &cache;

    REQUIRE(cache.resolve(doc, "user.name", 1s).string_or("") == "ada");
    REQUIRE(cache.resolve(doc, "n", 1s).int_or(0) == 7);
    REQUIRE(seen_evictions == std::vector<std::uint64_t>{ 1 });

    clock.advance(2s);
    REQUIRE(cache.resolve(doc, "n", 1s).int_or(0) == 7);
    REQUIRE(expiry_records == 1);
    REQUIRE(cache.stats().size == 1);
}

TEST_CASE("Non-positive TTL and Disabled Cache Bypass Storage") {
    auto doc = must_parse(text);

    Stanza::path_cache cache;
    REQUIRE(cache.resolve(doc, "n", 0ms).int_or(0) == 7);
    REQUIRE(cache.resolve(doc, "n", -5ms).int_or(0) == 7);
    REQUIRE(cache.stats().size == 0);
    REQUIRE(cache.stats().misses == 0);

    Stanza::CacheOptions off;
    off.enabled = false;
    Stanza::path_cache disabled{ off };
    REQUIRE(disabled.resolve(doc, "user.langs.0", 1min).string_or("") == "c++");
    REQUIRE(disabled.resolve(doc, "user.langs.0", 1min).string_or("") == "c++");
    REQUIRE(disabled.stats().size == 0);
    REQUIRE(disabled.stats().hits == 0);
}

TEST_CASE("Entries Are Scoped Per Document") {
    auto a = must_parse(R"({"v":1})");
    auto b = must_parse(R"({"v":2})");
    Stanza::path_cache cache;

    REQUIRE(cache.resolve(a, "v", 1min).int_or(0) == 1);
    REQUIRE(cache.resolve(b, "v", 1min).int_or(0) == 2);
    REQUIRE(cache.stats().size == 2);

    cache.erase(a);
    REQUIRE(cache.stats().size == 1);
    REQUIRE(cache.resolve(b, "v", 1min).int_or(0) == 2);
    REQUIRE(cache.stats().hits == 1);

    cache.clear();
    REQUIRE(cache.stats().size == 0);
}

TEST_CASE("Absent Document Resolves to Absent Node") {
    Stanza::path_cache cache;
    REQUIRE_FALSE(cache.resolve(Stanza::document{}, "a", 1min).exists());
    REQUIRE(cache.stats().size == 0);
}

TEST_CASE("Concurrent Readers Share One Cache") {
    auto doc = must_parse(text);
    Stanza::CacheOptions opts;
    opts.max_entries = 3;
    Stanza::path_cache cache{ opts };

    const std::vector<std::string_view> paths{ "user.name", "user.langs.0", "user.langs.1", "n", "user" };
    std::atomic<int> failures{ 0 };
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 2000; i++) {
                auto p = paths[static_cast<size_t>(i + t) % paths.size()];
                if (cache.resolve(doc, p, 1min) != doc.get_path(p)) failures++;
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(failures.load() == 0);
    auto s = cache.stats();
    REQUIRE(s.size <= 3);
    REQUIRE(s.hits + s.misses == 8 * 2000);
}
