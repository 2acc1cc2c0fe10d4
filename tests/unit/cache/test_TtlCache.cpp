#include <doctest/doctest.h>
#include <docket/cache/TtlCache.hpp>

#include <string>
#include <vector>

using namespace DK;
using namespace std::chrono_literals;

TEST_SUITE("cache.ttl") {

TEST_CASE("Entries live strictly before their expiry") {
    TtlCache<std::string> cache{60s};
    auto const            t0 = TtlCache<std::string>::Clock::now();

    cache.set(CacheNamespace::Search, "k", "v", t0);
    REQUIRE(cache.get(CacheNamespace::Search, "k", t0 + 59s).has_value());
    CHECK(*cache.get(CacheNamespace::Search, "k", t0 + 59s) == "v");

    CHECK_FALSE(cache.get(CacheNamespace::Search, "k", t0 + 60s).has_value());
}

TEST_CASE("An expired entry is evicted by the read that finds it") {
    TtlCache<int> cache{10s};
    auto const    t0 = TtlCache<int>::Clock::now();
    cache.set(CacheNamespace::States, "a", 1, t0);
    cache.set(CacheNamespace::States, "b", 2, t0 + 5s);
    CHECK(cache.size() == 2);

    CHECK_FALSE(cache.get(CacheNamespace::States, "a", t0 + 11s).has_value());
    CHECK(cache.size() == 1);
    CHECK(cache.get(CacheNamespace::States, "b", t0 + 11s) == 2);
}

TEST_CASE("Namespaces carry their own lifetimes") {
    TtlCache<int> cache;
    CacheTtls     defaults;
    cache.set_ttl(CacheNamespace::States, defaults.states);
    cache.set_ttl(CacheNamespace::Commissions, defaults.commissions);
    cache.set_ttl(CacheNamespace::Search, defaults.search);

    CHECK(cache.ttl(CacheNamespace::States) == std::chrono::hours{6});
    CHECK(cache.ttl(CacheNamespace::Commissions) == std::chrono::hours{1});
    CHECK(cache.ttl(CacheNamespace::Search) == std::chrono::minutes{5});
    CHECK(cache.ttl("other") == std::chrono::minutes{5});

    auto const t0 = TtlCache<int>::Clock::now();
    cache.set(CacheNamespace::States, "x", 1, t0);
    cache.set(CacheNamespace::Search, "x", 2, t0);
    CHECK(cache.get(CacheNamespace::States, "x", t0 + 30min) == 1);
    CHECK_FALSE(cache.get(CacheNamespace::Search, "x", t0 + 30min).has_value());
}

TEST_CASE("Set overwrites and restarts the lifetime") {
    TtlCache<int> cache{10s};
    auto const    t0 = TtlCache<int>::Clock::now();
    cache.set(CacheNamespace::Search, "k", 1, t0);
    cache.set(CacheNamespace::Search, "k", 2, t0 + 8s);
    CHECK(cache.size() == 1);
    CHECK(cache.get(CacheNamespace::Search, "k", t0 + 15s) == 2);
}

TEST_CASE("Erase and namespace clearing") {
    TtlCache<int> cache;
    cache.set(CacheNamespace::States, "all", 1);
    cache.set(CacheNamespace::Commissions, "10", 2);
    cache.set(CacheNamespace::Commissions, "11", 3);

    cache.erase(CacheNamespace::Commissions, "10");
    CHECK_FALSE(cache.get(CacheNamespace::Commissions, "10").has_value());
    CHECK(cache.size() == 2);

    cache.clear_namespace(CacheNamespace::Commissions);
    CHECK(cache.size() == 1);
    CHECK(cache.get(CacheNamespace::States, "all") == 1);

    cache.clear();
    CHECK(cache.size() == 0);
}

TEST_CASE("Values handed out are detached from the cache") {
    TtlCache<std::vector<int>> cache;
    cache.set(CacheNamespace::Search, "k", std::vector<int>{1, 2, 3});
    auto first = cache.get(CacheNamespace::Search, "k");
    REQUIRE(first);
    first->push_back(4);

    auto second = cache.get(CacheNamespace::Search, "k");
    REQUIRE(second);
    CHECK(second->size() == 3);
}

} // TEST_SUITE
