#include <catch2/catch.hpp>
#include "memocache.hpp"
#include <stdexcept>
#include <string>

using namespace memocache;

static Options named(const std::string& name) {
    Options opts;
    opts.name = name;
    return opts;
}

// ── Calls ────────────────────────────────────────────────────────

TEST_CASE("SyncMemoizor: second call is served from the cache", "[sync]") {
    int calls = 0;
    auto add = memoize_sync([&](const Args& a) -> nlohmann::json {
        calls++;
        return a.at(0).get<int>() + a.at(1).get<int>();
    }, named("add"));

    REQUIRE(add({1, 2}) == 3);
    REQUIRE(add({1, 2}) == 3);
    REQUIRE(calls == 1);

    REQUIRE(add({2, 1}) == 3);
    REQUIRE(calls == 2);
}

TEST_CASE("SyncMemoizor: null results are cached", "[sync]") {
    int calls = 0;
    auto lookup = memoize_sync([&](const Args&) -> nlohmann::json {
        calls++;
        return nullptr;
    });
    REQUIRE(lookup({"x"}).is_null());
    REQUIRE(lookup({"x"}).is_null());
    REQUIRE(calls == 1);
}

TEST_CASE("SyncMemoizor: exceptions propagate and are not cached", "[sync]") {
    int calls = 0;
    auto flaky = memoize_sync([&](const Args&) -> nlohmann::json {
        if (++calls == 1) throw std::runtime_error("first call fails");
        return "ok";
    });

    REQUIRE_THROWS_AS(flaky({1}), std::runtime_error);
    REQUIRE(flaky.store_contents().empty());
    REQUIRE(flaky({1}) == "ok");
    REQUIRE(calls == 2);
}

TEST_CASE("SyncMemoizor: target receives the raw arguments", "[sync]") {
    Options opts;
    opts.max_args = 1;
    Args seen;
    auto f = memoize_sync([&](const Args& a) -> nlohmann::json {
        seen = a;
        return a.size();
    }, opts);

    REQUIRE(f({1, 2, 3}) == 3);
    REQUIRE(seen.size() == 3);
    // Same first argument, same key.
    REQUIRE(f({1, 9}) == 3);
}

TEST_CASE("SyncMemoizor: max_args and ignore_args collapse every call", "[sync]") {
    Options opts;
    opts.max_args = 1;
    opts.ignore_args = {0};
    int calls = 0;
    auto f = memoize_sync([&](const Args&) -> nlohmann::json { return ++calls; }, opts);

    REQUIRE(f({"a"}) == 1);
    REQUIRE(f({"b", "c"}) == 1);
    REQUIRE(f.key({"x"}) == f.key({}));
}

TEST_CASE("SyncMemoizor: recursion shares one cache", "[sync]") {
    int calls = 0;
    std::shared_ptr<SyncMemoizor> fib;
    fib = std::make_shared<SyncMemoizor>(memoize_sync([&](const Args& a) -> nlohmann::json {
        calls++;
        auto n = a.at(0).get<int>();
        if (n < 2) return n;
        return (*fib)({n - 1}).get<long>() + (*fib)({n - 2}).get<long>();
    }, named("fib")));

    REQUIRE((*fib)({30}) == 832040);
    REQUIRE(calls == 31);
}

// ── Enable / disable ─────────────────────────────────────────────

TEST_CASE("SyncMemoizor: disabled memoizor calls through", "[sync]") {
    int calls = 0;
    auto f = memoize_sync([&](const Args&) -> nlohmann::json { return ++calls; });

    REQUIRE(f({1}) == 1);
    REQUIRE(f.disable());
    REQUIRE_FALSE(f.enabled());
    REQUIRE(f({1}) == 2);
    REQUIRE(f({1}) == 3);

    REQUIRE(f.enable());
    REQUIRE(f({1}) == 1);
}

TEST_CASE("SyncMemoizor: disable with empty forgets results", "[sync]") {
    int calls = 0;
    auto f = memoize_sync([&](const Args&) -> nlohmann::json { return ++calls; });
    f({1});
    f.disable(true);
    f.enable();
    REQUIRE(f({1}) == 2);
}

// ── Management ───────────────────────────────────────────────────

TEST_CASE("SyncMemoizor: default key is 32 hex chars and stable", "[sync]") {
    auto f = memoize_sync([](const Args&) -> nlohmann::json { return 0; }, named("k"));
    auto k = f.key({1, "two", {{"three", 3}}});
    REQUIRE(k.size() == 32);
    REQUIRE(k.find_first_not_of("0123456789abcdef") == std::string::npos);
    REQUIRE(k == f.key({1, "two", {{"three", 3}}}));
}

TEST_CASE("SyncMemoizor: get, save, remove, empty", "[sync]") {
    int calls = 0;
    auto f = memoize_sync([&](const Args&) -> nlohmann::json { return ++calls; });

    REQUIRE_FALSE(f.get({1}).has_value());
    f.save(42, {1});
    REQUIRE(f.get({1}).value_or(nullptr) == 42);
    REQUIRE(f({1}) == 42);
    REQUIRE(calls == 0);

    REQUIRE(f.remove({1}).value_or(nullptr) == 42);
    REQUIRE(f({1}) == 1);

    f.save(7, {2});
    f.empty();
    REQUIRE(f.store_contents().empty());
}

TEST_CASE("SyncMemoizor: store_contents is keyed by derived key", "[sync]") {
    auto f = memoize_sync([](const Args& a) -> nlohmann::json { return a.at(0); });
    f({"v"});
    auto contents = f.store_contents();
    REQUIRE(contents.size() == 1);
    REQUIRE(contents.at(f.key({"v"})) == "v");
}

TEST_CASE("SyncMemoizor: set_options with new uid empties the store", "[sync]") {
    auto f = memoize_sync([](const Args&) -> nlohmann::json { return 1; });
    f({1});
    f.set_options(nlohmann::json{{"uid", "fresh"}});
    REQUIRE(f.store_contents().empty());
}

TEST_CASE("SyncMemoizor: set_storage swaps the backend", "[sync]") {
    int calls = 0;
    auto f = memoize_sync([&](const Args&) -> nlohmann::json { return ++calls; });
    f({1});
    f.set_storage(std::make_unique<MapStorage>());
    REQUIRE(f({1}) == 2);
}

TEST_CASE("SyncMemoizor: empty target throws", "[sync]") {
    REQUIRE_THROWS_AS(memoize_sync(SyncMemoizor::Target()), std::invalid_argument);
}

TEST_CASE("SyncMemoizor: null engine throws", "[sync]") {
    REQUIRE_THROWS_AS(SyncMemoizor([](const Args&) -> nlohmann::json { return 0; }, nullptr),
                      std::invalid_argument);
}

TEST_CASE("SyncMemoizor: copies share the cache", "[sync]") {
    int calls = 0;
    auto f = memoize_sync([&](const Args&) -> nlohmann::json { return ++calls; });
    auto g = f;
    f({1});
    REQUIRE(g({1}) == 1);
    REQUIRE(calls == 1);
}

TEST_CASE("memoize_sync: Config picks options and backend", "[sync]") {
    Config cfg;
    cfg.storage = "memory";
    cfg.options.name = "configured";
    auto f = memoize_sync([](const Args&) -> nlohmann::json { return 1; }, cfg);
    REQUIRE(f.name() == "configured");
    REQUIRE(f.engine()->storage().controller_name() == "MapStorage");
}
