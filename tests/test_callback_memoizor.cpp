#include <catch2/catch.hpp>
#include "memocache.hpp"
#include <exception>
#include <stdexcept>
#include <string>

using namespace memocache;

namespace {

// Captures what a completion callback was called with.
struct Outcome {
    int calls = 0;
    std::exception_ptr error;
    Args results;

    Callback callback() {
        return [this](std::exception_ptr e, const Args& r) {
            calls++;
            error = e;
            results = r;
        };
    }
};

// (x, done) -> done(null, x * 2)
CallbackMemoizor make_doubler(int& target_calls, Options opts = {}) {
    return memoize_callback([&target_calls](CallArgs args) {
        target_calls++;
        int x = value_at(args, 0)->get<int>();
        (*callback_at(args, 1))(nullptr, Args{x * 2});
    }, std::move(opts));
}

} // namespace

// ── Calls ────────────────────────────────────────────────────────

TEST_CASE("CallbackMemoizor: result is stored with a null error slot", "[callback]") {
    int target_calls = 0;
    auto doubler = make_doubler(target_calls);
    Outcome out;

    doubler(CallArgs{nlohmann::json(4), out.callback()});
    REQUIRE(out.calls == 1);
    REQUIRE_FALSE(out.error);
    REQUIRE(out.results == Args{8});

    auto contents = doubler.store_contents();
    REQUIRE(contents.size() == 1);
    REQUIRE(contents.begin()->second == nlohmann::json::array({nullptr, 8}));
}

TEST_CASE("CallbackMemoizor: second call does not reach the target", "[callback]") {
    int target_calls = 0;
    auto doubler = make_doubler(target_calls);
    Outcome first;
    Outcome second;

    doubler(CallArgs{nlohmann::json(4), first.callback()});
    doubler(CallArgs{nlohmann::json(4), second.callback()});

    REQUIRE(target_calls == 1);
    REQUIRE(second.calls == 1);
    REQUIRE(second.results == Args{8});
}

TEST_CASE("CallbackMemoizor: errors are delivered and not cached", "[callback]") {
    int target_calls = 0;
    auto f = memoize_callback([&](CallArgs args) {
        target_calls++;
        (*callback_at(args, 1))(std::make_exception_ptr(std::runtime_error("nope")), Args{});
    });

    Outcome out;
    f(CallArgs{nlohmann::json(1), out.callback()});
    REQUIRE(out.calls == 1);
    REQUIRE(out.error);
    REQUIRE_THROWS_AS(std::rethrow_exception(out.error), std::runtime_error);
    REQUIRE(f.store_contents().empty());

    f(CallArgs{nlohmann::json(1), Outcome().callback()});
    REQUIRE(target_calls == 2);
}

TEST_CASE("CallbackMemoizor: completion fires exactly once", "[callback]") {
    auto f = memoize_callback([](CallArgs args) {
        const auto* done = callback_at(args, 0);
        (*done)(nullptr, Args{"first"});
        (*done)(nullptr, Args{"second"});
    });

    Outcome out;
    f(CallArgs{out.callback()});
    REQUIRE(out.calls == 1);
    REQUIRE(out.results == Args{"first"});
    REQUIRE(f.store_contents().begin()->second == nlohmann::json::array({nullptr, "first"}));
}

TEST_CASE("CallbackMemoizor: callback_index picks the completion", "[callback]") {
    Options opts;
    opts.callback_index = 0;
    Args seen;
    auto f = memoize_callback([&](CallArgs args) {
        REQUIRE(callback_at(args, 0) != nullptr);
        seen = {*value_at(args, 1), *value_at(args, 2)};
        (*callback_at(args, 0))(nullptr, Args{"ok"});
    }, opts);

    Outcome out;
    f(CallArgs{out.callback(), nlohmann::json("a"), nlohmann::json("b")});
    REQUIRE(out.calls == 1);
    REQUIRE(seen == Args{"a", "b"});
}

TEST_CASE("CallbackMemoizor: callback_index past the end is clamped", "[callback]") {
    Options opts;
    opts.callback_index = 10;
    auto f = memoize_callback([](CallArgs args) {
        REQUIRE(args.size() == 2);
        (*callback_at(args, 1))(nullptr, Args{*value_at(args, 0)});
    }, opts);

    Outcome out;
    f(CallArgs{nlohmann::json(5)});
    // The completion slot is filled by the wrapper; the caller has none.
    REQUIRE(out.calls == 0);
    REQUIRE(f.store_contents().size() == 1);
}

TEST_CASE("CallbackMemoizor: missing completion still runs the target", "[callback]") {
    int target_calls = 0;
    auto f = memoize_callback([&](CallArgs args) {
        target_calls++;
        (*callback_at(args, 0))(nullptr, Args{"done"});
    });

    f(CallArgs{nlohmann::json("not a callback")});
    REQUIRE(target_calls == 1);
    REQUIRE(f.store_contents().size() == 1);
}

TEST_CASE("CallbackMemoizor: synchronous throw goes to the completion", "[callback]") {
    auto f = memoize_callback([](CallArgs) {
        throw std::invalid_argument("bad call");
    });

    Outcome out;
    REQUIRE_NOTHROW(f(CallArgs{nlohmann::json(1), out.callback()}));
    REQUIRE(out.calls == 1);
    REQUIRE_THROWS_AS(std::rethrow_exception(out.error), std::invalid_argument);
    REQUIRE(f.store_contents().empty());
}

TEST_CASE("CallbackMemoizor: completion kept past a throw does not cache", "[callback]") {
    Callback kept;
    auto f = memoize_callback([&](CallArgs args) {
        kept = *callback_at(args, 1);
        throw std::runtime_error("failed before completing");
    });

    Outcome out;
    f(CallArgs{nlohmann::json(4), out.callback()});
    REQUIRE(out.calls == 1);
    REQUIRE_THROWS_AS(std::rethrow_exception(out.error), std::runtime_error);

    REQUIRE(kept);
    kept(nullptr, Args{8});
    REQUIRE(out.calls == 1);
    REQUIRE(f.store_contents().empty());
}

TEST_CASE("CallbackMemoizor: throw after completion is surfaced to the caller", "[callback]") {
    auto f = memoize_callback([](CallArgs args) {
        (*callback_at(args, 0))(nullptr, Args{1});
        throw std::runtime_error("late failure");
    });

    Outcome out;
    REQUIRE_THROWS_AS(f(CallArgs{out.callback()}), std::runtime_error);
    REQUIRE(out.calls == 1);
    REQUIRE_FALSE(out.error);
}

TEST_CASE("CallbackMemoizor: disabled memoizor passes the caller's completion", "[callback]") {
    int target_calls = 0;
    auto doubler = make_doubler(target_calls);
    doubler.disable();

    Outcome out;
    doubler(CallArgs{nlohmann::json(3), out.callback()});
    doubler(CallArgs{nlohmann::json(3), out.callback()});
    REQUIRE(target_calls == 2);
    REQUIRE(out.calls == 2);
    REQUIRE(doubler.store_contents().empty());
}

// ── Management ───────────────────────────────────────────────────

TEST_CASE("CallbackMemoizor: key and get report through callbacks", "[callback]") {
    int target_calls = 0;
    auto doubler = make_doubler(target_calls);
    doubler(CallArgs{nlohmann::json(4), Outcome().callback()});

    std::string key;
    doubler.key({4}, [&](std::exception_ptr e, const std::string& k) {
        REQUIRE_FALSE(e);
        key = k;
    });
    REQUIRE(key.size() == 32);
    REQUIRE(doubler.store_contents().count(key) == 1);

    Cached got;
    doubler.get({4}, [&](std::exception_ptr, const Cached& c) { got = c; });
    REQUIRE(got.value_or(nullptr) == nlohmann::json::array({nullptr, 8}));
}

TEST_CASE("CallbackMemoizor: save wraps plain values", "[callback]") {
    int target_calls = 0;
    auto doubler = make_doubler(target_calls);

    Cached saved;
    doubler.save(100, {5}, [&](std::exception_ptr, const Cached& c) { saved = c; });
    REQUIRE(saved.value_or(nullptr) == nlohmann::json::array({nullptr, 100}));

    Outcome out;
    doubler(CallArgs{nlohmann::json(5), out.callback()});
    REQUIRE(target_calls == 0);
    REQUIRE(out.results == Args{100});

    doubler.save(nlohmann::json::array({nullptr, 1, 2}), {6}, [](std::exception_ptr, const Cached&) {});
    Outcome multi;
    doubler(CallArgs{nlohmann::json(6), multi.callback()});
    REQUIRE(multi.results == Args{1, 2});
}

TEST_CASE("CallbackMemoizor: remove and empty", "[callback]") {
    int target_calls = 0;
    auto doubler = make_doubler(target_calls);
    doubler(CallArgs{nlohmann::json(1), Outcome().callback()});
    doubler(CallArgs{nlohmann::json(2), Outcome().callback()});

    Cached removed;
    doubler.remove({1}, [&](std::exception_ptr, const Cached& c) { removed = c; });
    REQUIRE(removed.value_or(nullptr) == nlohmann::json::array({nullptr, 2}));
    REQUIRE(doubler.store_contents().size() == 1);

    bool done = false;
    doubler.empty([&](std::exception_ptr e) { done = !e; });
    REQUIRE(done);
    REQUIRE(doubler.store_contents().empty());
}

TEST_CASE("CallbackMemoizor: storage failure reaches the management callback", "[callback]") {
    class BrokenStorage : public MapStorage {
    public:
        void empty() override { throw std::runtime_error("locked"); }
    };

    int target_calls = 0;
    auto doubler = make_doubler(target_calls);
    doubler.set_storage(std::make_unique<BrokenStorage>());

    std::exception_ptr error;
    doubler.empty([&](std::exception_ptr e) { error = e; });
    REQUIRE(error);
}

TEST_CASE("CallbackMemoizor: empty target throws", "[callback]") {
    REQUIRE_THROWS_AS(memoize_callback(CallbackMemoizor::Target()), std::invalid_argument);
}
