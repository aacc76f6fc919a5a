#include <catch2/catch.hpp>
#include "arguments.hpp"

using namespace memocache;

TEST_CASE("resolve_arguments: no options is identity", "[arguments]") {
    Args raw{1, "two", {{"three", 3}}};
    REQUIRE(resolve_arguments(raw, Options{}) == raw);
}

TEST_CASE("resolve_arguments: max_args truncates by count", "[arguments]") {
    Options opts;
    opts.max_args = 2;
    REQUIRE(resolve_arguments({1, 2, 3, 4}, opts) == Args{1, 2});
}

TEST_CASE("resolve_arguments: max_args larger than list keeps all", "[arguments]") {
    Options opts;
    opts.max_args = 10;
    REQUIRE(resolve_arguments({1, 2}, opts) == Args{1, 2});
}

TEST_CASE("resolve_arguments: ignore_args drops and compacts", "[arguments]") {
    Options opts;
    opts.ignore_args = {0, 2};
    REQUIRE(resolve_arguments({"a", "b", "c", "d"}, opts) == Args{"b", "d"});
}

TEST_CASE("resolve_arguments: ignore_args out of range is harmless", "[arguments]") {
    Options opts;
    opts.ignore_args = {7};
    REQUIRE(resolve_arguments({1, 2}, opts) == Args{1, 2});
}

TEST_CASE("resolve_arguments: single coercer applied to every argument", "[arguments]") {
    Options opts;
    opts.coerce_args = Coercer([](const nlohmann::json& arg, size_t index) {
        return nlohmann::json(arg.get<int>() * 10 + static_cast<int>(index));
    });
    REQUIRE(resolve_arguments({1, 2, 3}, opts) == Args{10, 21, 32});
}

TEST_CASE("resolve_arguments: per-index coercers skip empty slots", "[arguments]") {
    Options opts;
    opts.coerce_args = std::vector<Coercer>{
        Coercer(),
        [](const nlohmann::json& arg, size_t) { return nlohmann::json(arg.get<std::string>().size()); }
    };
    REQUIRE(resolve_arguments({"keep", "hello", "tail"}, opts) == Args{"keep", 5, "tail"});
}

TEST_CASE("resolve_arguments: truncation happens before coercion", "[arguments]") {
    Options opts;
    opts.max_args = 1;
    size_t calls = 0;
    opts.coerce_args = Coercer([&calls](const nlohmann::json& arg, size_t) {
        calls++;
        return arg;
    });
    resolve_arguments({1, 2, 3}, opts);
    REQUIRE(calls == 1);
}

TEST_CASE("resolve_arguments: ignored arguments are still coerced", "[arguments]") {
    Options opts;
    opts.ignore_args = {0};
    std::vector<size_t> seen;
    opts.coerce_args = Coercer([&seen](const nlohmann::json& arg, size_t index) {
        seen.push_back(index);
        return arg;
    });
    REQUIRE(resolve_arguments({"a", "b"}, opts) == Args{"b"});
    REQUIRE(seen == std::vector<size_t>{0, 1});
}

TEST_CASE("resolve_arguments: max_args=1 with ignore_args=[0] collapses everything", "[arguments]") {
    Options opts;
    opts.max_args = 1;
    opts.ignore_args = {0};
    REQUIRE(resolve_arguments({1, 2, 3}, opts).empty());
    REQUIRE(resolve_arguments({"x"}, opts).empty());
}
