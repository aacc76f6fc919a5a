#include <catch2/catch.hpp>
#include "key.hpp"
#include "util.hpp"

using namespace memocache;

static bool is_hex_digest(const std::string& s) {
    if (s.size() != 32) return false;
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

// ── Default mode ─────────────────────────────────────────────────

TEST_CASE("KeyDeriver: default mode yields a 32-char hex digest", "[key]") {
    KeyDeriver deriver;
    auto key = deriver.derive({1, 2, 3}, Options{});
    REQUIRE(is_hex_digest(key));
}

TEST_CASE("KeyDeriver: default mode is deterministic", "[key]") {
    KeyDeriver a;
    KeyDeriver b;
    Options opts;
    opts.name = "fixed";
    REQUIRE(a.derive({1, 2, 3}, opts) == a.derive({1, 2, 3}, opts));
    REQUIRE(a.derive({1, 2, 3}, opts) == b.derive({1, 2, 3}, opts));
}

TEST_CASE("KeyDeriver: default key is md5 of the normalized signature", "[key]") {
    KeyDeriver deriver;
    Options opts;
    opts.uid = "ns";
    REQUIRE(normalized_signature("ns", {1, "a"}) == R"({"prefix":"ns","signature":[1,"a"]})");
    REQUIRE(deriver.derive({1, "a"}, opts) == md5_hex(R"({"prefix":"ns","signature":[1,"a"]})"));
}

TEST_CASE("KeyDeriver: object key order does not matter", "[key]") {
    KeyDeriver deriver;
    auto first = nlohmann::json::parse(R"({"foo":"hello","bar":"world"})");
    auto second = nlohmann::json::parse(R"({"bar":"world","foo":"hello"})");
    REQUIRE(deriver.derive({first}, Options{}) == deriver.derive({second}, Options{}));
}

TEST_CASE("KeyDeriver: different arguments give different keys", "[key]") {
    KeyDeriver deriver;
    REQUIRE(deriver.derive({1, 2, 3}, Options{}) != deriver.derive({1, 2, 4}, Options{}));
    REQUIRE(deriver.derive({"1"}, Options{}) != deriver.derive({1}, Options{}));
}

TEST_CASE("KeyDeriver: uid namespaces keys", "[key]") {
    KeyDeriver deriver;
    Options a;
    a.uid = "one";
    Options b;
    b.uid = "two";
    REQUIRE(deriver.derive({1}, a) != deriver.derive({1}, b));
}

TEST_CASE("KeyDeriver: digests are memoized and bounded", "[key]") {
    KeyDeriver deriver(2);
    deriver.derive({1}, Options{});
    deriver.derive({1}, Options{});
    REQUIRE(deriver.memo_size() == 1);

    deriver.derive({2}, Options{});
    deriver.derive({3}, Options{});
    REQUIRE(deriver.memo_size() <= 2);

    deriver.reset();
    REQUIRE(deriver.memo_size() == 0);
}

// ── Primitive mode ───────────────────────────────────────────────

TEST_CASE("KeyDeriver: integral floats key like integers", "[key]") {
    KeyDeriver deriver;
    Options opts;
    REQUIRE(nlohmann::json(1) == nlohmann::json(1.0));
    REQUIRE(deriver.derive({1}, opts) == deriver.derive({1.0}, opts));
    REQUIRE(deriver.derive({0}, opts) == deriver.derive({-0.0}, opts));
    REQUIRE(deriver.derive({{{"n", 2}, {"xs", {3, 4}}}}, opts) ==
            deriver.derive({{{"n", 2.0}, {"xs", {3.0, 4}}}}, opts));
    REQUIRE(deriver.derive({1}, opts) != deriver.derive({1.5}, opts));
}

TEST_CASE("KeyDeriver: primitive mode normalizes integral floats", "[key]") {
    KeyDeriver deriver;
    Options opts;
    opts.mode = KeyMode::Primitive;
    REQUIRE(deriver.derive({1.0, 2}, opts) == deriver.derive({1, 2.0}, opts));
    REQUIRE(deriver.derive({2.5}, opts) == "2.5");
}

TEST_CASE("KeyDeriver: primitive mode joins with NUL", "[key]") {
    KeyDeriver deriver;
    Options opts;
    opts.mode = KeyMode::Primitive;
    REQUIRE(deriver.derive({1, 2, 3}, opts) == std::string("1\0" "2\0" "3", 5));
}

TEST_CASE("KeyDeriver: primitive mode uses raw string text", "[key]") {
    Options opts;
    opts.mode = KeyMode::Primitive;
    KeyDeriver deriver;
    REQUIRE(deriver.derive({"abc", true}, opts) == std::string("abc\0true", 8));
    REQUIRE(primitive_key({}).empty());
}

// ── Custom generator ─────────────────────────────────────────────

TEST_CASE("KeyDeriver: key_generator result used verbatim", "[key]") {
    Options opts;
    opts.uid = "ns";
    opts.key_generator = [](const std::string& uid, const Args& args) {
        return uid + ":" + std::to_string(args.size());
    };
    KeyDeriver deriver;
    REQUIRE(deriver.derive({1, 2}, opts) == "ns:2");
    REQUIRE(deriver.memo_size() == 0);
}
