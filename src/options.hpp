#pragma once
#include "value.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace memocache {

enum class KeyMode { Default, Primitive };

// Replaces an argument for key/storage purposes: (arg, index) -> coerced.
using Coercer = std::function<nlohmann::json(const nlohmann::json&, size_t)>;

// No coercion, one coercer for every argument, or one per index (empty
// entries leave that argument alone).
using Coercion = std::variant<std::monostate, Coercer, std::vector<Coercer>>;

// (uid, resolved args) -> key, used verbatim.
using KeyGenerator = std::function<std::string(const std::string&, const Args&)>;

constexpr std::chrono::milliseconds kMinTtl{60};
constexpr uint32_t kDefaultPercentPadding = 10;
constexpr double kDefaultHistoryFactor = 2.0;

struct Options {
    std::string name = "anonymous";
    std::string uid;                                // empty = "MEMOCACHE:" + name
    std::optional<std::chrono::milliseconds> ttl;
    std::optional<uint64_t> max_records;
    uint32_t lru_percent_padding = kDefaultPercentPadding;
    double lru_history_factor = kDefaultHistoryFactor;
    std::optional<size_t> max_args;
    std::vector<size_t> ignore_args;
    Coercion coerce_args;
    KeyGenerator key_generator;
    KeyMode mode = KeyMode::Default;
    std::optional<size_t> callback_index;

    // Clamp numeric fields into range. Returns *this.
    Options& validate();

    // Namespace actually mixed into keys.
    std::string effective_uid() const;

    bool has_coercion() const { return !std::holds_alternative<std::monostate>(coerce_args); }

    // Parse the JSON-expressible subset. Throws std::invalid_argument on
    // malformed uid / ignore_args / mode. Result is validated.
    static Options from_json(const nlohmann::json& j);

    // Merge a JSON patch into a copy of this. Callables are kept.
    Options merged(const nlohmann::json& patch) const;

    // JSON-expressible subset (callables omitted).
    nlohmann::json to_json() const;

    // Defaults in JSON form.
    static nlohmann::json defaults_json();
};

std::string mode_to_string(KeyMode mode);
KeyMode mode_from_string(const std::string& s);

} // namespace memocache
