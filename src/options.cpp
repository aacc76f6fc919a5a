#include "options.hpp"
#include "util.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace memocache {

std::string mode_to_string(KeyMode mode) {
    return mode == KeyMode::Primitive ? "primitive" : "default";
}

KeyMode mode_from_string(const std::string& s) {
    if (s == "default") return KeyMode::Default;
    if (s == "primitive") return KeyMode::Primitive;
    throw std::invalid_argument("memocache: options.mode must be \"default\" or \"primitive\", got \"" + s + "\"");
}

// Numbers and numeric strings parse like an integer prefix ("60ms" -> 60);
// anything else leaves the option unset.
static std::optional<int64_t> parse_integer(const nlohmann::json& v) {
    if (v.is_number_integer()) return v.get<int64_t>();
    if (v.is_number_unsigned()) {
        auto u = v.get<uint64_t>();
        return static_cast<int64_t>(std::min<uint64_t>(u, std::numeric_limits<int64_t>::max()));
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (!std::isfinite(d)) return std::nullopt;
        if (d >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return std::numeric_limits<int64_t>::max();
        }
        if (d <= static_cast<double>(std::numeric_limits<int64_t>::min())) {
            return std::numeric_limits<int64_t>::min();
        }
        return static_cast<int64_t>(d);
    }
    if (v.is_string()) {
        std::string s = trim(v.get<std::string>());
        if (s.empty()) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        long long parsed = std::strtoll(s.c_str(), &end, 10);
        if (end == s.c_str() || errno == ERANGE) return std::nullopt;
        return static_cast<int64_t>(parsed);
    }
    return std::nullopt;
}

static size_t parse_index(const nlohmann::json& v) {
    static const char* msg = "memocache: values of options.ignore_args must be finite non-negative integers";
    if (v.is_number_unsigned()) return static_cast<size_t>(v.get<uint64_t>());
    if (v.is_number_integer()) {
        auto i = v.get<int64_t>();
        if (i < 0) throw std::invalid_argument(msg);
        return static_cast<size_t>(i);
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (!std::isfinite(d) || d < 0 || std::floor(d) != d ||
            d > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
            throw std::invalid_argument(msg);
        }
        return static_cast<size_t>(d);
    }
    if (v.is_string()) {
        auto i = parse_integer(v);
        if (!i || *i < 0) throw std::invalid_argument(msg);
        return static_cast<size_t>(*i);
    }
    throw std::invalid_argument(msg);
}

Options& Options::validate() {
    if (ttl && *ttl < kMinTtl) ttl = kMinTtl;
    if (lru_percent_padding < 1) lru_percent_padding = 1;
    if (!std::isfinite(lru_history_factor) || lru_history_factor < 1.0) {
        lru_history_factor = 1.0;
    }
    if (max_args && *max_args < 1) max_args = 1;
    if (name.empty()) name = "anonymous";
    return *this;
}

std::string Options::effective_uid() const {
    return uid.empty() ? "MEMOCACHE:" + name : uid;
}

Options Options::from_json(const nlohmann::json& j) {
    Options opts;
    if (!j.is_object()) return opts;

    if (j.contains("name") && j["name"].is_string())
        opts.name = j["name"].get<std::string>();

    if (j.contains("uid") && !j["uid"].is_null()) {
        if (!j["uid"].is_string()) {
            throw std::invalid_argument("memocache: options.uid must be a string");
        }
        opts.uid = j["uid"].get<std::string>();
    }

    if (j.contains("ttl")) {
        if (auto v = parse_integer(j["ttl"])) opts.ttl = std::chrono::milliseconds(*v);
    }
    if (j.contains("max_records")) {
        if (auto v = parse_integer(j["max_records"]))
            opts.max_records = static_cast<uint64_t>(std::max<int64_t>(0, *v));
    }
    if (j.contains("max_args")) {
        if (auto v = parse_integer(j["max_args"]))
            opts.max_args = static_cast<size_t>(std::max<int64_t>(1, *v));
    }
    if (j.contains("lru_percent_padding")) {
        if (auto v = parse_integer(j["lru_percent_padding"])) {
            int64_t clamped = std::clamp<int64_t>(*v, 1, std::numeric_limits<uint32_t>::max());
            opts.lru_percent_padding = static_cast<uint32_t>(clamped);
        }
    }
    if (j.contains("lru_history_factor") && j["lru_history_factor"].is_number())
        opts.lru_history_factor = j["lru_history_factor"].get<double>();

    if (j.contains("ignore_args") && !j["ignore_args"].is_null()) {
        const auto& ia = j["ignore_args"];
        if (!ia.is_array()) {
            throw std::invalid_argument("memocache: options.ignore_args must be an array");
        }
        for (const auto& item : ia) {
            opts.ignore_args.push_back(parse_index(item));
        }
    }

    if (j.contains("mode") && !j["mode"].is_null()) {
        if (!j["mode"].is_string()) {
            throw std::invalid_argument("memocache: options.mode must be a string");
        }
        opts.mode = mode_from_string(j["mode"].get<std::string>());
    }

    if (j.contains("callback_index")) {
        auto v = parse_integer(j["callback_index"]);
        if (v && *v >= 0) opts.callback_index = static_cast<size_t>(*v);
    }

    opts.validate();
    return opts;
}

Options Options::merged(const nlohmann::json& patch) const {
    nlohmann::json j = to_json();
    if (patch.is_object()) {
        for (auto& [key, value] : patch.items()) {
            j[key] = value;
        }
    }
    Options out = from_json(j);
    out.coerce_args = coerce_args;
    out.key_generator = key_generator;
    return out;
}

nlohmann::json Options::to_json() const {
    nlohmann::json j = {
        {"name", name},
        {"uid", uid},
        {"ttl", nullptr},
        {"max_records", nullptr},
        {"max_args", nullptr},
        {"lru_percent_padding", lru_percent_padding},
        {"lru_history_factor", lru_history_factor},
        {"ignore_args", ignore_args},
        {"mode", mode_to_string(mode)},
        {"callback_index", nullptr}
    };
    if (ttl) j["ttl"] = ttl->count();
    if (max_records) j["max_records"] = *max_records;
    if (max_args) j["max_args"] = *max_args;
    if (callback_index) j["callback_index"] = *callback_index;
    return j;
}

nlohmann::json Options::defaults_json() {
    return Options{}.to_json();
}

} // namespace memocache
