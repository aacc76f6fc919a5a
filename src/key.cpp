#include "key.hpp"
#include "util.hpp"
#include <cmath>

namespace memocache {

// Floats holding an integral value become integers (-0.0 becomes 0), so
// values that compare equal as JSON serialize identically.
static nlohmann::json canonical_numbers(const nlohmann::json& j) {
    if (j.is_number_float()) {
        double d = j.get<double>();
        if (std::isfinite(d) && std::floor(d) == d &&
            d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
            return static_cast<int64_t>(d);
        }
        return j;
    }
    if (j.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : j) out.push_back(canonical_numbers(item));
        return out;
    }
    if (j.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (const auto& [key, value] : j.items()) out[key] = canonical_numbers(value);
        return out;
    }
    return j;
}

static std::string dump_json(const nlohmann::json& j) {
    // nlohmann::json objects are std::map backed, so keys come out sorted
    // and permuted objects serialize identically.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string normalized_signature(const std::string& uid, const Args& resolved) {
    nlohmann::json doc = {
        {"prefix", uid},
        {"signature", canonical_numbers(resolved)}
    };
    return dump_json(doc);
}

std::string primitive_key(const Args& resolved) {
    std::string key;
    for (size_t i = 0; i < resolved.size(); ++i) {
        if (i > 0) key += '\0';
        const auto& arg = resolved[i];
        key += arg.is_string() ? arg.get<std::string>() : dump_json(canonical_numbers(arg));
    }
    return key;
}

std::string KeyDeriver::derive(const Args& resolved, const Options& options) {
    if (options.key_generator) {
        return options.key_generator(options.effective_uid(), resolved);
    }
    if (options.mode == KeyMode::Primitive) {
        return primitive_key(resolved);
    }
    return hashed(normalized_signature(options.effective_uid(), resolved));
}

std::string KeyDeriver::hashed(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = memo_.find(text);
        if (it != memo_.end()) return it->second;
    }

    std::string digest = md5_hex(text);

    std::lock_guard<std::mutex> lock(mutex_);
    if (memo_.size() >= memo_limit_) memo_.clear();
    memo_.emplace(text, digest);
    return digest;
}

void KeyDeriver::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    memo_.clear();
}

size_t KeyDeriver::memo_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return memo_.size();
}

} // namespace memocache
