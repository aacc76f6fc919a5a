#include "arguments.hpp"
#include <algorithm>

namespace memocache {

static nlohmann::json coerce(const nlohmann::json& arg, size_t index, const Coercion& coercion) {
    if (const auto* single = std::get_if<Coercer>(&coercion)) {
        return *single ? (*single)(arg, index) : arg;
    }
    if (const auto* each = std::get_if<std::vector<Coercer>>(&coercion)) {
        if (index < each->size() && (*each)[index]) return (*each)[index](arg, index);
    }
    return arg;
}

Args resolve_arguments(const Args& raw, const Options& options) {
    size_t count = raw.size();
    if (options.max_args) count = std::min(count, *options.max_args);

    Args coerced;
    coerced.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        coerced.push_back(coerce(raw[i], i, options.coerce_args));
    }

    if (options.ignore_args.empty()) return coerced;

    Args resolved;
    resolved.reserve(count);
    for (size_t i = 0; i < coerced.size(); ++i) {
        bool ignored = std::find(options.ignore_args.begin(), options.ignore_args.end(), i)
                       != options.ignore_args.end();
        if (!ignored) resolved.push_back(std::move(coerced[i]));
    }
    return resolved;
}

} // namespace memocache
