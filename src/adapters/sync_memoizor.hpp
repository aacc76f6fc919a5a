#pragma once
#include "../memoizor.hpp"
#include <functional>

namespace memocache {

// Memoizes a target that returns its result directly. Exceptions from the
// target or the store propagate to the caller; failed calls are not cached.
class SyncMemoizor : public Memoizor {
public:
    using Target = std::function<nlohmann::json(const Args&)>;

    // Throws std::invalid_argument if target is empty.
    SyncMemoizor(Target target, std::shared_ptr<CacheEngine> engine);

    nlohmann::json operator()(const Args& args) const;

    std::string key(const Args& args) const;
    Cached get(const Args& args) const;
    nlohmann::json save(const nlohmann::json& value, const Args& args) const;
    Cached remove(const Args& args) const;
    void empty() const;

private:
    Target target_;
};

} // namespace memocache
