#pragma once
#include "../memoizor.hpp"
#include <functional>
#include <future>

namespace memocache {

// Memoizes a target that returns a future. Each call runs on its own
// std::async thread and yields a future of the result; target and store
// failures are rethrown by get() on that future.
//
// Concurrent misses for one key are not merged: both reach the target and
// the later save wins.
class FutureMemoizor : public Memoizor {
public:
    using Target = std::function<std::future<nlohmann::json>(const Args&)>;

    // Throws std::invalid_argument if target is empty.
    FutureMemoizor(Target target, std::shared_ptr<CacheEngine> engine);

    std::future<nlohmann::json> operator()(const Args& args) const;

    std::future<std::string> key(const Args& args) const;
    std::future<Cached> get(const Args& args) const;
    std::future<nlohmann::json> save(const nlohmann::json& value, const Args& args) const;
    std::future<Cached> remove(const Args& args) const;
    std::future<void> empty() const;

private:
    Target target_;
};

} // namespace memocache
