#include "future_memoizor.hpp"
#include <stdexcept>

namespace memocache {

FutureMemoizor::FutureMemoizor(Target target, std::shared_ptr<CacheEngine> engine)
    : Memoizor(std::move(engine))
    , target_(std::move(target))
{
    if (!target_) throw std::invalid_argument("Cannot memoize non-function");
}

std::future<nlohmann::json> FutureMemoizor::operator()(const Args& args) const {
    return std::async(std::launch::async, [engine = engine_, target = target_, args]() {
        if (!engine->enabled()) return target(args).get();

        Args resolved = engine->resolve(args);
        std::string key = engine->derive_key(resolved);

        Cached cached = engine->retrieve(key, resolved);
        if (cached) return *cached;

        nlohmann::json result = target(args).get();
        engine->save(key, result, resolved);
        return result;
    });
}

std::future<std::string> FutureMemoizor::key(const Args& args) const {
    return std::async(std::launch::async, [engine = engine_, args]() {
        return engine->key(args);
    });
}

std::future<Cached> FutureMemoizor::get(const Args& args) const {
    return std::async(std::launch::async, [engine = engine_, args]() {
        Args resolved = engine->resolve(args);
        return engine->retrieve(engine->derive_key(resolved), resolved);
    });
}

std::future<nlohmann::json> FutureMemoizor::save(const nlohmann::json& value,
                                                 const Args& args) const {
    return std::async(std::launch::async, [engine = engine_, value, args]() {
        Args resolved = engine->resolve(args);
        return engine->save(engine->derive_key(resolved), value, resolved);
    });
}

std::future<Cached> FutureMemoizor::remove(const Args& args) const {
    return std::async(std::launch::async, [engine = engine_, args]() {
        Args resolved = engine->resolve(args);
        return engine->remove(engine->derive_key(resolved), resolved);
    });
}

std::future<void> FutureMemoizor::empty() const {
    return std::async(std::launch::async, [engine = engine_]() {
        engine->empty();
    });
}

} // namespace memocache
