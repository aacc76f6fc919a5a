#include "sync_memoizor.hpp"
#include <stdexcept>

namespace memocache {

SyncMemoizor::SyncMemoizor(Target target, std::shared_ptr<CacheEngine> engine)
    : Memoizor(std::move(engine))
    , target_(std::move(target))
{
    if (!target_) throw std::invalid_argument("Cannot memoize non-function");
}

nlohmann::json SyncMemoizor::operator()(const Args& args) const {
    if (!engine_->enabled()) return target_(args);

    Args resolved = engine_->resolve(args);
    std::string key = engine_->derive_key(resolved);

    Cached cached = engine_->retrieve(key, resolved);
    if (cached) return *cached;

    nlohmann::json result = target_(args);
    engine_->save(key, result, resolved);
    return result;
}

std::string SyncMemoizor::key(const Args& args) const {
    return engine_->key(args);
}

Cached SyncMemoizor::get(const Args& args) const {
    Args resolved = engine_->resolve(args);
    return engine_->retrieve(engine_->derive_key(resolved), resolved);
}

nlohmann::json SyncMemoizor::save(const nlohmann::json& value, const Args& args) const {
    Args resolved = engine_->resolve(args);
    return engine_->save(engine_->derive_key(resolved), value, resolved);
}

Cached SyncMemoizor::remove(const Args& args) const {
    Args resolved = engine_->resolve(args);
    return engine_->remove(engine_->derive_key(resolved), resolved);
}

void SyncMemoizor::empty() const {
    engine_->empty();
}

} // namespace memocache
