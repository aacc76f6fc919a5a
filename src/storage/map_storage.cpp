#include "map_storage.hpp"
#include "../plugin.hpp"

static memocache::StorageRegistrar reg_memory("memory",
    [](const memocache::Config&) { return std::make_unique<memocache::MapStorage>(); });

namespace memocache {

nlohmann::json MapStorage::save(const std::string& key, const nlohmann::json& value,
                                const Args&) {
    store_[key] = value;
    return value;
}

Cached MapStorage::retrieve(const std::string& key, const Args&) {
    auto it = store_.find(key);
    if (it == store_.end()) return not_cached;
    return it->second;
}

Cached MapStorage::remove(const std::string& key, const Args&) {
    auto it = store_.find(key);
    if (it == store_.end()) return not_cached;
    Cached removed = std::move(it->second);
    store_.erase(it);
    return removed;
}

void MapStorage::empty() {
    store_.clear();
}

StoreContents MapStorage::contents() const {
    return StoreContents(store_.begin(), store_.end());
}

} // namespace memocache
