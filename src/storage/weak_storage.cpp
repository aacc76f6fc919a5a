#include "weak_storage.hpp"
#include "../plugin.hpp"
#include <stdexcept>

static memocache::StorageRegistrar reg_weak("weak",
    [](const memocache::Config&) { return std::make_unique<memocache::WeakStorage>(); });

namespace memocache {

WeakStorage::KeyHandle WeakStorage::pin(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = pins_[key];
    if (auto live = slot.lock()) return live;
    auto handle = std::make_shared<const std::string>(key);
    slot = handle;
    return handle;
}

nlohmann::json WeakStorage::save(const std::string& key, const nlohmann::json& value,
                                 const Args&) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto pin_it = pins_.find(key);
    if (pin_it == pins_.end() || pin_it->second.expired()) {
        throw std::invalid_argument("WeakStorage::save: key is not pinned: " + key);
    }
    store_[key] = Entry{pin_it->second, value};
    return value;
}

Cached WeakStorage::retrieve(const std::string& key, const Args&) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = store_.find(key);
    if (it == store_.end()) return not_cached;
    if (it->second.owner.expired()) {
        store_.erase(it);
        pins_.erase(key);
        return not_cached;
    }
    return it->second.value;
}

Cached WeakStorage::remove(const std::string& key, const Args&) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = store_.find(key);
    if (it == store_.end()) return not_cached;
    Cached removed;
    if (!it->second.owner.expired()) removed = std::move(it->second.value);
    store_.erase(it);
    return removed;
}

void WeakStorage::empty() {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.clear();
}

StoreContents WeakStorage::contents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StoreContents out;
    for (const auto& [key, entry] : store_) {
        if (!entry.owner.expired()) out.emplace(key, entry.value);
    }
    return out;
}

size_t WeakStorage::collect() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t collected = 0;
    for (auto it = store_.begin(); it != store_.end(); ) {
        if (it->second.owner.expired()) {
            it = store_.erase(it);
            ++collected;
        } else {
            ++it;
        }
    }
    for (auto it = pins_.begin(); it != pins_.end(); ) {
        if (it->second.expired()) it = pins_.erase(it); else ++it;
    }
    return collected;
}

} // namespace memocache
