#include "plugin.hpp"
#include "storage.hpp"
#include <stdexcept>
#include <algorithm>

namespace memocache {

StorageRegistry& StorageRegistry::instance() {
    static StorageRegistry registry;
    return registry;
}

void StorageRegistry::register_storage(const std::string& name, StorageFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[name] = std::move(factory);
}

std::unique_ptr<StorageController> StorageRegistry::create(const std::string& name,
                                                           const Config& config) const {
    StorageFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(name);
        if (it == factories_.end()) {
            throw std::invalid_argument("Unknown storage backend: " + name);
        }
        factory = it->second;
    }
    // Factories may do file I/O; run them outside the lock.
    auto storage = factory(config);
    if (!storage) {
        throw std::invalid_argument("Storage backend \"" + name + "\" produced no controller");
    }
    return storage;
}

std::vector<std::string> StorageRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool StorageRegistry::has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(name) > 0;
}

} // namespace memocache
