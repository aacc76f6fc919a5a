#pragma once
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace memocache {

class StorageController;

using StorageFactory = std::function<std::unique_ptr<StorageController>(const Config& config)>;

// Central registry for self-registering storage controllers.
// Holds factories only, never cache state. All methods are thread-safe.
class StorageRegistry {
public:
    static StorageRegistry& instance();

    void register_storage(const std::string& name, StorageFactory factory);

    std::unique_ptr<StorageController> create(const std::string& name,
                                              const Config& config) const;

    std::vector<std::string> names() const;
    bool has(const std::string& name) const;

private:
    StorageRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StorageFactory> factories_;
};

// Self-registrar helper (used at file scope in each storage .cpp)
struct StorageRegistrar {
    StorageRegistrar(const std::string& name, StorageFactory factory) {
        StorageRegistry::instance().register_storage(name, std::move(factory));
    }
};

} // namespace memocache
