#include "storage.hpp"
#include "config.hpp"
#include "plugin.hpp"

namespace memocache {

NotImplementedError::NotImplementedError(const std::string& controller, const std::string& method)
    : std::logic_error(controller + "::" + method + ": method not implemented. "
                       "Subclasses of StorageController must implement this method!") {}

void StorageController::not_implemented(const char* method) const {
    throw NotImplementedError(controller_name(), method);
}

nlohmann::json StorageController::save(const std::string&, const nlohmann::json&, const Args&) {
    not_implemented("save");
}

Cached StorageController::retrieve(const std::string&, const Args&) {
    not_implemented("retrieve");
}

Cached StorageController::remove(const std::string&, const Args&) {
    not_implemented("remove");
}

void StorageController::empty() {
    not_implemented("empty");
}

StoreContents StorageController::contents() const {
    not_implemented("contents");
}

std::unique_ptr<StorageController> create_storage(const Config& config) {
    return StorageRegistry::instance().create(config.storage, config);
}

} // namespace memocache
