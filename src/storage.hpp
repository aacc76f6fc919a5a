#pragma once
#include "value.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace memocache {

// Thrown when a controller is asked for an operation it never implemented.
class NotImplementedError : public std::logic_error {
public:
    NotImplementedError(const std::string& controller, const std::string& method);
};

// Persistence boundary for one cache engine. Subclasses override the
// operations they support; the rest fail fast with NotImplementedError.
// Not instantiable directly.
//
// All calls arrive serialized by the owning engine.
class StorageController {
public:
    virtual ~StorageController() = default;

    StorageController(const StorageController&) = delete;
    StorageController& operator=(const StorageController&) = delete;

    virtual std::string controller_name() const = 0;

    // Store value under key. Returns the stored value.
    virtual nlohmann::json save(const std::string& key,
                                const nlohmann::json& value,
                                const Args& args);

    // Look up key. Returns not_cached when absent; never throws for a miss.
    virtual Cached retrieve(const std::string& key, const Args& args);

    // Remove key. Returns the removed value, or not_cached if none.
    virtual Cached remove(const std::string& key, const Args& args);

    // Remove everything.
    virtual void empty();

    // Snapshot of every stored key/value pair.
    virtual StoreContents contents() const;

protected:
    StorageController() = default;

    [[noreturn]] void not_implemented(const char* method) const;
};

struct Config;

// Create the storage controller named by config.storage through the
// registry. File-backed controllers are loaded before being returned.
std::unique_ptr<StorageController> create_storage(const Config& config);

} // namespace memocache
