#pragma once
#include "../storage.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>

namespace memocache {

// In-memory store whose entries live only as long as a pinned key handle.
// A hashed key is a plain string with no owner, so callers that want this
// behavior pin the keys they care about (typically with a key_generator
// producing identity-like keys) and drop the handle to release the entry.
// Saving a key that is not pinned throws.
class WeakStorage : public StorageController {
public:
    using KeyHandle = std::shared_ptr<const std::string>;

    std::string controller_name() const override { return "WeakStorage"; }

    // Return the live handle for key, creating one if needed. The entry
    // stored under key is collectible once every copy is released.
    KeyHandle pin(const std::string& key);

    nlohmann::json save(const std::string& key, const nlohmann::json& value,
                        const Args& args) override;
    Cached retrieve(const std::string& key, const Args& args) override;
    Cached remove(const std::string& key, const Args& args) override;
    void empty() override;
    StoreContents contents() const override;

    // Drop entries and pins whose handles have been released. Returns the
    // number of entries collected.
    size_t collect();

private:
    struct Entry {
        std::weak_ptr<const std::string> owner;
        nlohmann::json value;
    };

    // pin() is called by users outside the engine lock.
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::weak_ptr<const std::string>> pins_;
    std::unordered_map<std::string, Entry> store_;
};

} // namespace memocache
