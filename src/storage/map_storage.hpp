#pragma once
#include "../storage.hpp"
#include <unordered_map>

namespace memocache {

// Process-local store backed by an unordered_map. The default controller.
class MapStorage : public StorageController {
public:
    MapStorage() = default;

    std::string controller_name() const override { return "MapStorage"; }

    nlohmann::json save(const std::string& key, const nlohmann::json& value,
                        const Args& args) override;
    Cached retrieve(const std::string& key, const Args& args) override;
    Cached remove(const std::string& key, const Args& args) override;
    void empty() override;
    StoreContents contents() const override;

    size_t size() const { return store_.size(); }

protected:
    std::unordered_map<std::string, nlohmann::json> store_;
};

} // namespace memocache
