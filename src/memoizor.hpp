#pragma once
#include "engine.hpp"
#include <memory>
#include <string>

namespace memocache {

// Management surface shared by the execution adapters. Copies share one
// engine, so a copy captured inside the target (recursion) sees the same
// cache as the caller's.
class Memoizor {
public:
    // Throws std::invalid_argument if engine is null.
    explicit Memoizor(std::shared_ptr<CacheEngine> engine);

    std::string name() const { return engine_->name(); }
    bool enabled() const { return engine_->enabled(); }

    bool enable() { return engine_->enable(); }
    bool disable(bool empty_first = false) { return engine_->disable(empty_first); }

    StoreContents store_contents() const { return engine_->contents(); }

    void set_options(Options options, bool clear_store = false) {
        engine_->set_options(std::move(options), clear_store);
    }
    void set_options(const nlohmann::json& patch, bool clear_store = false) {
        engine_->set_options(patch, clear_store);
    }

    void set_storage(std::unique_ptr<StorageController> storage) {
        engine_->set_storage(std::move(storage));
    }

    EventBus& events() { return engine_->events(); }

    const std::shared_ptr<CacheEngine>& engine() const { return engine_; }

protected:
    std::shared_ptr<CacheEngine> engine_;
};

} // namespace memocache
