#pragma once
#include "event_bus.hpp"
#include "key.hpp"
#include "options.hpp"
#include "storage.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace memocache {

// Caching core for one memoized target. Wraps a StorageController with the
// enable/disable state, TTL bookkeeping and max_records eviction. Execution
// adapters drive it; it never calls the target itself.
//
// Thread-safe: every operation runs under one recursive mutex, so event
// handlers may call back into the engine from the publishing thread.
class CacheEngine {
public:
    // Milliseconds since an arbitrary epoch. Injectable for tests.
    using Clock = std::function<uint64_t()>;

    // Throws std::invalid_argument if storage is null.
    CacheEngine(Options options, std::unique_ptr<StorageController> storage);
    ~CacheEngine();

    CacheEngine(const CacheEngine&) = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;

    std::string name() const;
    Options options() const;
    EventBus& events() { return events_; }
    bool enabled() const;

    // State transitions. Return false, without emitting, when already in
    // the target state.
    bool enable();
    bool disable(bool empty_first = false);

    // Raw arguments -> resolved arguments.
    Args resolve(const Args& raw) const;

    // Resolved arguments -> key.
    std::string derive_key(const Args& resolved);

    // Raw arguments -> key (resolve then derive).
    std::string key(const Args& raw);

    Cached retrieve(const std::string& key, const Args& args);
    nlohmann::json save(const std::string& key, const nlohmann::json& value, const Args& args);
    Cached remove(const std::string& key, const Args& args);
    void empty();
    void clear() { empty(); }
    StoreContents contents() const;

    // Replace the options. The store is emptied when clear_store is set or
    // when key derivation changes (uid, key_generator, coerce_args, mode).
    // Callables cannot be compared, so supplying one counts as a change.
    void set_options(Options next, bool clear_store = false);

    // Merge a JSON patch into the current options. Callables are kept.
    void set_options(const nlohmann::json& patch, bool clear_store = false);

    // Swap the controller and drop all bookkeeping. Throws on null.
    void set_storage(std::unique_ptr<StorageController> storage);

    StorageController& storage();

    // Saves counted toward max_records (may overcount re-saved keys).
    uint64_t record_count() const;

    void set_clock(Clock clock);

private:
    struct Usage {
        uint64_t frequency = 0;
        uint64_t last_access = 0;
    };

    template <typename E>
    E make_event() const;

    // Caller holds mutex_. force_empty empties even if keys are unaffected.
    void apply_options(Options next, bool force_empty);
    void reset_bookkeeping();
    void evict_overflow(const std::string& just_saved);

    mutable std::recursive_mutex mutex_;
    Options options_;
    std::unique_ptr<StorageController> storage_;
    EventBus events_;
    KeyDeriver deriver_;
    Clock clock_;
    bool enabled_ = true;

    std::unordered_map<std::string, Usage> usage_;        // max_records only
    std::unordered_map<std::string, uint64_t> created_;   // ttl only
    uint64_t record_count_ = 0;

    uint64_t trace_subscription_ = 0;
};

} // namespace memocache
