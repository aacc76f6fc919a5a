#include "engine.hpp"
#include "arguments.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace memocache {

// ── Debug tracing ────────────────────────────────────────────────

static const std::string* event_key(const Event& e) {
    const char* tag = e.type_tag;
    if (std::strcmp(tag, event_tags::Retrieve) == 0)  return &static_cast<const RetrieveEvent&>(e).key;
    if (std::strcmp(tag, event_tags::Retrieved) == 0) return &static_cast<const RetrievedEvent&>(e).key;
    if (std::strcmp(tag, event_tags::Save) == 0)      return &static_cast<const SaveEvent&>(e).key;
    if (std::strcmp(tag, event_tags::Delete) == 0)    return &static_cast<const DeleteEvent&>(e).key;
    if (std::strcmp(tag, event_tags::Deleted) == 0)   return &static_cast<const DeletedEvent&>(e).key;
    return nullptr;
}

static void trace_event(const Event& e) {
    std::cerr << "[memocache] " << e.function << ": " << e.type_tag;
    if (const auto* key = event_key(e)) {
        std::cerr << " key=" << *key;
    }
    if (std::strcmp(e.type_tag, event_tags::Retrieved) == 0) {
        const auto& r = static_cast<const RetrievedEvent&>(e);
        std::cerr << (r.value ? " hit" : " miss") << (r.expired ? " (expired)" : "");
    } else if (std::strcmp(e.type_tag, event_tags::Overflow) == 0) {
        const auto& o = static_cast<const OverflowEvent&>(e);
        std::cerr << " records=" << o.record_count << " max=" << o.max_records
                  << " evicting=" << o.keys.size();
    }
    std::cerr << "\n";
}

// ── Construction ─────────────────────────────────────────────────

CacheEngine::CacheEngine(Options options, std::unique_ptr<StorageController> storage)
    : options_(std::move(options.validate()))
    , storage_(std::move(storage))
    , clock_(epoch_millis)
{
    if (!storage_) {
        throw std::invalid_argument("CacheEngine: storage controller cannot be null");
    }
    if (debug_enabled()) {
        trace_subscription_ = events_.subscribe_all(trace_event);
    }
}

CacheEngine::~CacheEngine() {
    if (trace_subscription_ != 0) events_.unsubscribe(trace_subscription_);
}

template <typename E>
E CacheEngine::make_event() const {
    E event;
    event.function = options_.name;
    return event;
}

// ── Accessors ────────────────────────────────────────────────────

std::string CacheEngine::name() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return options_.name;
}

Options CacheEngine::options() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return options_;
}

bool CacheEngine::enabled() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return enabled_;
}

StorageController& CacheEngine::storage() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return *storage_;
}

uint64_t CacheEngine::record_count() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return record_count_;
}

void CacheEngine::set_clock(Clock clock) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    clock_ = clock ? std::move(clock) : Clock(epoch_millis);
}

// ── State machine ────────────────────────────────────────────────

bool CacheEngine::enable() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (enabled_) return false;
    enabled_ = true;
    events_.publish(make_event<EnableEvent>());
    return true;
}

bool CacheEngine::disable(bool empty_first) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!enabled_) return false;
    if (empty_first) empty();
    enabled_ = false;
    auto event = make_event<DisableEvent>();
    event.emptied = empty_first;
    events_.publish(event);
    return true;
}

// ── Keys ─────────────────────────────────────────────────────────

Args CacheEngine::resolve(const Args& raw) const {
    Options options = this->options();
    return resolve_arguments(raw, options);
}

std::string CacheEngine::derive_key(const Args& resolved) {
    Options options = this->options();
    return deriver_.derive(resolved, options);
}

std::string CacheEngine::key(const Args& raw) {
    Options options = this->options();
    return deriver_.derive(resolve_arguments(raw, options), options);
}

// ── Store operations ─────────────────────────────────────────────

Cached CacheEngine::retrieve(const std::string& key, const Args& args) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto before = make_event<RetrieveEvent>();
    before.key = key;
    before.args = args;
    events_.publish(before);

    uint64_t now = clock_();
    auto after = make_event<RetrievedEvent>();
    after.key = key;
    after.args = args;

    if (options_.ttl) {
        auto created = created_.find(key);
        if (created != created_.end() && now >= created->second &&
            now - created->second >= static_cast<uint64_t>(options_.ttl->count())) {
            remove(key, args);
            after.expired = true;
            events_.publish(after);
            return not_cached;
        }
    }

    if (options_.max_records) {
        auto usage = usage_.find(key);
        if (usage != usage_.end()) {
            usage->second.frequency++;
            usage->second.last_access = now;
        }
    }

    Cached value = storage_->retrieve(key, args);

    // Entries loaded from a persistent store have no creation record; their
    // TTL starts at the first lookup.
    if (value && options_.ttl && created_.find(key) == created_.end()) {
        created_[key] = now;
    }

    after.value = value;
    events_.publish(after);
    return value;
}

nlohmann::json CacheEngine::save(const std::string& key, const nlohmann::json& value,
                                 const Args& args) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto event = make_event<SaveEvent>();
    event.key = key;
    event.value = value;
    event.args = args;
    events_.publish(event);

    nlohmann::json stored = storage_->save(key, value, args);

    uint64_t now = clock_();
    if (options_.ttl) {
        created_[key] = now;
    }

    if (options_.max_records) {
        if (usage_.find(key) == usage_.end()) {
            usage_[key] = Usage{0, now};
        }
        // Re-saving a tracked key counts again (no in-flight deduplication).
        record_count_++;
        if (record_count_ > *options_.max_records) {
            evict_overflow(key);
        }
    }
    return stored;
}

void CacheEngine::evict_overflow(const std::string& just_saved) {
    struct Candidate {
        std::string key;
        Usage usage;
    };

    // The entry being saved is spared unless max_records is 0.
    bool spare_new = *options_.max_records > 0;
    std::vector<Candidate> candidates;
    candidates.reserve(usage_.size());
    for (const auto& [k, usage] : usage_) {
        if (!spare_new || k != just_saved) candidates.push_back({k, usage});
    }
    if (candidates.empty()) return;

    std::stable_sort(candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) {
            return a.usage.last_access > b.usage.last_access;
        });

    auto history = static_cast<size_t>(
        std::floor(static_cast<double>(candidates.size()) / options_.lru_history_factor));
    candidates.resize(std::clamp<size_t>(history, 1, candidates.size()));

    std::stable_sort(candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) {
            return a.usage.frequency < b.usage.frequency;
        });

    auto delete_count = static_cast<size_t>(std::ceil(
        options_.lru_percent_padding * 0.01 * static_cast<double>(candidates.size())));
    delete_count = std::min(delete_count, candidates.size());

    auto event = make_event<OverflowEvent>();
    event.max_records = *options_.max_records;
    event.record_count = record_count_;
    for (size_t i = 0; i < delete_count; ++i) {
        event.keys.push_back(candidates[i].key);
    }
    events_.publish(event);

    for (const auto& k : event.keys) {
        remove(k, {});
    }
}

Cached CacheEngine::remove(const std::string& key, const Args& args) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto before = make_event<DeleteEvent>();
    before.key = key;
    before.args = args;
    events_.publish(before);

    Cached removed = storage_->remove(key, args);

    if (usage_.erase(key) > 0 && record_count_ > 0) {
        record_count_--;
    }
    created_.erase(key);

    auto after = make_event<DeletedEvent>();
    after.key = key;
    after.args = args;
    after.value = removed;
    events_.publish(after);
    return removed;
}

void CacheEngine::empty() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    events_.publish(make_event<EmptyEvent>());
    events_.publish(make_event<ClearEvent>());
    storage_->empty();
    reset_bookkeeping();
}

StoreContents CacheEngine::contents() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return storage_->contents();
}

void CacheEngine::reset_bookkeeping() {
    usage_.clear();
    created_.clear();
    record_count_ = 0;
}

// ── Reconfiguration ──────────────────────────────────────────────

void CacheEngine::set_options(Options next, bool clear_store) {
    next.validate();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    bool callables_changed = static_cast<bool>(next.key_generator) ||
                             static_cast<bool>(options_.key_generator) ||
                             next.has_coercion() || options_.has_coercion();
    apply_options(std::move(next), clear_store || callables_changed);
}

void CacheEngine::set_options(const nlohmann::json& patch, bool clear_store) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    // merged() keeps the current callables, so only uid and mode can move keys.
    apply_options(options_.merged(patch), clear_store);
}

void CacheEngine::apply_options(Options next, bool force_empty) {
    bool key_changed = next.effective_uid() != options_.effective_uid() ||
                       next.mode != options_.mode;
    bool had_max_records = options_.max_records.has_value();
    bool had_ttl = options_.ttl.has_value();
    options_ = std::move(next);

    if (key_changed || force_empty) {
        deriver_.reset();
        empty();
        return;
    }
    if (had_max_records && !options_.max_records) {
        usage_.clear();
        record_count_ = 0;
    }
    if (had_ttl && !options_.ttl) {
        created_.clear();
    }
}

void CacheEngine::set_storage(std::unique_ptr<StorageController> storage) {
    if (!storage) {
        throw std::invalid_argument("CacheEngine: storage controller cannot be null");
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    storage_ = std::move(storage);
    reset_bookkeeping();
}

} // namespace memocache
