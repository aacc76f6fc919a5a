#pragma once
#include "value.hpp"
#include <string>
#include <vector>

namespace memocache {

// Tag-based event dispatch: handlers switch on type_tag, no RTTI.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
    std::string function;   // name of the memoized target
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* Retrieve  = "retrieve";
    constexpr const char* Retrieved = "retrieved";
    constexpr const char* Save      = "save";
    constexpr const char* Overflow  = "overflow";
    constexpr const char* Delete    = "delete";
    constexpr const char* Deleted   = "deleted";
    constexpr const char* Empty     = "empty";
    constexpr const char* Clear     = "clear";
    constexpr const char* Enable    = "enable";
    constexpr const char* Disable   = "disable";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

// Emitted before the storage controller is asked for a key.
struct RetrieveEvent : Event {
    static constexpr const char* TAG = event_tags::Retrieve;
    std::string key;
    Args args;

    RetrieveEvent() { type_tag = TAG; }
};

// Emitted after a lookup completes. `value` is set only on a hit.
struct RetrievedEvent : Event {
    static constexpr const char* TAG = event_tags::Retrieved;
    std::string key;
    Args args;
    Cached value;
    bool expired = false;   // entry existed but its TTL had elapsed

    RetrievedEvent() { type_tag = TAG; }
};

struct SaveEvent : Event {
    static constexpr const char* TAG = event_tags::Save;
    std::string key;
    nlohmann::json value;
    Args args;

    SaveEvent() { type_tag = TAG; }
};

// Emitted once per eviction batch, before any key is deleted.
struct OverflowEvent : Event {
    static constexpr const char* TAG = event_tags::Overflow;
    std::vector<std::string> keys;
    uint64_t max_records = 0;
    uint64_t record_count = 0;

    OverflowEvent() { type_tag = TAG; }
};

struct DeleteEvent : Event {
    static constexpr const char* TAG = event_tags::Delete;
    std::string key;
    Args args;

    DeleteEvent() { type_tag = TAG; }
};

struct DeletedEvent : Event {
    static constexpr const char* TAG = event_tags::Deleted;
    std::string key;
    Args args;
    Cached value;           // nullopt when nothing was stored under key

    DeletedEvent() { type_tag = TAG; }
};

struct EmptyEvent : Event {
    static constexpr const char* TAG = event_tags::Empty;

    EmptyEvent() { type_tag = TAG; }
};

// Alias of EmptyEvent, emitted right after it.
struct ClearEvent : Event {
    static constexpr const char* TAG = event_tags::Clear;

    ClearEvent() { type_tag = TAG; }
};

struct EnableEvent : Event {
    static constexpr const char* TAG = event_tags::Enable;

    EnableEvent() { type_tag = TAG; }
};

struct DisableEvent : Event {
    static constexpr const char* TAG = event_tags::Disable;
    bool emptied = false;

    DisableEvent() { type_tag = TAG; }
};

} // namespace memocache
