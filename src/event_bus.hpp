#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <cstdint>

namespace memocache {

using EventHandler = std::function<void(const Event&)>;

// Per-engine event channel. Subscriptions either name one tag or listen to
// every tag (loggers, metrics).
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Subscribe to every event regardless of tag.
    uint64_t subscribe_all(EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish an event synchronously. Handlers called in registration order.
    // Mutex is released before calling handlers, so a handler may publish
    // or (un)subscribe.
    void publish(const Event& event) const;

    // Remove all subscriptions.
    void clear();

    // Handlers that would receive `tag`, catch-all subscriptions included.
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        std::string tag;    // empty = all tags
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace memocache
