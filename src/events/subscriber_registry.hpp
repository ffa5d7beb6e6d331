// File: src/events/subscriber_registry.hpp
#pragma once

#include "events/change_event.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace geochron {

/// Receives change events; must not publish to the database it listens on
using EventSink = std::function<void(const ChangeEvent&)>;

/// Opaque subscription handle (never 0)
using SubscriptionHandle = uint64_t;

/// Publish/subscribe registry for change events, one topic per database
///
/// Publishes to one database are serialized, so each subscriber sees that
/// database's events in publish order; publishes to different databases run
/// concurrently. Delivery is synchronous, best-effort and at-most-once. A
/// sink that throws is logged and skipped.
///
/// Unsubscribe takes effect immediately: a publish in flight re-checks each
/// subscription before calling its sink.
///
/// A topic exists from the first Subscribe until RemoveDatabase. Events
/// published while a database has no topic reach nobody and get no sequence
/// number. Sequence numbers start at 1 for each new topic, so they restart
/// after RemoveDatabase; a publish still running on the removed topic
/// delivers to none of its (deactivated) subscriptions.
class SubscriberRegistry {
public:
    /// Statistics structure
    struct Stats {
        size_t topics{0};
        size_t subscriptions{0};
        uint64_t published{0};
        uint64_t delivered{0};
        uint64_t sink_failures{0};
    };

    SubscriberRegistry() = default;

    SubscriberRegistry(const SubscriberRegistry&) = delete;
    SubscriberRegistry& operator=(const SubscriberRegistry&) = delete;

    /// Register a sink for a database's events
    /// @throws std::invalid_argument if sink is empty
    /// @throws IndexError(INVALID_BOUNDING_BOX) if the filter box is invalid
    SubscriptionHandle Subscribe(const std::string& database,
                                 const SubscriptionFilter& filter,
                                 EventSink sink);

    /// Stop delivery to a subscription
    /// @return false for an unknown handle
    bool Unsubscribe(SubscriptionHandle handle);

    /// Deliver an event to every matching subscription of event.database
    /// Sinks that throw (anything) are counted as failures and skipped.
    /// @return Number of sinks that received the event without throwing
    size_t Publish(ChangeEvent event);

    size_t SubscriberCount(const std::string& database) const;
    size_t TotalSubscribers() const;

    /// Drop a database's topic and every subscription on it
    /// @return Number of subscriptions removed
    size_t RemoveDatabase(const std::string& database);

    Stats GetStats() const;

private:
    struct Subscription {
        SubscriptionHandle handle{0};
        std::string database;
        SubscriptionFilter filter;
        EventSink sink;
        std::atomic<bool> active{true};
    };

    struct Topic {
        // Serializes publishes to this database; taken before registry_mutex_
        std::mutex publish_mutex;

        // Guarded by publish_mutex
        uint64_t next_sequence{1};

        // Guarded by registry_mutex_
        std::vector<std::shared_ptr<Subscription>> subscriptions;
    };

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Topic>> topics_;
    std::unordered_map<SubscriptionHandle, std::shared_ptr<Subscription>> handles_;

    std::atomic<SubscriptionHandle> next_handle_{1};

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> sink_failures_{0};

    /// @return nullptr if nobody has subscribed to the database
    std::shared_ptr<Topic> FindTopic(const std::string& database) const;
};

} // namespace geochron
