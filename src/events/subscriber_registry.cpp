// File: src/events/subscriber_registry.cpp
#include "events/subscriber_registry.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace geochron {

std::shared_ptr<SubscriberRegistry::Topic> SubscriberRegistry::FindTopic(
        const std::string& database) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);

    auto it = topics_.find(database);
    return it == topics_.end() ? nullptr : it->second;
}

SubscriptionHandle SubscriberRegistry::Subscribe(const std::string& database,
                                                 const SubscriptionFilter& filter,
                                                 EventSink sink) {
    if (!sink) {
        throw std::invalid_argument("Subscribe requires a sink");
    }
    if (filter.bbox) {
        ValidateBoundingBox(*filter.bbox);
    }

    auto subscription = std::make_shared<Subscription>();
    subscription->handle = next_handle_.fetch_add(1);
    subscription->database = database;
    subscription->filter = filter;
    subscription->sink = std::move(sink);

    std::unique_lock<std::shared_mutex> lock(registry_mutex_);

    auto& topic = topics_[database];
    if (!topic) {
        topic = std::make_shared<Topic>();
    }
    topic->subscriptions.push_back(subscription);
    handles_.emplace(subscription->handle, subscription);

    return subscription->handle;
}

bool SubscriberRegistry::Unsubscribe(SubscriptionHandle handle) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);

    auto it = handles_.find(handle);
    if (it == handles_.end()) {
        return false;
    }

    auto subscription = it->second;
    subscription->active.store(false);
    handles_.erase(it);

    auto topic_it = topics_.find(subscription->database);
    if (topic_it != topics_.end()) {
        auto& subs = topic_it->second->subscriptions;
        subs.erase(std::remove(subs.begin(), subs.end(), subscription), subs.end());
    }

    return true;
}

size_t SubscriberRegistry::Publish(ChangeEvent event) {
    published_.fetch_add(1, std::memory_order_relaxed);

    // Databases nobody has subscribed to get no topic
    auto topic = FindTopic(event.database);
    if (!topic) {
        return 0;
    }

    std::lock_guard<std::mutex> publish_lock(topic->publish_mutex);

    event.sequence = topic->next_sequence++;

    // Snapshot so sinks run without the registry lock
    std::vector<std::shared_ptr<Subscription>> subscriptions;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        subscriptions = topic->subscriptions;
    }

    size_t delivered = 0;
    for (const auto& subscription : subscriptions) {
        if (!subscription->active.load() || !subscription->filter.Matches(event)) {
            continue;
        }

        try {
            subscription->sink(event);
            ++delivered;
        } catch (const std::exception& e) {
            sink_failures_.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("Subscriber {} on database {} failed: {}",
                         subscription->handle, event.database, e.what());
        } catch (...) {
            sink_failures_.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("Subscriber {} on database {} failed: unknown exception",
                         subscription->handle, event.database);
        }
    }

    delivered_.fetch_add(delivered, std::memory_order_relaxed);
    return delivered;
}

size_t SubscriberRegistry::SubscriberCount(const std::string& database) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);

    auto it = topics_.find(database);
    return it == topics_.end() ? 0 : it->second->subscriptions.size();
}

size_t SubscriberRegistry::TotalSubscribers() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return handles_.size();
}

size_t SubscriberRegistry::RemoveDatabase(const std::string& database) {
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);

    auto it = topics_.find(database);
    if (it == topics_.end()) {
        return 0;
    }

    size_t removed = it->second->subscriptions.size();
    for (const auto& subscription : it->second->subscriptions) {
        subscription->active.store(false);
        handles_.erase(subscription->handle);
    }

    topics_.erase(it);
    return removed;
}

SubscriberRegistry::Stats SubscriberRegistry::GetStats() const {
    Stats stats;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        stats.topics = topics_.size();
        stats.subscriptions = handles_.size();
    }
    stats.published = published_.load(std::memory_order_relaxed);
    stats.delivered = delivered_.load(std::memory_order_relaxed);
    stats.sink_failures = sink_failures_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace geochron
