// File: tests/events/subscriber_registry_test.cpp
#include "events/subscriber_registry.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

namespace geochron {
namespace {

ChangeEvent PointEvent(const std::string& database, const std::string& series,
                       const std::string& id) {
    ChangeEvent event;
    event.database = database;
    event.kind = RecordKind::TIME_SERIES;
    event.record_id = id;
    event.series_id = series;
    event.value = 1.0;
    return event;
}

// ============================================================================
// Subscribe / Unsubscribe Tests
// ============================================================================

TEST(SubscriberRegistryTest, SubscribeReturnsDistinctNonZeroHandles) {
    SubscriberRegistry registry;
    auto sink = [](const ChangeEvent&) {};

    auto a = registry.Subscribe("db", {}, sink);
    auto b = registry.Subscribe("db", {}, sink);

    EXPECT_NE(0u, a);
    EXPECT_NE(a, b);
    EXPECT_EQ(2u, registry.SubscriberCount("db"));
    EXPECT_EQ(2u, registry.TotalSubscribers());
}

TEST(SubscriberRegistryTest, SubscribeValidatesArguments) {
    SubscriberRegistry registry;

    EXPECT_THROW(registry.Subscribe("db", {}, EventSink()), std::invalid_argument);

    SubscriptionFilter filter;
    filter.bbox = BoundingBox(5, 0, 1, 1);
    EXPECT_THROW(registry.Subscribe("db", filter, [](const ChangeEvent&) {}), IndexError);

    EXPECT_EQ(0u, registry.TotalSubscribers());
}

TEST(SubscriberRegistryTest, UnsubscribeStopsDelivery) {
    SubscriberRegistry registry;
    int received = 0;
    auto handle = registry.Subscribe("db", {}, [&received](const ChangeEvent&) { ++received; });

    registry.Publish(PointEvent("db", "s", "p1"));
    EXPECT_TRUE(registry.Unsubscribe(handle));
    EXPECT_FALSE(registry.Unsubscribe(handle));
    registry.Publish(PointEvent("db", "s", "p2"));

    EXPECT_EQ(1, received);
    EXPECT_EQ(0u, registry.SubscriberCount("db"));
}

// ============================================================================
// Publish Tests
// ============================================================================

TEST(SubscriberRegistryTest, PublishRoutesByDatabaseAndFilter) {
    SubscriberRegistry registry;
    std::vector<std::string> all;
    std::vector<std::string> filtered;
    std::vector<std::string> other;

    SubscriptionFilter filter;
    filter.series_id = "sensor_001";

    registry.Subscribe("sensors", {}, [&all](const ChangeEvent& e) { all.push_back(e.record_id); });
    registry.Subscribe("sensors", filter,
                       [&filtered](const ChangeEvent& e) { filtered.push_back(e.record_id); });
    registry.Subscribe("cities", {}, [&other](const ChangeEvent& e) { other.push_back(e.record_id); });

    EXPECT_EQ(2u, registry.Publish(PointEvent("sensors", "sensor_001", "p1")));
    EXPECT_EQ(1u, registry.Publish(PointEvent("sensors", "sensor_002", "p2")));

    EXPECT_EQ((std::vector<std::string>{"p1", "p2"}), all);
    EXPECT_EQ(std::vector<std::string>{"p1"}, filtered);
    EXPECT_TRUE(other.empty());
}

TEST(SubscriberRegistryTest, SequenceIsPerDatabase) {
    SubscriberRegistry registry;
    std::vector<uint64_t> a_seq;
    std::vector<uint64_t> b_seq;

    registry.Subscribe("a", {}, [&a_seq](const ChangeEvent& e) { a_seq.push_back(e.sequence); });
    registry.Subscribe("b", {}, [&b_seq](const ChangeEvent& e) { b_seq.push_back(e.sequence); });

    registry.Publish(PointEvent("a", "s", "1"));
    registry.Publish(PointEvent("b", "s", "1"));
    registry.Publish(PointEvent("a", "s", "2"));

    EXPECT_EQ((std::vector<uint64_t>{1, 2}), a_seq);
    EXPECT_EQ(std::vector<uint64_t>{1}, b_seq);
}

TEST(SubscriberRegistryTest, ThrowingSinkDoesNotBlockOthers) {
    SubscriberRegistry registry;
    int received = 0;

    registry.Subscribe("db", {}, [](const ChangeEvent&) {
        throw std::runtime_error("sink broke");
    });
    registry.Subscribe("db", {}, [&received](const ChangeEvent&) { ++received; });

    EXPECT_EQ(1u, registry.Publish(PointEvent("db", "s", "p")));
    EXPECT_EQ(1, received);
    EXPECT_EQ(1u, registry.GetStats().sink_failures);
}

TEST(SubscriberRegistryTest, NonStandardThrowDoesNotBlockOthers) {
    SubscriberRegistry registry;
    int received = 0;

    registry.Subscribe("db", {}, [](const ChangeEvent&) { throw 42; });
    registry.Subscribe("db", {}, [](const ChangeEvent&) { throw std::string("bad"); });
    registry.Subscribe("db", {}, [&received](const ChangeEvent&) { ++received; });

    size_t delivered = 0;
    EXPECT_NO_THROW(delivered = registry.Publish(PointEvent("db", "s", "p")));
    EXPECT_EQ(1u, delivered);
    EXPECT_EQ(1, received);
    EXPECT_EQ(2u, registry.GetStats().sink_failures);
}

TEST(SubscriberRegistryTest, PublishWithoutSubscribers) {
    SubscriberRegistry registry;
    EXPECT_EQ(0u, registry.Publish(PointEvent("db", "s", "p")));

    // Publishing alone never creates a topic
    auto stats = registry.GetStats();
    EXPECT_EQ(0u, stats.topics);
    EXPECT_EQ(1u, stats.published);
}

TEST(SubscriberRegistryTest, SequencesRestartAfterRemoveDatabase) {
    SubscriberRegistry registry;
    std::vector<uint64_t> before;
    std::vector<uint64_t> after;

    registry.Subscribe("db", {}, [&before](const ChangeEvent& e) { before.push_back(e.sequence); });
    registry.Publish(PointEvent("db", "s", "p1"));
    registry.Publish(PointEvent("db", "s", "p2"));

    registry.RemoveDatabase("db");
    EXPECT_EQ(0u, registry.GetStats().topics);

    registry.Subscribe("db", {}, [&after](const ChangeEvent& e) { after.push_back(e.sequence); });
    registry.Publish(PointEvent("db", "s", "p3"));

    EXPECT_EQ((std::vector<uint64_t>{1, 2}), before);
    EXPECT_EQ(std::vector<uint64_t>{1}, after);
}

TEST(SubscriberRegistryTest, SinkMayUnsubscribeItself) {
    SubscriberRegistry registry;
    int received = 0;
    SubscriptionHandle handle = 0;

    handle = registry.Subscribe("db", {}, [&](const ChangeEvent&) {
        ++received;
        registry.Unsubscribe(handle);
    });

    registry.Publish(PointEvent("db", "s", "p1"));
    registry.Publish(PointEvent("db", "s", "p2"));

    EXPECT_EQ(1, received);
}

TEST(SubscriberRegistryTest, RemoveDatabaseDropsSubscriptions) {
    SubscriberRegistry registry;
    int received = 0;
    auto handle = registry.Subscribe("db", {}, [&received](const ChangeEvent&) { ++received; });
    registry.Subscribe("keep", {}, [](const ChangeEvent&) {});

    EXPECT_EQ(1u, registry.RemoveDatabase("db"));
    EXPECT_EQ(0u, registry.RemoveDatabase("db"));
    EXPECT_FALSE(registry.Unsubscribe(handle));

    registry.Publish(PointEvent("db", "s", "p"));
    EXPECT_EQ(0, received);
    EXPECT_EQ(1u, registry.TotalSubscribers());
}

TEST(SubscriberRegistryTest, Stats) {
    SubscriberRegistry registry;
    registry.Subscribe("a", {}, [](const ChangeEvent&) {});
    registry.Subscribe("a", {}, [](const ChangeEvent&) {});
    registry.Subscribe("b", {}, [](const ChangeEvent&) {});

    registry.Publish(PointEvent("a", "s", "p"));

    auto stats = registry.GetStats();
    EXPECT_EQ(2u, stats.topics);
    EXPECT_EQ(3u, stats.subscriptions);
    EXPECT_EQ(1u, stats.published);
    EXPECT_EQ(2u, stats.delivered);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST(SubscriberRegistryTest, ConcurrentPublishersKeepPerDatabaseOrder) {
    SubscriberRegistry registry;
    std::mutex mutex;
    std::vector<uint64_t> sequences;

    registry.Subscribe("db", {}, [&](const ChangeEvent& e) {
        std::lock_guard<std::mutex> lock(mutex);
        sequences.push_back(e.sequence);
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t]() {
            for (int i = 0; i < 100; ++i) {
                registry.Publish(PointEvent("db", "s", std::to_string(t) + "_" + std::to_string(i)));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Publishes are serialized, so the sink sees 1..400 in order
    ASSERT_EQ(400u, sequences.size());
    for (size_t i = 0; i < sequences.size(); ++i) {
        EXPECT_EQ(i + 1, sequences[i]);
    }
}

}  // namespace
}  // namespace geochron
