#include <gtest/gtest.h>
#include "fts/events/event_bus.hpp"
#include "fts/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace fts::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::size_t received = 0;

    bus.subscribe<PendingCountChangedEvent>([&](const PendingCountChangedEvent& e) {
        handler_called = true;
        received = e.pending_count;
    });

    bus.emit(PendingCountChangedEvent{3});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received, 3u);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int count_events = 0;
    int connectivity_events = 0;

    bus.subscribe<PendingCountChangedEvent>([&](const PendingCountChangedEvent&) { count_events++; });
    bus.subscribe<ConnectivityChangedEvent>([&](const ConnectivityChangedEvent&) { connectivity_events++; });

    bus.emit(PendingCountChangedEvent{1});
    bus.emit(ConnectivityChangedEvent{true});
    bus.emit(PendingCountChangedEvent{0});

    EXPECT_EQ(count_events, 2);
    EXPECT_EQ(connectivity_events, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<ConnectivityChangedEvent>([&](const ConnectivityChangedEvent&) { count++; });

    bus.emit(ConnectivityChangedEvent{true});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<ConnectivityChangedEvent>(id);

    bus.emit(ConnectivityChangedEvent{false});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(PendingCountChangedEvent{1}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int later_calls = 0;
    bus.subscribe<PendingCountChangedEvent>([](const PendingCountChangedEvent&) {
        throw std::runtime_error("badge widget gone");
    });
    bus.subscribe<PendingCountChangedEvent>([&](const PendingCountChangedEvent&) { later_calls++; });

    EXPECT_NO_THROW(bus.emit(PendingCountChangedEvent{2}));
    EXPECT_EQ(later_calls, 1);
}

TEST(EventBus, HandlerMayEmitAndSubscribe) {
    EventBus bus;

    int nested = 0;
    bus.subscribe<ConnectivityChangedEvent>([&](const ConnectivityChangedEvent& e) {
        if (e.reachable) {
            bus.subscribe<PendingCountChangedEvent>([&](const PendingCountChangedEvent&) { nested++; });
            bus.emit(PendingCountChangedEvent{0});
        }
    });

    bus.emit(ConnectivityChangedEvent{true});
    EXPECT_EQ(nested, 1);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::size_t> total{0};

    bus.subscribe<PendingCountChangedEvent>([&total](const PendingCountChangedEvent& e) {
        total += e.pending_count;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(PendingCountChangedEvent{2});
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(total.load(), 100u);
}

TEST(EventBus, SubscriberCount) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<DrainCompletedEvent>(), 0u);

    auto id1 = bus.subscribe<DrainCompletedEvent>([](const DrainCompletedEvent&) {});
    bus.subscribe<DrainCompletedEvent>([](const DrainCompletedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<DrainCompletedEvent>(), 2u);

    bus.unsubscribe<DrainCompletedEvent>(id1);
    EXPECT_EQ(bus.subscriber_count<DrainCompletedEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<DrainCompletedEvent>(), 0u);
}
