#include "fts/events/components.hpp"
#include "fts/events/event_bus.hpp"
#include "fts/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using fts::events::ConnectivityChangedEvent;
using fts::events::DrainCompletedEvent;
using fts::events::EventBus;
using fts::events::ItemAcknowledgedEvent;
using fts::events::ItemEnqueuedEvent;
using fts::events::ItemFailedEvent;
using fts::events::LoggerComponent;
using fts::events::PendingCountChangedEvent;
using fts::events::RetryScheduledEvent;
using fts::events::SessionRolledBackEvent;
using fts::events::SessionStateChangedEvent;
using fts::events::SyncMetricsComponent;
using fts::events::SyncStatusComponent;
using fts::model::LifecycleState;
using fts::model::OperationType;

TEST(SyncStatusComponentTest, TracksBadgeStatesAndBanners) {
    EventBus bus;
    SyncStatusComponent status(bus);

    bus.emit(PendingCountChangedEvent{2});
    bus.emit(ConnectivityChangedEvent{true});
    bus.emit(SessionStateChangedEvent{"s-1", LifecycleState::Pending, LifecycleState::RolledBack});
    bus.emit(ItemFailedEvent{"i-1", OperationType::CreateClockIn, "s-1", "InvalidWorkOrder", 0, true});

    auto snapshot = status.snapshot();
    EXPECT_EQ(snapshot.pending_count, 2u);
    EXPECT_TRUE(snapshot.reachable);
    EXPECT_EQ(status.session_state("s-1"), std::optional<LifecycleState>(LifecycleState::RolledBack));
    ASSERT_EQ(snapshot.failed_items.count("i-1"), 1u);
    EXPECT_EQ(snapshot.failed_items.at("i-1"), "InvalidWorkOrder");
    EXPECT_FALSE(snapshot.last_synced_at.has_value());

    // Manual retry re-enqueues the item, then the server accepts it.
    bus.emit(ItemEnqueuedEvent{"i-1", OperationType::CreateClockIn, "s-1", 1});
    EXPECT_TRUE(status.snapshot().failed_items.empty());

    const auto created = fts::from_unix_millis(1'700'000'000'000);
    bus.emit(ItemAcknowledgedEvent{"i-1", OperationType::CreateClockIn, "s-1", "R1", created});
    EXPECT_EQ(status.snapshot().last_synced_at, std::optional<fts::Timestamp>(created));
    EXPECT_FALSE(status.session_state("s-unknown").has_value());
}

TEST(SyncStatusComponentTest, RestoresLastSyncedFromCursor) {
    EventBus bus;
    SyncStatusComponent status(bus);

    fts::model::SyncCursor cursor;
    cursor.last_synced_item_at = fts::from_unix_millis(1'700'000'500'000);
    status.restore(cursor);
    EXPECT_EQ(status.snapshot().last_synced_at, cursor.last_synced_item_at);

    status.restore(fts::model::SyncCursor{});
    EXPECT_FALSE(status.snapshot().last_synced_at.has_value());
}

TEST(SyncStatusComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        SyncStatusComponent status(bus);
        EXPECT_EQ(bus.subscriber_count<PendingCountChangedEvent>(), 1u);
    }
    EXPECT_EQ(bus.subscriber_count<PendingCountChangedEvent>(), 0u);
    EXPECT_NO_THROW(bus.emit(PendingCountChangedEvent{1}));
}

TEST(SyncMetricsComponentTest, CountsSyncTraffic) {
    EventBus bus;
    SyncMetricsComponent metrics(bus);

    bus.emit(ItemEnqueuedEvent{"i-1", OperationType::CreateClockIn, "s-1", 1});
    bus.emit(ItemEnqueuedEvent{"i-2", OperationType::CreateClockIn, "s-2", 2});
    bus.emit(RetryScheduledEvent{"i-1", 1, std::chrono::milliseconds{2000}, "timeout"});
    bus.emit(ItemAcknowledgedEvent{"i-1", OperationType::CreateClockIn, "s-1", "R1"});
    bus.emit(ItemFailedEvent{"i-2", OperationType::CreateClockIn, "s-2", "InvalidWorkOrder", 0, true});
    bus.emit(SessionRolledBackEvent{"s-2", "i-2", OperationType::CreateClockIn, LifecycleState::RolledBack,
                                    "InvalidWorkOrder"});
    bus.emit(ItemFailedEvent{"i-3", OperationType::CreateClockOut, "s-3", "timeout", 3, false});

    DrainCompletedEvent drain;
    drain.submitted = 4;
    bus.emit(drain);

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.items_enqueued.load(), 2u);
    EXPECT_EQ(stats.acknowledged.load(), 1u);
    EXPECT_EQ(stats.transient_failures.load(), 2u);
    EXPECT_EQ(stats.permanent_failures.load(), 1u);
    EXPECT_EQ(stats.exhausted_items.load(), 1u);
    EXPECT_EQ(stats.rollbacks.load(), 1u);
    EXPECT_EQ(stats.drains.load(), 1u);
    EXPECT_EQ(stats.submissions.load(), 4u);
}

TEST(LoggerComponentTest, HandlesEveryEventType) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_EQ(bus.subscriber_count<DrainCompletedEvent>(), 1u);
    EXPECT_NO_THROW(bus.emit(ItemFailedEvent{"i-1", OperationType::UpdateRate, "s-1", "RateNotAllowed", 0, true}));
    EXPECT_NO_THROW(bus.emit(DrainCompletedEvent{}));
}
