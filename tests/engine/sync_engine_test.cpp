#include "fts/engine.hpp"

#include "fts/events/components.hpp"
#include "fts/store/sqlite_store.hpp"
#include "../support/fake_remote_endpoint.hpp"
#include "../support/temp_database.hpp"

#include <gtest/gtest.h>

#include <chrono>

using fts::ClockInRequest;
using fts::ClockOutRequest;
using fts::EngineConfig;
using fts::ErrorCode;
using fts::ManualScheduler;
using fts::SyncEngine;
using fts::events::SyncStatusComponent;
using fts::store::SqliteStore;
using fts::testing::FakeRemoteEndpoint;
using fts::testing::TempDatabase;
using namespace fts::model;
using namespace std::chrono_literals;

namespace {

std::unique_ptr<SyncEngine> make_engine(const TempDatabase& db, FakeRemoteEndpoint& remote, ManualScheduler& scheduler) {
    EngineConfig config;
    config.store = db.config();
    auto engine = SyncEngine::open(config, remote, scheduler);
    EXPECT_TRUE(engine.is_ok());
    return engine.is_ok() ? std::move(engine.value()) : nullptr;
}

ClockInRequest clock_in_request(const std::string& employee) {
    ClockInRequest request;
    request.employee_id = employee;
    request.work_order_id = "WO-1";
    request.rate_type = "Regular";
    request.location = LocationReading{47.6, -122.3, 12.0, true};
    return request;
}

} // namespace

TEST(SyncEngineTest, OfflineActionsCommitLocally) {
    TempDatabase db;
    FakeRemoteEndpoint remote;
    ManualScheduler scheduler;
    auto engine = make_engine(db, remote, scheduler);
    ASSERT_NE(engine, nullptr);
    ASSERT_TRUE(engine->start().is_ok());

    auto session_id = engine->clock_in(clock_in_request("E1"));
    ASSERT_TRUE(session_id.is_ok());
    scheduler.run_due();

    EXPECT_EQ(remote.call_count(), 0u);
    EXPECT_EQ(engine->pending_count().value(), 1u);
    auto session = engine->session(session_id.value());
    ASSERT_TRUE(session.is_ok());
    EXPECT_EQ(session.value().state, LifecycleState::Pending);
    EXPECT_EQ(session.value().clock_in_time, scheduler.now());
}

TEST(SyncEngineTest, FullDaySyncsWhenNetworkReturns) {
    TempDatabase db;
    FakeRemoteEndpoint remote;
    ManualScheduler scheduler;
    auto engine = make_engine(db, remote, scheduler);
    ASSERT_NE(engine, nullptr);
    SyncStatusComponent status(engine->bus());
    ASSERT_TRUE(engine->start().is_ok());

    const auto in = scheduler.now();
    auto session_id = engine->clock_in(clock_in_request("E1"));
    ASSERT_TRUE(session_id.is_ok());
    ASSERT_TRUE(engine->update_rate(session_id.value(), "Overtime").is_ok());

    ClockOutRequest out;
    out.session_id = session_id.value();
    out.occurred_at = in + 8h;
    ASSERT_TRUE(engine->clock_out(out).is_ok());
    EXPECT_EQ(status.pending_count(), 3u);

    engine->on_network_status(true);
    scheduler.run_due();

    EXPECT_EQ(remote.call_count(), 3u);
    EXPECT_EQ(engine->pending_count().value(), 0u);
    EXPECT_EQ(status.pending_count(), 0u);
    EXPECT_EQ(status.session_state(session_id.value()), std::optional<LifecycleState>(LifecycleState::Synced));

    auto session = engine->session(session_id.value());
    ASSERT_TRUE(session.is_ok());
    EXPECT_EQ(session.value().rate_type, "Overtime");
    EXPECT_EQ(session.value().duration_seconds, std::optional<std::int64_t>(8 * 3600));

    auto cursor = engine->cursor();
    ASSERT_TRUE(cursor.is_ok());
    ASSERT_TRUE(cursor.value().last_synced_item_at.has_value());
    EXPECT_EQ(status.snapshot().last_synced_at, cursor.value().last_synced_item_at);
}

TEST(SyncEngineTest, OnlineActionTriggersDrain) {
    TempDatabase db;
    FakeRemoteEndpoint remote;
    ManualScheduler scheduler;
    auto engine = make_engine(db, remote, scheduler);
    ASSERT_NE(engine, nullptr);
    engine->on_network_status(true);

    auto session_id = engine->clock_in(clock_in_request("E1"));
    ASSERT_TRUE(session_id.is_ok());
    EXPECT_EQ(remote.call_count(), 0u);

    scheduler.run_due();
    EXPECT_EQ(remote.call_count(), 1u);
    EXPECT_EQ(engine->session(session_id.value()).value().state, LifecycleState::Active);
}

TEST(SyncEngineTest, SecondClockInRejected) {
    TempDatabase db;
    FakeRemoteEndpoint remote;
    ManualScheduler scheduler;
    auto engine = make_engine(db, remote, scheduler);
    ASSERT_NE(engine, nullptr);

    ASSERT_TRUE(engine->clock_in(clock_in_request("E1")).is_ok());
    auto second = engine->clock_in(clock_in_request("E1"));
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().code, ErrorCode::InvalidOperation);
    EXPECT_EQ(engine->pending_count().value(), 1u);
}

TEST(SyncEngineTest, SyncNowIgnoresGate) {
    TempDatabase db;
    FakeRemoteEndpoint remote;
    ManualScheduler scheduler;
    auto engine = make_engine(db, remote, scheduler);
    ASSERT_NE(engine, nullptr);

    ASSERT_TRUE(engine->clock_in(clock_in_request("E1")).is_ok());
    engine->sync_now();
    scheduler.run_due();

    EXPECT_EQ(remote.call_count(), 1u);
}

TEST(SyncEngineTest, RejectionSurfacesAndRetrySucceeds) {
    TempDatabase db;
    FakeRemoteEndpoint remote;
    ManualScheduler scheduler;
    auto engine = make_engine(db, remote, scheduler);
    ASSERT_NE(engine, nullptr);
    SyncStatusComponent status(engine->bus());
    engine->on_network_status(true);

    remote.fail_permanent("InvalidWorkOrder");
    auto session_id = engine->clock_in(clock_in_request("E1"));
    ASSERT_TRUE(session_id.is_ok());
    scheduler.run_due();

    auto failed = engine->failed_items();
    ASSERT_TRUE(failed.is_ok());
    ASSERT_EQ(failed.value().size(), 1u);
    EXPECT_EQ(status.snapshot().failed_items.at(failed.value()[0].id), "InvalidWorkOrder");
    EXPECT_EQ(engine->session(session_id.value()).value().state, LifecycleState::RolledBack);

    ASSERT_TRUE(engine->retry(failed.value()[0].id).is_ok());
    scheduler.run_due();

    EXPECT_TRUE(engine->failed_items().value().empty());
    EXPECT_TRUE(status.snapshot().failed_items.empty());
    EXPECT_EQ(engine->session(session_id.value()).value().state, LifecycleState::Active);
}

TEST(SyncEngineTest, RestartResumesInterruptedSubmission) {
    TempDatabase db;
    FakeRemoteEndpoint remote;
    ManualScheduler scheduler;
    std::string session_id;
    {
        auto engine = make_engine(db, remote, scheduler);
        ASSERT_NE(engine, nullptr);
        auto opened = engine->clock_in(clock_in_request("E1"));
        ASSERT_TRUE(opened.is_ok());
        session_id = opened.value();

        auto next = engine->queue().next_eligible();
        ASSERT_TRUE(next.is_ok() && next.value().has_value());
        ASSERT_TRUE(engine->queue().mark_in_flight(next.value()->id).is_ok());
    }

    auto engine = make_engine(db, remote, scheduler);
    ASSERT_NE(engine, nullptr);
    engine->on_network_status(true);
    scheduler.run_due();
    EXPECT_EQ(remote.call_count(), 0u);

    ASSERT_TRUE(engine->start().is_ok());
    scheduler.run_due();

    EXPECT_EQ(remote.call_count(), 1u);
    EXPECT_EQ(engine->session(session_id).value().state, LifecycleState::Active);
}

TEST(SyncEngineTest, ArchivesOldSyncedSessions) {
    TempDatabase db;
    FakeRemoteEndpoint remote;
    ManualScheduler scheduler;
    auto engine = make_engine(db, remote, scheduler);
    ASSERT_NE(engine, nullptr);
    engine->on_network_status(true);

    auto session_id = engine->clock_in(clock_in_request("E1"));
    ASSERT_TRUE(session_id.is_ok());
    scheduler.advance(1h);
    ClockOutRequest out;
    out.session_id = session_id.value();
    ASSERT_TRUE(engine->clock_out(out).is_ok());
    scheduler.run_due();
    ASSERT_EQ(engine->session(session_id.value()).value().state, LifecycleState::Synced);

    EXPECT_EQ(engine->archive_expired().value(), 0u);
    scheduler.advance(24h * 7);
    EXPECT_EQ(engine->archive_expired().value(), 1u);
    EXPECT_EQ(engine->session(session_id.value()).value().state, LifecycleState::Archived);
    EXPECT_TRUE(engine->suspend().is_ok());
}

TEST(SyncEngineTest, OpenFailsOnUnusablePath) {
    FakeRemoteEndpoint remote;
    ManualScheduler scheduler;
    EngineConfig config;
    config.store.path = "/nonexistent-dir/fts/store.db";

    auto engine = SyncEngine::open(config, remote, scheduler);
    ASSERT_TRUE(engine.is_error());
    EXPECT_EQ(engine.error().code, ErrorCode::IOFailure);
}
