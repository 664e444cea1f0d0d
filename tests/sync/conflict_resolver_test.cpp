#include "fts/sync/conflict.hpp"

#include <gtest/gtest.h>

#include <chrono>

using fts::from_unix_millis;
using fts::sync::ConflictResolver;
using namespace fts::model;
using namespace std::chrono_literals;

namespace {

ClockSession make_session(LifecycleState state) {
    ClockSession session;
    session.local_id = "s-1";
    session.employee_id = "E1";
    session.work_order_id = "WO-1";
    session.rate_type = "Regular";
    session.clock_in_time = from_unix_millis(1'700'000'000'000);
    session.state = state;
    session.ui_flags = 4;
    return session;
}

QueueItem make_item(OperationType operation) {
    QueueItem item;
    item.id = "i-1";
    item.operation = operation;
    item.payload.session_id = "s-1";
    return item;
}

} // namespace

TEST(ConflictResolverTest, ServerValuesWinWholesale) {
    ConflictResolver resolver;
    ClockSession local = make_session(LifecycleState::Pending);
    local.last_error = "banner";

    AuthoritativeSessionFields remote;
    remote.remote_id = "R1";
    remote.clock_in_time = local.clock_in_time + 1s;
    remote.rate_type = "Travel";
    remote.work_order_id = "WO-2";

    const ClockSession resolved = resolver.reconcile(local, remote);
    EXPECT_EQ(resolved.remote_id, std::optional<std::string>("R1"));
    EXPECT_EQ(resolved.clock_in_time, local.clock_in_time + 1s);
    EXPECT_EQ(resolved.rate_type, "Travel");
    EXPECT_EQ(resolved.work_order_id, "WO-2");

    // Local-only fields and the lifecycle are not the server's to change.
    EXPECT_EQ(resolved.last_error, local.last_error);
    EXPECT_EQ(resolved.ui_flags, 4u);
    EXPECT_EQ(resolved.state, LifecycleState::Pending);
}

TEST(ConflictResolverTest, AbsentFieldsKeepLocalValues) {
    ConflictResolver resolver;
    ClockSession local = make_session(LifecycleState::PendingClockOut);
    local.clock_out_time = local.clock_in_time + 2h;

    AuthoritativeSessionFields remote;
    remote.remote_id = "R1";

    const ClockSession resolved = resolver.reconcile(local, remote);
    EXPECT_EQ(resolved.clock_out_time, local.clock_out_time);
    EXPECT_EQ(resolved.rate_type, "Regular");
}

TEST(ConflictResolverTest, ReconcileIsIdempotent) {
    ConflictResolver resolver;
    ClockSession local = make_session(LifecycleState::PendingClockOut);
    local.clock_out_time = local.clock_in_time + 8h;

    AuthoritativeSessionFields remote;
    remote.remote_id = "R1";
    remote.clock_out_time = local.clock_in_time + 8h + 1s;
    remote.duration_seconds = 8 * 3600 + 1;

    const ClockSession once = resolver.reconcile(local, remote);
    const ClockSession twice = resolver.reconcile(once, remote);
    EXPECT_EQ(once, twice);
}

TEST(ConflictResolverTest, ServerClockInPastLocalClockOutDropsLocalClockOut) {
    ConflictResolver resolver;
    ClockSession local = make_session(LifecycleState::PendingClockOut);
    local.clock_out_time = local.clock_in_time + 2s;
    local.duration_seconds = 2;

    AuthoritativeSessionFields remote;
    remote.remote_id = "R1";
    remote.clock_in_time = local.clock_in_time + 3s;

    const ClockSession resolved = resolver.reconcile(local, remote);
    EXPECT_EQ(resolved.remote_id, std::optional<std::string>("R1"));
    EXPECT_EQ(resolved.clock_in_time, local.clock_in_time + 3s);
    EXPECT_FALSE(resolved.clock_out_time.has_value());
    EXPECT_FALSE(resolved.duration_seconds.has_value());
    EXPECT_EQ(resolved.state, LifecycleState::PendingClockOut);
    EXPECT_EQ(resolver.reconcile(resolved, remote), resolved);
}

TEST(ConflictResolverTest, RejectedClockInRollsBack) {
    ConflictResolver resolver;
    auto outcome = resolver.rollback(make_session(LifecycleState::Pending),
                                     make_item(OperationType::CreateClockIn), "InvalidWorkOrder");
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().restored_state, LifecycleState::RolledBack);
    EXPECT_EQ(outcome.value().session.state, LifecycleState::RolledBack);
    EXPECT_EQ(outcome.value().session.last_error, std::optional<std::string>("InvalidWorkOrder"));
}

TEST(ConflictResolverTest, RejectedClockOutRestoresConfirmedState) {
    ConflictResolver resolver;
    ClockSession session = make_session(LifecycleState::PendingClockOut);
    session.remote_id = "R1";
    session.clock_out_time = session.clock_in_time + 1h;
    session.clock_out_location = LocationReading{};

    auto outcome = resolver.rollback(session, make_item(OperationType::CreateClockOut), "PeriodLocked");
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().restored_state, LifecycleState::Active);
    EXPECT_FALSE(outcome.value().session.clock_out_time.has_value());
    EXPECT_FALSE(outcome.value().session.clock_out_location.has_value());
}

TEST(ConflictResolverTest, RejectedClockOutOfUnconfirmedSessionGoesBackToPending) {
    ConflictResolver resolver;
    ClockSession session = make_session(LifecycleState::PendingClockOut);
    session.clock_out_time = session.clock_in_time + 1h;

    auto outcome = resolver.rollback(session, make_item(OperationType::CreateClockOut), "PeriodLocked");
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().restored_state, LifecycleState::Pending);
}

TEST(ConflictResolverTest, RejectedRateChangeRestoresPreviousRate) {
    ConflictResolver resolver;
    ClockSession session = make_session(LifecycleState::Active);
    session.rate_type = "Overtime";
    QueueItem item = make_item(OperationType::UpdateRate);
    item.payload.rate_type = "Overtime";
    item.payload.previous_rate_type = "Regular";

    auto outcome = resolver.rollback(session, item, "RateNotAllowed");
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().session.rate_type, "Regular");
    EXPECT_EQ(outcome.value().restored_state, LifecycleState::Active);
}

TEST(ConflictResolverTest, FirstErrorStaysOnBanner) {
    ConflictResolver resolver;
    ClockSession session = make_session(LifecycleState::Active);
    session.last_error = "first";
    QueueItem item = make_item(OperationType::UpdateRate);

    auto outcome = resolver.rollback(session, item, "second");
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().session.last_error, std::optional<std::string>("first"));
}

TEST(ConflictResolverTest, ClockInRollbackFromActiveIsIllegal) {
    ConflictResolver resolver;
    auto outcome = resolver.rollback(make_session(LifecycleState::Active),
                                     make_item(OperationType::CreateClockIn), "late rejection");
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().code, fts::ErrorCode::InvalidOperation);
}
