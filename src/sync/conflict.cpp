#include "fts/sync/conflict.hpp"

#include "fts/sync/session.hpp"

namespace fts::sync {

using model::LifecycleState;
using model::OperationType;

model::ClockSession ConflictResolver::reconcile(const model::ClockSession& session,
                                                const model::AuthoritativeSessionFields& remote) const {
    model::ClockSession resolved = session;

    if (!remote.remote_id.empty()) {
        resolved.remote_id = remote.remote_id;
    }
    if (remote.clock_in_time) {
        resolved.clock_in_time = *remote.clock_in_time;
    }
    if (remote.clock_out_time) {
        resolved.clock_out_time = *remote.clock_out_time;
    }
    if (remote.duration_seconds) {
        resolved.duration_seconds = *remote.duration_seconds;
    }
    if (remote.rate_type) {
        resolved.rate_type = *remote.rate_type;
    }
    if (remote.work_order_id) {
        resolved.work_order_id = *remote.work_order_id;
    }

    // An unconfirmed local clock-out that the server's clock-in overtook is
    // dropped; the clock-out acknowledgement will supply the real one.
    if (!remote.clock_out_time && resolved.clock_out_time && *resolved.clock_out_time <= resolved.clock_in_time) {
        resolved.clock_out_time.reset();
        if (!remote.duration_seconds) {
            resolved.duration_seconds.reset();
        }
    }
    return resolved;
}

Result<RollbackOutcome> ConflictResolver::rollback(const model::ClockSession& session,
                                                   const model::QueueItem& item,
                                                   const std::string& error_message) const {
    RollbackOutcome outcome{session, session.state};
    auto& reverted = outcome.session;
    SessionStateMachine machine(reverted);

    switch (item.operation) {
        case OperationType::CreateClockIn: {
            auto moved = machine.transition_to(LifecycleState::RolledBack);
            if (moved.is_error()) {
                return Err<RollbackOutcome>(moved.error());
            }
            break;
        }

        case OperationType::CreateClockOut: {
            auto moved = machine.transition_to(LifecycleState::RolledBack);
            if (moved.is_error()) {
                return Err<RollbackOutcome>(moved.error());
            }
            reverted.clock_out_time.reset();
            reverted.clock_out_location.reset();
            reverted.duration_seconds.reset();

            moved = machine.transition_to(reverted.remote_id ? LifecycleState::Active : LifecycleState::Pending);
            if (moved.is_error()) {
                return Err<RollbackOutcome>(moved.error());
            }
            break;
        }

        case OperationType::UpdateRate:
            if (reverted.rate_type == item.payload.rate_type && !item.payload.previous_rate_type.empty()) {
                reverted.rate_type = item.payload.previous_rate_type;
            }
            break;
    }

    if (!reverted.last_error) {
        reverted.last_error = error_message;
    }
    outcome.restored_state = reverted.state;
    return Ok(outcome);
}

} // namespace fts::sync
