#include "fts/sync/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace fts::sync {

using model::LifecycleState;
using model::OperationType;

bool can_transition(LifecycleState from, LifecycleState to) noexcept {
    static const std::unordered_map<LifecycleState, std::vector<LifecycleState>> transitions {
        {LifecycleState::Idle, {LifecycleState::Pending}},
        {LifecycleState::Pending, {LifecycleState::Active, LifecycleState::PendingClockOut, LifecycleState::RolledBack}},
        {LifecycleState::Active, {LifecycleState::PendingClockOut}},
        {LifecycleState::PendingClockOut, {LifecycleState::Synced, LifecycleState::RolledBack}},
        {LifecycleState::Synced, {LifecycleState::Archived}},
        // Re-submission after a rejected clock-in, or the clock-out revert
        // landing back on the last confirmed state.
        {LifecycleState::RolledBack, {LifecycleState::Pending, LifecycleState::PendingClockOut, LifecycleState::Active}},
    };

    if (from == to) {
        return true;
    }

    const auto it = transitions.find(from);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), to) != allowed_list.end();
}

Result<model::ClockSession> SessionStateMachine::open(const model::ActionPayload& payload) {
    model::ClockSession session;
    session.local_id = payload.session_id;
    session.employee_id = payload.employee_id;
    session.work_order_id = payload.work_order_id;
    session.rate_type = payload.rate_type;
    session.clock_in_time = payload.occurred_at;
    session.clock_in_location = payload.location;
    session.state = LifecycleState::Idle;

    SessionStateMachine machine(session);
    auto moved = machine.transition_to(LifecycleState::Pending);
    if (moved.is_error()) {
        return Err<model::ClockSession>(moved.error());
    }
    return Ok(session);
}

Result<void> SessionStateMachine::transition_to(LifecycleState next) {
    if (!can_transition(session_.state, next)) {
        return Err<void>(Error::invalid_operation(
            std::string("Illegal session state transition ") + model::to_string(session_.state) +
            " -> " + model::to_string(next) + " for session " + session_.local_id));
    }
    session_.state = next;
    return Ok();
}

Result<void> SessionStateMachine::apply_enqueue(OperationType operation, const model::ActionPayload& payload) {
    switch (operation) {
        case OperationType::CreateClockIn: {
            if (session_.state != LifecycleState::RolledBack) {
                return Err<void>(Error::invalid_operation("Session " + session_.local_id + " is already clocked in"));
            }
            // The clock-in payload is replayed unchanged; restore what it says.
            session_.clock_in_time = payload.occurred_at;
            session_.clock_in_location = payload.location;
            return transition_to(session_.clock_out_time ? LifecycleState::PendingClockOut : LifecycleState::Pending);
        }

        case OperationType::CreateClockOut: {
            if (session_.state != LifecycleState::Pending && session_.state != LifecycleState::Active) {
                return Err<void>(Error::invalid_operation(
                    "No active session to clock out for " + session_.employee_id));
            }
            if (payload.occurred_at <= session_.clock_in_time) {
                return Err<void>(Error::invalid_operation("Clock-out time must be after clock-in time"));
            }
            auto moved = transition_to(LifecycleState::PendingClockOut);
            if (moved.is_error()) {
                return moved;
            }
            session_.clock_out_time = payload.occurred_at;
            session_.clock_out_location = payload.location;
            session_.duration_seconds.reset();
            return Ok();
        }

        case OperationType::UpdateRate: {
            if (session_.state != LifecycleState::Pending && session_.state != LifecycleState::Active) {
                return Err<void>(Error::invalid_operation("Rate change needs a session that is not clocked out: " +
                                                          session_.local_id));
            }
            session_.rate_type = payload.rate_type;
            return Ok();
        }
    }
    return Err<void>(Error::invalid_argument("Unknown operation type"));
}

Result<void> SessionStateMachine::apply_acknowledged(OperationType operation) {
    switch (operation) {
        case OperationType::CreateClockIn:
            session_.last_error.reset();
            // A clock-out queued behind this clock-in keeps the session in
            // PendingClockOut until it is acknowledged too.
            if (session_.state == LifecycleState::PendingClockOut) {
                return Ok();
            }
            return transition_to(LifecycleState::Active);

        case OperationType::CreateClockOut:
            session_.last_error.reset();
            return transition_to(LifecycleState::Synced);

        case OperationType::UpdateRate:
            return Ok();
    }
    return Err<void>(Error::invalid_argument("Unknown operation type"));
}

Result<void> SessionStateMachine::archive() {
    if (session_.state != LifecycleState::Synced) {
        return Err<void>(Error::invalid_operation("Only synced sessions can be archived: " + session_.local_id));
    }
    return transition_to(LifecycleState::Archived);
}

} // namespace fts::sync
