#pragma once

#include "fts/core/result.hpp"
#include "fts/model/types.hpp"

namespace fts::sync {

/**
 * @brief Whether the lifecycle table allows from -> to
 *
 * Staying in the same state is always allowed.
 */
[[nodiscard]] bool can_transition(model::LifecycleState from, model::LifecycleState to) noexcept;

/**
 * @brief Lifecycle rules for one ClockSession
 *
 * Operates on a session value loaded from the store inside the caller's
 * transaction; the caller writes the result back in the same transaction.
 * Every state change goes through transition_to(), so an illegal edge is an
 * InvalidOperation instead of a silently corrupted session.
 */
class SessionStateMachine {
public:
    explicit SessionStateMachine(model::ClockSession& session) : session_(session) {}

    /**
     * @brief Fresh session for a clock-in payload, already in Pending
     */
    static Result<model::ClockSession> open(const model::ActionPayload& payload);

    [[nodiscard]] model::LifecycleState state() const noexcept { return session_.state; }
    [[nodiscard]] const model::ClockSession& session() const noexcept { return session_; }

    Result<void> transition_to(model::LifecycleState next);

    /**
     * @brief Optimistic local effect of enqueuing an operation
     *
     * CreateClockIn: RolledBack -> Pending (re-submission of a rejected
     * clock-in), or PendingClockOut when its clock-out is still queued.
     * CreateClockOut: Pending/Active -> PendingClockOut, records the
     * device clock-out time and location.
     * UpdateRate: swaps the rate, no lifecycle change.
     */
    Result<void> apply_enqueue(model::OperationType operation, const model::ActionPayload& payload);

    /**
     * @brief Lifecycle effect of the server accepting an operation
     *
     * Field values are reconciled separately (ConflictResolver::reconcile);
     * this only moves the state and clears the session's error banner.
     */
    Result<void> apply_acknowledged(model::OperationType operation);

    /// Synced -> Archived
    Result<void> archive();

private:
    model::ClockSession& session_;
};

} // namespace fts::sync
