#pragma once

#include "fts/core/result.hpp"
#include "fts/model/types.hpp"

#include <string>

namespace fts::sync {

/**
 * @brief What a rollback did to the session
 */
struct RollbackOutcome {
    model::ClockSession session;
    model::LifecycleState restored_state = model::LifecycleState::RolledBack;
};

/**
 * @brief Server-wins reconciliation and rollback of optimistic effects
 */
class ConflictResolver {
public:
    /**
     * @brief Overwrite local values with every authoritative field the server sent
     *
     * Wholesale substitution, never a per-field "most recent wins" merge:
     * local-only fields (last_error, ui_flags) and the lifecycle state are
     * left alone. A local clock-out the server did not send that is no
     * longer after the authoritative clock-in is cleared. Applying the same
     * response twice gives the same session.
     */
    [[nodiscard]] model::ClockSession reconcile(const model::ClockSession& session,
                                                const model::AuthoritativeSessionFields& remote) const;

    /**
     * @brief Revert the optimistic effect of a permanently rejected item
     *
     * CreateClockIn: Pending/PendingClockOut -> RolledBack; the record stays
     * for audit and the user may re-submit.
     * CreateClockOut: PendingClockOut -> RolledBack -> Active (Pending if the
     * clock-in was never confirmed); clock-out fields are cleared.
     * UpdateRate: restores the previous rate; the lifecycle is untouched.
     * The rejection message becomes the session's last_error unless an
     * earlier failure already set one.
     */
    Result<RollbackOutcome> rollback(const model::ClockSession& session,
                                     const model::QueueItem& item,
                                     const std::string& error_message) const;
};

} // namespace fts::sync
