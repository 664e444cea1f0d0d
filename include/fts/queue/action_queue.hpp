#pragma once

#include "fts/core/config.hpp"
#include "fts/core/result.hpp"
#include "fts/core/scheduler.hpp"
#include "fts/events/event_bus.hpp"
#include "fts/model/types.hpp"
#include "fts/store/durable_store.hpp"
#include "fts/sync/backoff.hpp"
#include "fts/sync/conflict.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fts::queue {

/**
 * @brief Where mark_failed() left an item
 */
struct FailureOutcome {
    model::QueueStatus status = model::QueueStatus::Failed;   ///< Pending when a retry is due
    int retry_count = 0;
    std::optional<std::chrono::milliseconds> retry_delay;       ///< Set when status == Pending
    bool rolled_back = false;                                   ///< Session effect was reverted
};

/**
 * @brief Replay log of user actions over the durable store
 *
 * Every public mutation is one store transaction: the queue item and the
 * session change it implies commit together or not at all. Events are
 * emitted only after the commit, so observers never see a state the store
 * does not hold.
 *
 * Drain eligibility: an item is eligible when it is Pending and no item of
 * the same session with a smaller sequence is still in the queue. Items are
 * deleted on acknowledgement, so a remaining earlier item is by definition
 * unsent, in flight, or Failed; all three block later items of that session.
 */
class ActionQueue {
public:
    ActionQueue(store::DurableStore& store,
                events::EventBus& bus,
                const Clock& clock,
                SyncConfig config = {});

    /**
     * @brief Capture a user action and apply its optimistic effect
     * @return id of the new QueueItem (also its idempotency key)
     *
     * InvalidOperation when the action makes no sense for the session's
     * current state: a second clock-in for an employee who is already
     * clocked in, a clock-out without a Pending/Active session, a clock-out
     * not after the clock-in.
     */
    Result<std::string> enqueue(model::OperationType operation, model::ActionPayload payload);

    /// Pending -> InFlight; stamps the cursor's last attempt time.
    Result<model::QueueItem> mark_in_flight(const std::string& id);

    /**
     * @brief Server accepted the item: reconcile, advance the session, delete the item
     *
     * PermanentSync when the authoritative fields would break a session
     * invariant (clock-out not after clock-in); nothing is written then.
     */
    Result<model::ClockSession> ack_success(const std::string& id, const model::AuthoritativeSessionFields& remote);

    /**
     * @brief Record a failed submission
     *
     * TransientSync below the retry budget: back to Pending with
     * retry_count + 1 and the backoff delay to wait. TransientSync with the
     * budget spent: Failed, no rollback. Anything else: Failed and the
     * session's optimistic effect is rolled back.
     */
    Result<FailureOutcome> mark_failed(const std::string& id, const Error& error);

    /**
     * @brief Manual retry of a Failed item
     *
     * Resets status and retry count, clears lastError, moves the item to the
     * tail of the drain order and re-applies a rolled-back optimistic effect.
     */
    Result<void> retry(const std::string& id);

    /**
     * @brief Start-up recovery: items left InFlight by a previous run become Pending
     */
    Result<std::size_t> recover();

    /// First eligible item in drain order, if any.
    Result<std::optional<model::QueueItem>> next_eligible();

    /// Pending + InFlight items, from committed state.
    Result<std::size_t> pending_count();
    Result<std::vector<model::QueueItem>> failed_items();
    Result<std::vector<model::QueueItem>> list_items();
    Result<model::ClockSession> session(const std::string& local_id);
    Result<model::SyncCursor> cursor();

    /// Synced sessions clocked out more than the retention window ago -> Archived.
    Result<std::size_t> archive_expired(Timestamp now);

    [[nodiscard]] const sync::RetryPolicy& retry_policy() const noexcept { return policy_; }

private:
    /// Read and emit under one lock so the last value published is the newest.
    /// PendingCountChangedEvent handlers must not enqueue on the same thread.
    void publish_pending_count();

    store::DurableStore& store_;
    events::EventBus& bus_;
    const Clock& clock_;
    SyncConfig config_;
    sync::RetryPolicy policy_;
    sync::ConflictResolver resolver_;
    std::mutex publish_mutex_;
};

} // namespace fts::queue
