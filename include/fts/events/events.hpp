/**
 * @file events.hpp
 * @brief Domain events published by the action queue and the sync processor
 *
 * NAMING CONVENTION:
 * Events are past-tense and describe state that is already committed to the
 * durable store. Subscribers may read the store from a handler and will see
 * the change.
 */

#pragma once

#include "fts/core/time.hpp"
#include "fts/model/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace fts::events {

// ════════════════════════════════════════════════════════
// Queue Events
// ════════════════════════════════════════════════════════

/**
 * @brief A user action was captured locally
 *
 * WHO EMITS: ActionQueue::enqueue, after the item and the optimistic session
 * change committed together
 * WHO SUBSCRIBES: LoggerComponent, SyncMetricsComponent
 */
struct ItemEnqueuedEvent {
    std::string item_id;
    model::OperationType operation = model::OperationType::CreateClockIn;
    std::string session_id;
    std::int64_t sequence = 0;
    Timestamp timestamp{SystemClock::now()};
};

/**
 * @brief Badge value changed (Pending + InFlight items)
 */
struct PendingCountChangedEvent {
    std::size_t pending_count = 0;
    Timestamp timestamp{SystemClock::now()};
};

struct SessionStateChangedEvent {
    std::string session_id;
    model::LifecycleState from = model::LifecycleState::Idle;
    model::LifecycleState to = model::LifecycleState::Idle;
    Timestamp timestamp{SystemClock::now()};
};

/**
 * @brief The remote authority accepted an item; the item is gone from the queue
 */
struct ItemAcknowledgedEvent {
    std::string item_id;
    model::OperationType operation = model::OperationType::CreateClockIn;
    std::string session_id;
    std::string remote_id;
    Timestamp synced_item_at{};   ///< created_at of the item, as recorded in the sync cursor
    Timestamp timestamp{SystemClock::now()};
};

/**
 * @brief A transient failure was absorbed and a retry timer armed
 */
struct RetryScheduledEvent {
    std::string item_id;
    int retry_count = 0;
    std::chrono::milliseconds delay{0};
    std::string reason;
    Timestamp timestamp{SystemClock::now()};
};

/**
 * @brief An item reached Failed and now waits for a manual retry
 *
 * permanent is false when transient retries were exhausted.
 */
struct ItemFailedEvent {
    std::string item_id;
    model::OperationType operation = model::OperationType::CreateClockIn;
    std::string session_id;
    std::string last_error;
    int retry_count = 0;
    bool permanent = true;
    Timestamp timestamp{SystemClock::now()};
};

/**
 * @brief The optimistic effect of a rejected item was reverted
 */
struct SessionRolledBackEvent {
    std::string session_id;
    std::string item_id;
    model::OperationType operation = model::OperationType::CreateClockIn;
    model::LifecycleState restored_state = model::LifecycleState::RolledBack;
    std::string reason;
    Timestamp timestamp{SystemClock::now()};
};

// ════════════════════════════════════════════════════════
// Sync Events
// ════════════════════════════════════════════════════════

struct ConnectivityChangedEvent {
    bool reachable = false;
    Timestamp timestamp{SystemClock::now()};
};

/**
 * @brief One drain pass ended (queue empty, everything blocked, unreachable,
 * or waiting on a backoff timer)
 */
struct DrainCompletedEvent {
    std::size_t submitted = 0;
    std::size_t acknowledged = 0;
    std::size_t failed = 0;
    std::size_t remaining = 0;
    bool backoff_pending = false;
    std::chrono::milliseconds duration{0};
    Timestamp timestamp{SystemClock::now()};
};

} // namespace fts::events
