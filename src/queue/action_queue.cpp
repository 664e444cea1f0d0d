#include "fts/queue/action_queue.hpp"

#include "fts/core/id.hpp"
#include "fts/events/events.hpp"
#include "fts/model/codec.hpp"
#include "fts/sync/session.hpp"

#include <spdlog/spdlog.h>

#include <map>

namespace fts::queue {
namespace {

using model::ClockSession;
using model::LifecycleState;
using model::OperationType;
using model::QueueItem;
using model::QueueStatus;

Result<void> validate_payload(OperationType operation, const model::ActionPayload& payload) {
    if (payload.session_id.empty()) {
        return Err<void>(Error::invalid_argument("Payload has no session id"));
    }
    if (operation == OperationType::CreateClockIn) {
        if (payload.employee_id.empty() || payload.work_order_id.empty() || payload.rate_type.empty()) {
            return Err<void>(Error::invalid_argument("Clock-in needs employee, work order and rate"));
        }
    }
    if (operation == OperationType::UpdateRate && payload.rate_type.empty()) {
        return Err<void>(Error::invalid_argument("Rate change needs a rate type"));
    }
    auto encoded = model::dump_json(model::payload_to_json(payload));
    if (encoded.is_error()) {
        return Err<void>(encoded.error());
    }
    return Ok();
}

// A missing session for a follow-up action is caller misuse, not a lookup failure.
Result<ClockSession> load_target_session(store::StoreTransaction& tx, const std::string& session_id) {
    auto session = tx.get_session(session_id);
    if (session.is_error() && session.error().code == ErrorCode::NotFound) {
        return Err<ClockSession>(Error::invalid_operation("No matching session " + session_id));
    }
    return session;
}

std::optional<events::SessionStateChangedEvent> state_change(const std::string& session_id,
                                                             LifecycleState from,
                                                             LifecycleState to) {
    if (from == to) {
        return std::nullopt;
    }
    return events::SessionStateChangedEvent{session_id, from, to};
}

} // namespace

ActionQueue::ActionQueue(store::DurableStore& store,
                         events::EventBus& bus,
                         const Clock& clock,
                         SyncConfig config)
    : store_(store),
      bus_(bus),
      clock_(clock),
      config_(config),
      policy_(sync::RetryPolicy::from_config(config)) {}

Result<std::string> ActionQueue::enqueue(OperationType operation, model::ActionPayload payload) {
    auto valid = validate_payload(operation, payload);
    if (valid.is_error()) {
        return Err<std::string>(valid.error());
    }

    QueueItem item;
    item.id = generate_id();
    item.operation = operation;
    item.status = QueueStatus::Pending;
    item.created_at = clock_.now();

    std::optional<events::SessionStateChangedEvent> changed;

    auto result = store_.execute([&](store::StoreTransaction& tx) -> Result<void> {
        ClockSession session;
        LifecycleState before = LifecycleState::Idle;

        if (operation == OperationType::CreateClockIn) {
            auto open = tx.find_open_session(payload.employee_id);
            if (open.is_error()) {
                return Err<void>(open.error());
            }
            if (open.value()) {
                return Err<void>(Error::invalid_operation("Employee " + payload.employee_id +
                                                          " is already clocked in (session " +
                                                          open.value()->local_id + ")"));
            }
            auto existing = tx.get_session(payload.session_id);
            if (existing.is_ok()) {
                return Err<void>(Error::invalid_operation("Session " + payload.session_id + " already exists"));
            }
            if (existing.error().code != ErrorCode::NotFound) {
                return Err<void>(existing.error());
            }

            auto opened = sync::SessionStateMachine::open(payload);
            if (opened.is_error()) {
                return Err<void>(opened.error());
            }
            session = opened.value();
        } else {
            auto loaded = load_target_session(tx, payload.session_id);
            if (loaded.is_error()) {
                return Err<void>(loaded.error());
            }
            session = loaded.value();
            before = session.state;

            // The payload must replay on its own, so complete it from the session.
            if (payload.employee_id.empty()) {
                payload.employee_id = session.employee_id;
            }
            if (payload.work_order_id.empty()) {
                payload.work_order_id = session.work_order_id;
            }
            if (operation == OperationType::CreateClockOut && payload.rate_type.empty()) {
                payload.rate_type = session.rate_type;
            }
            if (operation == OperationType::UpdateRate) {
                payload.previous_rate_type = session.rate_type;
            }

            sync::SessionStateMachine machine(session);
            auto applied = machine.apply_enqueue(operation, payload);
            if (applied.is_error()) {
                return applied;
            }
        }

        item.payload = payload;
        auto inserted = tx.insert_item(item);
        if (inserted.is_error()) {
            return inserted;
        }
        auto saved = tx.put_session(session);
        if (saved.is_error()) {
            return saved;
        }

        changed = state_change(session.local_id, before, session.state);
        return Ok();
    });

    if (result.is_error()) {
        spdlog::warn("Enqueue {} for session {} rejected: {}",
                     model::to_string(operation), payload.session_id, result.error().message);
        return Err<std::string>(result.error());
    }

    bus_.emit(events::ItemEnqueuedEvent{item.id, operation, item.payload.session_id, item.sequence});
    if (changed) {
        bus_.emit(*changed);
    }
    publish_pending_count();
    return Ok(item.id);
}

Result<QueueItem> ActionQueue::mark_in_flight(const std::string& id) {
    QueueItem item;
    auto result = store_.execute([&](store::StoreTransaction& tx) -> Result<void> {
        auto loaded = tx.get_item(id);
        if (loaded.is_error()) {
            return Err<void>(loaded.error());
        }
        item = loaded.value();
        if (item.status != QueueStatus::Pending) {
            return Err<void>(Error::invalid_operation("Item " + id + " is " + model::to_string(item.status) +
                                                      ", not Pending"));
        }

        auto updated = tx.update_item_state(id, QueueStatus::InFlight, item.retry_count, std::nullopt);
        if (updated.is_error()) {
            return updated;
        }
        item.status = QueueStatus::InFlight;

        auto cursor = tx.get_cursor();
        if (cursor.is_error()) {
            return Err<void>(cursor.error());
        }
        cursor.value().last_attempt_at = clock_.now();
        return tx.put_cursor(cursor.value());
    });
    if (result.is_error()) {
        return Err<QueueItem>(result.error());
    }
    return Ok(item);
}

Result<ClockSession> ActionQueue::ack_success(const std::string& id, const model::AuthoritativeSessionFields& remote) {
    QueueItem item;
    ClockSession resolved;
    std::optional<events::SessionStateChangedEvent> changed;

    auto result = store_.execute([&](store::StoreTransaction& tx) -> Result<void> {
        auto loaded = tx.get_item(id);
        if (loaded.is_error()) {
            return Err<void>(loaded.error());
        }
        item = loaded.value();
        if (item.status != QueueStatus::InFlight) {
            return Err<void>(Error::invalid_operation("Item " + id + " was not submitted"));
        }

        auto session = tx.get_session(item.payload.session_id);
        if (session.is_error()) {
            return Err<void>(session.error());
        }
        const LifecycleState before = session.value().state;

        resolved = resolver_.reconcile(session.value(), remote);
        if (session.value().clock_out_time && !resolved.clock_out_time) {
            spdlog::warn("Server clock-in for session {} is not before the local clock-out; "
                         "clock-out time left to its acknowledgement", resolved.local_id);
        }
        sync::SessionStateMachine machine(resolved);
        auto advanced = machine.apply_acknowledged(item.operation);
        if (advanced.is_error()) {
            return advanced;
        }

        if (resolved.clock_out_time && *resolved.clock_out_time <= resolved.clock_in_time) {
            return Err<void>(Error::permanent("Server times put clock-out at or before clock-in for session " +
                                              resolved.local_id));
        }

        auto saved = tx.put_session(resolved);
        if (saved.is_error()) {
            return saved;
        }
        auto deleted = tx.delete_item(id);
        if (deleted.is_error()) {
            return deleted;
        }

        auto cursor = tx.get_cursor();
        if (cursor.is_error()) {
            return Err<void>(cursor.error());
        }
        cursor.value().last_synced_item_at = item.created_at;
        auto stored = tx.put_cursor(cursor.value());
        if (stored.is_error()) {
            return stored;
        }

        changed = state_change(resolved.local_id, before, resolved.state);
        return Ok();
    });

    if (result.is_error()) {
        return Err<ClockSession>(result.error());
    }

    bus_.emit(events::ItemAcknowledgedEvent{item.id, item.operation, item.payload.session_id, remote.remote_id,
                                            item.created_at, clock_.now()});
    if (changed) {
        bus_.emit(*changed);
    }
    publish_pending_count();
    return Ok(resolved);
}

Result<FailureOutcome> ActionQueue::mark_failed(const std::string& id, const Error& error) {
    QueueItem item;
    FailureOutcome outcome;
    std::optional<events::SessionStateChangedEvent> changed;
    std::optional<sync::RollbackOutcome> rollback;

    const bool transient = error.code == ErrorCode::TransientSync;

    auto result = store_.execute([&](store::StoreTransaction& tx) -> Result<void> {
        auto loaded = tx.get_item(id);
        if (loaded.is_error()) {
            return Err<void>(loaded.error());
        }
        item = loaded.value();
        if (item.status == QueueStatus::Failed) {
            return Err<void>(Error::invalid_operation("Item " + id + " has already failed"));
        }

        if (transient) {
            if (auto delay = policy_.next_delay(item.retry_count)) {
                outcome.status = QueueStatus::Pending;
                outcome.retry_count = item.retry_count + 1;
                outcome.retry_delay = *delay;
                return tx.update_item_state(id, QueueStatus::Pending, outcome.retry_count, std::nullopt);
            }
            outcome.status = QueueStatus::Failed;
            outcome.retry_count = item.retry_count;
            return tx.update_item_state(id, QueueStatus::Failed, item.retry_count, error.message);
        }

        outcome.status = QueueStatus::Failed;
        outcome.retry_count = item.retry_count;
        auto updated = tx.update_item_state(id, QueueStatus::Failed, item.retry_count, error.message);
        if (updated.is_error()) {
            return updated;
        }

        auto session = tx.get_session(item.payload.session_id);
        if (session.is_error()) {
            return Err<void>(session.error());
        }
        auto reverted = resolver_.rollback(session.value(), item, error.message);
        if (reverted.is_error()) {
            return Err<void>(reverted.error());
        }
        auto saved = tx.put_session(reverted.value().session);
        if (saved.is_error()) {
            return saved;
        }

        outcome.rolled_back = true;
        changed = state_change(item.payload.session_id, session.value().state, reverted.value().session.state);
        rollback = reverted.value();
        return Ok();
    });

    if (result.is_error()) {
        return Err<FailureOutcome>(result.error());
    }

    if (outcome.status == QueueStatus::Failed) {
        bus_.emit(events::ItemFailedEvent{item.id, item.operation, item.payload.session_id, error.message,
                                          outcome.retry_count, !transient});
    }
    if (rollback) {
        bus_.emit(events::SessionRolledBackEvent{item.payload.session_id, item.id, item.operation,
                                                 rollback->restored_state, error.message});
    }
    if (changed) {
        bus_.emit(*changed);
    }
    publish_pending_count();
    return Ok(outcome);
}

Result<void> ActionQueue::retry(const std::string& id) {
    QueueItem item;
    std::optional<events::SessionStateChangedEvent> changed;

    auto result = store_.execute([&](store::StoreTransaction& tx) -> Result<void> {
        auto loaded = tx.get_item(id);
        if (loaded.is_error()) {
            return Err<void>(loaded.error());
        }
        item = loaded.value();
        if (item.status != QueueStatus::Failed) {
            return Err<void>(Error::invalid_operation("Only Failed items can be retried: " + id));
        }

        auto session = tx.get_session(item.payload.session_id);
        if (session.is_error()) {
            return Err<void>(session.error());
        }
        ClockSession updated = session.value();
        sync::SessionStateMachine machine(updated);

        switch (item.operation) {
            case OperationType::CreateClockIn:
                if (updated.state == LifecycleState::RolledBack) {
                    auto open = tx.find_open_session(updated.employee_id);
                    if (open.is_error()) {
                        return Err<void>(open.error());
                    }
                    if (open.value()) {
                        return Err<void>(Error::invalid_operation("Employee " + updated.employee_id +
                                                                  " has clocked in again since (session " +
                                                                  open.value()->local_id + ")"));
                    }
                    auto applied = machine.apply_enqueue(item.operation, item.payload);
                    if (applied.is_error()) {
                        return applied;
                    }
                }
                break;

            case OperationType::CreateClockOut:
                if (updated.state == LifecycleState::Active || updated.state == LifecycleState::Pending) {
                    auto applied = machine.apply_enqueue(item.operation, item.payload);
                    if (applied.is_error()) {
                        return applied;
                    }
                }
                break;

            case OperationType::UpdateRate:
                if (updated.state == LifecycleState::Active || updated.state == LifecycleState::Pending) {
                    updated.rate_type = item.payload.rate_type;
                }
                break;
        }
        updated.last_error.reset();

        auto reset = tx.update_item_state(id, QueueStatus::Pending, 0, std::nullopt);
        if (reset.is_error()) {
            return reset;
        }
        auto moved = tx.move_item_to_tail(id);
        if (moved.is_error()) {
            return moved;
        }
        auto saved = tx.put_session(updated);
        if (saved.is_error()) {
            return saved;
        }

        changed = state_change(updated.local_id, session.value().state, updated.state);
        return Ok();
    });

    if (result.is_error()) {
        return result;
    }

    spdlog::info("Item {} ({}) queued for manual retry", id, model::to_string(item.operation));
    bus_.emit(events::ItemEnqueuedEvent{item.id, item.operation, item.payload.session_id, item.sequence});
    if (changed) {
        bus_.emit(*changed);
    }
    publish_pending_count();
    return Ok();
}

Result<std::size_t> ActionQueue::recover() {
    std::size_t reset = 0;
    auto result = store_.execute([&reset](store::StoreTransaction& tx) -> Result<void> {
        auto count = tx.reset_in_flight();
        if (count.is_error()) {
            return Err<void>(count.error());
        }
        reset = count.value();
        return Ok();
    });
    if (result.is_error()) {
        return Err<std::size_t>(result.error());
    }

    if (reset > 0) {
        spdlog::warn("Recovered {} item(s) left in flight by a previous run", reset);
    }
    publish_pending_count();
    return Ok(reset);
}

Result<std::optional<QueueItem>> ActionQueue::next_eligible() {
    auto items = store_.list_items();
    if (items.is_error()) {
        return Err<std::optional<QueueItem>>(items.error());
    }

    // Smallest remaining sequence per session: only that item may go next.
    std::map<std::string, std::int64_t> head_of_session;
    for (const auto& item : items.value()) {
        auto [it, inserted] = head_of_session.emplace(item.payload.session_id, item.sequence);
        if (!inserted && item.sequence < it->second) {
            it->second = item.sequence;
        }
    }

    for (const auto& item : items.value()) {
        if (item.status != QueueStatus::Pending) {
            continue;
        }
        if (head_of_session[item.payload.session_id] == item.sequence) {
            return Ok(std::optional<QueueItem>{item});
        }
    }
    return Ok(std::optional<QueueItem>{});
}

Result<std::size_t> ActionQueue::pending_count() {
    return store_.pending_count();
}

Result<std::vector<QueueItem>> ActionQueue::failed_items() {
    auto items = store_.list_items();
    if (items.is_error()) {
        return items;
    }
    std::vector<QueueItem> failed;
    for (auto& item : items.value()) {
        if (item.status == QueueStatus::Failed) {
            failed.push_back(std::move(item));
        }
    }
    return Ok(std::move(failed));
}

Result<std::vector<QueueItem>> ActionQueue::list_items() {
    return store_.list_items();
}

Result<ClockSession> ActionQueue::session(const std::string& local_id) {
    return store_.get_session(local_id);
}

Result<model::SyncCursor> ActionQueue::cursor() {
    return store_.cursor();
}

Result<std::size_t> ActionQueue::archive_expired(Timestamp now) {
    std::vector<events::SessionStateChangedEvent> changes;

    auto result = store_.execute([&](store::StoreTransaction& tx) -> Result<void> {
        auto sessions = tx.list_sessions();
        if (sessions.is_error()) {
            return Err<void>(sessions.error());
        }
        for (auto& session : sessions.value()) {
            if (session.state != LifecycleState::Synced) {
                continue;
            }
            const Timestamp ended = session.clock_out_time.value_or(session.clock_in_time);
            if (now - ended < config_.archive_retention) {
                continue;
            }

            sync::SessionStateMachine machine(session);
            auto archived = machine.archive();
            if (archived.is_error()) {
                return archived;
            }
            auto saved = tx.put_session(session);
            if (saved.is_error()) {
                return saved;
            }
            changes.push_back({session.local_id, LifecycleState::Synced, LifecycleState::Archived});
        }
        return Ok();
    });

    if (result.is_error()) {
        return Err<std::size_t>(result.error());
    }

    for (const auto& change : changes) {
        bus_.emit(change);
    }
    if (!changes.empty()) {
        spdlog::info("Archived {} synced session(s)", changes.size());
    }
    return Ok(changes.size());
}

void ActionQueue::publish_pending_count() {
    std::lock_guard lock(publish_mutex_);
    auto count = store_.pending_count();
    if (count.is_error()) {
        spdlog::warn("Could not read pending count: {}", count.error().message);
        return;
    }
    bus_.emit(events::PendingCountChangedEvent{count.value()});
}

} // namespace fts::queue
