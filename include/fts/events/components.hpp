/**
 * @file components.hpp
 * @brief Ready-made subscribers for the sync engine's domain events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * SyncStatusComponent status(bus);
 * // status.snapshot() now tracks the badge, session states and error banners
 */

#pragma once

#include "fts/events/event_bus.hpp"
#include "fts/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fts::events {

/**
 * @brief Base for components that subscribe in their constructor and must
 * unsubscribe before they are destroyed
 */
class Subscriber {
public:
    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;

protected:
    explicit Subscriber(EventBus& bus) : bus_(bus) {}

    ~Subscriber() {
        for (auto& unsubscribe : unsubscribers_) {
            unsubscribe();
        }
    }

    template<typename EventType, typename Handler>
    void listen(Handler handler) {
        size_t id = bus_.subscribe<EventType>(std::function<void(const EventType&)>(std::move(handler)));
        unsubscribers_.push_back([this, id] { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;

private:
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Logs every domain event through spdlog
 */
class LoggerComponent : private Subscriber {
public:
    explicit LoggerComponent(EventBus& bus) : Subscriber(bus) {
        listen<ItemEnqueuedEvent>([](const ItemEnqueuedEvent& e) {
            spdlog::info("[Enqueued] item={} op={} session={} seq={}",
                         e.item_id, model::to_string(e.operation), e.session_id, e.sequence);
        });

        listen<PendingCountChangedEvent>([](const PendingCountChangedEvent& e) {
            spdlog::debug("[PendingCount] {}", e.pending_count);
        });

        listen<SessionStateChangedEvent>([](const SessionStateChangedEvent& e) {
            spdlog::info("[SessionState] session={} {} -> {}",
                         e.session_id, model::to_string(e.from), model::to_string(e.to));
        });

        listen<ItemAcknowledgedEvent>([](const ItemAcknowledgedEvent& e) {
            spdlog::info("[Acknowledged] item={} op={} session={} remote={}",
                         e.item_id, model::to_string(e.operation), e.session_id, e.remote_id);
        });

        listen<RetryScheduledEvent>([](const RetryScheduledEvent& e) {
            spdlog::warn("[RetryScheduled] item={} attempt={} delay={}ms reason={}",
                         e.item_id, e.retry_count, e.delay.count(), e.reason);
        });

        listen<ItemFailedEvent>([](const ItemFailedEvent& e) {
            spdlog::error("[Failed] item={} op={} session={} retries={} {} error={}",
                          e.item_id, model::to_string(e.operation), e.session_id, e.retry_count,
                          e.permanent ? "permanent" : "retries-exhausted", e.last_error);
        });

        listen<SessionRolledBackEvent>([](const SessionRolledBackEvent& e) {
            spdlog::warn("[RolledBack] session={} item={} op={} now={} reason={}",
                         e.session_id, e.item_id, model::to_string(e.operation),
                         model::to_string(e.restored_state), e.reason);
        });

        listen<ConnectivityChangedEvent>([](const ConnectivityChangedEvent& e) {
            spdlog::info("[Connectivity] {}", e.reachable ? "reachable" : "unreachable");
        });

        listen<DrainCompletedEvent>([](const DrainCompletedEvent& e) {
            spdlog::info("[DrainCompleted] submitted={} acked={} failed={} remaining={} backoff={} duration={}ms",
                         e.submitted, e.acknowledged, e.failed, e.remaining,
                         e.backoff_pending, e.duration.count());
        });
    }
};

/**
 * @brief UI-facing view of sync progress
 *
 * Holds only what the UI observes: the pending badge, the last lifecycle
 * state seen per session, the error banner text per Failed item, and the
 * "last synced" time. The durable store stays the source of truth; this is
 * a cache rebuilt from events.
 */
class SyncStatusComponent : private Subscriber {
public:
    struct Snapshot {
        std::size_t pending_count = 0;
        bool reachable = false;
        std::optional<Timestamp> last_synced_at;
        std::map<std::string, model::LifecycleState> session_states;
        std::map<std::string, std::string> failed_items;   ///< item id -> lastError
    };

    explicit SyncStatusComponent(EventBus& bus) : Subscriber(bus) {
        listen<PendingCountChangedEvent>([this](const PendingCountChangedEvent& e) {
            std::lock_guard lock(mutex_);
            snapshot_.pending_count = e.pending_count;
        });

        listen<SessionStateChangedEvent>([this](const SessionStateChangedEvent& e) {
            std::lock_guard lock(mutex_);
            snapshot_.session_states[e.session_id] = e.to;
        });

        listen<ItemAcknowledgedEvent>([this](const ItemAcknowledgedEvent& e) {
            std::lock_guard lock(mutex_);
            snapshot_.failed_items.erase(e.item_id);
            snapshot_.last_synced_at = e.synced_item_at;
        });

        listen<ItemFailedEvent>([this](const ItemFailedEvent& e) {
            std::lock_guard lock(mutex_);
            snapshot_.failed_items[e.item_id] = e.last_error;
        });

        // A retried item leaves the Failed set as soon as it is re-enqueued.
        listen<ItemEnqueuedEvent>([this](const ItemEnqueuedEvent& e) {
            std::lock_guard lock(mutex_);
            snapshot_.failed_items.erase(e.item_id);
        });

        listen<ConnectivityChangedEvent>([this](const ConnectivityChangedEvent& e) {
            std::lock_guard lock(mutex_);
            snapshot_.reachable = e.reachable;
        });
    }

    /// Seed the "last synced" time from the durable cursor after a restart.
    void restore(const model::SyncCursor& cursor) {
        std::lock_guard lock(mutex_);
        snapshot_.last_synced_at = cursor.last_synced_item_at;
    }

    Snapshot snapshot() const {
        std::lock_guard lock(mutex_);
        return snapshot_;
    }

    std::size_t pending_count() const {
        std::lock_guard lock(mutex_);
        return snapshot_.pending_count;
    }

    std::optional<model::LifecycleState> session_state(const std::string& session_id) const {
        std::lock_guard lock(mutex_);
        auto it = snapshot_.session_states.find(session_id);
        if (it == snapshot_.session_states.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    mutable std::mutex mutex_;
    Snapshot snapshot_;
};

/**
 * @brief Counters for sync traffic
 */
class SyncMetricsComponent : private Subscriber {
public:
    struct Stats {
        std::atomic<uint64_t> items_enqueued{0};
        std::atomic<uint64_t> submissions{0};
        std::atomic<uint64_t> acknowledged{0};
        std::atomic<uint64_t> transient_failures{0};
        std::atomic<uint64_t> permanent_failures{0};
        std::atomic<uint64_t> exhausted_items{0};
        std::atomic<uint64_t> rollbacks{0};
        std::atomic<uint64_t> drains{0};
    };

    explicit SyncMetricsComponent(EventBus& bus) : Subscriber(bus) {
        listen<ItemEnqueuedEvent>([this](const ItemEnqueuedEvent&) {
            stats_.items_enqueued++;
        });

        listen<ItemAcknowledgedEvent>([this](const ItemAcknowledgedEvent&) {
            stats_.acknowledged++;
        });

        listen<RetryScheduledEvent>([this](const RetryScheduledEvent&) {
            stats_.transient_failures++;
        });

        listen<ItemFailedEvent>([this](const ItemFailedEvent& e) {
            if (e.permanent) {
                stats_.permanent_failures++;
            } else {
                // The attempt that exhausted the retries was itself transient.
                stats_.transient_failures++;
                stats_.exhausted_items++;
            }
        });

        listen<SessionRolledBackEvent>([this](const SessionRolledBackEvent&) {
            stats_.rollbacks++;
        });

        listen<DrainCompletedEvent>([this](const DrainCompletedEvent& e) {
            stats_.drains++;
            stats_.submissions += e.submitted;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync Statistics:");
        spdlog::info("  Items enqueued:     {}", stats_.items_enqueued.load());
        spdlog::info("  Submissions:        {}", stats_.submissions.load());
        spdlog::info("  Acknowledged:       {}", stats_.acknowledged.load());
        spdlog::info("  Transient failures: {}", stats_.transient_failures.load());
        spdlog::info("  Permanent failures: {}", stats_.permanent_failures.load());
        spdlog::info("  Retries exhausted:  {}", stats_.exhausted_items.load());
        spdlog::info("  Rollbacks:          {}", stats_.rollbacks.load());
        spdlog::info("  Drain passes:       {}", stats_.drains.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
};

} // namespace fts::events
