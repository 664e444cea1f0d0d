#pragma once

#include "fts/core/scheduler.hpp"
#include "fts/events/event_bus.hpp"
#include "fts/queue/action_queue.hpp"
#include "fts/sync/connectivity.hpp"
#include "fts/sync/remote.hpp"

#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace fts::sync {

struct DrainReport {
    std::size_t submitted = 0;
    std::size_t acknowledged = 0;
    std::size_t failed = 0;
    std::size_t remaining = 0;
    bool backoff_pending = false;
    bool skipped = false;          ///< Another pass was running, or a backoff timer is armed
};

/**
 * @brief Sequential drain of the action queue against the remote authority
 *
 * One pass at a time: a trigger that arrives while a pass runs is folded
 * into one follow-up pass. A pass submits eligible items one by one until
 * the queue has nothing eligible, the gate reports unreachable (automatic
 * passes only), or a transient failure arms the backoff timer. While that
 * timer is armed the processor is suspended: further triggers, manual ones
 * included, wait for it.
 *
 * Store errors never crash the loop. If the store cannot record the outcome
 * of a submission the item is returned to Pending and re-sent under the same
 * idempotency key on the next pass.
 *
 * Destruction blocks until a pass running on the scheduler thread returns,
 * so it must not happen from inside one of the processor's own tasks.
 */
class SyncProcessor {
public:
    SyncProcessor(queue::ActionQueue& queue,
                  RemoteEndpoint& remote,
                  ConnectivityGate& gate,
                  Scheduler& scheduler,
                  events::EventBus& bus,
                  bool drain_on_reconnect = true);
    ~SyncProcessor();

    SyncProcessor(const SyncProcessor&) = delete;
    SyncProcessor& operator=(const SyncProcessor&) = delete;

    /**
     * @brief Schedule a drain pass on the scheduler
     * @param manual true for a user-initiated sync: ignores the gate
     */
    void trigger(bool manual = false);

    /**
     * @brief Run a drain pass on the calling thread
     */
    DrainReport drain(bool manual = false);

    [[nodiscard]] bool backoff_pending() const;

private:
    DrainReport run_pass(bool manual);
    void arm_backoff(std::chrono::milliseconds delay, bool manual);
    void release_in_flight();

    queue::ActionQueue& queue_;
    RemoteEndpoint& remote_;
    ConnectivityGate& gate_;
    Scheduler& scheduler_;
    events::EventBus& bus_;
    bool drain_on_reconnect_;
    size_t connectivity_subscription_ = 0;

    mutable std::mutex mutex_;
    bool draining_ = false;
    bool rerun_requested_ = false;
    bool rerun_manual_ = false;
    bool backoff_armed_ = false;

    std::mutex release_mutex_;
    std::condition_variable release_cv_;
    bool released_ = false;

    // Scheduled tasks hold a weak reference and keep it locked while they
    // run; the destructor waits for the last lock to go away.
    std::shared_ptr<SyncProcessor*> self_;
};

} // namespace fts::sync
