#pragma once

#include "fts/core/config.hpp"
#include "fts/core/result.hpp"
#include "fts/core/scheduler.hpp"
#include "fts/events/event_bus.hpp"
#include "fts/queue/action_queue.hpp"
#include "fts/store/durable_store.hpp"
#include "fts/sync/connectivity.hpp"
#include "fts/sync/processor.hpp"
#include "fts/sync/remote.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fts {

struct ClockInRequest {
    std::string employee_id;
    std::string work_order_id;
    std::string rate_type;
    std::optional<Timestamp> occurred_at;            ///< Defaults to the engine clock
    std::optional<model::LocationReading> location;  ///< Advisory only
};

struct ClockOutRequest {
    std::string session_id;
    std::optional<Timestamp> occurred_at;
    std::optional<model::LocationReading> location;
};

/**
 * @brief Entry point for the application layer
 *
 * Owns the event bus, the connectivity gate, the action queue and the sync
 * processor, all wired to one durable store. Every user action is committed
 * locally first and returns as soon as the commit is done; a drain is then
 * triggered when the gate says the authority is reachable.
 *
 * Lifecycle: start() after construction (crash recovery + first drain),
 * suspend() when the app goes to background, destruction on shutdown. The
 * scheduler must not run tasks after the engine is destroyed.
 */
class SyncEngine {
public:
    SyncEngine(std::unique_ptr<store::DurableStore> store,
               sync::RemoteEndpoint& remote,
               Scheduler& scheduler,
               SyncConfig config = {});
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /**
     * @brief Open the SQLite store named by config.store and build an engine on it
     */
    static Result<std::unique_ptr<SyncEngine>> open(const EngineConfig& config,
                                                    sync::RemoteEndpoint& remote,
                                                    Scheduler& scheduler);

    /// Reset items a previous run left InFlight, then drain if reachable.
    Result<void> start();

    /// @return local id of the new session
    Result<std::string> clock_in(const ClockInRequest& request);
    /// @return id of the queued clock-out item
    Result<std::string> clock_out(const ClockOutRequest& request);
    /// @return id of the queued rate-change item
    Result<std::string> update_rate(const std::string& session_id, const std::string& rate_type);

    Result<void> retry(const std::string& item_id);

    /// Manual sync: drains even when the gate reports unreachable.
    void sync_now();

    void on_network_status(bool reachable);

    Result<std::size_t> pending_count();
    Result<model::ClockSession> session(const std::string& local_id);
    Result<std::vector<model::QueueItem>> failed_items();
    Result<model::SyncCursor> cursor();

    /// Flush committed state to the main database file.
    Result<void> suspend();

    Result<std::size_t> archive_expired();

    events::EventBus& bus() { return bus_; }
    sync::ConnectivityGate& gate() { return gate_; }
    queue::ActionQueue& queue() { return queue_; }
    sync::SyncProcessor& processor() { return processor_; }

private:
    Result<std::string> submit(model::OperationType operation, model::ActionPayload payload);

    std::unique_ptr<store::DurableStore> store_;
    Scheduler& scheduler_;
    events::EventBus bus_;
    sync::ConnectivityGate gate_;
    queue::ActionQueue queue_;
    sync::SyncProcessor processor_;
};

} // namespace fts
