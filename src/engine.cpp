#include "fts/engine.hpp"

#include "fts/core/id.hpp"
#include "fts/store/sqlite_store.hpp"

#include <spdlog/spdlog.h>

namespace fts {

SyncEngine::SyncEngine(std::unique_ptr<store::DurableStore> store,
                       sync::RemoteEndpoint& remote,
                       Scheduler& scheduler,
                       SyncConfig config)
    : store_(std::move(store)),
      scheduler_(scheduler),
      gate_(bus_),
      queue_(*store_, bus_, scheduler, config),
      processor_(queue_, remote, gate_, scheduler, bus_, config.drain_on_reconnect) {}

SyncEngine::~SyncEngine() {
    auto flushed = store_->flush();
    if (flushed.is_error()) {
        spdlog::warn("Final store flush failed: {}", flushed.error().message);
    }
}

Result<std::unique_ptr<SyncEngine>> SyncEngine::open(const EngineConfig& config,
                                                     sync::RemoteEndpoint& remote,
                                                     Scheduler& scheduler) {
    auto store = store::SqliteStore::open(config.store);
    if (store.is_error()) {
        return Err<std::unique_ptr<SyncEngine>>(store.error());
    }
    return Ok(std::make_unique<SyncEngine>(std::move(store.value()), remote, scheduler, config.sync));
}

Result<void> SyncEngine::start() {
    auto recovered = queue_.recover();
    if (recovered.is_error()) {
        return Err<void>(recovered.error());
    }

    auto pending = queue_.pending_count();
    if (pending.is_error()) {
        return Err<void>(pending.error());
    }
    spdlog::info("Sync engine started: {} item(s) awaiting sync", pending.value());

    if (pending.value() > 0 && gate_.is_reachable()) {
        processor_.trigger();
    }
    return Ok();
}

Result<std::string> SyncEngine::clock_in(const ClockInRequest& request) {
    model::ActionPayload payload;
    payload.session_id = generate_id();
    payload.employee_id = request.employee_id;
    payload.work_order_id = request.work_order_id;
    payload.rate_type = request.rate_type;
    payload.occurred_at = request.occurred_at.value_or(scheduler_.now());
    payload.location = request.location;

    if (!payload.location || !payload.location->in_zone) {
        spdlog::info("Clock-in for {} outside the expected zone or without a location fix", request.employee_id);
    }

    auto queued = submit(model::OperationType::CreateClockIn, payload);
    if (queued.is_error()) {
        return queued;
    }
    return Ok(payload.session_id);
}

Result<std::string> SyncEngine::clock_out(const ClockOutRequest& request) {
    model::ActionPayload payload;
    payload.session_id = request.session_id;
    payload.occurred_at = request.occurred_at.value_or(scheduler_.now());
    payload.location = request.location;
    return submit(model::OperationType::CreateClockOut, payload);
}

Result<std::string> SyncEngine::update_rate(const std::string& session_id, const std::string& rate_type) {
    model::ActionPayload payload;
    payload.session_id = session_id;
    payload.rate_type = rate_type;
    payload.occurred_at = scheduler_.now();
    return submit(model::OperationType::UpdateRate, payload);
}

Result<std::string> SyncEngine::submit(model::OperationType operation, model::ActionPayload payload) {
    auto queued = queue_.enqueue(operation, std::move(payload));
    if (queued.is_error()) {
        return queued;
    }
    if (gate_.is_reachable()) {
        processor_.trigger();
    }
    return queued;
}

Result<void> SyncEngine::retry(const std::string& item_id) {
    auto retried = queue_.retry(item_id);
    if (retried.is_error()) {
        return retried;
    }
    if (gate_.is_reachable()) {
        processor_.trigger();
    }
    return Ok();
}

void SyncEngine::sync_now() {
    processor_.trigger(true);
}

void SyncEngine::on_network_status(bool reachable) {
    gate_.on_network_status(reachable);
}

Result<std::size_t> SyncEngine::pending_count() {
    return queue_.pending_count();
}

Result<model::ClockSession> SyncEngine::session(const std::string& local_id) {
    return queue_.session(local_id);
}

Result<std::vector<model::QueueItem>> SyncEngine::failed_items() {
    return queue_.failed_items();
}

Result<model::SyncCursor> SyncEngine::cursor() {
    return queue_.cursor();
}

Result<void> SyncEngine::suspend() {
    auto flushed = store_->flush();
    if (flushed.is_ok()) {
        spdlog::info("Sync engine suspended; store flushed");
    }
    return flushed;
}

Result<std::size_t> SyncEngine::archive_expired() {
    return queue_.archive_expired(scheduler_.now());
}

} // namespace fts
