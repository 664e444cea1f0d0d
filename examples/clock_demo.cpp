// Walks one shift through the sync engine against a running authority_stub:
// clock in while offline, change rate, clock out, then come back online and
// watch the queue drain.
//
//   fts_authority_stub --port 8080 &
//   fts_clock_demo [config.json]

#include "fts/core/config.hpp"
#include "fts/core/logging.hpp"
#include "fts/core/scheduler.hpp"
#include "fts/engine.hpp"
#include "fts/events/components.hpp"
#include "fts/network/http_remote_endpoint.hpp"
#include "fts/network/tcp_probe.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

namespace {

void print_session(const fts::model::ClockSession& session) {
    spdlog::info("Session {} state={} remote={} rate={} in={} out={} duration={}s",
                 session.local_id,
                 fts::model::to_string(session.state),
                 session.remote_id.value_or("-"),
                 session.rate_type,
                 fts::format_iso8601(session.clock_in_time),
                 session.clock_out_time ? fts::format_iso8601(*session.clock_out_time) : "-",
                 session.duration_seconds.value_or(0));
}

} // namespace

int main(int argc, char* argv[]) {
    fts::EngineConfig config;
    if (argc > 1) {
        auto loaded = fts::load_config(argv[1]);
        if (loaded.is_error()) {
            spdlog::error("Config error: {}", loaded.error().message);
            return 1;
        }
        config = loaded.value();
    }
    fts::apply_env_overrides(config);
    fts::init_logging(config.logging);

    fts::AsioScheduler scheduler;
    scheduler.start();

    fts::network::HttpRemoteEndpoint remote(config.remote);
    fts::network::TcpConnectivityProbe probe(config.remote);

    auto opened = fts::SyncEngine::open(config, remote, scheduler);
    if (opened.is_error()) {
        spdlog::error("Cannot open store: {}", opened.error().message);
        return 1;
    }
    auto& engine = *opened.value();

    fts::events::LoggerComponent logger(engine.bus());
    fts::events::SyncStatusComponent status(engine.bus());
    fts::events::SyncMetricsComponent metrics(engine.bus());

    auto started = engine.start();
    if (started.is_error()) {
        spdlog::error("Start failed: {}", started.error().message);
        return 1;
    }
    auto cursor = engine.cursor();
    if (cursor.is_ok()) {
        status.restore(cursor.value());
    }

    // Offline: everything is captured locally.
    engine.on_network_status(false);

    fts::ClockInRequest clock_in;
    clock_in.employee_id = "E-1001";
    clock_in.work_order_id = "WO-42";
    clock_in.rate_type = "REGULAR";
    clock_in.location = fts::model::LocationReading{47.6062, -122.3321, 8.0, true};

    auto session_id = engine.clock_in(clock_in);
    if (session_id.is_error()) {
        spdlog::error("Clock-in rejected: {}", session_id.error().message);
        return 1;
    }

    auto rate = engine.update_rate(session_id.value(), "OVERTIME");
    if (rate.is_error()) {
        spdlog::error("Rate change rejected: {}", rate.error().message);
    }

    fts::ClockOutRequest clock_out;
    clock_out.session_id = session_id.value();
    clock_out.occurred_at = scheduler.now() + std::chrono::hours(8);
    auto out = engine.clock_out(clock_out);
    if (out.is_error()) {
        spdlog::error("Clock-out rejected: {}", out.error().message);
    }

    spdlog::info("Offline: {} item(s) pending", status.pending_count());

    // Back online once the authority answers.
    engine.gate().poll(probe);
    if (!engine.gate().is_reachable()) {
        spdlog::warn("Authority at {}:{} unreachable; forcing a manual sync", config.remote.host, config.remote.port);
        engine.sync_now();
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (std::chrono::steady_clock::now() < deadline) {
        auto pending = engine.pending_count();
        if (pending.is_ok() && pending.value() == 0) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    auto session = engine.session(session_id.value());
    if (session.is_ok()) {
        print_session(session.value());
    }

    auto failed = engine.failed_items();
    if (failed.is_ok()) {
        for (const auto& item : failed.value()) {
            spdlog::warn("Needs attention: {} {} ({})", fts::model::to_string(item.operation), item.id,
                         item.last_error.value_or(""));
        }
    }

    metrics.print_stats();

    auto suspended = engine.suspend();
    if (suspended.is_error()) {
        spdlog::error("Flush failed: {}", suspended.error().message);
    }
    scheduler.stop();
    opened.value().reset();
    fts::shutdown_logging();
    return 0;
}
