#pragma once

#include "fts/events/event_bus.hpp"

#include <atomic>

namespace fts::sync {

/**
 * @brief Active reachability check (e.g. a TCP connect to the authority)
 */
class ConnectivityProbe {
public:
    virtual ~ConnectivityProbe() = default;
    virtual bool probe() = 0;
};

/**
 * @brief Current reachability as last reported by the platform
 *
 * A scheduling hint only: it decides when a drain is worth starting, never
 * whether an action is persisted. A stale "reachable" is fine; the
 * processor treats the failed request like any other transient failure.
 * Transitions are published as ConnectivityChangedEvent.
 */
class ConnectivityGate {
public:
    explicit ConnectivityGate(events::EventBus& bus, bool initially_reachable = false)
        : bus_(bus), reachable_(initially_reachable) {}

    ConnectivityGate(const ConnectivityGate&) = delete;
    ConnectivityGate& operator=(const ConnectivityGate&) = delete;

    [[nodiscard]] bool is_reachable() const noexcept { return reachable_.load(); }

    /**
     * @brief Feed a network-status transition from the platform
     * @return true when the value actually changed
     */
    bool on_network_status(bool reachable);

    /**
     * @brief Ask a probe and record its answer
     */
    bool poll(ConnectivityProbe& probe);

private:
    events::EventBus& bus_;
    std::atomic<bool> reachable_;
};

} // namespace fts::sync
