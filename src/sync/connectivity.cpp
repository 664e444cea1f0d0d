#include "fts/sync/connectivity.hpp"

#include "fts/events/events.hpp"

#include <spdlog/spdlog.h>

namespace fts::sync {

bool ConnectivityGate::on_network_status(bool reachable) {
    const bool previous = reachable_.exchange(reachable);
    if (previous == reachable) {
        return false;
    }
    spdlog::debug("Connectivity gate: {}", reachable ? "reachable" : "unreachable");
    bus_.emit(events::ConnectivityChangedEvent{reachable});
    return true;
}

bool ConnectivityGate::poll(ConnectivityProbe& probe) {
    const bool reachable = probe.probe();
    on_network_status(reachable);
    return reachable;
}

} // namespace fts::sync
