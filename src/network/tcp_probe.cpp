#include "fts/network/tcp_probe.hpp"

#include "fts/network/socket.hpp"

#include <spdlog/spdlog.h>

namespace fts::network {

bool TcpConnectivityProbe::probe() {
    Socket socket;
    auto connected = socket.connect(config_.host, config_.port, config_.timeout_ms);
    if (connected.is_error()) {
        spdlog::debug("Probe of {}:{} failed: {}", config_.host, config_.port, connected.error().message);
        return false;
    }
    return true;
}

} // namespace fts::network
