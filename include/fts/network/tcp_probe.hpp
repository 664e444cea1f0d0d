#pragma once

#include "fts/core/config.hpp"
#include "fts/sync/connectivity.hpp"

namespace fts::network {

/**
 * @brief Reachable when a TCP connection to the authority can be opened
 */
class TcpConnectivityProbe final : public sync::ConnectivityProbe {
public:
    explicit TcpConnectivityProbe(RemoteConfig config) : config_(std::move(config)) {}

    bool probe() override;

private:
    RemoteConfig config_;
};

} // namespace fts::network
