#pragma once

#include "fts/core/config.hpp"
#include "fts/network/http_types.hpp"
#include "fts/sync/remote.hpp"

namespace fts::network {

/**
 * @brief Map an authority response onto accepted fields or a classified error
 *
 * 2xx with a decodable body: accepted.
 * 408, 429, 5xx: TransientSync.
 * Anything else, or a 2xx body that cannot be decoded: PermanentSync whose
 * message is the server's "error_code" when it sent one.
 */
Result<model::AuthoritativeSessionFields> interpret_submit_response(const HttpResponse& response);

/**
 * @brief RemoteEndpoint speaking JSON over HTTP/1.1
 *
 * One connection per submission (Connection: close). The queue item id
 * travels in the Idempotency-Key header and in the body. Connection,
 * send and receive failures, timeouts included, are TransientSync.
 */
class HttpRemoteEndpoint final : public sync::RemoteEndpoint {
public:
    explicit HttpRemoteEndpoint(RemoteConfig config) : config_(std::move(config)) {}

    Result<model::AuthoritativeSessionFields> submit(model::OperationType operation,
                                                     const model::ActionPayload& payload,
                                                     const std::string& idempotency_key) override;

    Result<HttpRequest> build_request(model::OperationType operation,
                                      const model::ActionPayload& payload,
                                      const std::string& idempotency_key) const;

private:
    Result<HttpResponse> exchange(const HttpRequest& request);

    RemoteConfig config_;
};

} // namespace fts::network
