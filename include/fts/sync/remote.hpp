#pragma once

#include "fts/core/result.hpp"
#include "fts/model/types.hpp"

#include <string>

namespace fts::sync {

/**
 * @brief The remote authority for time records
 *
 * submit() either returns the authoritative fields of the accepted record or
 * an Error classified as TransientSync (retry later) or PermanentSync (the
 * server will never accept this payload). The idempotency key is the queue
 * item id; a server must treat a repeated key as the same submission.
 */
class RemoteEndpoint {
public:
    virtual ~RemoteEndpoint() = default;

    virtual Result<model::AuthoritativeSessionFields> submit(model::OperationType operation,
                                                             const model::ActionPayload& payload,
                                                             const std::string& idempotency_key) = 0;
};

} // namespace fts::sync
