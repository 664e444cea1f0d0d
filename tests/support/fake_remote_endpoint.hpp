#pragma once

#include "fts/sync/remote.hpp"

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace fts::testing {

/**
 * @brief In-memory remote authority for tests
 *
 * Accepts everything by default, assigning "R1", "R2", ... as remote ids.
 * Scripted responses are consumed first, one per submission. Repeated
 * idempotency keys get the original response back, like the real server.
 */
class FakeRemoteEndpoint : public sync::RemoteEndpoint {
public:
    using Response = Result<model::AuthoritativeSessionFields>;

    struct Call {
        model::OperationType operation;
        model::ActionPayload payload;
        std::string idempotency_key;
    };

    Response submit(model::OperationType operation,
                    const model::ActionPayload& payload,
                    const std::string& idempotency_key) override {
        std::lock_guard lock(mutex_);
        calls_.push_back(Call{operation, payload, idempotency_key});

        auto cached = accepted_.find(idempotency_key);
        if (cached != accepted_.end()) {
            return Ok(cached->second);
        }

        Response response = scripted_.empty() ? accept(operation, payload) : next_scripted();
        if (response.is_ok()) {
            accepted_.emplace(idempotency_key, response.value());
        }
        return response;
    }

    void fail_transient(int times, const std::string& message = "Service Unavailable") {
        std::lock_guard lock(mutex_);
        for (int i = 0; i < times; ++i) {
            scripted_.push_back(Err<model::AuthoritativeSessionFields>(Error::transient(message)));
        }
    }

    void fail_permanent(const std::string& message) {
        std::lock_guard lock(mutex_);
        scripted_.push_back(Err<model::AuthoritativeSessionFields>(Error::permanent(message)));
    }

    void fail_with(const Error& error) {
        std::lock_guard lock(mutex_);
        scripted_.push_back(Err<model::AuthoritativeSessionFields>(error));
    }

    void respond_with(model::AuthoritativeSessionFields fields) {
        std::lock_guard lock(mutex_);
        scripted_.push_back(Ok(std::move(fields)));
    }

    std::vector<Call> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    std::size_t call_count() const {
        std::lock_guard lock(mutex_);
        return calls_.size();
    }

    /// Distinct idempotency keys the server has accepted.
    std::size_t accepted_count() const {
        std::lock_guard lock(mutex_);
        return accepted_.size();
    }

private:
    Response next_scripted() {
        Response response = scripted_.front();
        scripted_.pop_front();
        return response;
    }

    Response accept(model::OperationType operation, const model::ActionPayload& payload) {
        auto& remote_id = remote_ids_[payload.session_id];
        if (remote_id.empty()) {
            remote_id = "R" + std::to_string(remote_ids_.size());
        }

        model::AuthoritativeSessionFields fields;
        fields.remote_id = remote_id;
        if (operation == model::OperationType::CreateClockIn) {
            fields.clock_in_time = payload.occurred_at;
            clock_in_times_[payload.session_id] = payload.occurred_at;
        }
        if (operation == model::OperationType::CreateClockOut) {
            fields.clock_out_time = payload.occurred_at;
            auto in = clock_in_times_.find(payload.session_id);
            if (in != clock_in_times_.end()) {
                fields.duration_seconds =
                    std::chrono::duration_cast<std::chrono::seconds>(payload.occurred_at - in->second).count();
            }
        }
        if (operation == model::OperationType::UpdateRate) {
            fields.rate_type = payload.rate_type;
        }
        return Ok(fields);
    }

    mutable std::mutex mutex_;
    std::deque<Response> scripted_;
    std::vector<Call> calls_;
    std::map<std::string, model::AuthoritativeSessionFields> accepted_;
    std::map<std::string, std::string> remote_ids_;
    std::map<std::string, Timestamp> clock_in_times_;
};

} // namespace fts::testing
