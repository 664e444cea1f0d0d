#pragma once

#include "fts/store/durable_store.hpp"

#include <atomic>

namespace fts::testing {

/**
 * @brief DurableStore decorator whose Nth execute() fails with IOFailure
 */
class FailingStore : public store::DurableStore {
public:
    explicit FailingStore(store::DurableStore& inner) : inner_(inner) {}

    /// Fail the execute() call that comes `calls_from_now` calls after this one (1 = the next).
    void fail_execute_after(int calls_from_now) { countdown_ = calls_from_now; }

    Result<void> execute(const TransactionBody& body) override {
        if (countdown_ > 0 && --countdown_ == 0) {
            return Err<void>(Error::io_failure("simulated disk failure"));
        }
        return inner_.execute(body);
    }

    Result<std::vector<model::QueueItem>> list_pending() override { return inner_.list_pending(); }
    Result<std::vector<model::QueueItem>> list_items() override { return inner_.list_items(); }
    Result<model::ClockSession> get_session(const std::string& local_id) override {
        return inner_.get_session(local_id);
    }
    Result<std::vector<model::ClockSession>> list_sessions() override { return inner_.list_sessions(); }
    Result<std::size_t> pending_count() override { return inner_.pending_count(); }
    Result<model::SyncCursor> cursor() override { return inner_.cursor(); }
    Result<void> flush() override { return inner_.flush(); }

private:
    store::DurableStore& inner_;
    std::atomic<int> countdown_{0};
};

} // namespace fts::testing
