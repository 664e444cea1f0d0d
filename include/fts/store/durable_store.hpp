#pragma once

#include "fts/core/result.hpp"
#include "fts/model/types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fts::store {

/**
 * @brief Reads and writes available inside one store transaction
 *
 * Reads see the transaction's own uncommitted writes. Nothing done through
 * this interface is visible to other callers until the enclosing execute()
 * commits.
 */
class StoreTransaction {
public:
    virtual ~StoreTransaction() = default;

    /// Assigns item.sequence and item.drain_position (both one past the current maximum).
    virtual Result<void> insert_item(model::QueueItem& item) = 0;
    virtual Result<model::QueueItem> get_item(const std::string& id) = 0;
    virtual Result<void> update_item_state(const std::string& id,
                                           model::QueueStatus status,
                                           int retry_count,
                                           const std::optional<std::string>& last_error) = 0;
    virtual Result<void> move_item_to_tail(const std::string& id) = 0;
    virtual Result<void> delete_item(const std::string& id) = 0;
    /// All items in drain order.
    virtual Result<std::vector<model::QueueItem>> list_items() = 0;
    /// InFlight -> Pending for every item; returns how many were reset.
    virtual Result<std::size_t> reset_in_flight() = 0;

    virtual Result<model::ClockSession> get_session(const std::string& local_id) = 0;
    virtual Result<std::optional<model::ClockSession>> find_open_session(const std::string& employee_id) = 0;
    virtual Result<void> put_session(const model::ClockSession& session) = 0;
    virtual Result<std::vector<model::ClockSession>> list_sessions() = 0;

    virtual Result<model::SyncCursor> get_cursor() = 0;
    virtual Result<void> put_cursor(const model::SyncCursor& cursor) = 0;
};

/**
 * @brief Transactional on-device record store
 *
 * Sole owner of persisted queue items, sessions and the sync cursor. Every
 * mutation goes through execute(): the body's writes either all commit or
 * all roll back, and a body that returns an error voids the whole
 * transaction. Concurrent callers (UI enqueue vs background drain) are
 * serialized inside the store; callers hold no locks of their own.
 */
class DurableStore {
public:
    using TransactionBody = std::function<Result<void>(StoreTransaction&)>;

    virtual ~DurableStore() = default;

    virtual Result<void> execute(const TransactionBody& body) = 0;

    /// Pending items in drain order (FIFO by createdAt, retried items at the tail).
    virtual Result<std::vector<model::QueueItem>> list_pending() = 0;
    virtual Result<std::vector<model::QueueItem>> list_items() = 0;
    virtual Result<model::ClockSession> get_session(const std::string& local_id) = 0;
    virtual Result<std::vector<model::ClockSession>> list_sessions() = 0;
    /// Items still awaiting the server (Pending + InFlight), committed state only.
    virtual Result<std::size_t> pending_count() = 0;
    virtual Result<model::SyncCursor> cursor() = 0;

    /// Push everything committed so far to the main database file (suspend hook).
    virtual Result<void> flush() = 0;
};

} // namespace fts::store
