#pragma once

#include "fts/core/config.hpp"
#include "fts/store/durable_store.hpp"
#include "fts/store/sqlite_db.hpp"

#include <memory>
#include <mutex>

namespace fts::store {

/**
 * @brief DurableStore on SQLite
 *
 * WAL journal with synchronous=FULL: once execute() returns Ok the commit
 * survives process death and power loss. Writers use BEGIN IMMEDIATE so the
 * write lock is taken up front and a transaction never fails half-way on
 * lock upgrade.
 *
 * Lifecycle: open() on start (runs migrations), flush() on suspend,
 * destruction closes the connection.
 */
class SqliteStore final : public DurableStore {
public:
    static Result<std::unique_ptr<SqliteStore>> open(const StoreConfig& config);

    Result<void> execute(const TransactionBody& body) override;

    Result<std::vector<model::QueueItem>> list_pending() override;
    Result<std::vector<model::QueueItem>> list_items() override;
    Result<model::ClockSession> get_session(const std::string& local_id) override;
    Result<std::vector<model::ClockSession>> list_sessions() override;
    Result<std::size_t> pending_count() override;
    Result<model::SyncCursor> cursor() override;

    Result<void> flush() override;

    const std::string& path() const noexcept { return db_->path(); }

private:
    explicit SqliteStore(std::unique_ptr<SqliteDB> db) : db_(std::move(db)) {}

    Result<void> configure(const StoreConfig& config);
    Result<void> migrate();

    /// Consistent read snapshot (BEGIN DEFERRED ... COMMIT).
    Result<void> read(const TransactionBody& body);

    std::unique_ptr<SqliteDB> db_;
    std::mutex mutex_;
};

} // namespace fts::store
