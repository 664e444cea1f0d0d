#include "fts/store/sqlite_store.hpp"

#include "fts/model/codec.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <array>

namespace fts::store {
namespace {

using model::ClockSession;
using model::LifecycleState;
using model::QueueItem;
using model::QueueStatus;

constexpr int kSchemaVersion = 1;

// Index i migrates the schema from version i to i + 1.
const std::array<const char*, kSchemaVersion> kMigrations = {
    R"sql(
    CREATE TABLE IF NOT EXISTS queue_items (
        id              TEXT PRIMARY KEY,
        operation       TEXT NOT NULL,
        session_id      TEXT NOT NULL,
        payload         TEXT NOT NULL,
        status          TEXT NOT NULL CHECK (status IN ('Pending', 'InFlight', 'Failed')),
        retry_count     INTEGER NOT NULL DEFAULT 0 CHECK (retry_count >= 0),
        last_error      TEXT,
        created_at      INTEGER NOT NULL,
        sequence        INTEGER NOT NULL UNIQUE,
        drain_position  INTEGER NOT NULL UNIQUE,
        CHECK (last_error IS NULL OR status = 'Failed')
    );
    CREATE INDEX IF NOT EXISTS idx_queue_items_drain ON queue_items (status, drain_position);
    CREATE INDEX IF NOT EXISTS idx_queue_items_session ON queue_items (session_id, sequence);

    CREATE TRIGGER IF NOT EXISTS queue_items_write_once
    BEFORE UPDATE OF id, operation, session_id, payload, created_at, sequence ON queue_items
    BEGIN
        SELECT RAISE(ABORT, 'queue item payload is write-once');
    END;

    CREATE TABLE IF NOT EXISTS sessions (
        local_id            TEXT PRIMARY KEY,
        remote_id           TEXT,
        employee_id         TEXT NOT NULL,
        work_order_id       TEXT NOT NULL,
        rate_type           TEXT NOT NULL,
        clock_in_time       INTEGER NOT NULL,
        clock_out_time      INTEGER,
        clock_in_location   TEXT,
        clock_out_location  TEXT,
        duration_seconds    INTEGER,
        state               TEXT NOT NULL,
        last_error          TEXT,
        ui_flags            INTEGER NOT NULL DEFAULT 0,
        CHECK (clock_out_time IS NULL OR clock_out_time > clock_in_time)
    );
    CREATE INDEX IF NOT EXISTS idx_sessions_employee ON sessions (employee_id, state);

    CREATE TABLE IF NOT EXISTS sync_cursor (
        id                  INTEGER PRIMARY KEY CHECK (id = 1),
        last_synced_item_at INTEGER,
        last_attempt_at     INTEGER
    );
    )sql",
};

constexpr const char* kItemColumns =
    "id, operation, payload, status, retry_count, last_error, created_at, sequence, drain_position";

constexpr const char* kSessionColumns =
    "local_id, remote_id, employee_id, work_order_id, rate_type, clock_in_time, clock_out_time, "
    "clock_in_location, clock_out_location, duration_seconds, state, last_error, ui_flags";

std::optional<QueueStatus> status_from_string(const std::string& text) {
    if (text == "Pending") return QueueStatus::Pending;
    if (text == "InFlight") return QueueStatus::InFlight;
    if (text == "Failed") return QueueStatus::Failed;
    return std::nullopt;
}

std::optional<LifecycleState> state_from_string(const std::string& text) {
    static const std::array<LifecycleState, 7> all = {
        LifecycleState::Idle, LifecycleState::Pending, LifecycleState::Active,
        LifecycleState::PendingClockOut, LifecycleState::Synced, LifecycleState::Archived,
        LifecycleState::RolledBack};
    for (auto state : all) {
        if (text == model::to_string(state)) {
            return state;
        }
    }
    return std::nullopt;
}

std::optional<std::int64_t> optional_millis(const std::optional<Timestamp>& tp) {
    if (!tp) {
        return std::nullopt;
    }
    return to_unix_millis(*tp);
}

std::optional<std::string> optional_location_text(const std::optional<model::LocationReading>& location) {
    if (!location) {
        return std::nullopt;
    }
    return model::location_to_json(*location).dump();
}

Result<std::optional<model::LocationReading>> parse_location_column(const std::optional<std::string>& text) {
    if (!text) {
        return Ok(std::optional<model::LocationReading>{});
    }
    auto doc = nlohmann::json::parse(*text, nullptr, false);
    if (doc.is_discarded()) {
        return Err<std::optional<model::LocationReading>>(Error::io_failure("Corrupt location column"));
    }
    auto location = model::location_from_json(doc);
    if (location.is_error()) {
        return Err<std::optional<model::LocationReading>>(Error::io_failure(location.error().message));
    }
    return Ok(std::optional<model::LocationReading>{location.value()});
}

Result<QueueItem> read_item(const Statement& stmt) {
    QueueItem item;
    item.id = stmt.column_text(0);

    auto operation = model::operation_from_string(stmt.column_text(1));
    if (!operation) {
        return Err<QueueItem>(Error::io_failure("Corrupt operation column for item " + item.id));
    }
    item.operation = *operation;

    auto doc = nlohmann::json::parse(stmt.column_text(2), nullptr, false);
    if (doc.is_discarded()) {
        return Err<QueueItem>(Error::io_failure("Corrupt payload for item " + item.id));
    }
    auto payload = model::payload_from_json(doc);
    if (payload.is_error()) {
        return Err<QueueItem>(Error::io_failure("Corrupt payload for item " + item.id + ": " + payload.error().message));
    }
    item.payload = payload.value();

    auto status = status_from_string(stmt.column_text(3));
    if (!status) {
        return Err<QueueItem>(Error::io_failure("Corrupt status column for item " + item.id));
    }
    item.status = *status;
    item.retry_count = static_cast<int>(stmt.column_int64(4));
    item.last_error = stmt.column_optional_text(5);
    item.created_at = from_unix_millis(stmt.column_int64(6));
    item.sequence = stmt.column_int64(7);
    item.drain_position = stmt.column_int64(8);
    return Ok(item);
}

Result<ClockSession> read_session(const Statement& stmt) {
    ClockSession session;
    session.local_id = stmt.column_text(0);
    session.remote_id = stmt.column_optional_text(1);
    session.employee_id = stmt.column_text(2);
    session.work_order_id = stmt.column_text(3);
    session.rate_type = stmt.column_text(4);
    session.clock_in_time = from_unix_millis(stmt.column_int64(5));
    if (auto out = stmt.column_optional_int64(6)) {
        session.clock_out_time = from_unix_millis(*out);
    }

    auto in_location = parse_location_column(stmt.column_optional_text(7));
    if (in_location.is_error()) {
        return Err<ClockSession>(in_location.error());
    }
    session.clock_in_location = in_location.value();

    auto out_location = parse_location_column(stmt.column_optional_text(8));
    if (out_location.is_error()) {
        return Err<ClockSession>(out_location.error());
    }
    session.clock_out_location = out_location.value();

    session.duration_seconds = stmt.column_optional_int64(9);

    auto state = state_from_string(stmt.column_text(10));
    if (!state) {
        return Err<ClockSession>(Error::io_failure("Corrupt state column for session " + session.local_id));
    }
    session.state = *state;
    session.last_error = stmt.column_optional_text(11);
    session.ui_flags = static_cast<std::uint32_t>(stmt.column_int64(12));
    return Ok(session);
}

template<typename T, typename Reader>
Result<std::vector<T>> collect_rows(Statement& stmt, Reader reader) {
    std::vector<T> rows;
    while (true) {
        auto row = stmt.step();
        if (row.is_error()) {
            return Err<std::vector<T>>(row.error());
        }
        if (!row.value()) {
            break;
        }
        auto parsed = reader(stmt);
        if (parsed.is_error()) {
            return Err<std::vector<T>>(parsed.error());
        }
        rows.push_back(std::move(parsed.value()));
    }
    return Ok(std::move(rows));
}

/**
 * @brief Query facade bound to one open sqlite transaction
 */
class SqliteTransaction final : public StoreTransaction {
public:
    explicit SqliteTransaction(SqliteDB& db) : db_(db) {}

    Result<void> insert_item(QueueItem& item) override {
        auto next = next_value("SELECT COALESCE(MAX(sequence), 0) + 1, COALESCE(MAX(drain_position), 0) + 1 FROM queue_items;");
        if (next.is_error()) {
            return Err<void>(next.error());
        }
        item.sequence = next.value().first;
        item.drain_position = next.value().second;

        auto stmt = db_.prepare(
            "INSERT INTO queue_items (id, operation, session_id, payload, status, retry_count, last_error, "
            "created_at, sequence, drain_position) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
        if (stmt.is_error()) {
            return Err<void>(stmt.error());
        }
        auto payload = model::dump_json(model::payload_to_json(item.payload));
        if (payload.is_error()) {
            return Err<void>(payload.error());
        }
        auto& s = stmt.value();
        s.bind_text(1, item.id);
        s.bind_text(2, model::to_string(item.operation));
        s.bind_text(3, item.payload.session_id);
        s.bind_text(4, payload.value());
        s.bind_text(5, model::to_string(item.status));
        s.bind_int64(6, item.retry_count);
        s.bind_optional_text(7, item.last_error);
        s.bind_int64(8, to_unix_millis(item.created_at));
        s.bind_int64(9, item.sequence);
        s.bind_int64(10, item.drain_position);
        return s.run();
    }

    Result<QueueItem> get_item(const std::string& id) override {
        auto stmt = db_.prepare(std::string("SELECT ") + kItemColumns + " FROM queue_items WHERE id = ?;");
        if (stmt.is_error()) {
            return Err<QueueItem>(stmt.error());
        }
        stmt.value().bind_text(1, id);
        auto row = stmt.value().step();
        if (row.is_error()) {
            return Err<QueueItem>(row.error());
        }
        if (!row.value()) {
            return Err<QueueItem>(Error::not_found("Queue item not found: " + id));
        }
        return read_item(stmt.value());
    }

    Result<void> update_item_state(const std::string& id,
                                   QueueStatus status,
                                   int retry_count,
                                   const std::optional<std::string>& last_error) override {
        auto stmt = db_.prepare("UPDATE queue_items SET status = ?, retry_count = ?, last_error = ? WHERE id = ?;");
        if (stmt.is_error()) {
            return Err<void>(stmt.error());
        }
        auto& s = stmt.value();
        s.bind_text(1, model::to_string(status));
        s.bind_int64(2, retry_count);
        s.bind_optional_text(3, last_error);
        s.bind_text(4, id);
        return expect_one_row_changed(s, id);
    }

    Result<void> move_item_to_tail(const std::string& id) override {
        auto stmt = db_.prepare(
            "UPDATE queue_items SET drain_position = (SELECT COALESCE(MAX(drain_position), 0) + 1 FROM queue_items) "
            "WHERE id = ?;");
        if (stmt.is_error()) {
            return Err<void>(stmt.error());
        }
        stmt.value().bind_text(1, id);
        return expect_one_row_changed(stmt.value(), id);
    }

    Result<void> delete_item(const std::string& id) override {
        auto stmt = db_.prepare("DELETE FROM queue_items WHERE id = ?;");
        if (stmt.is_error()) {
            return Err<void>(stmt.error());
        }
        stmt.value().bind_text(1, id);
        return expect_one_row_changed(stmt.value(), id);
    }

    Result<std::vector<QueueItem>> list_items() override {
        auto stmt = db_.prepare(std::string("SELECT ") + kItemColumns + " FROM queue_items ORDER BY drain_position;");
        if (stmt.is_error()) {
            return Err<std::vector<QueueItem>>(stmt.error());
        }
        return collect_rows<QueueItem>(stmt.value(), read_item);
    }

    Result<std::size_t> reset_in_flight() override {
        auto stmt = db_.prepare("UPDATE queue_items SET status = 'Pending' WHERE status = 'InFlight';");
        if (stmt.is_error()) {
            return Err<std::size_t>(stmt.error());
        }
        auto run = stmt.value().run();
        if (run.is_error()) {
            return Err<std::size_t>(run.error());
        }
        return Ok(static_cast<std::size_t>(stmt.value().changes()));
    }

    Result<ClockSession> get_session(const std::string& local_id) override {
        auto stmt = db_.prepare(std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE local_id = ?;");
        if (stmt.is_error()) {
            return Err<ClockSession>(stmt.error());
        }
        stmt.value().bind_text(1, local_id);
        auto row = stmt.value().step();
        if (row.is_error()) {
            return Err<ClockSession>(row.error());
        }
        if (!row.value()) {
            return Err<ClockSession>(Error::not_found("Session not found: " + local_id));
        }
        return read_session(stmt.value());
    }

    Result<std::optional<ClockSession>> find_open_session(const std::string& employee_id) override {
        auto stmt = db_.prepare(std::string("SELECT ") + kSessionColumns +
                                " FROM sessions WHERE employee_id = ? AND state IN ('Pending', 'Active', 'PendingClockOut') "
                                "ORDER BY clock_in_time DESC LIMIT 1;");
        if (stmt.is_error()) {
            return Err<std::optional<ClockSession>>(stmt.error());
        }
        stmt.value().bind_text(1, employee_id);
        auto row = stmt.value().step();
        if (row.is_error()) {
            return Err<std::optional<ClockSession>>(row.error());
        }
        if (!row.value()) {
            return Ok(std::optional<ClockSession>{});
        }
        auto session = read_session(stmt.value());
        if (session.is_error()) {
            return Err<std::optional<ClockSession>>(session.error());
        }
        return Ok(std::optional<ClockSession>{session.value()});
    }

    Result<void> put_session(const ClockSession& session) override {
        auto stmt = db_.prepare(
            "INSERT INTO sessions (local_id, remote_id, employee_id, work_order_id, rate_type, clock_in_time, "
            "clock_out_time, clock_in_location, clock_out_location, duration_seconds, state, last_error, ui_flags) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(local_id) DO UPDATE SET remote_id = excluded.remote_id, employee_id = excluded.employee_id, "
            "work_order_id = excluded.work_order_id, rate_type = excluded.rate_type, "
            "clock_in_time = excluded.clock_in_time, clock_out_time = excluded.clock_out_time, "
            "clock_in_location = excluded.clock_in_location, clock_out_location = excluded.clock_out_location, "
            "duration_seconds = excluded.duration_seconds, state = excluded.state, "
            "last_error = excluded.last_error, ui_flags = excluded.ui_flags;");
        if (stmt.is_error()) {
            return Err<void>(stmt.error());
        }
        auto& s = stmt.value();
        s.bind_text(1, session.local_id);
        s.bind_optional_text(2, session.remote_id);
        s.bind_text(3, session.employee_id);
        s.bind_text(4, session.work_order_id);
        s.bind_text(5, session.rate_type);
        s.bind_int64(6, to_unix_millis(session.clock_in_time));
        s.bind_optional_int64(7, optional_millis(session.clock_out_time));
        s.bind_optional_text(8, optional_location_text(session.clock_in_location));
        s.bind_optional_text(9, optional_location_text(session.clock_out_location));
        s.bind_optional_int64(10, session.duration_seconds);
        s.bind_text(11, model::to_string(session.state));
        s.bind_optional_text(12, session.last_error);
        s.bind_int64(13, session.ui_flags);
        return s.run();
    }

    Result<std::vector<ClockSession>> list_sessions() override {
        auto stmt = db_.prepare(std::string("SELECT ") + kSessionColumns + " FROM sessions ORDER BY clock_in_time;");
        if (stmt.is_error()) {
            return Err<std::vector<ClockSession>>(stmt.error());
        }
        return collect_rows<ClockSession>(stmt.value(), read_session);
    }

    Result<model::SyncCursor> get_cursor() override {
        auto stmt = db_.prepare("SELECT last_synced_item_at, last_attempt_at FROM sync_cursor WHERE id = 1;");
        if (stmt.is_error()) {
            return Err<model::SyncCursor>(stmt.error());
        }
        auto row = stmt.value().step();
        if (row.is_error()) {
            return Err<model::SyncCursor>(row.error());
        }
        model::SyncCursor cursor;
        if (row.value()) {
            if (auto synced = stmt.value().column_optional_int64(0)) {
                cursor.last_synced_item_at = from_unix_millis(*synced);
            }
            if (auto attempt = stmt.value().column_optional_int64(1)) {
                cursor.last_attempt_at = from_unix_millis(*attempt);
            }
        }
        return Ok(cursor);
    }

    Result<void> put_cursor(const model::SyncCursor& cursor) override {
        auto stmt = db_.prepare(
            "INSERT INTO sync_cursor (id, last_synced_item_at, last_attempt_at) VALUES (1, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET last_synced_item_at = excluded.last_synced_item_at, "
            "last_attempt_at = excluded.last_attempt_at;");
        if (stmt.is_error()) {
            return Err<void>(stmt.error());
        }
        stmt.value().bind_optional_int64(1, optional_millis(cursor.last_synced_item_at));
        stmt.value().bind_optional_int64(2, optional_millis(cursor.last_attempt_at));
        return stmt.value().run();
    }

    Result<std::size_t> count_awaiting_sync() {
        auto stmt = db_.prepare("SELECT COUNT(*) FROM queue_items WHERE status IN ('Pending', 'InFlight');");
        if (stmt.is_error()) {
            return Err<std::size_t>(stmt.error());
        }
        auto row = stmt.value().step();
        if (row.is_error()) {
            return Err<std::size_t>(row.error());
        }
        return Ok(static_cast<std::size_t>(row.value() ? stmt.value().column_int64(0) : 0));
    }

private:
    Result<std::pair<std::int64_t, std::int64_t>> next_value(const char* sql) {
        auto stmt = db_.prepare(sql);
        if (stmt.is_error()) {
            return Err<std::pair<std::int64_t, std::int64_t>>(stmt.error());
        }
        auto row = stmt.value().step();
        if (row.is_error()) {
            return Err<std::pair<std::int64_t, std::int64_t>>(row.error());
        }
        return Ok(std::make_pair(stmt.value().column_int64(0), stmt.value().column_int64(1)));
    }

    static Result<void> expect_one_row_changed(Statement& stmt, const std::string& id) {
        auto run = stmt.run();
        if (run.is_error()) {
            return run;
        }
        if (stmt.changes() == 0) {
            return Err<void>(Error::not_found("Queue item not found: " + id));
        }
        return Ok();
    }

    SqliteDB& db_;
};

/**
 * @brief Rolls back an open transaction unless it was committed
 */
class TransactionGuard {
public:
    explicit TransactionGuard(SqliteDB& db) : db_(db) {}

    ~TransactionGuard() {
        if (committed_ || sqlite3_get_autocommit(db_.handle())) {
            return;
        }
        auto rollback = db_.exec("ROLLBACK;");
        if (rollback.is_error()) {
            spdlog::error("Rollback failed on {}: {}", db_.path(), rollback.error().message);
        }
    }

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    void mark_committed() noexcept { committed_ = true; }

private:
    SqliteDB& db_;
    bool committed_ = false;
};

} // namespace

Result<std::unique_ptr<SqliteStore>> SqliteStore::open(const StoreConfig& config) {
    auto db = SqliteDB::open(config.path, config.busy_timeout_ms);
    if (db.is_error()) {
        return Err<std::unique_ptr<SqliteStore>>(db.error());
    }

    std::unique_ptr<SqliteStore> store(new SqliteStore(std::move(db.value())));

    auto configured = store->configure(config);
    if (configured.is_error()) {
        return Err<std::unique_ptr<SqliteStore>>(configured.error());
    }

    auto migrated = store->migrate();
    if (migrated.is_error()) {
        return Err<std::unique_ptr<SqliteStore>>(migrated.error());
    }

    spdlog::info("Durable store ready at {}", config.path);
    return Ok(std::move(store));
}

Result<void> SqliteStore::configure(const StoreConfig& config) {
    auto wal = db_->exec("PRAGMA journal_mode=WAL;");
    if (wal.is_error()) {
        return wal;
    }
    auto sync = db_->exec(config.synchronous_full ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;");
    if (sync.is_error()) {
        return sync;
    }
    return db_->exec("PRAGMA foreign_keys=ON;");
}

Result<void> SqliteStore::migrate() {
    std::lock_guard lock(mutex_);

    auto version = db_->user_version();
    if (version.is_error()) {
        return Err<void>(version.error());
    }
    if (version.value() > kSchemaVersion) {
        return Err<void>(Error::io_failure("Database schema version " + std::to_string(version.value()) +
                                           " is newer than supported version " + std::to_string(kSchemaVersion)));
    }

    for (int v = version.value(); v < kSchemaVersion; ++v) {
        auto begin = db_->exec("BEGIN IMMEDIATE;");
        if (begin.is_error()) {
            return begin;
        }
        TransactionGuard guard(*db_);

        auto applied = db_->exec(kMigrations[static_cast<std::size_t>(v)]);
        if (applied.is_error()) {
            return applied;
        }
        auto bumped = db_->exec("PRAGMA user_version = " + std::to_string(v + 1) + ";");
        if (bumped.is_error()) {
            return bumped;
        }
        auto commit = db_->exec("COMMIT;");
        if (commit.is_error()) {
            return commit;
        }
        guard.mark_committed();
        spdlog::info("Migrated store schema to version {}", v + 1);
    }
    return Ok();
}

Result<void> SqliteStore::execute(const TransactionBody& body) {
    std::lock_guard lock(mutex_);

    auto begin = db_->exec("BEGIN IMMEDIATE;");
    if (begin.is_error()) {
        return begin;
    }
    TransactionGuard guard(*db_);

    SqliteTransaction tx(*db_);
    auto result = body(tx);
    if (result.is_error()) {
        spdlog::debug("Transaction rolled back: {} ({})", result.error().message, to_string(result.error().code));
        return result;
    }

    auto commit = db_->exec("COMMIT;");
    if (commit.is_error()) {
        spdlog::error("Commit failed on {}: {}", db_->path(), commit.error().message);
        return commit;
    }
    guard.mark_committed();
    return Ok();
}

Result<void> SqliteStore::read(const TransactionBody& body) {
    std::lock_guard lock(mutex_);

    auto begin = db_->exec("BEGIN DEFERRED;");
    if (begin.is_error()) {
        return begin;
    }
    TransactionGuard guard(*db_);

    SqliteTransaction tx(*db_);
    auto result = body(tx);
    if (result.is_error()) {
        return result;
    }
    auto commit = db_->exec("COMMIT;");
    if (commit.is_error()) {
        return commit;
    }
    guard.mark_committed();
    return Ok();
}

Result<std::vector<QueueItem>> SqliteStore::list_pending() {
    auto all = list_items();
    if (all.is_error()) {
        return all;
    }
    std::vector<QueueItem> pending;
    for (auto& item : all.value()) {
        if (item.status == QueueStatus::Pending) {
            pending.push_back(std::move(item));
        }
    }
    return Ok(std::move(pending));
}

Result<std::vector<QueueItem>> SqliteStore::list_items() {
    std::vector<QueueItem> items;
    auto result = read([&items](StoreTransaction& tx) -> Result<void> {
        auto listed = tx.list_items();
        if (listed.is_error()) {
            return Err<void>(listed.error());
        }
        items = std::move(listed.value());
        return Ok();
    });
    if (result.is_error()) {
        return Err<std::vector<QueueItem>>(result.error());
    }
    return Ok(std::move(items));
}

Result<ClockSession> SqliteStore::get_session(const std::string& local_id) {
    std::optional<ClockSession> found;
    auto result = read([&](StoreTransaction& tx) -> Result<void> {
        auto session = tx.get_session(local_id);
        if (session.is_error()) {
            return Err<void>(session.error());
        }
        found = session.value();
        return Ok();
    });
    if (result.is_error()) {
        return Err<ClockSession>(result.error());
    }
    return Ok(*found);
}

Result<std::vector<ClockSession>> SqliteStore::list_sessions() {
    std::vector<ClockSession> sessions;
    auto result = read([&sessions](StoreTransaction& tx) -> Result<void> {
        auto listed = tx.list_sessions();
        if (listed.is_error()) {
            return Err<void>(listed.error());
        }
        sessions = std::move(listed.value());
        return Ok();
    });
    if (result.is_error()) {
        return Err<std::vector<ClockSession>>(result.error());
    }
    return Ok(std::move(sessions));
}

Result<std::size_t> SqliteStore::pending_count() {
    std::size_t count = 0;
    auto result = read([&count](StoreTransaction& tx) -> Result<void> {
        auto counted = static_cast<SqliteTransaction&>(tx).count_awaiting_sync();
        if (counted.is_error()) {
            return Err<void>(counted.error());
        }
        count = counted.value();
        return Ok();
    });
    if (result.is_error()) {
        return Err<std::size_t>(result.error());
    }
    return Ok(count);
}

Result<model::SyncCursor> SqliteStore::cursor() {
    model::SyncCursor cursor;
    auto result = read([&cursor](StoreTransaction& tx) -> Result<void> {
        auto loaded = tx.get_cursor();
        if (loaded.is_error()) {
            return Err<void>(loaded.error());
        }
        cursor = loaded.value();
        return Ok();
    });
    if (result.is_error()) {
        return Err<model::SyncCursor>(result.error());
    }
    return Ok(cursor);
}

Result<void> SqliteStore::flush() {
    std::lock_guard lock(mutex_);
    auto checkpoint = db_->exec("PRAGMA wal_checkpoint(TRUNCATE);");
    if (checkpoint.is_ok()) {
        spdlog::debug("Store flushed to {}", db_->path());
    }
    return checkpoint;
}

} // namespace fts::store
