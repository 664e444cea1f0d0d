#include "fts/store/sqlite_db.hpp"

#include <spdlog/spdlog.h>

namespace fts::store {

Error sqlite_error(sqlite3* db, int rc, const std::string& what) {
    std::string message = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        return Error::constraint(std::move(message));
    }
    return Error::io_failure(std::move(message));
}

// ---------------------------------------------------------------------------
// Statement
// ---------------------------------------------------------------------------

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.db_ = nullptr;
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::bind_text(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void Statement::bind_int64(int index, std::int64_t value) {
    sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
}

void Statement::bind_null(int index) {
    sqlite3_bind_null(stmt_, index);
}

void Statement::bind_optional_text(int index, const std::optional<std::string>& value) {
    if (value) {
        bind_text(index, *value);
    } else {
        bind_null(index);
    }
}

void Statement::bind_optional_int64(int index, const std::optional<std::int64_t>& value) {
    if (value) {
        bind_int64(index, *value);
    } else {
        bind_null(index);
    }
}

Result<bool> Statement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return Ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Ok(false);
    }
    return Err<bool>(sqlite_error(db_, rc, "sqlite step"));
}

Result<void> Statement::run() {
    auto stepped = step();
    if (stepped.is_error()) {
        return Err<void>(stepped.error());
    }
    return Ok();
}

std::string Statement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

std::int64_t Statement::column_int64(int col) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
}

bool Statement::column_is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::optional<std::string> Statement::column_optional_text(int col) const {
    if (column_is_null(col)) {
        return std::nullopt;
    }
    return column_text(col);
}

std::optional<std::int64_t> Statement::column_optional_int64(int col) const {
    if (column_is_null(col)) {
        return std::nullopt;
    }
    return column_int64(col);
}

int Statement::changes() const {
    return sqlite3_changes(db_);
}

// ---------------------------------------------------------------------------
// SqliteDB
// ---------------------------------------------------------------------------

Result<std::unique_ptr<SqliteDB>> SqliteDB::open(const std::string& path, int busy_timeout_ms) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        Error error = sqlite_error(raw, rc, "sqlite open " + path);
        if (raw) {
            sqlite3_close(raw);
        }
        return Err<std::unique_ptr<SqliteDB>>(std::move(error));
    }

    sqlite3_extended_result_codes(raw, 1);
    sqlite3_busy_timeout(raw, busy_timeout_ms);

    spdlog::debug("Opened sqlite database {}", path);
    return Ok(std::unique_ptr<SqliteDB>(new SqliteDB(raw, path)));
}

SqliteDB::~SqliteDB() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Result<void> SqliteDB::exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        if ((rc & 0xff) == SQLITE_CONSTRAINT) {
            return Err<void>(Error::constraint(std::move(message)));
        }
        return Err<void>(Error::io_failure(std::move(message)));
    }
    return Ok();
}

Result<Statement> SqliteDB::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Err<Statement>(sqlite_error(db_, rc, "sqlite prepare"));
    }
    return Ok(Statement(db_, stmt));
}

Result<int> SqliteDB::user_version() {
    auto stmt = prepare("PRAGMA user_version;");
    if (stmt.is_error()) {
        return Err<int>(stmt.error());
    }
    auto row = stmt.value().step();
    if (row.is_error()) {
        return Err<int>(row.error());
    }
    return Ok(row.value() ? static_cast<int>(stmt.value().column_int64(0)) : 0);
}

} // namespace fts::store
