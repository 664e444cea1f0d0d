#pragma once

#include "fts/core/result.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace fts::store {

/**
 * @brief Map a sqlite result code onto the store error kinds
 *
 * Constraint failures (including RAISE(ABORT) from triggers) become
 * ConstraintViolation; everything else is an IOFailure.
 */
Error sqlite_error(sqlite3* db, int rc, const std::string& what);

/**
 * @brief RAII prepared statement, finalized on destruction
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    void bind_text(int index, const std::string& value);
    void bind_int64(int index, std::int64_t value);
    void bind_null(int index);
    void bind_optional_text(int index, const std::optional<std::string>& value);
    void bind_optional_int64(int index, const std::optional<std::int64_t>& value);

    /// true when a row is available, false when the statement is done.
    Result<bool> step();

    /// Step a statement that must not return rows (INSERT/UPDATE/DELETE).
    Result<void> run();

    std::string column_text(int col) const;
    std::int64_t column_int64(int col) const;
    bool column_is_null(int col) const;
    std::optional<std::string> column_optional_text(int col) const;
    std::optional<std::int64_t> column_optional_int64(int col) const;

    int changes() const;

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Thin RAII wrapper around a sqlite3 connection
 */
class SqliteDB {
public:
    static Result<std::unique_ptr<SqliteDB>> open(const std::string& path, int busy_timeout_ms);

    ~SqliteDB();

    SqliteDB(const SqliteDB&) = delete;
    SqliteDB& operator=(const SqliteDB&) = delete;

    sqlite3* handle() const { return db_; }
    const std::string& path() const noexcept { return path_; }

    Result<void> exec(const std::string& sql);
    Result<Statement> prepare(const std::string& sql);

    Result<int> user_version();

private:
    SqliteDB(sqlite3* db, std::string path) : db_(db), path_(std::move(path)) {}

    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace fts::store
