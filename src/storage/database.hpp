#pragma once

#include "core/result.hpp"
#include "core/value.hpp"
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <memory>
#include <vector>

namespace strata::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers (1-based positions, like sqlite3_bind_*)
    Result<void, Error> bind(int index, const Value& value);
    Result<void, Error> bind(std::string_view name, const Value& value);
    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_null(int index);

    // Column getters (0-based)
    [[nodiscard]] int column_count() const;
    [[nodiscard]] std::string column_name(int index) const;
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;
    [[nodiscard]] Value column_value(int index) const;

    // Execute
    Result<bool, Error> step();  // Returns true if there's a row
    Result<void, Error> reset();

private:
    [[nodiscard]] Error bind_error(const char* what, int rc) const;

    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite connection.
 *
 * The execution engine the migrator drives: raw SQL execution, prepared
 * statements, transactions and savepoints, and the user_version header
 * field. One connection, used from one thread at a time.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open a database connection. Foreign key enforcement is switched on.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Execute one or more SQL statements. Returns the number of rows changed.
     */
    Result<int, Error> execute(const std::string& sql);

    /**
     * Execute a query and hand each row to the callback.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return Result<void, Error>::ok();
    }

    /**
     * Run a single-value query, e.g. "SELECT count(*) FROM people".
     * Returns Null when the query yields no rows.
     */
    [[nodiscard]] Result<Value, Error> query_value(const std::string& sql);

    // Transactions
    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    // Savepoints nest inside an open transaction.
    [[nodiscard]] Result<void, Error> savepoint(const std::string& name);
    [[nodiscard]] Result<void, Error> release(const std::string& name);
    [[nodiscard]] Result<void, Error> rollback_to(const std::string& name);

    /**
     * True while a BEGIN (or an outermost SAVEPOINT) is open.
     */
    [[nodiscard]] bool in_transaction() const;

    /**
     * Execute a function within a transaction.
     * Automatically commits on success, rolls back on failure.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            log_rollback_failure(rollback());
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            log_rollback_failure(rollback());
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

    // Header fields and pragmas
    [[nodiscard]] Result<int, Error> read_user_version();
    [[nodiscard]] Result<void, Error> write_user_version(int version);
    [[nodiscard]] Result<bool, Error> foreign_keys_enabled();
    [[nodiscard]] Result<void, Error> set_foreign_keys(bool enabled);

    [[nodiscard]] int64_t last_insert_rowid() const;

    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    static void log_rollback_failure(const Result<void, Error>& rollback_result);

    sqlite3* db_ = nullptr;
};

/**
 * Transaction scope guard.
 *
 * Opens a top-level transaction, or a named savepoint when the connection is
 * already inside one. Rolls back on destruction unless committed.
 */
class TransactionScope {
public:
    TransactionScope(Database& db, std::string savepoint_name);
    ~TransactionScope();

    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;

    /**
     * Result of opening the scope. Check before doing any work.
     */
    [[nodiscard]] const Result<void, Error>& status() const { return status_; }

    [[nodiscard]] bool nested() const { return nested_; }
    [[nodiscard]] bool is_active() const { return active_; }

    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

private:
    Database& db_;
    std::string name_;
    bool nested_ = false;
    bool active_ = false;
    Result<void, Error> status_ = Result<void, Error>::ok();
};

/**
 * Quote an identifier for SQLite: say "hi" -> "say ""hi""".
 */
[[nodiscard]] std::string escape_identifier(std::string_view identifier);

} // namespace strata::storage
