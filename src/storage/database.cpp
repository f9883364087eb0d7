#include "storage/database.hpp"
#include "core/logging.hpp"
#include <QDebug>

#include <limits>

namespace strata::storage {

// ============================================================================
// Statement implementation
// ============================================================================

Error Statement::bind_error(const char* what, int rc) const {
    sqlite3* db = stmt_ ? sqlite3_db_handle(stmt_.get()) : nullptr;
    std::string msg = what;
    if (db) {
        msg += ": ";
        msg += sqlite3_errmsg(db);
    }
    return Error{std::move(msg), rc};
}

Result<void, Error> Statement::bind(int index, const Value& value) {
    int rc = std::visit([&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null>) {
            return sqlite3_bind_null(stmt_.get(), index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt_.get(), index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt_.get(), index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt_.get(), index, v.data(),
                                     static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else {
            // sqlite binds a NULL for a null pointer, so an empty blob needs
            // a non-null address to stay a zero-length blob.
            static const uint8_t empty = 0;
            const void* data = v.empty() ? static_cast<const void*>(&empty) : v.data();
            return sqlite3_bind_blob(stmt_.get(), index, data,
                                     static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
    }, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(bind_error("Failed to bind parameter", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind(std::string_view name, const Value& value) {
    const std::string key(name);
    int index = sqlite3_bind_parameter_index(stmt_.get(), key.c_str());
    if (index == 0) {
        return Result<void, Error>::err(Error{"Unknown parameter name: " + key, SQLITE_RANGE});
    }
    return bind(index, value);
}

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    return bind(index, Value{std::string(text)});
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    return bind(index, Value{value});
}

Result<void, Error> Statement::bind_null(int index) {
    return bind(index, Value{Null{}});
}

int Statement::column_count() const {
    return sqlite3_column_count(stmt_.get());
}

std::string Statement::column_name(int index) const {
    const char* name = sqlite3_column_name(stmt_.get(), index);
    return name ? name : "";
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return reinterpret_cast<const char*>(text);
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Value Statement::column_value(int index) const {
    switch (sqlite3_column_type(stmt_.get(), index)) {
        case SQLITE_INTEGER:
            return Value{static_cast<int64_t>(sqlite3_column_int64(stmt_.get(), index))};
        case SQLITE_FLOAT:
            return Value{sqlite3_column_double(stmt_.get(), index)};
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_.get(), index));
            int size = sqlite3_column_bytes(stmt_.get(), index);
            return Value{std::string(text ? text : "", text ? static_cast<size_t>(size) : 0)};
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt_.get(), index);
            int size = sqlite3_column_bytes(stmt_.get(), index);
            if (!data || size <= 0) return Value{Blob{}};
            const auto* bytes = static_cast<const uint8_t*>(data);
            return Value{Blob(bytes, bytes + size)};
        }
        default:
            return Value{Null{}};
    }
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    return Result<bool, Error>::err(bind_error("Step failed", rc));
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(bind_error("Reset failed", rc));
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* handle = nullptr;
    int rc = sqlite3_open(path.c_str(), &handle);
    if (rc != SQLITE_OK) {
        std::string error = handle ? sqlite3_errmsg(handle) : "Unknown error";
        if (handle) sqlite3_close(handle);
        return Result<Database, Error>::err(Error{error, rc});
    }

    Database db(handle);
    auto fk = db.set_foreign_keys(true);
    if (fk.is_err()) {
        return Result<Database, Error>::err(fk.unwrap_err());
    }

    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error{last_error(), rc});
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<int, Error> Database::execute(const std::string& sql) {
    const auto before = sqlite3_total_changes(db_);
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<int, Error>::err(Error{error, rc});
    }
    return Result<int, Error>::ok(sqlite3_total_changes(db_) - before);
}

Result<Value, Error> Database::query_value(const std::string& sql) {
    auto stmt_result = prepare(sql);
    if (stmt_result.is_err()) {
        return Result<Value, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<Value, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<Value, Error>::ok(Value{Null{}});
    }
    return Result<Value, Error>::ok(stmt.column_value(0));
}

namespace {

Result<void, Error> discard_count(Result<int, Error> r) {
    if (r.is_err()) {
        return Result<void, Error>::err(r.unwrap_err());
    }
    return Result<void, Error>::ok();
}

} // namespace

Result<void, Error> Database::begin_transaction() {
    return discard_count(execute("BEGIN TRANSACTION;"));
}

Result<void, Error> Database::commit() {
    return discard_count(execute("COMMIT;"));
}

Result<void, Error> Database::rollback() {
    return discard_count(execute("ROLLBACK;"));
}

Result<void, Error> Database::savepoint(const std::string& name) {
    return discard_count(execute("SAVEPOINT " + escape_identifier(name) + ";"));
}

Result<void, Error> Database::release(const std::string& name) {
    return discard_count(execute("RELEASE " + escape_identifier(name) + ";"));
}

Result<void, Error> Database::rollback_to(const std::string& name) {
    // ROLLBACK TO leaves the savepoint on the stack; release it afterwards.
    auto rolled = discard_count(execute("ROLLBACK TO " + escape_identifier(name) + ";"));
    if (rolled.is_err()) {
        return rolled;
    }
    return release(name);
}

bool Database::in_transaction() const {
    return db_ && sqlite3_get_autocommit(db_) == 0;
}

void Database::log_rollback_failure(const Result<void, Error>& rollback_result) {
    if (rollback_result.is_err()) {
        qCWarning(strataStorageLog) << "rollback failed:"
                   << QString::fromStdString(rollback_result.unwrap_err().message);
    }
}

Result<int, Error> Database::read_user_version() {
    auto value = query_value("PRAGMA user_version;");
    if (value.is_err()) {
        return Result<int, Error>::err(value.unwrap_err());
    }
    const int64_t stored = as_integer(value.unwrap()).value_or(0);
    if (stored < std::numeric_limits<int>::min() || stored > std::numeric_limits<int>::max()) {
        return Result<int, Error>::err(Error("user_version out of range: " + std::to_string(stored)));
    }
    return Result<int, Error>::ok(static_cast<int>(stored));
}

Result<void, Error> Database::write_user_version(int version) {
    return discard_count(execute("PRAGMA user_version = " + std::to_string(version) + ";"));
}

Result<bool, Error> Database::foreign_keys_enabled() {
    auto value = query_value("PRAGMA foreign_keys;");
    if (value.is_err()) {
        return Result<bool, Error>::err(value.unwrap_err());
    }
    return Result<bool, Error>::ok(as_integer(value.unwrap()).value_or(0) != 0);
}

Result<void, Error> Database::set_foreign_keys(bool enabled) {
    return discard_count(execute(enabled ? "PRAGMA foreign_keys = ON;"
                                         : "PRAGMA foreign_keys = OFF;"));
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

// ============================================================================
// TransactionScope implementation
// ============================================================================

TransactionScope::TransactionScope(Database& db, std::string savepoint_name)
    : db_(db), name_(std::move(savepoint_name)), nested_(db.in_transaction()) {
    status_ = nested_ ? db_.savepoint(name_) : db_.begin_transaction();
    active_ = status_.is_ok();
}

TransactionScope::~TransactionScope() {
    if (active_) {
        auto result = rollback();
        if (result.is_err()) {
            qCWarning(strataStorageLog) << "scope rollback failed:"
                       << QString::fromStdString(result.unwrap_err().message);
        }
    }
}

Result<void, Error> TransactionScope::commit() {
    if (!active_) {
        return Result<void, Error>::err(Error{"No active transaction"});
    }
    auto result = nested_ ? db_.release(name_) : db_.commit();
    if (result.is_ok()) {
        active_ = false;
    }
    return result;
}

Result<void, Error> TransactionScope::rollback() {
    if (!active_) {
        return Result<void, Error>::ok();
    }
    active_ = false;
    return nested_ ? db_.rollback_to(name_) : db_.rollback();
}

std::string escape_identifier(std::string_view identifier) {
    std::string out;
    out.reserve(identifier.size() + 2);
    out += '"';
    for (char c : identifier) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace strata::storage
