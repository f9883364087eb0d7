#include "storage/version_store.hpp"

#include <limits>

namespace strata::storage {
namespace {

// Stored counters outside [0, INT_MAX] are not versions this engine wrote.
std::optional<int> checked_version(int64_t stored) {
    if (stored < 0 || stored > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(stored);
}

} // namespace

Result<bool, Error> VersionStore::table_exists() {
    auto stmt_result = db_.prepare(
        "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_text(1, TABLE_NAME);
    if (bind_result.is_err()) {
        return Result<bool, Error>::err(bind_result.unwrap_err());
    }
    return stmt.step();
}

Result<void, Error> VersionStore::ensure_table() {
    auto result = db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS strata_schema_versions (
            identifier TEXT PRIMARY KEY,
            version INTEGER NOT NULL
        );
    )SQL");
    if (result.is_err()) {
        return Result<void, Error>::err(result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<std::optional<int>, Error> VersionStore::read() {
    if (identifier_.empty()) {
        auto version = db_.read_user_version();
        if (version.is_err()) {
            return Result<std::optional<int>, Error>::err(version.unwrap_err());
        }
        return Result<std::optional<int>, Error>::ok(checked_version(version.unwrap()));
    }

    // Reading must not create the bookkeeping table.
    auto exists = table_exists();
    if (exists.is_err()) {
        return Result<std::optional<int>, Error>::err(exists.unwrap_err());
    }
    if (!exists.unwrap()) {
        return Result<std::optional<int>, Error>::ok(0);
    }

    auto stmt_result = db_.prepare(
        "SELECT version FROM strata_schema_versions WHERE identifier = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<int>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_text(1, identifier_);
    if (bind_result.is_err()) {
        return Result<std::optional<int>, Error>::err(bind_result.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<int>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<int>, Error>::ok(0);
    }

    auto stored = as_integer(stmt.column_value(0));
    if (!stored) {
        return Result<std::optional<int>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<int>, Error>::ok(checked_version(*stored));
}

Result<void, Error> VersionStore::write(int version) {
    if (identifier_.empty()) {
        return db_.write_user_version(version);
    }

    auto ensure_result = ensure_table();
    if (ensure_result.is_err()) {
        return ensure_result;
    }

    auto stmt_result = db_.prepare(
        "INSERT OR REPLACE INTO strata_schema_versions (identifier, version) VALUES (?, ?);");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_id = stmt.bind_text(1, identifier_);
    if (bind_id.is_err()) {
        return bind_id;
    }
    auto bind_version = stmt.bind_int64(2, version);
    if (bind_version.is_err()) {
        return bind_version;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }

    return Result<void, Error>::ok();
}

} // namespace strata::storage
