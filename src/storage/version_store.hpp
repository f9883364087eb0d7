#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <optional>

namespace strata::storage {

/**
 * VersionStore - The persisted "current schema version" of one schema.
 *
 * An empty identifier maps to the database header (PRAGMA user_version).
 * A non-empty identifier gets its own row in strata_schema_versions, so
 * several schemas can share one database file.
 */
class VersionStore {
public:
    static constexpr const char* TABLE_NAME = "strata_schema_versions";

    VersionStore(Database& db, std::string identifier)
        : db_(db), identifier_(std::move(identifier)) {}

    /**
     * The stored version. 0 when nothing was ever written; nullopt when the
     * stored value is not an integer in [0, INT_MAX] (corrupt bookkeeping).
     */
    [[nodiscard]] Result<std::optional<int>, Error> read();

    /**
     * Persist `version`. Runs inside whatever transaction is open.
     */
    [[nodiscard]] Result<void, Error> write(int version);

    [[nodiscard]] const std::string& identifier() const { return identifier_; }

private:
    Database& db_;
    std::string identifier_;

    [[nodiscard]] Result<bool, Error> table_exists();
    [[nodiscard]] Result<void, Error> ensure_table();
};

} // namespace strata::storage
