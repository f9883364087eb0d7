#pragma once

#include "schema/schema.hpp"
#include "storage/database.hpp"
#include "storage/version_store.hpp"
#include "core/result.hpp"
#include <optional>

namespace strata::schema {

enum class MigrationState {
    Idle,
    DeterminingRange,
    ApplyingOperations,
    Committed,
    RolledBack
};

[[nodiscard]] constexpr const char* state_name(MigrationState state) {
    switch (state) {
        case MigrationState::Idle: return "idle";
        case MigrationState::DeterminingRange: return "determining range";
        case MigrationState::ApplyingOperations: return "applying operations";
        case MigrationState::Committed: return "committed";
        case MigrationState::RolledBack: return "rolled back";
    }
    return "unknown";
}

/**
 * Migrator - Applies a schema's versions to one database connection.
 *
 * All work of one run happens inside a single transaction (a savepoint when
 * the caller already has one open); the stored version is written last.
 * Foreign key enforcement is switched off for the duration of a top-level
 * run, since a table rebuild drops and recreates referenced tables.
 */
class Migrator {
public:
    Migrator(const Schema& schema, storage::Database& db);

    [[nodiscard]] Result<bool, Error> migrate(std::optional<int> to, const MigrateOptions& options);
    [[nodiscard]] Result<void, Error> reset();

    [[nodiscard]] MigrationState state() const { return state_; }

    /**
     * Execute one operation. Failures come back untagged; migrate() adds
     * the version and operation context.
     */
    [[nodiscard]] Result<void, Error> apply(const Operation& op, const MigrateOptions& options);

private:
    struct Plan {
        int from{0};
        int to{0};
        bool drop_everything{false};   // unknown stored version
        bool drop_known{false};        // downgrade
    };

    [[nodiscard]] Result<std::optional<Plan>, Error> determine_range(std::optional<int> to,
                                                                     const MigrateOptions& options);

    template<typename F>
    [[nodiscard]] Result<void, Error> with_foreign_keys_off(F&& f);

    [[nodiscard]] Result<void, Error> run(const Plan& plan, const MigrateOptions& options);
    [[nodiscard]] Result<void, Error> drop_all_objects();
    [[nodiscard]] Result<void, Error> drop_known_objects();
    [[nodiscard]] Result<void, Error> check_foreign_keys(const std::string& table);

    const Schema& schema_;
    storage::Database& db_;
    storage::VersionStore store_;
    MigrationState state_ = MigrationState::Idle;
};

} // namespace strata::schema
