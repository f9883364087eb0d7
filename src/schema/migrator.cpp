#include "schema/migrator.hpp"
#include "schema/ddl.hpp"
#include "storage/introspection.hpp"
#include "core/logging.hpp"

#include <QDebug>
#include <QString>

namespace strata::schema {
namespace {

constexpr const char* SAVEPOINT_NAME = "strata_migration";

QString q(const std::string& s) {
    return QString::fromStdString(s);
}

Result<void, Error> exec(storage::Database& db, const std::string& sql) {
    if (migration_debug_enabled()) {
        qCInfo(strataMigrateLog) << "sql" << q(sql);
    }
    auto result = db.execute(sql);
    if (result.is_err()) {
        return Result<void, Error>::err(result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

} // namespace

Migrator::Migrator(const Schema& schema, storage::Database& db)
    : schema_(schema), db_(db), store_(db, schema.identifier()) {}

template<typename F>
Result<void, Error> Migrator::with_foreign_keys_off(F&& f) {
    // PRAGMA foreign_keys is a no-op inside a transaction.
    if (db_.in_transaction()) {
        return f();
    }

    auto enabled = db_.foreign_keys_enabled();
    if (enabled.is_err()) {
        return Result<void, Error>::err(enabled.unwrap_err());
    }
    if (!enabled.unwrap()) {
        return f();
    }

    auto off = db_.set_foreign_keys(false);
    if (off.is_err()) {
        return off;
    }

    auto result = f();

    auto on = db_.set_foreign_keys(true);
    if (on.is_err()) {
        qCWarning(strataMigrateLog) << "could not re-enable foreign keys:" << q(on.unwrap_err().message);
        if (result.is_ok()) {
            return on;
        }
    }
    return result;
}

Result<std::optional<Migrator::Plan>, Error> Migrator::determine_range(std::optional<int> to,
                                                                       const MigrateOptions& options) {
    using R = Result<std::optional<Plan>, Error>;

    const int latest = schema_.latest_version_number();
    const int target = to.value_or(latest);
    if (target < 0) {
        return R::err(Error::precondition("target version " + std::to_string(target) + " is negative"));
    }
    if (target > latest) {
        return R::err(Error::precondition(
            "target version " + std::to_string(target) + " is above the latest declared version " +
            std::to_string(latest)));
    }

    auto stored_result = store_.read();
    if (stored_result.is_err()) {
        return R::err(stored_result.unwrap_err());
    }
    const auto stored = stored_result.unwrap();

    Plan plan{.from = 0, .to = target, .drop_everything = false, .drop_known = false};

    if (!stored) {
        // Unreadable bookkeeping: start over, wiping only when asked to.
        qCWarning(strataMigrateLog) << "stored version of" << q(schema_.identifier()) << "is not a valid version";
        plan.drop_everything = options.reset_unknown_versions;
    } else if (*stored > latest) {
        if (!options.reset_unknown_versions) {
            return R::err(Error::precondition(
                "database is at version " + std::to_string(*stored) +
                ", which this schema does not declare (latest is " + std::to_string(latest) + ")"));
        }
        qCWarning(strataMigrateLog) << "unknown stored version" << *stored << "- resetting database";
        plan.drop_everything = true;
    } else {
        plan.from = *stored;
    }

    if (!plan.drop_everything && plan.from == target) {
        return R::ok(std::nullopt);
    }

    if (target < plan.from) {
        if (!options.reset_on_downgrade) {
            return R::err(Error::precondition(
                "database is at version " + std::to_string(plan.from) + "; going back to version " +
                std::to_string(target) + " requires a reset"));
        }
        plan.drop_known = true;
        plan.from = 0;
    }

    return R::ok(plan);
}

Result<bool, Error> Migrator::migrate(std::optional<int> to, const MigrateOptions& options) {
    install_file_logging();
    state_ = MigrationState::DeterminingRange;

    auto range = determine_range(to, options);
    if (range.is_err()) {
        state_ = MigrationState::Idle;
        return Result<bool, Error>::err(range.unwrap_err());
    }
    const auto plan = range.unwrap();
    if (!plan) {
        state_ = MigrationState::Idle;
        if (migration_debug_enabled()) {
            qCInfo(strataMigrateLog) << q(schema_.identifier()) << "already at version"
                    << to.value_or(schema_.latest_version_number());
        }
        return Result<bool, Error>::ok(false);
    }

    qCInfo(strataMigrateLog) << q(schema_.identifier()) << "from version" << plan->from
            << "to" << plan->to;

    state_ = MigrationState::ApplyingOperations;
    auto result = with_foreign_keys_off([&] { return run(*plan, options); });
    if (result.is_err()) {
        state_ = MigrationState::RolledBack;
        qCWarning(strataMigrateLog) << "rolled back:" << q(result.unwrap_err().describe());
        return Result<bool, Error>::err(result.unwrap_err());
    }

    state_ = MigrationState::Committed;
    qCInfo(strataMigrateLog) << q(schema_.identifier()) << "now at version" << plan->to;
    return Result<bool, Error>::ok(true);
}

Result<void, Error> Migrator::reset() {
    install_file_logging();
    qCInfo(strataMigrateLog) << "reset" << q(schema_.identifier());
    state_ = MigrationState::ApplyingOperations;

    auto result = with_foreign_keys_off([&]() -> Result<void, Error> {
        storage::TransactionScope scope(db_, SAVEPOINT_NAME);
        if (scope.status().is_err()) {
            return scope.status();
        }
        auto dropped = drop_known_objects();
        if (dropped.is_err()) {
            return dropped;
        }
        auto written = store_.write(0);
        if (written.is_err()) {
            return written;
        }
        return scope.commit();
    });

    if (result.is_err()) {
        state_ = MigrationState::RolledBack;
        qCWarning(strataMigrateLog) << "reset rolled back:" << q(result.unwrap_err().describe());
        return result;
    }
    state_ = MigrationState::Committed;
    return result;
}

Result<void, Error> Migrator::run(const Plan& plan, const MigrateOptions& options) {
    storage::TransactionScope scope(db_, SAVEPOINT_NAME);
    if (scope.status().is_err()) {
        return scope.status();
    }

    if (plan.drop_everything) {
        auto dropped = drop_all_objects();
        if (dropped.is_err()) {
            return dropped;
        }
    } else if (plan.drop_known) {
        auto dropped = drop_known_objects();
        if (dropped.is_err()) {
            return dropped;
        }
    }

    for (int number = plan.from + 1; number <= plan.to; ++number) {
        const Version* version = schema_.version(number);
        if (!version) {
            return Result<void, Error>::err(Error{"version " + std::to_string(number) + " is not declared"});
        }
        if (migration_debug_enabled()) {
            qCInfo(strataMigrateLog) << "applying version" << number
                    << "(" << static_cast<int>(version->operations.size()) << "operations )";
        }

        for (const auto& op : version->operations) {
            auto applied = apply(op, options);
            if (applied.is_err()) {
                return Result<void, Error>::err(applied.unwrap_err().during(number, describe(op)));
            }
        }
    }

    auto written = store_.write(plan.to);
    if (written.is_err()) {
        return written;
    }
    return scope.commit();
}

Result<void, Error> Migrator::apply(const Operation& op, const MigrateOptions& options) {
    if (migration_debug_enabled()) {
        qCInfo(strataMigrateLog) << q(describe(op));
    }

    if (const auto* execute = std::get_if<Execute>(&op)) {
        return execute->callback(db_);
    }

    for (const auto& sql : ddl::statements(op)) {
        auto result = exec(db_, sql);
        if (result.is_err()) {
            return result;
        }
    }

    if (const auto* rebuild = std::get_if<AlterTableRebuild>(&op); rebuild && options.check_foreign_keys) {
        return check_foreign_keys(rebuild->original_name);
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Migrator::check_foreign_keys(const std::string& table) {
    // Whole-database check: rows of other tables may reference the rebuilt one.
    // foreign_key_check rows: table, rowid, parent, fkid
    std::vector<std::string> violations;
    auto result = db_.query("PRAGMA foreign_key_check;", [&](storage::Statement& row) {
        violations.push_back("row " + row.column_text(1) + " of '" + row.column_text(0) +
                             "' references missing '" + row.column_text(2) + "'");
    });
    if (result.is_err()) {
        return result;
    }
    if (!violations.empty()) {
        std::string message = "foreign key violation after rebuilding '" + table + "': " + violations.front();
        if (violations.size() > 1) {
            message += " (and " + std::to_string(violations.size() - 1) + " more)";
        }
        return Result<void, Error>::err(Error{std::move(message), SQLITE_CONSTRAINT_FOREIGNKEY});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Migrator::drop_all_objects() {
    auto entries = storage::list_schema_entries(db_);
    if (entries.is_err()) {
        return Result<void, Error>::err(entries.unwrap_err());
    }

    for (const auto& entry : entries.unwrap()) {
        if (entry.is_index() && !entry.is_internal() && entry.sql) {
            auto result = exec(db_, ddl::drop_index(entry.name, true));
            if (result.is_err()) return result;
        }
    }
    for (const auto& entry : entries.unwrap()) {
        if (entry.is_table() && !entry.is_internal() && entry.name != storage::VersionStore::TABLE_NAME) {
            auto result = exec(db_, ddl::drop_table(entry.name, true));
            if (result.is_err()) return result;
        }
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Migrator::drop_known_objects() {
    for (const auto& name : schema_.known_index_names()) {
        auto result = exec(db_, ddl::drop_index(name, true));
        if (result.is_err()) return result;
    }
    for (const auto& name : schema_.known_table_names()) {
        auto result = exec(db_, ddl::drop_table(name, true));
        if (result.is_err()) return result;
    }
    return Result<void, Error>::ok();
}

} // namespace strata::schema
