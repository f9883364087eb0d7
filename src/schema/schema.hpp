#pragma once

#include "schema/version.hpp"
#include "storage/database.hpp"
#include "core/result.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace strata::schema {

using VersionDeclaration = std::function<void(VersionBuilder&)>;

/**
 * SchemaBuilder - Collects the version declarations of a schema, in order.
 */
class SchemaBuilder {
public:
    SchemaBuilder& version(int number, VersionDeclaration declare);

    struct Entry {
        int number;
        VersionDeclaration declare;
    };

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }

private:
    std::vector<Entry> entries_;
};

/**
 * MigrateOptions - Policies for the database states migrate() can't
 * reach by walking forward.
 */
struct MigrateOptions {
    // Stored version is corrupt or newer than any declared version:
    // drop every table and index in the database and start from version 1.
    bool reset_unknown_versions{false};

    // Target below the stored version: drop everything this schema knows
    // about and replay from version 1. Without it a downgrade is refused.
    bool reset_on_downgrade{false};

    // Run PRAGMA foreign_key_check on every rebuilt table.
    bool check_foreign_keys{true};
};

/**
 * Schema - An ordered, immutable sequence of versions.
 *
 * Snapshots are resolved on first request and memoized; resolving version N
 * replays the declarations of 1..N. create() resolves every version so
 * declaration errors surface before anything touches a database.
 *
 * Usage:
 *   auto schema = Schema::create("app", [](SchemaBuilder& s) {
 *       s.version(1, [](VersionBuilder& v) {
 *           v.create_table("people", [](TableBuilder& t) {
 *               t.primary_key("id");
 *               t.column("name", ColumnType::Text, {"NOT NULL"});
 *           });
 *       });
 *   });
 *   auto migrated = schema.unwrap().migrate(db);
 */
class Schema {
public:
    [[nodiscard]] static Result<Schema, Error> create(std::string identifier,
                                                      const std::function<void(SchemaBuilder&)>& declare);

    Schema(Schema&&) noexcept = default;
    Schema& operator=(Schema&&) noexcept = default;

    [[nodiscard]] const std::string& identifier() const { return identifier_; }

    /**
     * Highest declared version number, 0 for a schema with no versions.
     */
    [[nodiscard]] int latest_version_number() const { return static_cast<int>(declarations_.size()); }

    /**
     * Version `number`, or nullptr when it isn't declared.
     */
    [[nodiscard]] const Version* version(int number) const;
    [[nodiscard]] const Version* latest_version() const;

    // Inspection of the latest snapshot.
    [[nodiscard]] std::vector<std::string> table_names() const;
    [[nodiscard]] std::vector<std::string> index_names() const;
    [[nodiscard]] const Table* table(const std::string& name) const;
    [[nodiscard]] const Index* index(const std::string& name) const;

    /**
     * Every table / index name that appears in any version's snapshot.
     */
    [[nodiscard]] std::vector<std::string> known_table_names() const;
    [[nodiscard]] std::vector<std::string> known_index_names() const;

    /**
     * Bring `db` to version `to` (latest when omitted). Returns false when
     * the database was already there.
     */
    [[nodiscard]] Result<bool, Error> migrate(storage::Database& db,
                                              std::optional<int> to = std::nullopt,
                                              const MigrateOptions& options = {}) const;

    /**
     * Drop every table and index known to any version and record version 0.
     */
    [[nodiscard]] Result<void, Error> reset(storage::Database& db) const;

private:
    Schema(std::string identifier, std::vector<VersionDeclaration> declarations);

    [[nodiscard]] Result<const Version*, Error> resolve(int number) const;

    struct Arena {
        std::mutex mutex;
        std::vector<std::unique_ptr<Version>> versions;
    };

    std::string identifier_;
    std::vector<VersionDeclaration> declarations_;
    std::unique_ptr<Arena> arena_;
};

} // namespace strata::schema
