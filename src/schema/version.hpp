#pragma once

#include "schema/snapshot.hpp"
#include "schema/operation.hpp"
#include "schema/alter_table.hpp"
#include "core/result.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace strata::schema {

/**
 * Version - One immutable step of a schema.
 *
 * `snapshot` is the schema as it stands after this version; `operations`
 * take a database from the previous version's snapshot to this one.
 */
struct Version {
    int number{0};
    Snapshot snapshot;
    std::vector<Operation> operations;
};

/**
 * TableBuilder - The body of a create_table() block.
 */
class TableBuilder {
public:
    explicit TableBuilder(std::string name);

    /**
     * Adds an INTEGER column and makes it the table's primary key.
     */
    TableBuilder& primary_key(std::string name, bool autoincrement = false);

    TableBuilder& column(std::string name, ColumnType type, std::vector<std::string> constraints = {});

    TableBuilder& constraint(std::string clause, std::optional<std::string> name = std::nullopt);

    [[nodiscard]] const Table& table() const { return table_; }
    [[nodiscard]] const std::optional<Error>& error() const { return error_; }

private:
    void fail(std::string message);

    Table table_;
    std::optional<Error> error_;
};

/**
 * VersionBuilder - The declaration surface of one version.
 *
 * Each call edits a working copy of the previous snapshot and records the
 * operations that perform the same edit on a database. The first bad call
 * is remembered and every later call is ignored; Schema::create() reports
 * it.
 */
class VersionBuilder {
public:
    VersionBuilder(int number, Snapshot previous);

    VersionBuilder& create_table(const std::string& name, const std::function<void(TableBuilder&)>& block);
    VersionBuilder& drop_table(const std::string& name, bool if_exists = false);
    VersionBuilder& rename_table(const std::string& from, const std::string& to);
    VersionBuilder& alter_table(const std::string& name, const std::function<void(TableAlterer&)>& block);

    VersionBuilder& create_index(const std::string& name,
                                 const std::string& table_name,
                                 std::vector<std::string> columns,
                                 IndexOptions options = {});
    VersionBuilder& drop_index(const std::string& name, bool if_exists = false);
    VersionBuilder& rename_index(const std::string& from, const std::string& to);

    VersionBuilder& execute(std::string description, ExecuteFn callback);

    [[nodiscard]] int number() const { return number_; }
    [[nodiscard]] const Snapshot& snapshot() const { return snapshot_; }
    [[nodiscard]] const std::optional<Error>& error() const { return error_; }

    /**
     * The finished version, or the first declaration error.
     */
    [[nodiscard]] Result<Version, Error> build() &&;

private:
    void fail(std::string message);
    [[nodiscard]] bool failed() const { return error_.has_value(); }

    int number_;
    Snapshot snapshot_;
    std::vector<Operation> operations_;
    std::optional<Error> error_;
};

} // namespace strata::schema
