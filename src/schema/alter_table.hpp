#pragma once

#include "schema/table.hpp"
#include "schema/index.hpp"
#include "schema/operation.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata::schema {

/**
 * ColumnChange - Everything alter_column() can do to one column.
 *
 * `set_value` is a SQL expression evaluated against the old row during the
 * rebuild copy, e.g. "lower(email)" or "'unknown'".
 */
struct ColumnChange {
    std::optional<std::string> rename_to;
    std::optional<ColumnType> change_type_to;
    std::optional<std::vector<std::string>> set_constraints;
    std::optional<std::string> set_value;
};

namespace edit {

struct AddColumn {
    Column column;
    std::optional<std::string> initial_value;
};

struct AlterColumn {
    std::string name;
    ColumnChange change;
};

struct DropColumn {
    std::string name;
};

struct AddConstraint {
    Constraint constraint;
};

struct DropConstraintNamed {
    std::string name;
};

struct DropConstraint {
    std::string clause;
};

struct DropAllConstraints {};

} // namespace edit

using TableEdit = std::variant<
    edit::AddColumn,
    edit::AlterColumn,
    edit::DropColumn,
    edit::AddConstraint,
    edit::DropConstraintNamed,
    edit::DropConstraint,
    edit::DropAllConstraints
>;

/**
 * TableAlterer - Records the edits of one alter_table() block.
 *
 * Nothing is validated here; compile_alter_table() checks the edits against
 * the table and reports the first bad one.
 */
class TableAlterer {
public:
    TableAlterer& add_column(std::string name,
                             ColumnType type,
                             std::vector<std::string> constraints = {},
                             std::optional<std::string> initial_value = std::nullopt);

    TableAlterer& alter_column(std::string name, ColumnChange change);
    TableAlterer& drop_column(std::string name);

    TableAlterer& add_constraint(std::string clause, std::optional<std::string> name = std::nullopt);
    TableAlterer& drop_constraint_named(std::string name);
    TableAlterer& drop_constraint(std::string clause);
    TableAlterer& drop_all_constraints();

    [[nodiscard]] const std::vector<TableEdit>& edits() const { return edits_; }

private:
    std::vector<TableEdit> edits_;
};

/**
 * AlterPlan - The compiled result of one alter_table() block.
 */
struct AlterPlan {
    Table table;                       // structure after the block
    std::vector<Index> indexes;        // indexes on the table after the block
    std::vector<Operation> operations; // AddColumn..., or one AlterTableRebuild
};

/**
 * True when SQLite's ALTER TABLE ADD COLUMN accepts `column` as declared.
 */
[[nodiscard]] bool supports_native_add(const Column& column);

/**
 * Compile the edits of one block against `table` and its `indexes`.
 *
 * Edits that only append columns SQLite can add natively compile to one
 * AddColumn per column. Anything else collapses into a single rebuild.
 * alter_column() and drop_column() name columns as they were before the
 * block, or as declared when added earlier in the same block.
 */
[[nodiscard]] Result<AlterPlan, Error> compile_alter_table(const Table& table,
                                                           const std::vector<Index>& indexes,
                                                           const std::vector<TableEdit>& edits);

} // namespace strata::schema
