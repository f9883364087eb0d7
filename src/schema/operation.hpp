#pragma once

#include "schema/table.hpp"
#include "schema/index.hpp"
#include "core/result.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata::storage {
class Database;
}

namespace strata::schema {

/**
 * Operations - the primitive steps a migration is made of.
 *
 * The version builder and the alter-table compiler exist only to produce
 * these; the migrator is the only thing that executes them.
 */

struct CreateTable {
    Table table;
};

struct DropTable {
    std::string name;
    bool if_exists{false};
};

struct RenameTable {
    std::string from;
    std::string to;
};

/**
 * Native ALTER TABLE ... ADD COLUMN (the additive-only path).
 */
struct AddColumn {
    std::string table_name;
    Column column;
};

/**
 * Where one column of a rebuilt table takes its values from: an old column
 * name (escaped) or a raw SQL expression evaluated against the old row.
 */
struct ColumnSource {
    std::string column;
    std::string expression;

    bool operator==(const ColumnSource&) const = default;
};

/**
 * Create-temp / copy / drop-original / rename-into-place, then recreate the
 * surviving indexes. Executed as one unit.
 */
struct AlterTableRebuild {
    std::string original_name;
    Table final_table;
    std::vector<ColumnSource> column_plan;      // columns absent here take their DEFAULT
    std::vector<Index> indexes_to_recreate;     // after the rename, in this order
    std::vector<std::string> dropped_indexes;   // lost a column; gone with the old table
};

struct CreateIndex {
    Index index;
    bool if_not_exists{false};
};

struct DropIndex {
    std::string name;
    bool if_exists{false};
};

/**
 * SQLite cannot rename an index; this drops `from` and creates `renamed`.
 */
struct RenameIndex {
    std::string from;
    Index renamed;
};

using ExecuteFn = std::function<Result<void, Error>(storage::Database&)>;

/**
 * Opaque user step. The schema model cannot see what it does.
 */
struct Execute {
    std::string description;
    ExecuteFn callback;
};

using Operation = std::variant<
    CreateTable,
    DropTable,
    RenameTable,
    AddColumn,
    AlterTableRebuild,
    CreateIndex,
    DropIndex,
    RenameIndex,
    Execute
>;

enum class OperationKind {
    CreateTable,
    DropTable,
    RenameTable,
    AddColumn,
    AlterTableRebuild,
    CreateIndex,
    DropIndex,
    RenameIndex,
    Execute
};

[[nodiscard]] OperationKind kind_of(const Operation& op);

[[nodiscard]] constexpr std::string_view kind_name(OperationKind kind) {
    switch (kind) {
        case OperationKind::CreateTable: return "create table";
        case OperationKind::DropTable: return "drop table";
        case OperationKind::RenameTable: return "rename table";
        case OperationKind::AddColumn: return "add column";
        case OperationKind::AlterTableRebuild: return "rebuild table";
        case OperationKind::CreateIndex: return "create index";
        case OperationKind::DropIndex: return "drop index";
        case OperationKind::RenameIndex: return "rename index";
        case OperationKind::Execute: return "execute";
    }
    return "unknown";
}

/**
 * Short label naming the operation and its target, e.g.
 * "rebuild table 'people'" or "execute 'backfill emails'".
 */
[[nodiscard]] std::string describe(const Operation& op);

} // namespace strata::schema
