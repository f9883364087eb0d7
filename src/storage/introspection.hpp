#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>
#include <optional>

namespace strata::storage {

/**
 * One row of sqlite_master: a table, index, view or trigger.
 */
struct SchemaEntry {
    std::string type;        // "table", "index", "view", "trigger"
    std::string name;
    std::string table_name;  // indexed/triggering table; equals name for tables
    std::optional<std::string> sql;  // null for automatic indexes

    [[nodiscard]] bool is_table() const { return type == "table"; }
    [[nodiscard]] bool is_index() const { return type == "index"; }
    [[nodiscard]] bool is_internal() const { return name.rfind("sqlite_", 0) == 0; }
};

/**
 * A column as reported by PRAGMA table_info.
 */
struct ColumnInfo {
    int position{0};
    std::string name;
    std::string declared_type;
    bool not_null{false};
    std::optional<std::string> default_value;
    int primary_key_index{0};  // 0 when not part of the primary key
};

/**
 * An index as reported by PRAGMA index_list + PRAGMA index_info.
 */
struct IndexInfo {
    std::string name;
    bool unique{false};
    bool partial{false};
    std::string origin;  // "c" (CREATE INDEX), "u" (UNIQUE), "pk"
    std::vector<std::string> columns;
};

[[nodiscard]] Result<std::vector<SchemaEntry>, Error> list_schema_entries(Database& db);

/**
 * Columns of `table` in physical order. Empty when the table doesn't exist.
 */
[[nodiscard]] Result<std::vector<ColumnInfo>, Error> table_columns(Database& db, const std::string& table);

[[nodiscard]] Result<std::vector<IndexInfo>, Error> table_indexes(Database& db, const std::string& table);

} // namespace strata::storage
