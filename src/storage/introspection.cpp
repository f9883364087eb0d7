#include "storage/introspection.hpp"

namespace strata::storage {

Result<std::vector<SchemaEntry>, Error> list_schema_entries(Database& db) {
    std::vector<SchemaEntry> entries;

    auto result = db.query(
        "SELECT type, name, tbl_name, sql FROM sqlite_master ORDER BY rowid;",
        [&](Statement& stmt) {
            SchemaEntry entry{
                .type = stmt.column_text(0),
                .name = stmt.column_text(1),
                .table_name = stmt.column_text(2),
                .sql = std::nullopt
            };
            if (!stmt.column_is_null(3)) {
                entry.sql = stmt.column_text(3);
            }
            entries.push_back(std::move(entry));
        });
    if (result.is_err()) {
        return Result<std::vector<SchemaEntry>, Error>::err(result.unwrap_err());
    }

    return Result<std::vector<SchemaEntry>, Error>::ok(std::move(entries));
}

Result<std::vector<ColumnInfo>, Error> table_columns(Database& db, const std::string& table) {
    std::vector<ColumnInfo> columns;

    auto result = db.query(
        "PRAGMA table_info(" + escape_identifier(table) + ");",
        [&](Statement& stmt) {
            ColumnInfo info{
                .position = stmt.column_int(0),
                .name = stmt.column_text(1),
                .declared_type = stmt.column_text(2),
                .not_null = stmt.column_int(3) != 0,
                .default_value = std::nullopt,
                .primary_key_index = stmt.column_int(5)
            };
            if (!stmt.column_is_null(4)) {
                info.default_value = stmt.column_text(4);
            }
            columns.push_back(std::move(info));
        });
    if (result.is_err()) {
        return Result<std::vector<ColumnInfo>, Error>::err(result.unwrap_err());
    }

    return Result<std::vector<ColumnInfo>, Error>::ok(std::move(columns));
}

Result<std::vector<IndexInfo>, Error> table_indexes(Database& db, const std::string& table) {
    std::vector<IndexInfo> indexes;

    // index_list columns: seq, name, unique, origin, partial
    auto list_result = db.query(
        "PRAGMA index_list(" + escape_identifier(table) + ");",
        [&](Statement& stmt) {
            indexes.push_back(IndexInfo{
                .name = stmt.column_text(1),
                .unique = stmt.column_int(2) != 0,
                .partial = stmt.column_int(4) != 0,
                .origin = stmt.column_text(3),
                .columns = {}
            });
        });
    if (list_result.is_err()) {
        return Result<std::vector<IndexInfo>, Error>::err(list_result.unwrap_err());
    }

    // index_info columns: seqno, cid, name
    for (auto& index : indexes) {
        auto info_result = db.query(
            "PRAGMA index_info(" + escape_identifier(index.name) + ");",
            [&](Statement& stmt) {
                index.columns.push_back(stmt.column_text(2));
            });
        if (info_result.is_err()) {
            return Result<std::vector<IndexInfo>, Error>::err(info_result.unwrap_err());
        }
    }

    return Result<std::vector<IndexInfo>, Error>::ok(std::move(indexes));
}

} // namespace strata::storage
