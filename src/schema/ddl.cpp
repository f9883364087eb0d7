#include "schema/ddl.hpp"
#include "storage/database.hpp"
#include "core/value.hpp"

namespace strata::schema::ddl {

using storage::escape_identifier;

namespace {

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

std::string column_definition(const Column& column, const Table& table) {
    std::string def = escape_identifier(column.name);

    const auto keyword = type_keyword(column.type);
    if (!keyword.empty()) {
        def += ' ';
        def += keyword;
    }

    if (table.is_primary_key(column.name)) {
        def += " PRIMARY KEY";
        if (table.primary_key->autoincrement) {
            def += " AUTOINCREMENT";
        }
    }

    for (const auto& c : column.constraints) {
        def += ' ';
        def += c;
    }
    return def;
}

std::string constraint_definition(const Constraint& constraint) {
    if (constraint.name) {
        return "CONSTRAINT " + escape_identifier(*constraint.name) + " " + constraint.clause;
    }
    return constraint.clause;
}

std::string create_table(const Table& table, const std::string& name_override) {
    std::vector<std::string> definitions;
    definitions.reserve(table.columns.size() + table.constraints.size());
    for (const auto& column : table.columns) {
        definitions.push_back(column_definition(column, table));
    }
    for (const auto& constraint : table.constraints) {
        definitions.push_back(constraint_definition(constraint));
    }

    const auto& name = name_override.empty() ? table.name : name_override;
    return "CREATE TABLE " + escape_identifier(name) + " (" + join(definitions, ", ") + ")";
}

std::string drop_table(const std::string& name, bool if_exists) {
    return std::string("DROP TABLE ") + (if_exists ? "IF EXISTS " : "") + escape_identifier(name);
}

std::string rename_table(const std::string& from, const std::string& to) {
    return "ALTER TABLE " + escape_identifier(from) + " RENAME TO " + escape_identifier(to);
}

std::string add_column(const std::string& table_name, const Column& column) {
    // A native ADD COLUMN never carries the primary key.
    const Table no_key{.name = table_name, .columns = {}, .constraints = {}, .primary_key = std::nullopt};
    return "ALTER TABLE " + escape_identifier(table_name) + " ADD COLUMN " +
           column_definition(column, no_key);
}

std::string create_index(const Index& index, bool if_not_exists) {
    std::vector<std::string> columns;
    columns.reserve(index.columns.size());
    for (const auto& c : index.columns) {
        columns.push_back(escape_identifier(c));
    }

    std::string sql = "CREATE ";
    if (index.unique) sql += "UNIQUE ";
    sql += "INDEX ";
    if (if_not_exists) sql += "IF NOT EXISTS ";
    sql += escape_identifier(index.name) + " ON " + escape_identifier(index.table_name) +
           " (" + join(columns, ", ") + ")";
    if (index.where_clause) {
        sql += " WHERE " + *index.where_clause;
    }
    return sql;
}

std::string drop_index(const std::string& name, bool if_exists) {
    return std::string("DROP INDEX ") + (if_exists ? "IF EXISTS " : "") + escape_identifier(name);
}

std::string copy_rows(const std::string& source,
                      const std::string& target,
                      const std::vector<ColumnSource>& plan) {
    std::vector<std::string> columns;
    std::vector<std::string> expressions;
    columns.reserve(plan.size());
    expressions.reserve(plan.size());
    for (const auto& entry : plan) {
        columns.push_back(escape_identifier(entry.column));
        expressions.push_back(entry.expression);
    }

    if (plan.empty()) {
        // Every surviving column is new: one row of defaults per source row.
        return "INSERT INTO " + escape_identifier(target) +
               " (rowid) SELECT rowid FROM " + escape_identifier(source);
    }

    return "INSERT INTO " + escape_identifier(target) + " (" + join(columns, ", ") +
           ") SELECT " + join(expressions, ", ") + " FROM " + escape_identifier(source);
}

std::vector<std::string> carry_sequence(const std::string& source, const std::string& target) {
    const auto src = to_sql_literal(Value{source});
    const auto dst = to_sql_literal(Value{target});
    return {
        "UPDATE sqlite_sequence SET seq = (SELECT max(seq) FROM sqlite_sequence WHERE name IN (" +
            src + ", " + dst + ")) WHERE name = " + dst,
        "INSERT INTO sqlite_sequence (name, seq) SELECT " + dst + ", seq FROM sqlite_sequence"
            " WHERE name = " + src + " AND NOT EXISTS (SELECT 1 FROM sqlite_sequence WHERE name = " +
            dst + ")",
    };
}

std::string rebuild_temp_name(const std::string& table_name) {
    return "strata_rebuild_" + table_name;
}

std::vector<std::string> statements(const Operation& op) {
    return std::visit([](const auto& o) -> std::vector<std::string> {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, CreateTable>) {
            return {create_table(o.table)};
        } else if constexpr (std::is_same_v<T, DropTable>) {
            return {drop_table(o.name, o.if_exists)};
        } else if constexpr (std::is_same_v<T, RenameTable>) {
            return {rename_table(o.from, o.to)};
        } else if constexpr (std::is_same_v<T, AddColumn>) {
            return {add_column(o.table_name, o.column)};
        } else if constexpr (std::is_same_v<T, AlterTableRebuild>) {
            const auto temp = rebuild_temp_name(o.original_name);
            std::vector<std::string> out{
                drop_table(temp, true),
                create_table(o.final_table, temp),
                copy_rows(o.original_name, temp, o.column_plan),
            };
            if (o.final_table.primary_key && o.final_table.primary_key->autoincrement) {
                for (auto& sql : carry_sequence(o.original_name, temp)) {
                    out.push_back(std::move(sql));
                }
            }
            out.push_back(drop_table(o.original_name, false));
            out.push_back(rename_table(temp, o.original_name));
            for (const auto& index : o.indexes_to_recreate) {
                out.push_back(create_index(index));
            }
            return out;
        } else if constexpr (std::is_same_v<T, CreateIndex>) {
            return {create_index(o.index, o.if_not_exists)};
        } else if constexpr (std::is_same_v<T, DropIndex>) {
            return {drop_index(o.name, o.if_exists)};
        } else if constexpr (std::is_same_v<T, RenameIndex>) {
            return {drop_index(o.from, false), create_index(o.renamed)};
        } else {
            return {};
        }
    }, op);
}

} // namespace strata::schema::ddl
