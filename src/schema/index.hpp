#pragma once

#include <string>
#include <vector>
#include <optional>
#include <algorithm>

namespace strata::schema {

/**
 * Index - A CREATE INDEX on one table.
 *
 * Index names share one namespace per snapshot, separate from table names.
 * `where_clause` makes it a partial index; it is raw SQL and is never
 * rewritten when columns are renamed.
 */
struct Index {
    std::string name;
    std::string table_name;
    std::vector<std::string> columns;
    bool unique{false};
    std::optional<std::string> where_clause;

    [[nodiscard]] bool covers(const std::string& column) const {
        return std::find(columns.begin(), columns.end(), column) != columns.end();
    }

    bool operator==(const Index&) const = default;
};

/**
 * Optional parts of a create_index() declaration.
 */
struct IndexOptions {
    bool unique{false};
    std::optional<std::string> where;
};

} // namespace strata::schema
