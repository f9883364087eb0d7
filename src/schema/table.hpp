#pragma once

#include "schema/column.hpp"
#include <string>
#include <vector>
#include <optional>

namespace strata::schema {

/**
 * Constraint - A table-level constraint clause, e.g. "UNIQUE (a, b)" or
 * "CHECK (age >= 0)", optionally named.
 */
struct Constraint {
    std::optional<std::string> name;
    std::string clause;

    bool operator==(const Constraint&) const = default;
};

/**
 * PrimaryKey - The single-column primary key of a table.
 */
struct PrimaryKey {
    std::string column;
    bool autoincrement{false};

    bool operator==(const PrimaryKey&) const = default;
};

/**
 * Table - One table of a schema snapshot.
 *
 * Column order is the physical order used for CREATE TABLE and for the
 * INSERT ... SELECT of a rebuild.
 */
struct Table {
    std::string name;
    std::vector<Column> columns;
    std::vector<Constraint> constraints;
    std::optional<PrimaryKey> primary_key;

    [[nodiscard]] const Column* column(const std::string& column_name) const;
    [[nodiscard]] std::optional<size_t> index_of_column(const std::string& column_name) const;
    [[nodiscard]] std::vector<std::string> column_names() const;

    [[nodiscard]] std::optional<size_t> index_of_constraint_named(const std::string& constraint_name) const;
    [[nodiscard]] std::optional<size_t> index_of_constraint_clause(const std::string& clause) const;

    [[nodiscard]] bool is_primary_key(const std::string& column_name) const {
        return primary_key && primary_key->column == column_name;
    }

    bool operator==(const Table&) const = default;
};

} // namespace strata::schema
