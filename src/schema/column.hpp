#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace strata::schema {

/**
 * Declared column type. Null declares no type at all (no affinity).
 */
enum class ColumnType {
    Integer,
    Real,
    Text,
    Blob,
    Null
};

[[nodiscard]] constexpr std::string_view type_keyword(ColumnType type) {
    switch (type) {
        case ColumnType::Integer: return "INTEGER";
        case ColumnType::Real: return "REAL";
        case ColumnType::Text: return "TEXT";
        case ColumnType::Blob: return "BLOB";
        case ColumnType::Null: return "";
    }
    return "";
}

/**
 * Column - One column of a table at a particular version.
 *
 * Constraints are raw SQL clauses ("NOT NULL", "DEFAULT 0") kept in
 * declaration order; the generated DDL emits them in that order.
 */
struct Column {
    std::string name;
    ColumnType type{ColumnType::Text};
    std::vector<std::string> constraints;

    /**
     * The default term of the first clause naming DEFAULT, if any:
     * "DEFAULT 0" -> "0", "NOT NULL DEFAULT (1 + 2) CHECK (x)" -> "(1 + 2)".
     */
    [[nodiscard]] std::optional<std::string> default_value() const;

    [[nodiscard]] bool has_constraint(std::string_view keyword) const;

    bool operator==(const Column&) const = default;
};

/**
 * Case-insensitive search for a keyword at word boundaries,
 * e.g. contains_keyword("not null default 0", "NOT NULL") == true.
 */
[[nodiscard]] bool contains_keyword(std::string_view clause, std::string_view keyword);

} // namespace strata::schema
