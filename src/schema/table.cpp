#include "schema/table.hpp"

namespace strata::schema {

const Column* Table::column(const std::string& column_name) const {
    for (const auto& c : columns) {
        if (c.name == column_name) return &c;
    }
    return nullptr;
}

std::optional<size_t> Table::index_of_column(const std::string& column_name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].name == column_name) return i;
    }
    return std::nullopt;
}

std::vector<std::string> Table::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& c : columns) {
        names.push_back(c.name);
    }
    return names;
}

std::optional<size_t> Table::index_of_constraint_named(const std::string& constraint_name) const {
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (constraints[i].name && *constraints[i].name == constraint_name) return i;
    }
    return std::nullopt;
}

std::optional<size_t> Table::index_of_constraint_clause(const std::string& clause) const {
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (constraints[i].clause == clause) return i;
    }
    return std::nullopt;
}

} // namespace strata::schema
