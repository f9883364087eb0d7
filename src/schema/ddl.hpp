#pragma once

#include "schema/operation.hpp"
#include <string>
#include <vector>

namespace strata::schema::ddl {

// SQL text for each primitive. All identifiers are quoted; constraint,
// default, value and WHERE expressions are passed through verbatim.

[[nodiscard]] std::string column_definition(const Column& column, const Table& table);
[[nodiscard]] std::string constraint_definition(const Constraint& constraint);

/**
 * CREATE TABLE for `table`, under `name_override` when given (temp tables).
 */
[[nodiscard]] std::string create_table(const Table& table, const std::string& name_override = {});
[[nodiscard]] std::string drop_table(const std::string& name, bool if_exists);
[[nodiscard]] std::string rename_table(const std::string& from, const std::string& to);
[[nodiscard]] std::string add_column(const std::string& table_name, const Column& column);
[[nodiscard]] std::string create_index(const Index& index, bool if_not_exists = false);
[[nodiscard]] std::string drop_index(const std::string& name, bool if_exists);

/**
 * INSERT INTO target (...) SELECT ... FROM source, following `plan`.
 */
[[nodiscard]] std::string copy_rows(const std::string& source,
                                    const std::string& target,
                                    const std::vector<ColumnSource>& plan);

/**
 * Keeps target's sqlite_sequence counter at least as high as source's, so
 * AUTOINCREMENT ids of deleted rows stay retired after a rebuild.
 */
[[nodiscard]] std::vector<std::string> carry_sequence(const std::string& source, const std::string& target);

/**
 * Name of the scratch table a rebuild of `table_name` copies into.
 */
[[nodiscard]] std::string rebuild_temp_name(const std::string& table_name);

/**
 * The native statements an operation compiles to, in execution order.
 * Empty for Execute, which runs user code instead.
 */
[[nodiscard]] std::vector<std::string> statements(const Operation& op);

} // namespace strata::schema::ddl
