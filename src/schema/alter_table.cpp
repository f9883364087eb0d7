#include "schema/alter_table.hpp"
#include "schema/index_remap.hpp"
#include "storage/database.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace strata::schema {

TableAlterer& TableAlterer::add_column(std::string name,
                                       ColumnType type,
                                       std::vector<std::string> constraints,
                                       std::optional<std::string> initial_value) {
    edits_.emplace_back(edit::AddColumn{
        .column = Column{.name = std::move(name), .type = type, .constraints = std::move(constraints)},
        .initial_value = std::move(initial_value),
    });
    return *this;
}

TableAlterer& TableAlterer::alter_column(std::string name, ColumnChange change) {
    edits_.emplace_back(edit::AlterColumn{.name = std::move(name), .change = std::move(change)});
    return *this;
}

TableAlterer& TableAlterer::drop_column(std::string name) {
    edits_.emplace_back(edit::DropColumn{.name = std::move(name)});
    return *this;
}

TableAlterer& TableAlterer::add_constraint(std::string clause, std::optional<std::string> name) {
    edits_.emplace_back(edit::AddConstraint{
        .constraint = Constraint{.name = std::move(name), .clause = std::move(clause)},
    });
    return *this;
}

TableAlterer& TableAlterer::drop_constraint_named(std::string name) {
    edits_.emplace_back(edit::DropConstraintNamed{.name = std::move(name)});
    return *this;
}

TableAlterer& TableAlterer::drop_constraint(std::string clause) {
    edits_.emplace_back(edit::DropConstraint{.clause = std::move(clause)});
    return *this;
}

TableAlterer& TableAlterer::drop_all_constraints() {
    edits_.emplace_back(edit::DropAllConstraints{});
    return *this;
}

namespace {

std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

Error no_such_column(const std::string& column, const std::string& table) {
    return Error::declaration("no column '" + column + "' in table '" + table + "'");
}

Error column_exists(const std::string& column, const std::string& table) {
    return Error::declaration("column '" + column + "' already exists in table '" + table + "'");
}

// Where the values of one column of the rebuilt table come from.
struct Slot {
    std::optional<std::string> source;      // pre-edit column name
    std::optional<std::string> expression;  // set_value / initial value
};

/**
 * Working state of a rebuild: the table being edited, a slot per column,
 * and the bookkeeping that lets edits address columns by their old names.
 */
class RebuildState {
public:
    explicit RebuildState(const Table& table) : table_(table) {
        for (const auto& c : table.columns) {
            slots_.push_back(Slot{.source = c.name, .expression = std::nullopt});
            handles_.insert_or_assign(c.name, c.name);
        }
    }

    Result<void, Error> apply(const TableEdit& e) {
        return std::visit([this](const auto& ed) { return apply_one(ed); }, e);
    }

    [[nodiscard]] const Table& table() const { return table_; }
    [[nodiscard]] const ColumnMapping& mapping() const { return mapping_; }

    [[nodiscard]] std::vector<ColumnSource> column_plan() const {
        std::vector<ColumnSource> plan;
        for (size_t i = 0; i < table_.columns.size(); ++i) {
            const auto& slot = slots_[i];
            if (slot.expression) {
                plan.push_back({table_.columns[i].name, *slot.expression});
            } else if (slot.source) {
                plan.push_back({table_.columns[i].name, storage::escape_identifier(*slot.source)});
            }
        }
        return plan;
    }

private:
    Result<size_t, Error> resolve(const std::string& handle) const {
        auto it = handles_.find(handle);
        if (it == handles_.end()) {
            return Result<size_t, Error>::err(no_such_column(handle, table_.name));
        }
        auto pos = table_.index_of_column(it->second);
        if (!pos) {
            return Result<size_t, Error>::err(no_such_column(handle, table_.name));
        }
        return Result<size_t, Error>::ok(*pos);
    }

    Result<void, Error> apply_one(const edit::AddColumn& ed) {
        if (table_.column(ed.column.name)) {
            return Result<void, Error>::err(column_exists(ed.column.name, table_.name));
        }
        table_.columns.push_back(ed.column);
        slots_.push_back(Slot{.source = std::nullopt, .expression = ed.initial_value});
        handles_.insert_or_assign(ed.column.name, ed.column.name);
        return Result<void, Error>::ok();
    }

    Result<void, Error> apply_one(const edit::AlterColumn& ed) {
        auto pos_result = resolve(ed.name);
        if (pos_result.is_err()) {
            return Result<void, Error>::err(pos_result.unwrap_err());
        }
        const size_t pos = pos_result.unwrap();
        auto& column = table_.columns[pos];
        const auto& change = ed.change;

        if (change.rename_to && *change.rename_to != column.name) {
            if (table_.column(*change.rename_to)) {
                return Result<void, Error>::err(column_exists(*change.rename_to, table_.name));
            }
            if (table_.is_primary_key(column.name)) {
                table_.primary_key->column = *change.rename_to;
            }
            if (slots_[pos].source) {
                mapping_.rename(*slots_[pos].source, *change.rename_to);
            }
            column.name = *change.rename_to;
            handles_.insert_or_assign(ed.name, column.name);
        }
        if (change.change_type_to) {
            column.type = *change.change_type_to;
        }
        if (change.set_constraints) {
            column.constraints = *change.set_constraints;
        }
        if (change.set_value) {
            slots_[pos].expression = change.set_value;
        }
        return Result<void, Error>::ok();
    }

    Result<void, Error> apply_one(const edit::DropColumn& ed) {
        auto pos_result = resolve(ed.name);
        if (pos_result.is_err()) {
            return Result<void, Error>::err(pos_result.unwrap_err());
        }
        const size_t pos = pos_result.unwrap();

        if (table_.is_primary_key(table_.columns[pos].name)) {
            table_.primary_key.reset();
        }
        if (slots_[pos].source) {
            mapping_.drop(*slots_[pos].source);
        }
        table_.columns.erase(table_.columns.begin() + static_cast<std::ptrdiff_t>(pos));
        slots_.erase(slots_.begin() + static_cast<std::ptrdiff_t>(pos));
        handles_.erase(ed.name);
        return Result<void, Error>::ok();
    }

    Result<void, Error> apply_one(const edit::AddConstraint& ed) {
        if (ed.constraint.name && table_.index_of_constraint_named(*ed.constraint.name)) {
            return Result<void, Error>::err(Error::declaration(
                "constraint '" + *ed.constraint.name + "' already exists in table '" + table_.name + "'"));
        }
        table_.constraints.push_back(ed.constraint);
        return Result<void, Error>::ok();
    }

    Result<void, Error> apply_one(const edit::DropConstraintNamed& ed) {
        auto pos = table_.index_of_constraint_named(ed.name);
        if (!pos) {
            return Result<void, Error>::err(Error::declaration(
                "no constraint named '" + ed.name + "' in table '" + table_.name + "'"));
        }
        table_.constraints.erase(table_.constraints.begin() + static_cast<std::ptrdiff_t>(*pos));
        return Result<void, Error>::ok();
    }

    Result<void, Error> apply_one(const edit::DropConstraint& ed) {
        auto pos = table_.index_of_constraint_clause(ed.clause);
        if (!pos) {
            return Result<void, Error>::err(Error::declaration(
                "no constraint '" + ed.clause + "' in table '" + table_.name + "'"));
        }
        table_.constraints.erase(table_.constraints.begin() + static_cast<std::ptrdiff_t>(*pos));
        return Result<void, Error>::ok();
    }

    Result<void, Error> apply_one(const edit::DropAllConstraints&) {
        table_.constraints.clear();
        return Result<void, Error>::ok();
    }

    Table table_;
    std::vector<Slot> slots_;                      // parallel to table_.columns
    std::map<std::string, std::string> handles_;   // name used by edits -> current name
    ColumnMapping mapping_;                        // pre-edit name -> final name
};

bool is_additive_only(const Table& table, const std::vector<TableEdit>& edits) {
    return std::all_of(edits.begin(), edits.end(), [&](const TableEdit& e) {
        const auto* add = std::get_if<edit::AddColumn>(&e);
        return add && !add->initial_value && !table.column(add->column.name) &&
               supports_native_add(add->column);
    });
}

Result<AlterPlan, Error> compile_additive(const Table& table,
                                          const std::vector<Index>& indexes,
                                          const std::vector<TableEdit>& edits) {
    AlterPlan plan{.table = table, .indexes = indexes, .operations = {}};
    for (const auto& e : edits) {
        const auto& add = std::get<edit::AddColumn>(e);
        if (plan.table.column(add.column.name)) {
            return Result<AlterPlan, Error>::err(column_exists(add.column.name, table.name));
        }
        plan.table.columns.push_back(add.column);
        plan.operations.emplace_back(AddColumn{.table_name = table.name, .column = add.column});
    }
    return Result<AlterPlan, Error>::ok(std::move(plan));
}

} // namespace

bool supports_native_add(const Column& column) {
    if (column.has_constraint("PRIMARY KEY") || column.has_constraint("UNIQUE") ||
        column.has_constraint("STORED")) {
        return false;
    }

    const auto default_expr = column.default_value();
    if (default_expr) {
        const auto expr = upper(*default_expr);
        // ADD COLUMN refuses non-constant defaults.
        if (expr.front() == '(' || expr == "CURRENT_TIME" || expr == "CURRENT_DATE" ||
            expr == "CURRENT_TIMESTAMP") {
            return false;
        }
    }

    if (column.has_constraint("NOT NULL")) {
        return default_expr && upper(*default_expr) != "NULL";
    }
    return true;
}

Result<AlterPlan, Error> compile_alter_table(const Table& table,
                                             const std::vector<Index>& indexes,
                                             const std::vector<TableEdit>& edits) {
    if (edits.empty()) {
        return Result<AlterPlan, Error>::ok(AlterPlan{.table = table, .indexes = indexes, .operations = {}});
    }

    if (is_additive_only(table, edits)) {
        return compile_additive(table, indexes, edits);
    }

    RebuildState state(table);
    for (const auto& e : edits) {
        auto applied = state.apply(e);
        if (applied.is_err()) {
            return Result<AlterPlan, Error>::err(applied.unwrap_err());
        }
    }

    if (state.table().columns.empty()) {
        return Result<AlterPlan, Error>::err(
            Error::declaration("table '" + table.name + "' would have no columns"));
    }

    auto remapped = remap_indexes(indexes, state.table(), state.mapping());

    AlterPlan plan{.table = state.table(), .indexes = remapped.kept, .operations = {}};
    plan.operations.emplace_back(AlterTableRebuild{
        .original_name = table.name,
        .final_table = state.table(),
        .column_plan = state.column_plan(),
        .indexes_to_recreate = std::move(remapped.kept),
        .dropped_indexes = std::move(remapped.dropped),
    });
    return Result<AlterPlan, Error>::ok(std::move(plan));
}

} // namespace strata::schema
