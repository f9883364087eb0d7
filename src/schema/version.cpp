#include "schema/version.hpp"
#include "schema/index_remap.hpp"

namespace strata::schema {

TableBuilder::TableBuilder(std::string name) {
    table_.name = std::move(name);
}

void TableBuilder::fail(std::string message) {
    if (!error_) {
        error_ = Error::declaration(std::move(message));
    }
}

TableBuilder& TableBuilder::primary_key(std::string name, bool autoincrement) {
    if (table_.primary_key) {
        fail("table '" + table_.name + "' already has primary key '" + table_.primary_key->column + "'");
        return *this;
    }
    table_.primary_key = PrimaryKey{.column = name, .autoincrement = autoincrement};
    return column(std::move(name), ColumnType::Integer);
}

TableBuilder& TableBuilder::column(std::string name, ColumnType type, std::vector<std::string> constraints) {
    if (table_.column(name)) {
        fail("duplicate column '" + name + "' in table '" + table_.name + "'");
        return *this;
    }
    table_.columns.push_back(Column{.name = std::move(name), .type = type, .constraints = std::move(constraints)});
    return *this;
}

TableBuilder& TableBuilder::constraint(std::string clause, std::optional<std::string> name) {
    if (name && table_.index_of_constraint_named(*name)) {
        fail("duplicate constraint '" + *name + "' in table '" + table_.name + "'");
        return *this;
    }
    table_.constraints.push_back(Constraint{.name = std::move(name), .clause = std::move(clause)});
    return *this;
}

VersionBuilder::VersionBuilder(int number, Snapshot previous)
    : number_(number), snapshot_(std::move(previous)) {}

void VersionBuilder::fail(std::string message) {
    if (!error_) {
        auto e = Error::declaration(std::move(message));
        e.version = number_;
        error_ = std::move(e);
    }
}

VersionBuilder& VersionBuilder::create_table(const std::string& name,
                                             const std::function<void(TableBuilder&)>& block) {
    if (failed()) return *this;

    if (snapshot_.table(name)) {
        fail("table '" + name + "' already exists");
        return *this;
    }

    TableBuilder builder(name);
    block(builder);
    if (builder.error()) {
        fail(builder.error()->message);
        return *this;
    }
    if (builder.table().columns.empty()) {
        fail("table '" + name + "' has no columns");
        return *this;
    }

    snapshot_.put_table(builder.table());
    operations_.emplace_back(CreateTable{.table = builder.table()});
    return *this;
}

VersionBuilder& VersionBuilder::drop_table(const std::string& name, bool if_exists) {
    if (failed()) return *this;

    if (!snapshot_.table(name)) {
        if (!if_exists) {
            fail("cannot drop table '" + name + "': no such table");
            return *this;
        }
        operations_.emplace_back(DropTable{.name = name, .if_exists = true});
        return *this;
    }

    for (const auto& index : snapshot_.indexes_on(name)) {
        snapshot_.erase_index(index.name);
        operations_.emplace_back(DropIndex{.name = index.name, .if_exists = true});
    }
    snapshot_.erase_table(name);
    operations_.emplace_back(DropTable{.name = name, .if_exists = if_exists});
    return *this;
}

VersionBuilder& VersionBuilder::rename_table(const std::string& from, const std::string& to) {
    if (failed()) return *this;

    const Table* existing = snapshot_.table(from);
    if (!existing) {
        fail("cannot rename table '" + from + "': no such table");
        return *this;
    }
    if (snapshot_.table(to)) {
        fail("cannot rename table '" + from + "' to '" + to + "': table already exists");
        return *this;
    }

    Table renamed = *existing;
    renamed.name = to;
    auto indexes = retarget_indexes(snapshot_.indexes_on(from), from, to);

    snapshot_.erase_table(from);
    snapshot_.put_table(std::move(renamed));
    for (auto& index : indexes) {
        snapshot_.put_index(std::move(index));
    }
    operations_.emplace_back(RenameTable{.from = from, .to = to});
    return *this;
}

VersionBuilder& VersionBuilder::alter_table(const std::string& name,
                                            const std::function<void(TableAlterer&)>& block) {
    if (failed()) return *this;

    const Table* existing = snapshot_.table(name);
    if (!existing) {
        fail("cannot alter table '" + name + "': no such table");
        return *this;
    }

    TableAlterer alterer;
    block(alterer);

    const auto before = snapshot_.indexes_on(name);
    auto compiled = compile_alter_table(*existing, before, alterer.edits());
    if (compiled.is_err()) {
        fail(compiled.unwrap_err().message);
        return *this;
    }

    auto plan = std::move(compiled).unwrap();
    for (const auto& index : before) {
        snapshot_.erase_index(index.name);
    }
    snapshot_.put_table(std::move(plan.table));
    for (auto& index : plan.indexes) {
        snapshot_.put_index(std::move(index));
    }
    for (auto& op : plan.operations) {
        operations_.push_back(std::move(op));
    }
    return *this;
}

VersionBuilder& VersionBuilder::create_index(const std::string& name,
                                             const std::string& table_name,
                                             std::vector<std::string> columns,
                                             IndexOptions options) {
    if (failed()) return *this;

    if (snapshot_.index(name)) {
        fail("index '" + name + "' already exists");
        return *this;
    }
    const Table* table = snapshot_.table(table_name);
    if (!table) {
        fail("cannot create index '" + name + "': no table '" + table_name + "'");
        return *this;
    }
    if (columns.empty()) {
        fail("index '" + name + "' has no columns");
        return *this;
    }
    for (const auto& column : columns) {
        if (!table->column(column)) {
            fail("cannot create index '" + name + "': no column '" + column + "' in table '" + table_name + "'");
            return *this;
        }
    }

    Index index{
        .name = name,
        .table_name = table_name,
        .columns = std::move(columns),
        .unique = options.unique,
        .where_clause = std::move(options.where),
    };
    snapshot_.put_index(index);
    operations_.emplace_back(CreateIndex{.index = std::move(index), .if_not_exists = false});
    return *this;
}

VersionBuilder& VersionBuilder::drop_index(const std::string& name, bool if_exists) {
    if (failed()) return *this;

    if (!snapshot_.erase_index(name) && !if_exists) {
        fail("cannot drop index '" + name + "': no such index");
        return *this;
    }
    operations_.emplace_back(DropIndex{.name = name, .if_exists = if_exists});
    return *this;
}

VersionBuilder& VersionBuilder::rename_index(const std::string& from, const std::string& to) {
    if (failed()) return *this;

    const Index* existing = snapshot_.index(from);
    if (!existing) {
        fail("cannot rename index '" + from + "': no such index");
        return *this;
    }
    if (snapshot_.index(to)) {
        fail("cannot rename index '" + from + "' to '" + to + "': index already exists");
        return *this;
    }

    Index renamed = *existing;
    renamed.name = to;
    snapshot_.erase_index(from);
    snapshot_.put_index(renamed);
    operations_.emplace_back(RenameIndex{.from = from, .renamed = std::move(renamed)});
    return *this;
}

VersionBuilder& VersionBuilder::execute(std::string description, ExecuteFn callback) {
    if (failed()) return *this;

    if (!callback) {
        fail("execute step '" + description + "' has no callback");
        return *this;
    }
    operations_.emplace_back(Execute{.description = std::move(description), .callback = std::move(callback)});
    return *this;
}

Result<Version, Error> VersionBuilder::build() && {
    if (error_) {
        return Result<Version, Error>::err(*error_);
    }
    return Result<Version, Error>::ok(Version{
        .number = number_,
        .snapshot = std::move(snapshot_),
        .operations = std::move(operations_),
    });
}

} // namespace strata::schema
