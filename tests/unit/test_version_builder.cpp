#include <catch2/catch_test_macros.hpp>
#include "schema/version.hpp"

using namespace strata;
using namespace strata::schema;

namespace {

void people(TableBuilder& t) {
    t.primary_key("id", true);
    t.column("name", ColumnType::Text, {"NOT NULL"});
    t.column("age", ColumnType::Integer);
}

Snapshot people_snapshot() {
    VersionBuilder v(1, Snapshot{});
    v.create_table("people", people)
     .create_index("people_name", "people", {"name"})
     .create_index("people_age", "people", {"age"}, IndexOptions{.unique = false, .where = "age > 0"});
    return std::move(v).build().unwrap().snapshot;
}

Version build(VersionBuilder&& v) {
    auto result = std::move(v).build();
    REQUIRE(result.is_ok());
    return std::move(result).unwrap();
}

std::string build_error(VersionBuilder&& v) {
    auto result = std::move(v).build();
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::Declaration);
    return result.unwrap_err().message;
}

} // namespace

TEST_CASE("create_table", "[builder]") {
    VersionBuilder v(1, Snapshot{});
    v.create_table("people", people);
    auto version = build(std::move(v));

    REQUIRE(version.number == 1);
    REQUIRE(version.snapshot.table_names() == std::vector<std::string>{"people"});
    const Table* table = version.snapshot.table("people");
    REQUIRE(table);
    REQUIRE(table->column_names() == std::vector<std::string>{"id", "name", "age"});
    REQUIRE(table->primary_key == PrimaryKey{.column = "id", .autoincrement = true});

    REQUIRE(version.operations.size() == 1);
    REQUIRE(std::get<CreateTable>(version.operations[0]).table == *table);
}

TEST_CASE("Table declaration errors", "[builder]") {
    SECTION("duplicate table") {
        VersionBuilder v(2, people_snapshot());
        v.create_table("people", people);
        REQUIRE(build_error(std::move(v)) == "table 'people' already exists");
    }

    SECTION("duplicate column") {
        VersionBuilder v(1, Snapshot{});
        v.create_table("t", [](TableBuilder& t) {
            t.column("a", ColumnType::Text);
            t.column("a", ColumnType::Integer);
        });
        REQUIRE(build_error(std::move(v)) == "duplicate column 'a' in table 't'");
    }

    SECTION("second primary key") {
        VersionBuilder v(1, Snapshot{});
        v.create_table("t", [](TableBuilder& t) {
            t.primary_key("a");
            t.primary_key("b");
        });
        REQUIRE(build_error(std::move(v)) == "table 't' already has primary key 'a'");
    }

    SECTION("table without columns") {
        VersionBuilder v(1, Snapshot{});
        v.create_table("t", [](TableBuilder&) {});
        REQUIRE(build_error(std::move(v)) == "table 't' has no columns");
    }

    SECTION("errors are sticky and carry the version") {
        VersionBuilder v(3, people_snapshot());
        v.drop_table("missing")
         .create_table("pets", [](TableBuilder& t) { t.column("name", ColumnType::Text); });

        REQUIRE(v.error().has_value());
        REQUIRE(v.error()->version == 3);
        REQUIRE(v.snapshot().table("pets") == nullptr);
        REQUIRE(build_error(std::move(v)) == "cannot drop table 'missing': no such table");
    }
}

TEST_CASE("drop_table records the index drops", "[builder]") {
    VersionBuilder v(2, people_snapshot());
    v.drop_table("people");
    auto version = build(std::move(v));

    REQUIRE(version.snapshot.empty());
    REQUIRE(version.operations.size() == 3);
    REQUIRE(std::get<DropIndex>(version.operations[0]).name == "people_age");
    REQUIRE(std::get<DropIndex>(version.operations[0]).if_exists);
    REQUIRE(std::get<DropIndex>(version.operations[1]).name == "people_name");
    REQUIRE(std::get<DropTable>(version.operations[2]).name == "people");

    SECTION("if_exists on a missing table only records the drop") {
        VersionBuilder again(3, version.snapshot);
        again.drop_table("people", true);
        auto v3 = build(std::move(again));
        REQUIRE(v3.operations.size() == 1);
        REQUIRE(std::get<DropTable>(v3.operations[0]).if_exists);
    }
}

TEST_CASE("rename_table moves its indexes", "[builder]") {
    VersionBuilder v(2, people_snapshot());
    v.rename_table("people", "persons");
    auto version = build(std::move(v));

    REQUIRE(version.snapshot.table("people") == nullptr);
    REQUIRE(version.snapshot.table("persons")->name == "persons");
    REQUIRE(version.snapshot.index("people_name")->table_name == "persons");
    REQUIRE(version.snapshot.indexes_on("persons").size() == 2);
    REQUIRE(version.operations.size() == 1);
    REQUIRE(std::holds_alternative<RenameTable>(version.operations[0]));

    SECTION("onto an existing table") {
        VersionBuilder clash(3, version.snapshot);
        clash.create_table("people", people).rename_table("persons", "people");
        REQUIRE(build_error(std::move(clash)) ==
                "cannot rename table 'persons' to 'people': table already exists");
    }
}

TEST_CASE("alter_table merges the compiled table", "[builder]") {
    VersionBuilder v(2, people_snapshot());
    v.alter_table("people", [](TableAlterer& t) {
        t.alter_column("name", ColumnChange{.rename_to = "full_name"});
        t.drop_column("age");
    });
    auto version = build(std::move(v));

    REQUIRE(version.snapshot.table("people")->column_names() == std::vector<std::string>{"id", "full_name"});
    REQUIRE(version.snapshot.index_names() == std::vector<std::string>{"people_name"});
    REQUIRE(version.snapshot.index("people_name")->columns == std::vector<std::string>{"full_name"});

    REQUIRE(version.operations.size() == 1);
    const auto& rebuild = std::get<AlterTableRebuild>(version.operations[0]);
    REQUIRE(rebuild.dropped_indexes == std::vector<std::string>{"people_age"});

    SECTION("unknown table") {
        VersionBuilder bad(3, version.snapshot);
        bad.alter_table("pets", [](TableAlterer& t) { t.drop_column("x"); });
        REQUIRE(build_error(std::move(bad)) == "cannot alter table 'pets': no such table");
    }

    SECTION("compiler errors surface from the builder") {
        VersionBuilder bad(3, version.snapshot);
        bad.alter_table("people", [](TableAlterer& t) { t.drop_column("age"); });
        REQUIRE(build_error(std::move(bad)) == "no column 'age' in table 'people'");
    }
}

TEST_CASE("Index declarations", "[builder]") {
    SECTION("create_index validates table and columns") {
        VersionBuilder v(2, people_snapshot());
        v.create_index("by_email", "people", {"email"});
        REQUIRE(build_error(std::move(v)) ==
                "cannot create index 'by_email': no column 'email' in table 'people'");
    }

    SECTION("index names are unique") {
        VersionBuilder v(2, people_snapshot());
        v.create_index("people_name", "people", {"age"});
        REQUIRE(build_error(std::move(v)) == "index 'people_name' already exists");
    }

    SECTION("rename_index") {
        VersionBuilder v(2, people_snapshot());
        v.rename_index("people_name", "by_name");
        auto version = build(std::move(v));

        REQUIRE(version.snapshot.index("people_name") == nullptr);
        REQUIRE(version.snapshot.index("by_name")->columns == std::vector<std::string>{"name"});
        const auto& op = std::get<RenameIndex>(version.operations[0]);
        REQUIRE(op.from == "people_name");
        REQUIRE(op.renamed.name == "by_name");
    }

    SECTION("drop_index") {
        VersionBuilder v(2, people_snapshot());
        v.drop_index("people_age").drop_index("people_age", true);
        auto version = build(std::move(v));
        REQUIRE(version.snapshot.index_names() == std::vector<std::string>{"people_name"});
        REQUIRE(version.operations.size() == 2);

        VersionBuilder missing(3, version.snapshot);
        missing.drop_index("people_age");
        REQUIRE(build_error(std::move(missing)) == "cannot drop index 'people_age': no such index");
    }
}

TEST_CASE("execute is opaque", "[builder]") {
    VersionBuilder v(2, people_snapshot());
    v.execute("backfill", [](storage::Database&) { return Result<void, Error>::ok(); });
    auto version = build(std::move(v));

    REQUIRE(version.snapshot == people_snapshot());
    REQUIRE(describe(version.operations[0]) == "execute 'backfill'");
}
