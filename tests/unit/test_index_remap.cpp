#include <catch2/catch_test_macros.hpp>
#include "schema/index_remap.hpp"

using namespace strata::schema;

namespace {

Index make_index(std::string name, std::vector<std::string> columns, std::optional<std::string> where = std::nullopt) {
    return Index{.name = std::move(name), .table_name = "people", .columns = std::move(columns),
                 .unique = false, .where_clause = std::move(where)};
}

Table table_with(std::vector<std::string> column_names) {
    Table table{.name = "people", .columns = {}, .constraints = {}, .primary_key = std::nullopt};
    for (auto& name : column_names) {
        table.columns.push_back(Column{.name = std::move(name), .type = ColumnType::Text, .constraints = {}});
    }
    return table;
}

} // namespace

TEST_CASE("ColumnMapping", "[remap]") {
    ColumnMapping mapping;
    mapping.rename("name", "full_name");
    mapping.drop("age");

    REQUIRE(mapping.resolve("name") == "full_name");
    REQUIRE_FALSE(mapping.resolve("age").has_value());
    REQUIRE(mapping.resolve("id") == "id");
    REQUIRE(mapping.dropped("age"));
    REQUIRE_FALSE(mapping.dropped("name"));
}

TEST_CASE("remap_indexes", "[remap]") {
    ColumnMapping mapping;
    mapping.rename("name", "full_name");
    mapping.drop("age");

    const auto table = table_with({"id", "full_name"});
    const auto result = remap_indexes(
        {make_index("by_name", {"name"}, "name IS NOT NULL"), make_index("by_age", {"age"}),
         make_index("by_id_name", {"id", "name"})},
        table, mapping);

    REQUIRE(result.kept.size() == 2);
    REQUIRE(result.kept[0].columns == std::vector<std::string>{"full_name"});
    // Partial index predicates are carried verbatim.
    REQUIRE(result.kept[0].where_clause == "name IS NOT NULL");
    REQUIRE(result.kept[1].columns == std::vector<std::string>{"id", "full_name"});
    REQUIRE(result.dropped == std::vector<std::string>{"by_age"});
}

TEST_CASE("retarget_indexes", "[remap]") {
    auto other = make_index("other", {"x"});
    other.table_name = "pets";

    auto result = retarget_indexes({make_index("by_name", {"name"}), other}, "people", "persons");
    REQUIRE(result[0].table_name == "persons");
    REQUIRE(result[1].table_name == "pets");
}
