#include <catch2/catch_test_macros.hpp>
#include "core/value.hpp"

using namespace strata;

TEST_CASE("Value storage classes", "[value]") {
    REQUIRE(storage_class(Value{Null{}}) == StorageClass::Null);
    REQUIRE(storage_class(Value{int64_t{3}}) == StorageClass::Integer);
    REQUIRE(storage_class(Value{2.5}) == StorageClass::Real);
    REQUIRE(storage_class(Value{std::string("x")}) == StorageClass::Text);
    REQUIRE(storage_class(Value{Blob{1, 2}}) == StorageClass::Blob);

    REQUIRE(is_null(Value{Null{}}));
    REQUIRE_FALSE(is_null(Value{int64_t{0}}));
}

TEST_CASE("Value accessors only match their own class", "[value]") {
    Value number = int64_t{42};
    Value text = std::string("42");

    REQUIRE(as_integer(number) == 42);
    REQUIRE_FALSE(as_integer(text).has_value());
    REQUIRE(as_text(text) == "42");
    REQUIRE_FALSE(as_real(number).has_value());
}

TEST_CASE("to_sql_literal", "[value]") {
    REQUIRE(to_sql_literal(Value{Null{}}) == "NULL");
    REQUIRE(to_sql_literal(Value{int64_t{-7}}) == "-7");
    REQUIRE(to_sql_literal(Value{std::string("it's")}) == "'it''s'");
    REQUIRE(to_sql_literal(Value{Blob{0x00, 0xab}}) == "X'00ab'");
}
