#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace strata;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err creates an error result", "[result]") {
    auto result = Result<int>::err(Error{"something went wrong", 1});

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "something went wrong");
    REQUIRE(result.unwrap_err().code == 1);
    REQUIRE(result.unwrap_err().kind == ErrorKind::Engine);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success value", "[result]") {
    auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });

    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.unwrap() == 42);
}

TEST_CASE("Result::map propagates error", "[result]") {
    auto mapped = Result<int>::err(Error{"error"}).map([](int x) { return x * 2; });

    REQUIRE(mapped.is_err());
    REQUIRE(mapped.unwrap_err().message == "error");
}

TEST_CASE("Result::and_then chains operations", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error{"division by zero"});
        return Result<int>::ok(100 / x);
    };

    auto result = Result<int>::ok(5).and_then(divide);
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap() == 20);

    auto failed = Result<int>::ok(0).and_then(divide);
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().message == "division by zero");
}

TEST_CASE("Result::and_then short-circuits on error", "[result]") {
    bool called = false;
    auto divide = [&](int x) -> Result<int> {
        called = true;
        return Result<int>::ok(100 / x);
    };

    auto result = Result<int>::err(Error{"initial error"}).and_then(divide);

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "initial error");
    REQUIRE_FALSE(called);
}

TEST_CASE("Result::map_err transforms error", "[result]") {
    auto mapped = Result<int>::err(Error{"error", 1}).map_err([](Error e) {
        return Error{e.message + " (transformed)", e.code + 10};
    });

    REQUIRE(mapped.is_err());
    REQUIRE(mapped.unwrap_err().message == "error (transformed)");
    REQUIRE(mapped.unwrap_err().code == 11);
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("Result chaining works with different types", "[result]") {
    auto result = Result<int>::ok(5)
        .map([](int x) { return std::to_string(x); })
        .map([](const std::string& s) { return s + " items"; });

    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap() == "5 items");
}

TEST_CASE("Error carries migration context", "[result]") {
    SECTION("declaration and precondition helpers set the kind") {
        REQUIRE(Error::declaration("dup").kind == ErrorKind::Declaration);
        REQUIRE(Error::precondition("range").kind == ErrorKind::Precondition);
    }

    SECTION("during() retags as an execution error") {
        auto e = Error{"no such column: nme", 1}.during(2, "rebuild table 'people'");

        REQUIRE(e.kind == ErrorKind::Execution);
        REQUIRE(e.version == 2);
        REQUIRE(e.operation == "rebuild table 'people'");
        REQUIRE(e.describe() ==
                "execution error in version 2 (rebuild table 'people'): no such column: nme [code 1]");
    }

    SECTION("describe() without context") {
        REQUIRE(Error::precondition("target version 5 is above the latest declared version 3").describe() ==
                "precondition error: target version 5 is above the latest declared version 3");
    }
}
