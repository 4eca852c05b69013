#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

#include <string>

using namespace uuidv47;

TEST_CASE("Result::ok holds a value", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries message and code", "[result]") {
    auto result = Result<int>::err(Error{"bad input", ErrorCode::InvalidFormat});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "bad input");
    REQUIRE(result.unwrap_err().code == ErrorCode::InvalidFormat);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});
    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);

    auto ok = Result<int>::ok(1);
    REQUIRE_THROWS_AS(ok.unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or falls back on error", "[result]") {
    REQUIRE(Result<int>::ok(42).value_or(0) == 42);
    REQUIRE(Result<int>::err(Error{"error"}).value_or(7) == 7);
}

TEST_CASE("Result::and_then short-circuits on error", "[result]") {
    int calls = 0;
    auto step = [&calls](int x) {
        ++calls;
        return Result<std::string>::ok(std::to_string(x));
    };

    auto ok = Result<int>::ok(5).and_then(step);
    REQUIRE(ok.unwrap() == "5");

    auto failed = Result<int>::err(Error{"first", ErrorCode::InvalidKey}).and_then(step);
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().code == ErrorCode::InvalidKey);
    REQUIRE(calls == 1);
}

TEST_CASE("Result::map and map_err transform one side", "[result]") {
    auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(mapped.unwrap() == 42);

    auto relabelled = Result<int>::err(Error{"missing", ErrorCode::KeyNotConfigured})
        .map_err([](const Error& e) { return Error{"config: " + e.message, e.code}; });
    REQUIRE(relabelled.unwrap_err().message == "config: missing");
    REQUIRE(relabelled.unwrap_err().code == ErrorCode::KeyNotConfigured);
}

TEST_CASE("Result<void> reports success or failure", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error", ErrorCode::Storage});

    REQUIRE(ok_result.is_ok());
    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE(err_result.is_err());
    REQUIRE_THROWS(err_result.unwrap());
    REQUIRE(err_result.unwrap_err().code == ErrorCode::Storage);
}

TEST_CASE("ErrorCode has stable names", "[result]") {
    REQUIRE(to_string(ErrorCode::InvalidFormat) == "invalid-format");
    REQUIRE(to_string(ErrorCode::KeyNotConfigured) == "key-not-configured");
}
