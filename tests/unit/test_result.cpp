#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace pairlink;

TEST_CASE("Result::ok creates a success result", "[unit][result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries message and code", "[unit][result]") {
    auto result = Result<int>::err(Error{"no route to host", ErrorCode::NetworkUnreachable, 2});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "no route to host");
    REQUIRE(result.unwrap_err().code == ErrorCode::NetworkUnreachable);
    REQUIRE(result.unwrap_err().native_code == 2);
}

TEST_CASE("Result::unwrap throws on error", "[unit][result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
    REQUIRE_THROWS_AS(Result<int>::ok(1).unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[unit][result]") {
    REQUIRE(Result<int>::ok(42).value_or(0) == 42);
    REQUIRE(Result<int>::err(Error{"error"}).value_or(0) == 0);
}

TEST_CASE("Result::map transforms and propagates", "[unit][result]") {
    auto doubled = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(doubled.unwrap() == 42);

    auto failed = Result<int>::err(Error{"error", ErrorCode::Timeout}).map([](int x) { return x * 2; });
    REQUIRE(failed.unwrap_err().code == ErrorCode::Timeout);
}

TEST_CASE("Result::and_then short-circuits on error", "[unit][result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error{"division by zero", ErrorCode::InvalidArgument});
        return Result<int>::ok(100 / x);
    };

    REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);
    REQUIRE(Result<int>::ok(0).and_then(divide).unwrap_err().code == ErrorCode::InvalidArgument);
    REQUIRE(Result<int>::err(Error{"initial"}).and_then(divide).unwrap_err().message == "initial");
}

TEST_CASE("Result::match and inspect_err visit the right side", "[unit][result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.match([](int x) { return x; }, [](const Error&) { return -1; }) == 42);
    REQUIRE(err_result.match([](int x) { return x; }, [](const Error&) { return -1; }) == -1);

    std::string seen_error;
    ok_result.inspect_err([&](const Error& e) { seen_error = "unexpected: " + e.message; });
    REQUIRE(seen_error.empty());
    err_result.inspect_err([&](const Error& e) { seen_error = e.message; });
    REQUIRE(seen_error == "error");
}

TEST_CASE("Result<void> and fail()", "[unit][result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = fail("gone", ErrorCode::NotFound);

    REQUIRE(ok_result.is_ok());
    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE(err_result.is_err());
    REQUIRE_THROWS(err_result.unwrap());
    REQUIRE(err_result.unwrap_err().code == ErrorCode::NotFound);

    int calls = 0;
    auto chained = ok_result.and_then([&] {
        ++calls;
        return fail("second step", ErrorCode::Storage);
    });
    auto skipped = err_result.and_then([&] {
        ++calls;
        return Result<void>::ok();
    });
    REQUIRE(calls == 1);
    REQUIRE(chained.unwrap_err().code == ErrorCode::Storage);
    REQUIRE(skipped.unwrap_err().code == ErrorCode::NotFound);
}

TEST_CASE("ErrorCode names are stable", "[unit][result]") {
    REQUIRE(to_string(ErrorCode::NotFound) == "not_found");
    REQUIRE(to_string(ErrorCode::FingerprintMismatch) == "fingerprint_mismatch");
    REQUIRE(to_string(ErrorCode::UntrustedHost) == "untrusted_host");
    REQUIRE(to_string(ErrorCode::AlreadyRunning) == "already_running");
}
