#include <catch2/catch_test_macros.hpp>

#include <stdio_mcp/core/result.hpp>

#include <cerrno>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

using namespace stdio_mcp;

// ===========================================================================
// Basic Ok / Err
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result: move-only value can be moved out", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(5));
    REQUIRE(r.IsOk());
    auto ptr = std::move(r).Value();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 5);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, Error>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, Error>::Err(
        Error{"Op", "", "broke", ErrorCategory::Io, std::nullopt});
    REQUIRE(err.IsErr());
    CHECK(err.Error().message == "broke");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: ToString includes operation, target and message", "[result][error]") {
    Error e{"ReadFile", "/tmp/x", "gone", ErrorCategory::NotFound, std::nullopt};
    CHECK(e.ToString() == "ReadFile [/tmp/x]: gone");

    Error no_target{"Load", "", "bad", ErrorCategory::Config, std::nullopt};
    CHECK(no_target.ToString() == "Load: bad");

    std::ostringstream oss;
    oss << e;
    CHECK(oss.str() == e.ToString());
}

TEST_CASE("Error: categories map to exit codes", "[result][error]") {
    Error e;
    CHECK(e.category == ErrorCategory::Io);
    CHECK(e.ExitCode() == 1);

    e.category = ErrorCategory::Config;
    CHECK(e.ExitCode() == 99);

    e.category = ErrorCategory::NotFound;
    CHECK(e.ExitCode() == 2);

    e.category = ErrorCategory::Process;
    CHECK(e.ExitCode() == 5);
}

TEST_CASE("Error: FromErrno classifies common errno values", "[result][error]") {
    auto not_found = Error::FromErrno("Open", "/nope", ENOENT);
    CHECK(not_found.category == ErrorCategory::NotFound);
    REQUIRE(not_found.os_error.has_value());
    CHECK(*not_found.os_error == ENOENT);
    CHECK_FALSE(not_found.message.empty());

    auto denied = Error::FromErrno("Open", "/root", EACCES);
    CHECK(denied.category == ErrorCategory::NotAllowed);

    auto other = Error::FromErrno("Fork", "ls", EAGAIN, ErrorCategory::Process);
    CHECK(other.category == ErrorCategory::Process);
}

TEST_CASE("Error: equality compares all fields", "[result][error]") {
    Error a{"Op", "t", "m", ErrorCategory::Io, 5};
    Error b = a;
    CHECK(a == b);
    b.os_error = 6;
    CHECK(a != b);
}
