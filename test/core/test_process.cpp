#include <catch2/catch_test_macros.hpp>

#include <stdio_mcp/core/process.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace stdio_mcp;
using namespace std::chrono_literals;

// These tests spawn real POSIX utilities found through PATH.
#ifndef _WIN32

TEST_CASE("RunProcess: captures stdout of a successful command", "[core][process]") {
    auto result = RunProcess("echo", {"hello", "world"}, 5000ms);
    REQUIRE(result.IsOk());
    const auto& out = result.Value();
    CHECK(out.exit_code == 0);
    CHECK(out.stdout_text == "hello world\n");
    CHECK(out.stderr_text.empty());
    CHECK_FALSE(out.timed_out);
    CHECK(out.Succeeded());
}

TEST_CASE("RunProcess: arguments are not interpreted by a shell", "[core][process]") {
    auto result = RunProcess("echo", {"$HOME", ";", "ls"}, 5000ms);
    REQUIRE(result.IsOk());
    CHECK(result.Value().stdout_text == "$HOME ; ls\n");
}

TEST_CASE("RunProcess: non-zero exit code is reported", "[core][process]") {
    auto result = RunProcess("ls", {"/definitely/not/a/real/path"}, 5000ms);
    REQUIRE(result.IsOk());
    const auto& out = result.Value();
    CHECK(out.exit_code != 0);
    CHECK_FALSE(out.stderr_text.empty());
    CHECK_FALSE(out.Succeeded());
}

TEST_CASE("RunProcess: missing program exits with 127", "[core][process]") {
    auto result = RunProcess("stdio-mcp-no-such-program", {}, 5000ms);
    REQUIRE(result.IsOk());
    const auto& out = result.Value();
    CHECK(out.exit_code == 127);
    CHECK(out.stderr_text.find("exec failed:") != std::string::npos);
}

TEST_CASE("RunProcess: child is killed when the timeout elapses", "[core][process]") {
    const auto start = std::chrono::steady_clock::now();
    auto result = RunProcess("sleep", {"10"}, 200ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.IsOk());
    CHECK(result.Value().timed_out);
    CHECK(result.Value().exit_code == -1);
    CHECK_FALSE(result.Value().Succeeded());
    CHECK(elapsed < 5s);
}

TEST_CASE("RunProcess: timeout longer than poll can express", "[core][process]") {
    // 50 days in milliseconds does not fit in an int.
    auto result = RunProcess("sleep", {"1"}, std::chrono::hours(24 * 50));
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().timed_out);
    CHECK(result.Value().exit_code == 0);
}

TEST_CASE("RunProcess: stdin is empty", "[core][process]") {
    auto result = RunProcess("cat", {}, 5000ms);
    REQUIRE(result.IsOk());
    CHECK(result.Value().exit_code == 0);
    CHECK(result.Value().stdout_text.empty());
}

#endif
