#include <catch2/catch_test_macros.hpp>

#include <stdio_mcp/core/terminal.hpp>

#include <cstdlib>

#ifdef _WIN32
#include <stdlib.h>  // _putenv_s
#endif

using namespace stdio_mcp;

namespace {
void SetEnv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void UnsetEnv(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}
} // namespace

// ===========================================================================
// Terminal detection
// ===========================================================================

TEST_CASE("IsStderrTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStderrTty();
    CHECK((result == true || result == false));
}

TEST_CASE("NoColorEnvSet: follows the NO_COLOR variable", "[core][terminal]") {
    SetEnv("NO_COLOR", "1");
    CHECK(NoColorEnvSet());
    UnsetEnv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());
}

// ===========================================================================
// ResolveLogColor
// ===========================================================================

TEST_CASE("ResolveLogColor: --no-color wins over everything", "[core][terminal]") {
    CHECK_FALSE(ResolveLogColor(true, true));
    CHECK_FALSE(ResolveLogColor(false, true));
}

TEST_CASE("ResolveLogColor: --color wins over NO_COLOR", "[core][terminal]") {
    SetEnv("NO_COLOR", "1");
    CHECK(ResolveLogColor(true, false));
    UnsetEnv("NO_COLOR");
}

TEST_CASE("ResolveLogColor: NO_COLOR disables auto-detected color", "[core][terminal]") {
    SetEnv("NO_COLOR", "1");
    CHECK_FALSE(ResolveLogColor(false, false));
    UnsetEnv("NO_COLOR");
}

TEST_CASE("ResolveLogColor: without preferences follows stderr", "[core][terminal]") {
    UnsetEnv("NO_COLOR");
    CHECK(ResolveLogColor(false, false) == IsStderrTty());
}
