#pragma once

#include <stdio_mcp/core/result.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace stdio_mcp {

// ---------------------------------------------------------------------------
// ProcessOutput: captured result of a finished child process.
// ---------------------------------------------------------------------------
struct ProcessOutput {
    int exit_code = 0;          // -1 when killed by a signal
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;

    [[nodiscard]] bool Succeeded() const noexcept {
        return !timed_out && exit_code == 0;
    }
};

// Run `program` with `args`, without a shell. The program is resolved
// through PATH. stdin is connected to /dev/null; stdout and stderr are
// captured separately. When `timeout` elapses the child is killed and the
// partial output is returned with timed_out set.
//
// Errors: pipe/fork failures (Process). A program that cannot be executed
// is not an error here: it yields exit_code 127 and the reason on stderr,
// the same convention a shell uses.
Result<ProcessOutput, Error> RunProcess(const std::string& program,
                                        const std::vector<std::string>& args,
                                        std::chrono::milliseconds timeout);

} // namespace stdio_mcp
