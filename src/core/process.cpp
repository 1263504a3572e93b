#include <stdio_mcp/core/process.hpp>

#include <stdio_mcp/core/log.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace stdio_mcp {

#ifdef _WIN32

Result<ProcessOutput, Error> RunProcess(const std::string& program,
                                        const std::vector<std::string>&,
                                        std::chrono::milliseconds) {
    return Result<ProcessOutput, Error>::Err(
        Error{"RunProcess", program,
              "Subprocess execution is not supported on this platform",
              ErrorCategory::Process, std::nullopt});
}

#else

namespace {

constexpr int kExecFailedExitCode = 127;

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Runs in the forked child: wire up the pipes and exec. Never returns.
[[noreturn]] void ExecChild(const std::string& program,
                            const std::vector<std::string>& args,
                            int stdout_write, int stderr_write) {
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::close(devnull);
    }
    ::dup2(stdout_write, STDOUT_FILENO);
    ::dup2(stderr_write, STDERR_FILENO);
    ::close(stdout_write);
    ::close(stderr_write);

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    ::execvp(program.c_str(), argv.data());

    // Only async-signal-safe calls from here on.
    const char* reason = std::strerror(errno);
    const char prefix[] = "exec failed: ";
    ssize_t ignored = ::write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
    ignored = ::write(STDERR_FILENO, reason, std::strlen(reason));
    ignored = ::write(STDERR_FILENO, "\n", 1);
    (void)ignored;
    ::_exit(kExecFailedExitCode);
}

// Read whatever is available on fd into out. Returns false on EOF or error.
bool DrainOnce(int fd, std::string& out) {
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            return true;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return false;
    }
}

int WaitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

} // anonymous namespace

Result<ProcessOutput, Error> RunProcess(const std::string& program,
                                        const std::vector<std::string>& args,
                                        std::chrono::milliseconds timeout) {
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    if (::pipe(out_pipe) == -1) {
        return Result<ProcessOutput, Error>::Err(
            Error::FromErrno("RunProcess", program, errno, ErrorCategory::Process));
    }
    if (::pipe(err_pipe) == -1) {
        int saved = errno;
        CloseFd(out_pipe[0]);
        CloseFd(out_pipe[1]);
        return Result<ProcessOutput, Error>::Err(
            Error::FromErrno("RunProcess", program, saved, ErrorCategory::Process));
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        int saved = errno;
        CloseFd(out_pipe[0]);
        CloseFd(out_pipe[1]);
        CloseFd(err_pipe[0]);
        CloseFd(err_pipe[1]);
        return Result<ProcessOutput, Error>::Err(
            Error::FromErrno("RunProcess", program, saved, ErrorCategory::Process));
    }

    if (pid == 0) {
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        ExecChild(program, args, out_pipe[1], err_pipe[1]);
    }

    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    LogDebug("process", "Started '" + program + "' (pid " +
                        std::to_string(pid) + ")");

    ProcessOutput output;
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (out_fd >= 0 || err_fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            output.timed_out = true;
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        int out_slot = -1;
        int err_slot = -1;
        if (out_fd >= 0) {
            out_slot = static_cast<int>(count);
            fds[count++] = pollfd{out_fd, POLLIN, 0};
        }
        if (err_fd >= 0) {
            err_slot = static_cast<int>(count);
            fds[count++] = pollfd{err_fd, POLLIN, 0};
        }

        const auto wait_ms = std::min<std::chrono::milliseconds::rep>(
            remaining.count(), std::numeric_limits<int>::max());
        int ready = ::poll(fds, count, static_cast<int>(wait_ms));
        if (ready < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::kill(pid, SIGKILL);
            CloseFd(out_fd);
            CloseFd(err_fd);
            WaitForChild(pid);
            return Result<ProcessOutput, Error>::Err(
                Error::FromErrno("RunProcess", program, saved, ErrorCategory::Process));
        }
        if (ready == 0) continue;  // deadline re-checked at loop head

        if (out_slot >= 0 && fds[out_slot].revents != 0 &&
            !DrainOnce(out_fd, output.stdout_text)) {
            CloseFd(out_fd);
        }
        if (err_slot >= 0 && fds[err_slot].revents != 0 &&
            !DrainOnce(err_fd, output.stderr_text)) {
            CloseFd(err_fd);
        }
    }

    if (output.timed_out) {
        LogWarn("process", "'" + program + "' exceeded its time limit, killing pid " +
                           std::to_string(pid));
        ::kill(pid, SIGKILL);
    }
    CloseFd(out_fd);
    CloseFd(err_fd);

    output.exit_code = WaitForChild(pid);
    LogDebug("process", "'" + program + "' exited with code " +
                        std::to_string(output.exit_code));
    return Result<ProcessOutput, Error>::Ok(std::move(output));
}

#endif

} // namespace stdio_mcp
