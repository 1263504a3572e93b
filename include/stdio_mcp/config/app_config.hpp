#pragma once

#include <stdio_mcp/core/log.hpp>
#include <stdio_mcp/core/version.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stdio_mcp {

// Identity reported to clients as serverInfo.
struct ServerConfig {
    std::string name = "stdio-mcp";
    std::string version = kVersion;
};

struct ToolsConfig {
    std::uint64_t max_read_bytes = 1048576;
    std::vector<std::string> allowed_commands = {
        "echo", "date", "whoami", "pwd", "ls", "cat", "head", "tail", "wc",
    };
    int command_timeout_seconds = 30;
};

struct LogConfig {
    std::optional<LogLevel> level;  // explicit level; wins over debug/quiet
    bool debug = false;
    bool quiet = false;
    bool json = false;
    std::optional<std::string> log_file;
    std::optional<bool> color;  // unset: decide from NO_COLOR and the TTY
};

struct AppConfig {
    ServerConfig server;
    ToolsConfig tools;
    LogConfig log;
};

} // namespace stdio_mcp
