#pragma once

#include <stdio_mcp/config/app_config.hpp>
#include <stdio_mcp/core/result.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace stdio_mcp {

// Parse a YAML config file into an AppConfig. Missing keys keep defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// What the command line asked for: explicit settings only, so they can be
// laid over a YAML file without clobbering it with defaults.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> server_name;
    std::optional<std::string> server_version;
    std::optional<std::uint64_t> max_read_bytes;
    std::optional<int> command_timeout_seconds;
    std::optional<std::vector<std::string>> allowed_commands;
    std::optional<LogLevel> log_level;
    bool debug = false;
    bool quiet = false;
    bool log_json = false;
    std::optional<std::string> log_file;
    std::optional<bool> color;
    bool exit_requested = false;  // --help or --version was handled
};

// Parse CLI arguments. --help and --version print to `out` and set
// exit_requested.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv,
                                      std::ostream& out);

// Lay CLI settings over a base config (defaults or YAML).
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Full pipeline: CLI -> optional YAML -> merge -> validate.
Result<AppConfig, Error> LoadConfig(const CliOptions& cli);

} // namespace stdio_mcp
