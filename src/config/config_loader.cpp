#include <stdio_mcp/config/config_loader.hpp>

#include <stdio_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace stdio_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", message, ErrorCategory::Config, std::nullopt};
}

void ApplyYamlServer(const YAML::Node& node, ServerConfig& server) {
    if (node["name"]) {
        server.name = node["name"].as<std::string>();
    }
    if (node["version"]) {
        server.version = node["version"].as<std::string>();
    }
}

Result<void, Error> ApplyYamlTools(const YAML::Node& node, ToolsConfig& tools) {
    if (node["max_read_bytes"]) {
        auto value = node["max_read_bytes"].as<long long>();
        if (value <= 0) {
            return Result<void, Error>::Err(
                MakeConfigError("tools.max_read_bytes must be positive"));
        }
        tools.max_read_bytes = static_cast<std::uint64_t>(value);
    }
    if (node["command_timeout_seconds"]) {
        tools.command_timeout_seconds = node["command_timeout_seconds"].as<int>();
    }
    if (node["allowed_commands"]) {
        const auto& list = node["allowed_commands"];
        if (!list.IsSequence()) {
            return Result<void, Error>::Err(
                MakeConfigError("tools.allowed_commands must be a list"));
        }
        tools.allowed_commands.clear();
        for (const auto& cmd : list) {
            tools.allowed_commands.push_back(cmd.as<std::string>());
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ApplyYamlLog(const YAML::Node& node, LogConfig& log) {
    if (node["level"]) {
        auto level = ParseLogLevel(node["level"].as<std::string>());
        if (!level) {
            return Result<void, Error>::Err(
                MakeConfigError("log.level must be one of debug, info, warn, error"));
        }
        log.level = *level;
    }
    if (node["debug"]) {
        log.debug = node["debug"].as<bool>();
    }
    if (node["quiet"]) {
        log.quiet = node["quiet"].as<bool>();
    }
    if (node["json"]) {
        log.json = node["json"].as<bool>();
    }
    if (node["file"]) {
        log.log_file = node["file"].as<std::string>();
    }
    if (node["color"]) {
        log.color = node["color"].as<bool>();
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));

        if (root["server"]) {
            ApplyYamlServer(root["server"], config.server);
        }
        if (root["tools"]) {
            auto applied = ApplyYamlTools(root["tools"], config.tools);
            if (applied.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(applied).Error());
            }
        }
        if (root["log"]) {
            auto applied = ApplyYamlLog(root["log"], config.log);
            if (applied.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(applied).Error());
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv,
                                      std::ostream& out) {
    argparse::ArgumentParser program("stdio-mcp", kVersion,
                                     argparse::default_arguments::none);
    program.add_description(
        "MCP server speaking newline-delimited JSON-RPC over stdin/stdout.");

    program.add_argument("-h", "--help")
        .help("Show this help and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-V", "--version")
        .help("Print the version and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("-n", "--name")
        .help("Server name reported to clients");
    program.add_argument("--server-version")
        .help("Server version reported to clients");
    program.add_argument("--max-read-bytes")
        .help("Default size limit for read_file, in bytes")
        .scan<'i', long long>();
    program.add_argument("--command-timeout")
        .help("Time limit for execute_command, in seconds")
        .scan<'i', int>();
    program.add_argument("--allow-command")
        .help("Command execute_command may run (repeatable, replaces the default list)")
        .append();
    program.add_argument("--log-level")
        .help("Log level: debug, info, warn or error");
    program.add_argument("-d", "--debug")
        .help("Enable debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Only log warnings and errors")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Write JSON log lines to this file instead of stderr");
    program.add_argument("--log-json")
        .help("Log JSON lines to stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions options;

    if (program.get<bool>("--help")) {
        out << program;
        options.exit_requested = true;
        return Result<CliOptions, Error>::Ok(std::move(options));
    }
    if (program.get<bool>("--version")) {
        out << "stdio-mcp " << kVersion << "\n";
        options.exit_requested = true;
        return Result<CliOptions, Error>::Ok(std::move(options));
    }

    if (auto val = program.present("--config")) {
        options.config_path = *val;
    }
    if (auto val = program.present("--name")) {
        options.server_name = *val;
    }
    if (auto val = program.present("--server-version")) {
        options.server_version = *val;
    }
    if (auto val = program.present<long long>("--max-read-bytes")) {
        if (*val <= 0) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("--max-read-bytes must be positive"));
        }
        options.max_read_bytes = static_cast<std::uint64_t>(*val);
    }
    if (auto val = program.present<int>("--command-timeout")) {
        options.command_timeout_seconds = *val;
    }
    if (auto val = program.present<std::vector<std::string>>("--allow-command")) {
        options.allowed_commands = *val;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("--log-level must be one of debug, info, warn, error"));
        }
        options.log_level = *level;
    }
    options.debug = program.get<bool>("--debug");
    options.quiet = program.get<bool>("--quiet");
    options.log_json = program.get<bool>("--log-json");
    if (auto val = program.present("--log-file")) {
        options.log_file = *val;
    }
    if (program.get<bool>("--no-color")) {
        options.color = false;
    } else if (program.get<bool>("--color")) {
        options.color = true;
    }

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli) {
    AppConfig merged = base;

    if (cli.server_name) merged.server.name = *cli.server_name;
    if (cli.server_version) merged.server.version = *cli.server_version;

    if (cli.max_read_bytes) merged.tools.max_read_bytes = *cli.max_read_bytes;
    if (cli.command_timeout_seconds) {
        merged.tools.command_timeout_seconds = *cli.command_timeout_seconds;
    }
    if (cli.allowed_commands) merged.tools.allowed_commands = *cli.allowed_commands;

    if (cli.log_level) merged.log.level = cli.log_level;
    // Boolean flags can only switch things on from the command line.
    if (cli.debug) merged.log.debug = true;
    if (cli.quiet) merged.log.quiet = true;
    if (cli.log_json) merged.log.json = true;
    if (cli.log_file) merged.log.log_file = cli.log_file;
    if (cli.color) merged.log.color = cli.color;

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.name.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Server name must not be empty"));
    }
    if (config.server.version.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Server version must not be empty"));
    }
    if (config.tools.max_read_bytes == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("max_read_bytes must be positive"));
    }
    if (config.tools.command_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("command_timeout_seconds must be positive"));
    }
    for (const auto& cmd : config.tools.allowed_commands) {
        if (cmd.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Allowed command names must not be empty"));
        }
        if (cmd.find('/') != std::string::npos || cmd.find('\\') != std::string::npos) {
            return Result<void, Error>::Err(
                MakeConfigError("Allowed command must be a bare name, not a path: " + cmd));
        }
    }
    if (config.log.debug && config.log.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("--debug and --quiet are mutually exclusive"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// LoadConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadConfig(const CliOptions& cli) {
    AppConfig base;
    if (cli.config_path) {
        auto yaml = LoadFromYaml(*cli.config_path);
        if (yaml.IsErr()) {
            return yaml;
        }
        base = std::move(yaml).Value();
    }

    auto merged = MergeConfigs(base, cli);
    auto valid = ValidateConfig(merged);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(valid).Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(merged));
}

} // namespace stdio_mcp
