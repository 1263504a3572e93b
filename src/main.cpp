#include <stdio_mcp/config/config_loader.hpp>
#include <stdio_mcp/core/log.hpp>
#include <stdio_mcp/core/terminal.hpp>
#include <stdio_mcp/core/version.hpp>
#include <stdio_mcp/mcp/protocol_engine.hpp>
#include <stdio_mcp/mcp/stdio_transport.hpp>
#include <stdio_mcp/tools/builtin_tools.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess   = 0;
constexpr int kExitTransport = 1;
constexpr int kExitConfig    = 99;

void PrintError(const stdio_mcp::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

stdio_mcp::LogLevel ResolveLogLevel(const stdio_mcp::LogConfig& log) {
    if (log.level) return *log.level;
    if (log.debug) return stdio_mcp::LogLevel::Debug;
    if (log.quiet) return stdio_mcp::LogLevel::Warn;
    return stdio_mcp::LogLevel::Info;
}

// Logs go to stderr or a file: stdout is reserved for protocol frames.
// The log file stream must outlive the logger, hence the static.
stdio_mcp::Result<void, stdio_mcp::Error> InitLogging(const stdio_mcp::LogConfig& log) {
    using namespace stdio_mcp;

    const auto level = ResolveLogLevel(log);
    if (log.log_file) {
        static std::ofstream log_stream;
        log_stream.open(*log.log_file, std::ios::app);
        if (!log_stream) {
            return Result<void, Error>::Err(
                Error{"InitLogging", *log.log_file, "Cannot open log file",
                      ErrorCategory::Config, std::nullopt});
        }
        InitGlobalLogger(std::make_unique<JsonSink>(log_stream), level);
    } else if (log.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
    } else {
        bool use_color = ResolveLogColor(log.color.value_or(false),
                                         log.color.has_value() && !*log.color);
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color), level);
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace stdio_mcp;

    auto cli = LoadFromCli(argc, argv, std::cout);
    if (cli.IsErr()) {
        PrintError(cli.Error());
        return cli.Error().ExitCode();
    }
    if (cli.Value().exit_requested) {
        return kExitSuccess;
    }

    auto loaded = LoadConfig(cli.Value());
    if (loaded.IsErr()) {
        PrintError(loaded.Error());
        return loaded.Error().ExitCode();
    }
    const auto config = std::move(loaded).Value();

    auto logging = InitLogging(config.log);
    if (logging.IsErr()) {
        PrintError(logging.Error());
        return logging.Error().ExitCode();
    }

    LogInfo("main", "Starting " + config.server.name + " " + config.server.version +
                    " (stdio-mcp " + kVersion + ")");

    ToolRegistry registry;
    auto registered = RegisterBuiltinTools(registry, config.tools);
    if (registered.IsErr()) {
        LogError("main", registered.Error().ToString());
        return kExitConfig;
    }

    ProtocolEngine engine(std::move(registry),
                          ServerInfo{config.server.name, config.server.version});

    StdioTransport transport(engine, std::cin, std::cout);
    auto run = transport.Run();
    if (run.IsErr()) {
        return kExitTransport;
    }

    LogInfo("main", "Server stopped");
    return kExitSuccess;
}
