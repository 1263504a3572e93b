#pragma once

#include <stdio_mcp/config/app_config.hpp>
#include <stdio_mcp/core/result.hpp>
#include <stdio_mcp/mcp/tool.hpp>
#include <stdio_mcp/mcp/tool_registry.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace stdio_mcp {

// echo: repeats the given text back.
class EchoTool : public ITool {
public:
    std::string Name() const override { return "echo"; }
    std::string Description() const override;
    nlohmann::json InputSchema() const override;
    CallResult Invoke(const nlohmann::json& arguments) override;
};

// get_system_info: OS, architecture and hostname of this machine.
class SystemInfoTool : public ITool {
public:
    std::string Name() const override { return "get_system_info"; }
    std::string Description() const override;
    nlohmann::json InputSchema() const override;
    CallResult Invoke(const nlohmann::json& arguments) override;
};

// list_files: entries of one directory, sorted by name.
class ListFilesTool : public ITool {
public:
    std::string Name() const override { return "list_files"; }
    std::string Description() const override;
    nlohmann::json InputSchema() const override;
    CallResult Invoke(const nlohmann::json& arguments) override;
};

// read_file: text contents of a file up to a size limit.
class ReadFileTool : public ITool {
public:
    explicit ReadFileTool(std::uint64_t default_max_bytes);

    std::string Name() const override { return "read_file"; }
    std::string Description() const override;
    nlohmann::json InputSchema() const override;
    CallResult Invoke(const nlohmann::json& arguments) override;

private:
    std::uint64_t default_max_bytes_;
};

// execute_command: runs an allow-listed program without a shell.
class ExecuteCommandTool : public ITool {
public:
    ExecuteCommandTool(std::vector<std::string> allowed_commands,
                       std::chrono::seconds timeout);

    std::string Name() const override { return "execute_command"; }
    std::string Description() const override;
    nlohmann::json InputSchema() const override;
    CallResult Invoke(const nlohmann::json& arguments) override;

private:
    [[nodiscard]] bool IsAllowed(const std::string& command) const;

    std::vector<std::string> allowed_commands_;
    std::chrono::seconds timeout_;
};

// Register echo, get_system_info, list_files, read_file and
// execute_command, in that order.
Result<void, Error> RegisterBuiltinTools(ToolRegistry& registry,
                                         const ToolsConfig& config);

} // namespace stdio_mcp
