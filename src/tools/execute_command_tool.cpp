#include <stdio_mcp/tools/builtin_tools.hpp>

#include <stdio_mcp/core/log.hpp>
#include <stdio_mcp/core/process.hpp>

#include "tool_helpers.hpp"

#include <algorithm>
#include <sstream>

namespace stdio_mcp {

using namespace tool_helpers;

namespace {

std::string Join(const std::vector<std::string>& parts, const std::string& sep) {
    std::ostringstream out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out << sep;
        out << parts[i];
    }
    return out.str();
}

} // anonymous namespace

ExecuteCommandTool::ExecuteCommandTool(std::vector<std::string> allowed_commands,
                                       std::chrono::seconds timeout)
    : allowed_commands_(std::move(allowed_commands)), timeout_(timeout) {}

std::string ExecuteCommandTool::Description() const {
    return "Execute a safe system command (restricted for security)";
}

nlohmann::json ExecuteCommandTool::InputSchema() const {
    nlohmann::json args = {
        {"type", "array"},
        {"items", {{"type", "string"}}},
        {"description", "Command arguments"},
    };
    return MakeSchema({{"command", StringProp("Command to execute")},
                       {"args", args}},
                      nlohmann::json::array({"command"}));
}

bool ExecuteCommandTool::IsAllowed(const std::string& command) const {
    return std::find(allowed_commands_.begin(), allowed_commands_.end(), command) !=
           allowed_commands_.end();
}

CallResult ExecuteCommandTool::Invoke(const nlohmann::json& arguments) {
    auto command = OptString(arguments, "command");
    if (!command || command->empty()) {
        return CallResult::Failure("Missing required parameter: command");
    }

    if (!IsAllowed(*command)) {
        LogWarn("tool:execute_command", "Refused command '" + *command + "'");
        return CallResult::Failure("Command '" + *command +
                                   "' is not allowed. Allowed commands: " +
                                   Join(allowed_commands_, ", "));
    }

    // Non-string entries in "args" are skipped.
    std::vector<std::string> args;
    if (arguments.contains("args") && arguments["args"].is_array()) {
        for (const auto& arg : arguments["args"]) {
            if (arg.is_string()) {
                args.push_back(arg.get<std::string>());
            }
        }
    }

    LogInfo("tool:execute_command", "Running " + *command +
                                    (args.empty() ? "" : " " + Join(args, " ")));
    auto run = RunProcess(*command, args, timeout_);
    if (run.IsErr()) {
        return CallResult::Failure("Error executing command: " + run.Error().message);
    }

    const auto& output = run.Value();
    if (output.timed_out) {
        return CallResult::Failure("Command timed out after " +
                                   std::to_string(timeout_.count()) + " seconds");
    }

    std::ostringstream text;
    text << "Command: " << *command << ' ' << Join(args, " ") << '\n';
    if (!output.stderr_text.empty()) {
        text << "STDOUT:\n" << output.stdout_text << "\nSTDERR:\n" << output.stderr_text;
    } else {
        text << "Output:\n" << output.stdout_text;
    }

    CallResult result = CallResult::Text(text.str());
    result.is_error = !output.Succeeded();
    return result;
}

} // namespace stdio_mcp
