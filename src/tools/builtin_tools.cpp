#include <stdio_mcp/tools/builtin_tools.hpp>

#include <stdio_mcp/core/log.hpp>

#include "tool_helpers.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>

#ifndef _WIN32
#include <sys/utsname.h>
#include <unistd.h>
#endif

namespace stdio_mcp {

using namespace tool_helpers;

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

struct PlatformInfo {
    std::string os;
    std::string arch;
    std::string hostname;
};

PlatformInfo QueryPlatform() {
    PlatformInfo info;
#ifdef _WIN32
    info.os = "windows";
    const char* arch = std::getenv("PROCESSOR_ARCHITECTURE");
    info.arch = arch != nullptr ? ToLower(arch) : "unknown";
    const char* host = std::getenv("COMPUTERNAME");
    info.hostname = host != nullptr ? host : "unknown";
#else
    struct utsname uts {};
    if (::uname(&uts) == 0) {
        info.os = ToLower(uts.sysname);
        info.arch = uts.machine;
    } else {
        info.os = "unknown";
        info.arch = "unknown";
    }
    char host[256] = {};
    if (::gethostname(host, sizeof(host) - 1) == 0) {
        info.hostname = host;
    } else {
        info.hostname = "unknown";
    }
#endif
    return info;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// echo
// ---------------------------------------------------------------------------
std::string EchoTool::Description() const {
    return "Echo back the provided text";
}

nlohmann::json EchoTool::InputSchema() const {
    return MakeSchema({{"text", StringProp("Text to echo back")}},
                      nlohmann::json::array({"text"}));
}

CallResult EchoTool::Invoke(const nlohmann::json& arguments) {
    auto text = OptString(arguments, "text").value_or("No text provided");
    return CallResult::Text("Echo: " + text);
}

// ---------------------------------------------------------------------------
// get_system_info
// ---------------------------------------------------------------------------
std::string SystemInfoTool::Description() const {
    return "Get basic system information";
}

nlohmann::json SystemInfoTool::InputSchema() const {
    return {{"type", "object"},
            {"properties", nlohmann::json::object()},
            {"additionalProperties", false}};
}

CallResult SystemInfoTool::Invoke(const nlohmann::json& /*arguments*/) {
    auto info = QueryPlatform();
    return CallResult::Text("System Information:\n- OS: " + info.os +
                            "\n- Architecture: " + info.arch +
                            "\n- Hostname: " + info.hostname);
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------
Result<void, Error> RegisterBuiltinTools(ToolRegistry& registry,
                                         const ToolsConfig& config) {
    std::vector<std::unique_ptr<ITool>> tools;
    tools.push_back(std::make_unique<EchoTool>());
    tools.push_back(std::make_unique<SystemInfoTool>());
    tools.push_back(std::make_unique<ListFilesTool>());
    tools.push_back(std::make_unique<ReadFileTool>(config.max_read_bytes));
    tools.push_back(std::make_unique<ExecuteCommandTool>(
        config.allowed_commands, std::chrono::seconds(config.command_timeout_seconds)));

    for (auto& tool : tools) {
        auto registered = registry.Register(std::move(tool));
        if (registered.IsErr()) {
            return registered;
        }
    }
    LogInfo("registry", std::to_string(registry.Size()) + " tools registered");
    return Result<void, Error>::Ok();
}

} // namespace stdio_mcp
