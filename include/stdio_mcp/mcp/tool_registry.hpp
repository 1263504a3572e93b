#pragma once

#include <stdio_mcp/core/result.hpp>
#include <stdio_mcp/mcp/tool.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace stdio_mcp {

// A plain function usable as a tool body.
using ToolHandler = std::function<CallResult(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: the set of invocable tools, in registration order.
//
// Populated at startup and read-only afterwards. Lookup is by name.
// Move-only: the protocol engine takes ownership of it.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(ToolRegistry&&) noexcept = default;
    ToolRegistry& operator=(ToolRegistry&&) noexcept = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    // Fails when a tool with the same name is already registered or the
    // name is empty. The registry is unchanged on failure.
    Result<void, Error> Register(std::unique_ptr<ITool> tool);

    // Wrap a function as a tool.
    Result<void, Error> Register(const std::string& name,
                                 const std::string& description,
                                 const nlohmann::json& input_schema,
                                 ToolHandler handler);

    [[nodiscard]] const std::vector<ToolDefinition>& Tools() const noexcept {
        return definitions_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] size_t Size() const noexcept { return tools_.size(); }

    // Invoke a tool by name. Unknown names and exceptions thrown by the
    // tool come back as a CallResult with is_error set.
    [[nodiscard]] CallResult Execute(const std::string& name,
                                     const nlohmann::json& arguments) const;

private:
    std::vector<ToolDefinition> definitions_;
    std::vector<std::unique_ptr<ITool>> tools_;
    std::map<std::string, size_t> index_;
};

} // namespace stdio_mcp
