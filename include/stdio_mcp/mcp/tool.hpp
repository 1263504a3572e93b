#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace stdio_mcp {

// ---------------------------------------------------------------------------
// ContentBlock: one entry of a tool result's content sequence.
// Only "text" blocks are produced by this server.
// ---------------------------------------------------------------------------
struct ContentBlock {
    std::string type = "text";
    std::string text;

    static ContentBlock Text(std::string text) {
        return ContentBlock{"text", std::move(text)};
    }

    [[nodiscard]] nlohmann::json ToJson() const {
        return {{"type", type}, {"text", text}};
    }
};

// ---------------------------------------------------------------------------
// CallResult: outcome of a tools/call. A tool that could not do what was
// asked still returns a CallResult, with is_error set and the reason as text.
// ---------------------------------------------------------------------------
struct CallResult {
    std::vector<ContentBlock> content;
    bool is_error = false;

    static CallResult Text(std::string text) {
        return CallResult{{ContentBlock::Text(std::move(text))}, false};
    }

    static CallResult Failure(std::string text) {
        return CallResult{{ContentBlock::Text(std::move(text))}, true};
    }

    // Wire form: {"content":[...],"isError":bool}
    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ToolDefinition: what tools/list reports for a tool.
// ---------------------------------------------------------------------------
struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object

    // Wire form: {"name", "description", "inputSchema"}
    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ITool: capability set every invocable tool implements.
//
// Invoke may block (file I/O, subprocesses) and must not assume the
// resources it touches stay unchanged between calls.
// ---------------------------------------------------------------------------
class ITool {
public:
    virtual ~ITool() = default;

    [[nodiscard]] virtual std::string Name() const = 0;
    [[nodiscard]] virtual std::string Description() const = 0;
    [[nodiscard]] virtual nlohmann::json InputSchema() const = 0;

    virtual CallResult Invoke(const nlohmann::json& arguments) = 0;
};

} // namespace stdio_mcp
