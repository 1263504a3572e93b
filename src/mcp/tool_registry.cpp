#include <stdio_mcp/mcp/tool_registry.hpp>

#include <stdio_mcp/core/log.hpp>

namespace stdio_mcp {

namespace {

// Adapts a ToolHandler to the ITool interface.
class FunctionTool : public ITool {
public:
    FunctionTool(std::string name, std::string description,
                 nlohmann::json input_schema, ToolHandler handler)
        : name_(std::move(name)),
          description_(std::move(description)),
          input_schema_(std::move(input_schema)),
          handler_(std::move(handler)) {}

    std::string Name() const override { return name_; }
    std::string Description() const override { return description_; }
    nlohmann::json InputSchema() const override { return input_schema_; }

    CallResult Invoke(const nlohmann::json& arguments) override {
        return handler_(arguments);
    }

private:
    std::string name_;
    std::string description_;
    nlohmann::json input_schema_;
    ToolHandler handler_;
};

Error MakeRegistryError(const std::string& name, const std::string& message) {
    return Error{"ToolRegistry::Register", name, message,
                 ErrorCategory::Config, std::nullopt};
}

} // anonymous namespace

nlohmann::json CallResult::ToJson() const {
    nlohmann::json blocks = nlohmann::json::array();
    for (const auto& block : content) {
        blocks.push_back(block.ToJson());
    }
    return {{"content", blocks}, {"isError", is_error}};
}

nlohmann::json ToolDefinition::ToJson() const {
    return {{"name", name},
            {"description", description},
            {"inputSchema", input_schema}};
}

Result<void, Error> ToolRegistry::Register(std::unique_ptr<ITool> tool) {
    if (!tool) {
        return Result<void, Error>::Err(MakeRegistryError("", "Tool is null"));
    }
    auto name = tool->Name();
    if (name.empty()) {
        return Result<void, Error>::Err(MakeRegistryError(name, "Tool name is empty"));
    }
    if (index_.count(name) > 0) {
        return Result<void, Error>::Err(
            MakeRegistryError(name, "Tool is already registered"));
    }

    index_[name] = tools_.size();
    definitions_.push_back({name, tool->Description(), tool->InputSchema()});
    tools_.push_back(std::move(tool));
    LogDebug("registry", "Registered tool '" + name + "'");
    return Result<void, Error>::Ok();
}

Result<void, Error> ToolRegistry::Register(const std::string& name,
                                           const std::string& description,
                                           const nlohmann::json& input_schema,
                                           ToolHandler handler) {
    if (!handler) {
        return Result<void, Error>::Err(MakeRegistryError(name, "Handler is empty"));
    }
    return Register(std::make_unique<FunctionTool>(name, description, input_schema,
                                                   std::move(handler)));
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return index_.count(name) > 0;
}

CallResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& arguments) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return CallResult::Failure("Unknown tool: " + name);
    }

    try {
        return tools_[it->second]->Invoke(arguments);
    } catch (const std::exception& e) {
        LogError("tool:" + name, std::string("Unhandled exception: ") + e.what());
        return CallResult::Failure(std::string("Tool error: ") + e.what());
    } catch (...) {
        LogError("tool:" + name, "Unhandled non-standard exception");
        return CallResult::Failure("Tool error: unknown exception");
    }
}

} // namespace stdio_mcp
