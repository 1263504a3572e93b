// Built-in MCP methods: the method table and the handlers behind it.

#include <stdio_mcp/mcp/protocol_engine.hpp>

#include <stdio_mcp/core/log.hpp>

#include <algorithm>

namespace stdio_mcp {

namespace {

constexpr const char* kComponent = "engine";

using MethodResult = Result<nlohmann::json, ProtocolError>;

MethodResult Ok(nlohmann::json value) {
    return MethodResult::Ok(std::move(value));
}

MethodResult InvalidParams(std::string message,
                           std::optional<nlohmann::json> data = std::nullopt) {
    return MethodResult::Err(ProtocolError::InvalidParams(std::move(message), std::move(data)));
}

// Optional string member; anything else reads as empty.
std::string StringMember(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

std::string NegotiateVersion(const std::string& requested) {
    const auto& supported = SupportedProtocolVersions();
    if (std::find(supported.begin(), supported.end(), requested) != supported.end()) {
        return requested;
    }
    return kDefaultProtocolVersion;
}

} // anonymous namespace

void ProtocolEngine::RegisterBuiltinMethods() {
    methods_ = {
        {"initialize",     {&ProtocolEngine::HandleInitialize, false}},
        {"ping",           {&ProtocolEngine::HandlePing, false}},
        {"tools/list",     {&ProtocolEngine::HandleToolsList, true}},
        {"tools/call",     {&ProtocolEngine::HandleToolsCall, true}},
        {"resources/list", {&ProtocolEngine::HandleResourcesList, true}},
        {"prompts/list",   {&ProtocolEngine::HandlePromptsList, true}},
    };
}

// initialize
MethodResult ProtocolEngine::HandleInitialize(const nlohmann::json& params) {
    if (state_ != ServerState::Uninitialized) {
        return MethodResult::Err(
            ProtocolError::InvalidRequest("Handshake already completed"));
    }

    auto version = params.find("protocolVersion");
    if (version == params.end() || !version->is_string()) {
        return InvalidParams("Missing or invalid 'protocolVersion'");
    }
    auto client = params.find("clientInfo");
    if (client == params.end() || !client->is_object()) {
        return InvalidParams("Missing or invalid 'clientInfo'");
    }
    if (auto caps = params.find("capabilities");
        caps != params.end() && !caps->is_object()) {
        return InvalidParams("'capabilities' must be an object");
    }

    const auto requested = version->get<std::string>();
    protocol_version_ = NegotiateVersion(requested);
    client_ = ClientInfo{StringMember(*client, "name"),
                         StringMember(*client, "version")};
    state_ = ServerState::Initializing;

    LogInfo(kComponent, "Initializing for client " + client_->name + " " +
                        client_->version + " (protocol " + protocol_version_ + ")");
    if (protocol_version_ != requested) {
        LogWarn(kComponent, "Client requested unsupported protocol " + requested +
                            ", offering " + protocol_version_);
    }

    nlohmann::json result;
    result["protocolVersion"] = protocol_version_;
    result["capabilities"] = {
        {"tools", {{"listChanged", false}}},
        {"resources", nlohmann::json::object()},
        {"prompts", nlohmann::json::object()},
    };
    result["serverInfo"] = {
        {"name", server_info_.name},
        {"version", server_info_.version},
    };
    return Ok(std::move(result));
}

// ping
MethodResult ProtocolEngine::HandlePing(const nlohmann::json& /*params*/) {
    return Ok(nlohmann::json::object());
}

// tools/list
MethodResult ProtocolEngine::HandleToolsList(const nlohmann::json& /*params*/) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& definition : registry_.Tools()) {
        tools.push_back(definition.ToJson());
    }
    LogDebug(kComponent, "Listing " + std::to_string(tools.size()) + " tools");
    return Ok({{"tools", std::move(tools)}});
}

// tools/call
MethodResult ProtocolEngine::HandleToolsCall(const nlohmann::json& params) {
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return InvalidParams("Missing or invalid 'name' parameter");
    }
    const auto tool_name = name_it->get<std::string>();

    nlohmann::json arguments = nlohmann::json::object();
    if (auto args_it = params.find("arguments");
        args_it != params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return InvalidParams("'arguments' must be an object", nlohmann::json{{"tool", tool_name}});
        }
        arguments = *args_it;
    }

    if (!registry_.HasTool(tool_name)) {
        return InvalidParams("Unknown tool: " + tool_name, nlohmann::json{{"tool", tool_name}});
    }

    LogDebug(kComponent, "Calling tool " + tool_name);
    auto result = registry_.Execute(tool_name, arguments);
    if (result.is_error) {
        LogInfo(kComponent, "Tool " + tool_name + " reported an error");
    }
    return Ok(result.ToJson());
}

// resources/list
MethodResult ProtocolEngine::HandleResourcesList(const nlohmann::json& /*params*/) {
    return Ok({{"resources", nlohmann::json::array()}});
}

// prompts/list
MethodResult ProtocolEngine::HandlePromptsList(const nlohmann::json& /*params*/) {
    return Ok({{"prompts", nlohmann::json::array()}});
}

} // namespace stdio_mcp
