#pragma once

#include <stdio_mcp/core/result.hpp>
#include <stdio_mcp/mcp/message.hpp>
#include <stdio_mcp/mcp/message_codec.hpp>
#include <stdio_mcp/mcp/tool_registry.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace stdio_mcp {

// ---------------------------------------------------------------------------
// Handshake state. Uninitialized -> Initializing -> Ready, never backwards.
// ---------------------------------------------------------------------------
enum class ServerState {
    Uninitialized,
    Initializing,
    Ready,
};

const char* ServerStateName(ServerState state);

struct ServerInfo {
    std::string name;
    std::string version;
};

struct ClientInfo {
    std::string name;
    std::string version;
};

constexpr const char* kDefaultProtocolVersion = "2024-11-05";

// Protocol revisions this server accepts from a client, oldest first.
const std::vector<std::string>& SupportedProtocolVersions();

// ---------------------------------------------------------------------------
// ProtocolEngine: MCP request/notification handling.
//
// Owns the handshake state and the tool registry. Single-threaded: one
// message is fully handled before the next one is accepted.
//
// Methods:
//   - initialize, ping                    (any state)
//   - tools/list, tools/call,
//     resources/list, prompts/list        (Ready only)
//   - initialized / notifications/initialized (notification)
// ---------------------------------------------------------------------------
class ProtocolEngine {
public:
    ProtocolEngine(ToolRegistry registry, ServerInfo server_info);

    // Handle one decoded message. A request yields exactly one response;
    // notifications and stray responses yield none.
    [[nodiscard]] std::optional<Response> Handle(const Message& message);

    [[nodiscard]] Response HandleRequest(const Request& request);
    void HandleNotification(const Notification& notification);

    // Turn a frame decode failure into an error response, or nullopt when
    // no id could be recovered to correlate it with.
    [[nodiscard]] std::optional<Response> HandleDecodeError(const DecodeError& error);

    [[nodiscard]] ServerState State() const noexcept { return state_; }
    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return registry_; }
    [[nodiscard]] const ServerInfo& Server() const noexcept { return server_info_; }
    [[nodiscard]] const std::optional<ClientInfo>& Client() const noexcept {
        return client_;
    }
    [[nodiscard]] const std::string& ProtocolVersion() const noexcept {
        return protocol_version_;
    }

private:
    using MethodResult = Result<nlohmann::json, ProtocolError>;
    using MethodHandler = MethodResult (ProtocolEngine::*)(const nlohmann::json& params);

    struct MethodEntry {
        MethodHandler handler;
        bool requires_ready;
    };

    // Fills methods_; defined next to the handlers in builtin_methods.cpp.
    void RegisterBuiltinMethods();

    MethodResult HandleInitialize(const nlohmann::json& params);
    MethodResult HandlePing(const nlohmann::json& params);
    MethodResult HandleToolsList(const nlohmann::json& params);
    MethodResult HandleToolsCall(const nlohmann::json& params);
    MethodResult HandleResourcesList(const nlohmann::json& params);
    MethodResult HandlePromptsList(const nlohmann::json& params);

    ToolRegistry registry_;
    ServerInfo server_info_;
    ServerState state_ = ServerState::Uninitialized;
    std::optional<ClientInfo> client_;
    std::string protocol_version_;
    std::map<std::string, MethodEntry> methods_;
};

} // namespace stdio_mcp
