#include <stdio_mcp/mcp/protocol_engine.hpp>

#include <stdio_mcp/core/log.hpp>

#include <utility>

namespace stdio_mcp {

namespace {

constexpr const char* kComponent = "engine";

} // anonymous namespace

const char* ServerStateName(ServerState state) {
    switch (state) {
        case ServerState::Uninitialized: return "Uninitialized";
        case ServerState::Initializing:  return "Initializing";
        case ServerState::Ready:         return "Ready";
    }
    return "Unknown";
}

const std::vector<std::string>& SupportedProtocolVersions() {
    static const std::vector<std::string> versions = {
        "2024-11-05",
        "2025-03-26",
        "2025-06-18",
    };
    return versions;
}

ProtocolEngine::ProtocolEngine(ToolRegistry registry, ServerInfo server_info)
    : registry_(std::move(registry)),
      server_info_(std::move(server_info)),
      protocol_version_(kDefaultProtocolVersion) {
    RegisterBuiltinMethods();
}

std::optional<Response> ProtocolEngine::Handle(const Message& message) {
    if (const auto* request = std::get_if<Request>(&message)) {
        return HandleRequest(*request);
    }
    if (const auto* notification = std::get_if<Notification>(&message)) {
        HandleNotification(*notification);
        return std::nullopt;
    }

    // This server never issues requests, so nothing awaits a response.
    const auto& response = std::get<Response>(message);
    LogWarn(kComponent, "Ignoring unsolicited response (id " +
                        (response.id ? RequestIdToString(*response.id) : "null") + ")");
    return std::nullopt;
}

Response ProtocolEngine::HandleRequest(const Request& request) {
    LogDebug(kComponent, "Request " + RequestIdToString(request.id) + ": " +
                         request.method);

    auto it = methods_.find(request.method);
    if (it == methods_.end()) {
        LogDebug(kComponent, "Unknown method: " + request.method);
        return Response::Failure(request.id, ProtocolError::MethodNotFound(request.method));
    }

    const auto& entry = it->second;
    if (entry.requires_ready && state_ != ServerState::Ready) {
        LogWarn(kComponent, request.method + " rejected in state " +
                            ServerStateName(state_));
        return Response::Failure(
            request.id, ProtocolError::InvalidRequest("Server not initialized"));
    }

    nlohmann::json params = request.params.value_or(nlohmann::json::object());
    if (!params.is_object()) {
        return Response::Failure(
            request.id, ProtocolError::InvalidParams("'params' must be an object"));
    }

    try {
        auto result = (this->*entry.handler)(params);
        if (result.IsErr()) {
            LogDebug(kComponent, request.method + " failed: " + result.Error().message);
            return Response::Failure(request.id, std::move(result).Error());
        }
        return Response::Success(request.id, std::move(result).Value());
    } catch (const std::exception& e) {
        LogError(kComponent, "Internal error in " + request.method + ": " + e.what());
        return Response::Failure(
            request.id, ProtocolError::InternalError(std::string("Internal error: ") + e.what()));
    } catch (...) {
        LogError(kComponent, "Internal error in " + request.method + ": unknown exception");
        return Response::Failure(
            request.id, ProtocolError::InternalError("Internal error: unknown exception"));
    }
}

void ProtocolEngine::HandleNotification(const Notification& notification) {
    const auto& method = notification.method;

    if (method == "notifications/initialized" || method == "initialized") {
        if (state_ != ServerState::Initializing) {
            LogWarn(kComponent, "Ignoring '" + method + "' in state " +
                                ServerStateName(state_));
            return;
        }
        state_ = ServerState::Ready;
        LogInfo(kComponent, "Handshake complete, server ready");
        return;
    }

    if (method == "notifications/cancelled") {
        // Requests run to completion before the next frame is read, so there
        // is never anything in flight to cancel.
        LogDebug(kComponent, "Ignoring cancellation notification");
        return;
    }

    LogDebug(kComponent, "Ignoring notification: " + method);
}

std::optional<Response> ProtocolEngine::HandleDecodeError(const DecodeError& error) {
    if (!error.id) {
        LogWarn(kComponent, "Dropping undecodable frame: " + error.message);
        return std::nullopt;
    }

    LogDebug(kComponent, "Rejecting frame " + RequestIdToString(*error.id) + ": " +
                         error.message);
    // -32700 is reserved for text that is not JSON at all.
    auto protocol_error = error.kind == DecodeErrorKind::Malformed && !error.parsed
                              ? ProtocolError::ParseError("Parse error: " + error.message)
                              : ProtocolError::InvalidRequest("Invalid request: " + error.message);
    return Response::Failure(*error.id, std::move(protocol_error));
}

} // namespace stdio_mcp
