#include <stdio_mcp/mcp/message.hpp>

#include <utility>

namespace stdio_mcp {

nlohmann::json RequestIdToJson(const RequestId& id) {
    return std::visit([](const auto& value) { return nlohmann::json(value); }, id);
}

std::string RequestIdToString(const RequestId& id) {
    return RequestIdToJson(id).dump();
}

ProtocolError ProtocolError::ParseError(std::string message) {
    return ProtocolError{error_code::kParseError, std::move(message), std::nullopt};
}

ProtocolError ProtocolError::InvalidRequest(std::string message) {
    return ProtocolError{error_code::kInvalidRequest, std::move(message), std::nullopt};
}

ProtocolError ProtocolError::MethodNotFound(const std::string& method) {
    return ProtocolError{error_code::kMethodNotFound,
                         "Method not found: " + method,
                         nlohmann::json{{"method", method}}};
}

ProtocolError ProtocolError::InvalidParams(std::string message,
                                           std::optional<nlohmann::json> data) {
    return ProtocolError{error_code::kInvalidParams, std::move(message), std::move(data)};
}

ProtocolError ProtocolError::InternalError(std::string message) {
    return ProtocolError{error_code::kInternalError, std::move(message), std::nullopt};
}

nlohmann::json ProtocolError::ToJson() const {
    nlohmann::json j = {{"code", code}, {"message", message}};
    if (data) {
        j["data"] = *data;
    }
    return j;
}

Response Response::Success(RequestId id, nlohmann::json result) {
    Response r;
    r.id = std::move(id);
    r.outcome.emplace<0>(std::move(result));
    return r;
}

Response Response::Failure(std::optional<RequestId> id, ProtocolError error) {
    Response r;
    r.id = std::move(id);
    r.outcome.emplace<1>(std::move(error));
    return r;
}

} // namespace stdio_mcp
