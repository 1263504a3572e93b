#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace stdio_mcp {

// ---------------------------------------------------------------------------
// JSON-RPC 2.0 reserved error codes.
// ---------------------------------------------------------------------------
namespace error_code {

constexpr int kParseError     = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams  = -32602;
constexpr int kInternalError  = -32603;

} // namespace error_code

constexpr const char* kJsonRpcVersion = "2.0";

// Caller-chosen correlation token: a string or an integer. Integers above
// INT64_MAX are kept as unsigned so they echo back unchanged.
using RequestId = std::variant<std::int64_t, std::uint64_t, std::string>;

nlohmann::json RequestIdToJson(const RequestId& id);

// Human-readable form for log lines: 7 or "abc".
std::string RequestIdToString(const RequestId& id);

// ---------------------------------------------------------------------------
// ProtocolError: the JSON-RPC error object.
// ---------------------------------------------------------------------------
struct ProtocolError {
    int code = error_code::kInternalError;
    std::string message;
    std::optional<nlohmann::json> data;

    static ProtocolError ParseError(std::string message);
    static ProtocolError InvalidRequest(std::string message);
    static ProtocolError MethodNotFound(const std::string& method);
    static ProtocolError InvalidParams(std::string message,
                                       std::optional<nlohmann::json> data = std::nullopt);
    static ProtocolError InternalError(std::string message);

    [[nodiscard]] nlohmann::json ToJson() const;

    bool operator==(const ProtocolError& other) const {
        return code == other.code && message == other.message &&
               data == other.data;
    }
};

// ---------------------------------------------------------------------------
// Message variants.
// ---------------------------------------------------------------------------
struct Request {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;  // object or array when present
};

struct Notification {
    std::string method;
    std::optional<nlohmann::json> params;
};

struct Response {
    // Absent only for errors that cannot be correlated; encoded as null.
    std::optional<RequestId> id;
    std::variant<nlohmann::json, ProtocolError> outcome;

    static Response Success(RequestId id, nlohmann::json result);
    static Response Failure(std::optional<RequestId> id, ProtocolError error);

    [[nodiscard]] bool IsError() const noexcept { return outcome.index() == 1; }
    [[nodiscard]] const nlohmann::json& Result() const { return std::get<0>(outcome); }
    [[nodiscard]] const ProtocolError& Error() const { return std::get<1>(outcome); }
};

using Message = std::variant<Request, Response, Notification>;

} // namespace stdio_mcp
