#pragma once

#include <stdio_mcp/core/result.hpp>
#include <stdio_mcp/mcp/message.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace stdio_mcp {

// ---------------------------------------------------------------------------
// Message codec: one JSON document per newline-terminated frame.
//
// The codec only checks protocol shape. Whether `params` make sense for a
// method is decided by the method handler.
// ---------------------------------------------------------------------------

enum class DecodeErrorKind {
    Malformed,     // not JSON, not an object, or neither request nor response
    InvalidShape,  // recognizable message with a missing or ill-typed field
};

struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::Malformed;
    std::string message;
    std::optional<RequestId> id;  // correlation id, when one could be recovered
    bool parsed = false;          // the frame was valid JSON
};

// Serialize to the wire object (without framing).
nlohmann::json MessageToJson(const Message& message);

// Serialize to a frame: compact JSON followed by a single '\n'.
// Invalid UTF-8 in strings is replaced with U+FFFD rather than failing.
std::string EncodeMessage(const Message& message);

// Parse one frame. A trailing "\n" or "\r\n" is tolerated.
Result<Message, DecodeError> DecodeMessage(std::string_view frame);

// Best-effort lexical scan for a top-level "id" member in text that is not
// valid JSON. Returns nullopt when nothing usable is found.
std::optional<RequestId> RecoverRequestId(std::string_view frame);

} // namespace stdio_mcp
